#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

#include "warden/core/result.hpp"
#include "warden/foundation/types.hpp"
#include "warden/foundation/warden_result.hpp"

using namespace warden::foundation;

// --- Result tests ---

TEST(ResultTest, OkValue) {
    auto r = warden::Result<int>::ok(42);
    EXPECT_TRUE(r.hasValue());
    EXPECT_FALSE(r.hasError());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto r = warden::Result<int>::err(warden::Error(7, "boom"));
    EXPECT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code, 7);
    EXPECT_EQ(r.error().message, "boom");
    EXPECT_EQ(r.valueOr(5), 5);
}

TEST(ResultTest, SameTypeForValueAndError) {
    // Index-based storage keeps the two alternatives apart.
    auto ok = warden::Result<std::string, std::string>::ok("value");
    auto err = warden::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, MoveOutValue) {
    auto r = WardenResult<std::string>::ok("payload");
    std::string moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

TEST(ResultTest, VoidOk) {
    auto r = WardenResult<void>::ok();
    EXPECT_TRUE(r.hasValue());
}

TEST(ResultTest, VoidError) {
    auto r = WardenResult<void>::err(WardenError(ErrorCode::DirectoryUnavailable, "down"));
    EXPECT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::DirectoryUnavailable);
}

// --- StrongId tests ---

TEST(StrongIdTest, DefaultInvalid) {
    AccountId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    AccountId a(1);
    AccountId b(2);
    EXPECT_EQ(a, AccountId(1));
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_set<AccountId> ids;
    ids.insert(AccountId(1));
    ids.insert(AccountId(2));
    ids.insert(AccountId(1));
    EXPECT_EQ(ids.size(), 2u);
}
