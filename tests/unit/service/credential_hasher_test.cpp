#include <gtest/gtest.h>

#include "support/test_support.hpp"
#include "warden/service/credential_hasher.hpp"

#include <string>

using namespace warden::service;

// =============================================================================
// CredentialHasher
// =============================================================================

class CredentialHasherTest : public ::testing::Test {
protected:
    CredentialHasher hasher{warden::test::fastAuthConfig()};
};

TEST(CredentialHasherDefaultsTest, DefaultCostParameters) {
    CredentialHasher hasher;
    EXPECT_EQ(hasher.params().logN, 15u);
    EXPECT_EQ(hasher.params().r, 8u);
    EXPECT_EQ(hasher.params().p, 1u);
}

TEST_F(CredentialHasherTest, HashIsSelfDescribing) {
    auto hashed = hasher.hash("password123");
    ASSERT_TRUE(hashed.hasValue());
    const auto& encoded = hashed.value().encoded;
    EXPECT_EQ(encoded.rfind("$scrypt$ln=4,r=8,p=1$", 0), 0u);
    EXPECT_EQ(encoded.find("password123"), std::string::npos);
}

TEST_F(CredentialHasherTest, VerifyCorrectPassword) {
    auto hashed = hasher.hash("correct-horse-9");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_TRUE(hasher.verify("correct-horse-9", hashed.value().encoded));
}

TEST_F(CredentialHasherTest, VerifyWrongPassword) {
    auto hashed = hasher.hash("correct-horse-9");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_FALSE(hasher.verify("correct-horse-8", hashed.value().encoded));
    EXPECT_FALSE(hasher.verify("", hashed.value().encoded));
}

TEST_F(CredentialHasherTest, SaltMakesHashesDiffer) {
    auto a = hasher.hash("same-password1");
    auto b = hasher.hash("same-password1");
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value().encoded, b.value().encoded);
    EXPECT_TRUE(hasher.verify("same-password1", a.value().encoded));
    EXPECT_TRUE(hasher.verify("same-password1", b.value().encoded));
}

TEST_F(CredentialHasherTest, NonAsciiPassword) {
    auto hashed = hasher.hash("p\xC3\xA4ssw\xC3\xB6rd1");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_TRUE(hasher.verify("p\xC3\xA4ssw\xC3\xB6rd1", hashed.value().encoded));
    EXPECT_FALSE(hasher.verify("password1", hashed.value().encoded));
}

TEST_F(CredentialHasherTest, VerifyHashFromOtherCost) {
    // Stored hashes carry their own parameters.
    CredentialHasher cheaper(ScryptParams{3, 4, 1});
    auto hashed = cheaper.hash("portable-pw1");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_TRUE(hasher.verify("portable-pw1", hashed.value().encoded));
}

TEST_F(CredentialHasherTest, MalformedStoredHashIsRejected) {
    EXPECT_FALSE(hasher.verify("pw", ""));
    EXPECT_FALSE(hasher.verify("pw", "not-a-hash"));
    EXPECT_FALSE(hasher.verify("pw", "$scrypt$"));
    EXPECT_FALSE(hasher.verify("pw", "$scrypt$ln=4,r=8,p=1$"));
    EXPECT_FALSE(hasher.verify("pw", "$scrypt$ln=4,r=8$c2FsdHNhbHQ$a2V5"));
    EXPECT_FALSE(hasher.verify("pw", "$scrypt$ln=4,r=8,p=1$!!!$a2V5"));
}

TEST(CredentialHasherCostTest, MalformedHashCostsOneDerivation) {
    // A cost at which one derivation dwarfs parsing.
    CredentialHasher hasher(ScryptParams{12, 8, 1});
    auto hashed = hasher.hash("password123");
    ASSERT_TRUE(hashed.hasValue());
    const auto& stored = hashed.value().encoded;
    auto huge = stored;
    huge.replace(huge.find("ln=12"), 5, "ln=40");

    auto wrongPassword = warden::test::fastestMillis(
        [&] { EXPECT_FALSE(hasher.verify("password124", stored)); });
    auto malformed = warden::test::fastestMillis(
        [&] { EXPECT_FALSE(hasher.verify("password123", "not-a-hash")); });
    auto outOfBounds = warden::test::fastestMillis(
        [&] { EXPECT_FALSE(hasher.verify("password123", huge)); });

    EXPECT_GE(malformed, wrongPassword * 0.5);
    EXPECT_GE(outOfBounds, wrongPassword * 0.5);
    EXPECT_LE(malformed, wrongPassword * 3.0);
}

TEST_F(CredentialHasherTest, TruncatedKeyIsRejected) {
    auto hashed = hasher.hash("password123");
    ASSERT_TRUE(hashed.hasValue());
    auto truncated = hashed.value().encoded.substr(0, hashed.value().encoded.size() - 4);
    EXPECT_FALSE(hasher.verify("password123", truncated));
}

TEST_F(CredentialHasherTest, OutOfBoundsParametersAreRejected) {
    auto hashed = hasher.hash("password123");
    ASSERT_TRUE(hashed.hasValue());
    auto encoded = hashed.value().encoded;
    auto huge = encoded;
    huge.replace(huge.find("ln=4"), 4, "ln=40");
    EXPECT_FALSE(hasher.verify("password123", huge));
}

TEST_F(CredentialHasherTest, NeedsRehash) {
    auto hashed = hasher.hash("password123");
    ASSERT_TRUE(hashed.hasValue());
    EXPECT_FALSE(hasher.needsRehash(hashed.value().encoded));

    CredentialHasher stronger(ScryptParams{5, 8, 1});
    EXPECT_TRUE(stronger.needsRehash(hashed.value().encoded));
    EXPECT_TRUE(hasher.needsRehash("garbage"));
}

TEST(CredentialHasherBoundsTest, WithinBounds) {
    EXPECT_TRUE(CredentialHasher::withinBounds({15, 8, 1}));
    EXPECT_TRUE(CredentialHasher::withinBounds({20, 1, 1}));
    EXPECT_FALSE(CredentialHasher::withinBounds({20, 8, 1}));  // > 1 GiB
    EXPECT_FALSE(CredentialHasher::withinBounds({0, 8, 1}));
    EXPECT_FALSE(CredentialHasher::withinBounds({21, 1, 1}));
    EXPECT_FALSE(CredentialHasher::withinBounds({10, 0, 1}));
    EXPECT_FALSE(CredentialHasher::withinBounds({10, 8, 17}));
}
