#include <gtest/gtest.h>

#include "support/test_support.hpp"
#include "warden/service/activation_service.hpp"
#include "warden/service/clock.hpp"
#include "warden/service/token_signer.hpp"
#include "warden/service/user_directory.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace warden::service;
using warden::foundation::ErrorCode;

class ActivationServiceTest : public warden::test::LoggingTest {
protected:
    void SetUp() override {
        LoggingTest::SetUp();
        config_ = warden::test::fastAuthConfig();
        clock_ = std::make_shared<ManualClock>();
        directory_ = std::make_shared<InMemoryUserDirectory>();
        flaky_ = std::make_shared<warden::test::FlakyUserDirectory>(directory_);
        signer_ = std::make_shared<const TokenSigner>(config_, clock_);
        activation_ = std::make_unique<ActivationService>(config_, signer_, flaky_);

        Account alice;
        alice.username = "alice";
        alice.email = "a@x.com";
        alice.passwordHash = "$scrypt$placeholder";
        auto id = directory_->create(alice);
        ASSERT_TRUE(id.hasValue());
        aliceId_ = id.value();
    }

    std::string tokenFor(AccountId id) {
        auto token = activation_->issueFor(id);
        EXPECT_TRUE(token.hasValue());
        return token.hasValue() ? token.value() : std::string{};
    }

    bool aliceConfirmed() {
        auto found = directory_->findById(aliceId_);
        return found.hasValue() && found.value().has_value() && found.value()->confirmed;
    }

    AuthConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryUserDirectory> directory_;
    std::shared_ptr<warden::test::FlakyUserDirectory> flaky_;
    std::shared_ptr<const TokenSigner> signer_;
    std::unique_ptr<ActivationService> activation_;
    AccountId aliceId_;
};

TEST_F(ActivationServiceTest, FirstRedemptionConfirms) {
    auto outcome = activation_->redeem(tokenFor(aliceId_));
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().status, ActivationOutcome::Status::Confirmed);
    EXPECT_EQ(outcome.value().accountId, aliceId_);
    EXPECT_TRUE(outcome.value().succeeded());
    EXPECT_TRUE(aliceConfirmed());
}

TEST_F(ActivationServiceTest, SecondRedemptionIsIdempotent) {
    auto token = tokenFor(aliceId_);
    ASSERT_EQ(activation_->redeem(token).value().status, ActivationOutcome::Status::Confirmed);

    auto again = activation_->redeem(token);
    ASSERT_TRUE(again.hasValue());
    EXPECT_EQ(again.value().status, ActivationOutcome::Status::AlreadyConfirmed);
    EXPECT_TRUE(again.value().succeeded());
    EXPECT_TRUE(aliceConfirmed());
}

TEST_F(ActivationServiceTest, UnknownAccountDoesNotMutate) {
    auto outcome = activation_->redeem(tokenFor(AccountId(999)));
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().status, ActivationOutcome::Status::UnknownAccount);
    EXPECT_FALSE(outcome.value().succeeded());
    EXPECT_EQ(directory_->size(), 1u);
    EXPECT_FALSE(aliceConfirmed());
}

TEST_F(ActivationServiceTest, ExpiredTokenIsInvalid) {
    auto token = tokenFor(aliceId_);
    clock_->advance(config_.activationTokenTtl + std::chrono::seconds{1});

    auto outcome = activation_->redeem(token);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().status, ActivationOutcome::Status::Invalid);
    ASSERT_TRUE(outcome.value().reason.has_value());
    EXPECT_EQ(*outcome.value().reason, TokenError::Expired);
    EXPECT_FALSE(aliceConfirmed());
    EXPECT_TRUE(mockLogger_->contains("reason=expired"));
}

TEST_F(ActivationServiceTest, ExplicitTtlOverridesDefault) {
    auto token = activation_->issueFor(aliceId_, std::chrono::seconds{10});
    ASSERT_TRUE(token.hasValue());
    clock_->advance(std::chrono::seconds{11});

    auto outcome = activation_->redeem(token.value());
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().reason, TokenError::Expired);
}

TEST_F(ActivationServiceTest, ExplicitTtlIsBounded) {
    auto refused = activation_->issueFor(aliceId_, std::chrono::seconds{10000000000LL * 1000});
    ASSERT_TRUE(refused.hasError());
    EXPECT_EQ(refused.error().code(), ErrorCode::TokenLifetimeOutOfRange);

    auto token = activation_->issueFor(aliceId_, std::chrono::hours{24 * 365 * 10});
    ASSERT_TRUE(token.hasValue());
    clock_->advance(std::chrono::hours{24 * 365});
    auto outcome = activation_->redeem(token.value());
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().status, ActivationOutcome::Status::Confirmed);
}

TEST_F(ActivationServiceTest, TamperedTokenIsInvalid) {
    auto token = tokenFor(aliceId_);
    token[2] = token[2] == 'x' ? 'y' : 'x';

    auto outcome = activation_->redeem(token);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().status, ActivationOutcome::Status::Invalid);
    EXPECT_EQ(outcome.value().reason, TokenError::BadSignature);
    EXPECT_FALSE(aliceConfirmed());
}

TEST_F(ActivationServiceTest, GarbageTokenIsInvalid) {
    auto outcome = activation_->redeem("definitely-not-a-token");
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().reason, TokenError::Malformed);
}

TEST_F(ActivationServiceTest, AuthenticTokenWithoutUsableIdIsMalformed) {
    for (const TokenPayload& payload : {TokenPayload{},
                                        TokenPayload{{"id", std::string("1")}},
                                        TokenPayload{{"id", int64_t{0}}},
                                        TokenPayload{{"id", int64_t{-4}}},
                                        TokenPayload{{"user", int64_t{1}}}}) {
        auto token = signer_->issue(payload, std::chrono::seconds{60});
        ASSERT_TRUE(token.hasValue());
        auto outcome = activation_->redeem(token.value());
        ASSERT_TRUE(outcome.hasValue());
        EXPECT_EQ(outcome.value().status, ActivationOutcome::Status::Invalid);
        EXPECT_EQ(outcome.value().reason, TokenError::Malformed);
    }
    EXPECT_FALSE(aliceConfirmed());
}

TEST_F(ActivationServiceTest, DirectoryFaultIsAnError) {
    auto token = tokenFor(aliceId_);
    flaky_->setOffline(true);

    auto outcome = activation_->redeem(token);
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::DirectoryUnavailable);

    flaky_->setOffline(false);
    EXPECT_EQ(activation_->redeem(token).value().status, ActivationOutcome::Status::Confirmed);
}

TEST_F(ActivationServiceTest, ConcurrentRedemptionConfirmsOnce) {
    auto token = tokenFor(aliceId_);
    constexpr int kThreads = 8;
    std::atomic<int> confirmed{0};
    std::atomic<int> already{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            auto outcome = activation_->redeem(token);
            if (!outcome.hasValue()) {
                return;
            }
            if (outcome.value().status == ActivationOutcome::Status::Confirmed) {
                confirmed.fetch_add(1);
            } else if (outcome.value().status == ActivationOutcome::Status::AlreadyConfirmed) {
                already.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(confirmed.load(), 1);
    EXPECT_EQ(already.load(), kThreads - 1);
}

TEST(ActivationOutcomeTest, FailureMessagesAreGeneric) {
    auto invalid = ActivationOutcome::invalid(TokenError::BadSignature);
    auto expired = ActivationOutcome::invalid(TokenError::Expired);
    auto unknown = ActivationOutcome::unknownAccount();
    EXPECT_EQ(invalid.userMessage(), expired.userMessage());
    EXPECT_EQ(invalid.userMessage(), unknown.userMessage());
    EXPECT_EQ(invalid.userMessage().find("signature"), std::string_view::npos);
    EXPECT_NE(ActivationOutcome::confirmed(AccountId(1)).userMessage(), invalid.userMessage());
}
