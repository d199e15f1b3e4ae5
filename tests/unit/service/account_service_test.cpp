#include <gtest/gtest.h>

#include "support/test_support.hpp"
#include "warden/service/account_service.hpp"
#include "warden/service/activation_mailer.hpp"
#include "warden/service/activation_service.hpp"
#include "warden/service/clock.hpp"
#include "warden/service/credential_hasher.hpp"
#include "warden/service/token_signer.hpp"
#include "warden/service/user_directory.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace warden::service;
using warden::foundation::ErrorCode;

namespace {

/// Keeps every hand-off for inspection.
class RecordingMailer : public IActivationMailer {
public:
    void deliver(std::string_view email, std::string_view token) override {
        sent.emplace_back(std::string(email), std::string(token));
    }

    std::vector<std::pair<std::string, std::string>> sent;
};

}  // namespace

class AccountServiceTest : public warden::test::LoggingTest {
protected:
    void SetUp() override {
        LoggingTest::SetUp();
        config_ = warden::test::fastAuthConfig();
        clock_ = std::make_shared<ManualClock>();
        directory_ = std::make_shared<InMemoryUserDirectory>();
        hasher_ = std::make_shared<const CredentialHasher>(config_);
        auto signer = std::make_shared<const TokenSigner>(config_, clock_);
        activation_ = std::make_shared<ActivationService>(config_, signer, directory_);
        mailer_ = std::make_shared<RecordingMailer>();
        accounts_ = std::make_unique<AccountService>(config_, directory_, hasher_, activation_,
                                                     mailer_, clock_);
    }

    Registration registerAlice() {
        auto registration = accounts_->registerAccount({"alice", "a@x.com", "s3cret-pw"});
        EXPECT_TRUE(registration.hasValue());
        return registration.hasValue() ? registration.value() : Registration{};
    }

    Account stored(AccountId id) { return directory_->findById(id).value().value(); }

    AuthConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryUserDirectory> directory_;
    std::shared_ptr<const CredentialHasher> hasher_;
    std::shared_ptr<ActivationService> activation_;
    std::shared_ptr<RecordingMailer> mailer_;
    std::unique_ptr<AccountService> accounts_;
};

// -- Registration -------------------------------------------------------------

TEST_F(AccountServiceTest, RegisterCreatesUnconfirmedAccount) {
    auto reg = registerAlice();
    EXPECT_TRUE(reg.account.id.isValid());
    EXPECT_EQ(reg.account.username, "alice");
    EXPECT_FALSE(reg.account.confirmed);
    EXPECT_EQ(reg.account.createdAt, clock_->now());

    auto account = stored(reg.account.id);
    EXPECT_FALSE(account.confirmed);
    EXPECT_NE(account.passwordHash, "s3cret-pw");
    EXPECT_TRUE(hasher_->verify("s3cret-pw", account.passwordHash));
}

TEST_F(AccountServiceTest, RegisterSendsRedeemableToken) {
    auto reg = registerAlice();
    ASSERT_EQ(mailer_->sent.size(), 1u);
    EXPECT_EQ(mailer_->sent[0].first, "a@x.com");
    EXPECT_EQ(mailer_->sent[0].second, reg.activationToken);

    auto outcome = activation_->redeem(reg.activationToken);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_EQ(outcome.value().status, ActivationOutcome::Status::Confirmed);
    EXPECT_EQ(outcome.value().accountId, reg.account.id);
    EXPECT_TRUE(stored(reg.account.id).confirmed);
}

TEST_F(AccountServiceTest, RegisterRejectsInvalidInput) {
    auto badName = accounts_->registerAccount({"9lives", "c@x.com", "s3cret-pw"});
    ASSERT_TRUE(badName.hasError());
    EXPECT_EQ(badName.error().code(), ErrorCode::InvalidUsername);

    auto badEmail = accounts_->registerAccount({"carol", "carol-at-x", "s3cret-pw"});
    ASSERT_TRUE(badEmail.hasError());
    EXPECT_EQ(badEmail.error().code(), ErrorCode::InvalidEmail);

    auto weak = accounts_->registerAccount({"carol", "c@x.com", "short1"});
    ASSERT_TRUE(weak.hasError());
    EXPECT_EQ(weak.error().code(), ErrorCode::WeakPassword);

    EXPECT_EQ(directory_->size(), 0u);
    EXPECT_TRUE(mailer_->sent.empty());
}

TEST_F(AccountServiceTest, RegisterRejectsDuplicates) {
    registerAlice();

    auto sameName = accounts_->registerAccount({"alice", "other@x.com", "s3cret-pw"});
    ASSERT_TRUE(sameName.hasError());
    EXPECT_EQ(sameName.error().code(), ErrorCode::AlreadyExists);

    auto sameEmail = accounts_->registerAccount({"alicia", "a@x.com", "s3cret-pw"});
    ASSERT_TRUE(sameEmail.hasError());
    EXPECT_EQ(sameEmail.error().code(), ErrorCode::AlreadyExists);

    EXPECT_EQ(directory_->size(), 1u);
}

// -- Activation resend --------------------------------------------------------

TEST_F(AccountServiceTest, ResendIssuesNewToken) {
    auto reg = registerAlice();
    clock_->advance(config_.activationTokenTtl + std::chrono::seconds{1});
    EXPECT_EQ(activation_->redeem(reg.activationToken).value().reason, TokenError::Expired);

    auto token = accounts_->resendActivation(reg.account.id);
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(mailer_->sent.size(), 2u);
    EXPECT_EQ(activation_->redeem(token.value()).value().status,
              ActivationOutcome::Status::Confirmed);
}

TEST_F(AccountServiceTest, ResendRefusesConfirmedOrMissing) {
    auto reg = registerAlice();
    ASSERT_TRUE(activation_->redeem(reg.activationToken).value().succeeded());

    auto confirmed = accounts_->resendActivation(reg.account.id);
    ASSERT_TRUE(confirmed.hasError());
    EXPECT_EQ(confirmed.error().code(), ErrorCode::AlreadyConfirmed);

    auto missing = accounts_->resendActivation(AccountId(404));
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::AccountNotFound);
}

// -- Settings -----------------------------------------------------------------

TEST_F(AccountServiceTest, ChangePassword) {
    auto reg = registerAlice();

    auto wrong = accounts_->changePassword(reg.account.id, "not-it-1", "n3w-password");
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::InvalidCredentials);

    auto weak = accounts_->changePassword(reg.account.id, "s3cret-pw", "weak");
    ASSERT_TRUE(weak.hasError());
    EXPECT_EQ(weak.error().code(), ErrorCode::WeakPassword);

    ASSERT_TRUE(accounts_->changePassword(reg.account.id, "s3cret-pw", "n3w-password").hasValue());
    auto account = stored(reg.account.id);
    EXPECT_TRUE(hasher_->verify("n3w-password", account.passwordHash));
    EXPECT_FALSE(hasher_->verify("s3cret-pw", account.passwordHash));
    EXPECT_FALSE(mockLogger_->contains("n3w-password"));
}

TEST_F(AccountServiceTest, ChangePasswordKeepsConfirmation) {
    auto reg = registerAlice();
    ASSERT_TRUE(activation_->redeem(reg.activationToken).value().succeeded());
    ASSERT_TRUE(accounts_->changePassword(reg.account.id, "s3cret-pw", "n3w-password").hasValue());
    EXPECT_TRUE(stored(reg.account.id).confirmed);
}

TEST_F(AccountServiceTest, ChangeEmail) {
    auto reg = registerAlice();
    ASSERT_TRUE(accounts_->registerAccount({"bob", "b@x.com", "hunter22x"}).hasValue());

    auto invalid = accounts_->changeEmail(reg.account.id, "nope");
    ASSERT_TRUE(invalid.hasError());
    EXPECT_EQ(invalid.error().code(), ErrorCode::InvalidEmail);

    auto taken = accounts_->changeEmail(reg.account.id, "b@x.com");
    ASSERT_TRUE(taken.hasError());
    EXPECT_EQ(taken.error().code(), ErrorCode::AlreadyExists);

    EXPECT_TRUE(accounts_->changeEmail(reg.account.id, "a@x.com").hasValue());
    ASSERT_TRUE(accounts_->changeEmail(reg.account.id, "alice@new.example").hasValue());
    EXPECT_EQ(stored(reg.account.id).email, "alice@new.example");
}

TEST_F(AccountServiceTest, ChangesOnMissingAccount) {
    auto pw = accounts_->changePassword(AccountId(77), "x", "n3w-password");
    ASSERT_TRUE(pw.hasError());
    EXPECT_EQ(pw.error().code(), ErrorCode::AccountNotFound);

    auto email = accounts_->changeEmail(AccountId(77), "z@x.com");
    ASSERT_TRUE(email.hasError());
    EXPECT_EQ(email.error().code(), ErrorCode::AccountNotFound);
}

TEST(LoggingActivationMailerTest, LogsHandOffWithoutToken) {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.clear();
    auto logger = std::make_shared<warden::test::MockLogger>();
    registry.set_default_logger(logger);

    LoggingActivationMailer mailer;
    mailer.deliver("a@x.com", "secret-token-value");

    EXPECT_TRUE(logger->contains("Activation token handed off"));
    EXPECT_TRUE(logger->contains("email=a@x.com"));
    EXPECT_FALSE(logger->contains("secret-token-value"));
    registry.clear();
}
