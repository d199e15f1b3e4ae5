#include <gtest/gtest.h>

#include "support/test_support.hpp"
#include "warden/service/clock.hpp"
#include "warden/service/credential_hasher.hpp"
#include "warden/service/current_principal.hpp"
#include "warden/service/session_authenticator.hpp"
#include "warden/service/session_store.hpp"
#include "warden/service/user_directory.hpp"

#include <memory>
#include <string>

using namespace warden::service;
using warden::foundation::ErrorCode;

class CurrentPrincipalTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = warden::test::fastAuthConfig();
        clock_ = std::make_shared<ManualClock>();
        directory_ = std::make_shared<InMemoryUserDirectory>();
        flaky_ = std::make_shared<warden::test::FlakyUserDirectory>(directory_);
        sessions_ = std::make_shared<InMemorySessionStore>();
        auto hasher = std::make_shared<const CredentialHasher>(config);

        Account bob;
        bob.username = "bob";
        bob.email = "bob@example.org";
        bob.passwordHash = hasher->hash("hunter2-pw").value().encoded;
        ASSERT_TRUE(directory_->create(bob).hasValue());

        auth_ = std::make_unique<SessionAuthenticator>(config, flaky_, sessions_, hasher, clock_);
    }

    LoginRequest bobLogin() const {
        LoginRequest req;
        req.username = "bob";
        req.password = "hunter2-pw";
        req.client = client_;
        return req;
    }

    ClientContext client_{"192.0.2.1", "curl/8.0"};
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryUserDirectory> directory_;
    std::shared_ptr<warden::test::FlakyUserDirectory> flaky_;
    std::shared_ptr<InMemorySessionStore> sessions_;
    std::unique_ptr<SessionAuthenticator> auth_;
};

TEST_F(CurrentPrincipalTest, NoTokenIsAnonymous) {
    CurrentPrincipal current(*auth_, "", client_);
    EXPECT_TRUE(current.isAnonymous());
    EXPECT_FALSE(current.isAuthenticated());
    EXPECT_TRUE(current.sessionToken().empty());
}

TEST_F(CurrentPrincipalTest, LoginUpdatesTokenAndPrincipal) {
    CurrentPrincipal current(*auth_, "", client_);
    ASSERT_TRUE(current.isAnonymous());

    auto outcome = current.login(bobLogin());
    ASSERT_TRUE(outcome.hasValue());
    ASSERT_TRUE(outcome.value().succeeded());
    EXPECT_EQ(current.sessionToken(), outcome.value().sessionToken);
    EXPECT_TRUE(current.isAuthenticated());
    EXPECT_EQ(current.get().value().account()->username, "bob");
}

TEST_F(CurrentPrincipalTest, FailedLoginLeavesRequestAnonymous) {
    CurrentPrincipal current(*auth_, "", client_);
    auto req = bobLogin();
    req.password = "wrong";
    auto outcome = current.login(req);
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_FALSE(outcome.value().succeeded());
    EXPECT_TRUE(current.isAnonymous());
    EXPECT_TRUE(current.sessionToken().empty());
}

TEST_F(CurrentPrincipalTest, ExistingSessionResolves) {
    auto token = auth_->login(bobLogin()).value().sessionToken;
    CurrentPrincipal current(*auth_, token, client_);
    EXPECT_TRUE(current.isAuthenticated());
    EXPECT_EQ(current.sessionToken(), token);
}

TEST_F(CurrentPrincipalTest, ResolvesOncePerRequest) {
    auto token = auth_->login(bobLogin()).value().sessionToken;
    CurrentPrincipal current(*auth_, token, client_);
    ASSERT_TRUE(current.isAuthenticated());

    // Ended elsewhere mid-request: this request keeps its resolved view.
    auth_->logout(token);
    EXPECT_TRUE(current.isAuthenticated());

    CurrentPrincipal next(*auth_, token, client_);
    EXPECT_TRUE(next.isAnonymous());
    EXPECT_TRUE(next.sessionToken().empty());
}

TEST_F(CurrentPrincipalTest, LogoutInvalidatesCacheAndSession) {
    CurrentPrincipal current(*auth_, "", client_);
    ASSERT_TRUE(current.login(bobLogin()).value().succeeded());
    auto token = current.sessionToken();

    current.logout();
    EXPECT_TRUE(current.isAnonymous());
    EXPECT_TRUE(current.sessionToken().empty());
    EXPECT_FALSE(sessions_->find(token).has_value());
}

TEST_F(CurrentPrincipalTest, LoginReplacesPreviousSession) {
    auto first = auth_->login(bobLogin()).value().sessionToken;
    CurrentPrincipal current(*auth_, first, client_);

    ASSERT_TRUE(current.login(bobLogin()).value().succeeded());
    EXPECT_NE(current.sessionToken(), first);
    EXPECT_FALSE(sessions_->find(first).has_value());
    EXPECT_EQ(sessions_->size(), 1u);
}

TEST_F(CurrentPrincipalTest, FaultsAreNotCached) {
    auto token = auth_->login(bobLogin()).value().sessionToken;
    CurrentPrincipal current(*auth_, token, client_);

    flaky_->setOffline(true);
    auto failed = current.get();
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::DirectoryUnavailable);
    EXPECT_FALSE(current.isAuthenticated());

    flaky_->setOffline(false);
    EXPECT_TRUE(current.isAuthenticated());
}
