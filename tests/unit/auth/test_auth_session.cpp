/**
 * @file test_auth_session.cpp
 * @brief Unit tests for auth_session and oauth_token_refresher
 */

#include <gtest/gtest.h>

#include "mocks/mock_services.h"

#include <media_upload/auth/auth_session.h>
#include <media_upload/auth/token_refresher.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace media_upload::test {

using namespace std::chrono_literals;

class AuthSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<memory_credential_store>();
        refresher_ = std::make_shared<mock_token_refresher>();
        config_.clock = clock_.as_function();
    }

    auto expired_credential() -> credential {
        auto cred = make_valid_credential();
        cred.expires_at = clock_.now() - 1min;
        return cred;
    }

    auto make_session() -> std::unique_ptr<auth_session> {
        return std::make_unique<auth_session>(store_, refresher_, config_);
    }

    /// Refresh handler that hands out a token expiring at @p expires_at
    void refresh_to(std::chrono::system_clock::time_point expires_at) {
        refresher_->handler = [expires_at](const credential& current) -> result<credential> {
            auto next = current;
            next.access_token = "ya29.refreshed";
            next.expires_at = expires_at;
            return next;
        };
    }

    manual_clock clock_;
    auth_config config_;
    std::shared_ptr<memory_credential_store> store_;
    std::shared_ptr<mock_token_refresher> refresher_;
};

TEST_F(AuthSessionTest, NoCredentialIsInvalid) {
    auto session = make_session();

    EXPECT_FALSE(session->is_valid());
    EXPECT_FALSE(session->is_authenticated());
    EXPECT_FALSE(session->get_credential().has_value());
}

TEST_F(AuthSessionTest, LoadsStoredCredential) {
    ASSERT_TRUE(store_->save(make_valid_credential()).has_value());

    auto session = make_session();

    EXPECT_TRUE(session->is_valid());
    auto cred = session->get_credential();
    ASSERT_TRUE(cred.has_value());
    EXPECT_EQ(cred->access_token, "ya29.valid-access-token");
    EXPECT_EQ(refresher_->calls(), 0);
}

TEST_F(AuthSessionTest, CorruptedStoreIsDeleted) {
    store_->fail_loads_with(error{error_code::credential_corrupted, "digest mismatch"});

    auto session = make_session();

    EXPECT_FALSE(session->is_authenticated());
    EXPECT_EQ(store_->removals(), 1);
}

TEST_F(AuthSessionTest, ExpiredCredentialIsRefreshed) {
    ASSERT_TRUE(store_->save(expired_credential()).has_value());
    refresh_to(clock_.now() + 1h);
    auto session = make_session();

    EXPECT_TRUE(session->is_valid());

    EXPECT_EQ(refresher_->calls(), 1);
    EXPECT_EQ(session->refresh_attempts(), 1u);
    auto cred = session->get_credential();
    ASSERT_TRUE(cred.has_value());
    EXPECT_EQ(cred->access_token, "ya29.refreshed");
    ASSERT_TRUE(store_->stored().has_value());
    EXPECT_EQ(store_->stored()->access_token, "ya29.refreshed");
}

TEST_F(AuthSessionTest, CooldownAllowsOneRefreshPerWindow) {
    ASSERT_TRUE(store_->save(expired_credential()).has_value());
    // The refreshed token is already expired, so every check sees an expiry
    refresh_to(clock_.now() - 1s);
    auto session = make_session();

    EXPECT_TRUE(session->is_valid());
    EXPECT_TRUE(session->is_valid());
    EXPECT_EQ(refresher_->calls(), 1);

    clock_.advance(29s);
    EXPECT_TRUE(session->is_valid());
    EXPECT_EQ(refresher_->calls(), 1);

    clock_.advance(2s);
    EXPECT_TRUE(session->is_valid());
    EXPECT_EQ(refresher_->calls(), 2);
}

TEST_F(AuthSessionTest, ConcurrentExpiryTriggersSingleRefresh) {
    ASSERT_TRUE(store_->save(expired_credential()).has_value());
    refresh_to(clock_.now() - 1s);
    auto session = make_session();

    std::atomic<int> valid{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 16; ++i) {
        workers.emplace_back([&]() {
            if (session->is_valid()) {
                valid.fetch_add(1);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(refresher_->calls(), 1);
    EXPECT_EQ(valid.load(), 16);
}

TEST_F(AuthSessionTest, FailedRefreshLogsOut) {
    ASSERT_TRUE(store_->save(expired_credential()).has_value());
    auto session = make_session();

    EXPECT_FALSE(session->is_valid());

    EXPECT_EQ(refresher_->calls(), 1);
    EXPECT_FALSE(session->is_authenticated());
    EXPECT_FALSE(store_->stored().has_value());
    EXPECT_FALSE(session->is_valid());
    EXPECT_EQ(refresher_->calls(), 1);
}

TEST_F(AuthSessionTest, ExpiredWithoutRefreshTokenLogsOut) {
    auto cred = expired_credential();
    cred.refresh_token.clear();
    ASSERT_TRUE(store_->save(cred).has_value());
    auto session = make_session();

    EXPECT_FALSE(session->is_valid());

    EXPECT_EQ(refresher_->calls(), 0);
    EXPECT_FALSE(store_->stored().has_value());
}

TEST_F(AuthSessionTest, ExplicitRefreshFailureInvalidatesSession) {
    ASSERT_TRUE(store_->save(make_valid_credential()).has_value());
    auto session = make_session();

    auto result = session->refresh();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::auth_refresh_failed);
    EXPECT_FALSE(session->is_authenticated());
    EXPECT_EQ(store_->removals(), 1);
}

TEST_F(AuthSessionTest, RefreshWithoutCredential) {
    auto session = make_session();

    auto result = session->refresh();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::auth_required);
    EXPECT_EQ(refresher_->calls(), 0);
}

TEST_F(AuthSessionTest, EstablishPersistsAndResetsCooldown) {
    auto session = make_session();

    ASSERT_TRUE(session->establish(make_valid_credential()).has_value());

    EXPECT_TRUE(session->is_valid());
    EXPECT_EQ(store_->saves(), 1);
}

TEST_F(AuthSessionTest, EstablishRejectsEmptyToken) {
    auto session = make_session();

    auto result = session->establish(credential{});

    ASSERT_FALSE(result.has_value());
    EXPECT_FALSE(session->is_authenticated());
}

TEST_F(AuthSessionTest, LogoutClearsMemoryAndStore) {
    ASSERT_TRUE(store_->save(make_valid_credential()).has_value());
    auto session = make_session();

    session->logout();

    EXPECT_FALSE(session->is_valid());
    EXPECT_FALSE(store_->stored().has_value());
}

TEST_F(AuthSessionTest, AuthenticatedProbeNeverRefreshes) {
    ASSERT_TRUE(store_->save(expired_credential()).has_value());
    auto session = make_session();

    EXPECT_TRUE(session->is_authenticated());
    EXPECT_EQ(refresher_->calls(), 0);
}

// =============================================================================
// oauth_token_refresher
// =============================================================================

class OAuthTokenRefresherTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<mock_http_client>();
        refresher_ = std::make_unique<oauth_token_refresher>(http_, clock_.as_function());
    }

    manual_clock clock_;
    std::shared_ptr<mock_http_client> http_;
    std::unique_ptr<oauth_token_refresher> refresher_;
};

TEST_F(OAuthTokenRefresherTest, PostsRefreshGrant) {
    http_->enqueue(200, R"({"access_token":"ya29.new","expires_in":3599,"token_type":"Bearer"})");

    auto result = refresher_->refresh(make_valid_credential());

    ASSERT_TRUE(result.has_value()) << result.error().message;
    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].url, "https://oauth2.googleapis.com/token");
    EXPECT_NE(requests[0].body.find("grant_type=refresh_token"), std::string::npos);
    EXPECT_NE(requests[0].body.find("client_id=client-id"), std::string::npos);
    EXPECT_EQ(requests[0].headers.at("Content-Type"), "application/x-www-form-urlencoded");

    EXPECT_EQ(result.value().access_token, "ya29.new");
    EXPECT_EQ(result.value().refresh_token, "1//refresh-token");
    ASSERT_TRUE(result.value().expires_at.has_value());
    EXPECT_EQ(*result.value().expires_at, clock_.now() + 3599s);
}

TEST_F(OAuthTokenRefresherTest, PicksUpRotatedRefreshToken) {
    http_->enqueue(200, R"({"access_token":"ya29.new","refresh_token":"1//rotated"})");

    auto result = refresher_->refresh(make_valid_credential());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().refresh_token, "1//rotated");
    EXPECT_FALSE(result.value().expires_at.has_value());
}

TEST_F(OAuthTokenRefresherTest, RejectedGrantFails) {
    http_->enqueue(400, R"({"error":"invalid_grant"})");

    auto result = refresher_->refresh(make_valid_credential());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::auth_refresh_failed);
    EXPECT_NE(result.error().message.find("invalid_grant"), std::string::npos);
}

TEST_F(OAuthTokenRefresherTest, TransportErrorFails) {
    http_->enqueue_transport_error("connection refused");

    auto result = refresher_->refresh(make_valid_credential());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::auth_refresh_failed);
}

TEST_F(OAuthTokenRefresherTest, MissingAccessTokenFails) {
    http_->enqueue(200, R"({"expires_in":3599})");

    auto result = refresher_->refresh(make_valid_credential());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::auth_refresh_failed);
}

TEST_F(OAuthTokenRefresherTest, NoRefreshTokenSendsNothing) {
    auto cred = make_valid_credential();
    cred.refresh_token.clear();

    auto result = refresher_->refresh(cred);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::auth_no_refresh_token);
    EXPECT_EQ(http_->request_count(), 0u);
}

}  // namespace media_upload::test
