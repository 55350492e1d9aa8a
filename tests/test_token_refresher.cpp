#include <gtest/gtest.h>

#include <atomic>
#include <deque>
#include <future>
#include <mutex>

#include "auth/credential_source.hpp"
#include "auth/jwt.hpp"
#include "auth/token_refresher.hpp"
#include "core/time_util.hpp"

using namespace kuberde;
using namespace kuberde::auth;
using std::chrono::milliseconds;

namespace {

// Plays back queued results; once drained it keeps answering with fresh short-lived tokens
class ScriptedSource : public CredentialSource {
 public:
  explicit ScriptedSource(milliseconds validity) : validity_(validity) {}

  void push_failure(ErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Result<Credential>::failure(code, "scripted failure"));
  }

  void fail_forever() {
    fail_forever_ = true;
  }

  Result<Credential> fetch() override {
    int n = ++calls_;
    if (fail_forever_) return Result<Credential>::failure(ErrorCode::Unavailable, "down");
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!script_.empty()) {
        auto next = script_.front();
        script_.pop_front();
        return next;
      }
    }
    Credential credential;
    credential.token = "token-" + std::to_string(n);
    credential.issued_at = std::chrono::system_clock::now();
    credential.expiry = credential.issued_at + validity_;
    return Result<Credential>::success(credential);
  }

  int calls() const {
    return calls_.load();
  }

 private:
  milliseconds validity_;
  std::mutex mutex_;
  std::deque<Result<Credential>> script_;
  std::atomic<int> calls_{0};
  std::atomic<bool> fail_forever_{false};
};

BackoffConfig fast_retry(int attempts) {
  return BackoffConfig{milliseconds(5), milliseconds(20), 2.0, attempts};
}

}  // namespace

// --- TokenRefresherTest ---

TEST(TokenRefresherTest, RefreshDelay) {
  Credential credential;
  credential.issued_at = from_unix_seconds(1000);
  credential.expiry = from_unix_seconds(1100);

  EXPECT_EQ(TokenRefresher::refresh_delay(credential, 0.8, from_unix_seconds(1000)), milliseconds(80000));
  EXPECT_EQ(TokenRefresher::refresh_delay(credential, 0.8, from_unix_seconds(1050)), milliseconds(30000));
  EXPECT_EQ(TokenRefresher::refresh_delay(credential, 0.8, from_unix_seconds(1200)), milliseconds(0));
}

TEST(TokenRefresherTest, InitialFetchRetriesTransientErrors) {
  auto source = std::make_shared<ScriptedSource>(std::chrono::hours(1));
  source->push_failure(ErrorCode::Unavailable);
  source->push_failure(ErrorCode::Timeout);

  TokenRefresher refresher(source, 0.8, fast_retry(5));
  ASSERT_TRUE(refresher.fetch_initial().ok());
  EXPECT_EQ(source->calls(), 3);
  EXPECT_EQ(refresher.token(), "token-3");
}

TEST(TokenRefresherTest, InitialFetchStopsOnUnauthorized) {
  auto source = std::make_shared<ScriptedSource>(std::chrono::hours(1));
  source->push_failure(ErrorCode::Unauthorized);

  TokenRefresher refresher(source, 0.8, fast_retry(5));
  EXPECT_EQ(refresher.fetch_initial().code, ErrorCode::Unauthorized);
  EXPECT_EQ(source->calls(), 1);
  EXPECT_EQ(refresher.token(), "");
}

TEST(TokenRefresherTest, InitialFetchGivesUp) {
  auto source = std::make_shared<ScriptedSource>(std::chrono::hours(1));
  source->fail_forever();

  TokenRefresher refresher(source, 0.8, fast_retry(2));
  EXPECT_EQ(refresher.fetch_initial().code, ErrorCode::Unavailable);
  EXPECT_EQ(source->calls(), 3);
}

TEST(TokenRefresherTest, RenewsBeforeExpiry) {
  auto source = std::make_shared<ScriptedSource>(milliseconds(200));
  TokenRefresher refresher(source, 0.5, fast_retry(3));
  ASSERT_TRUE(refresher.fetch_initial().ok());

  std::promise<std::string> refreshed;
  std::atomic<bool> once{false};
  refresher.start(
      [&](const Credential& credential) {
        if (!once.exchange(true)) refreshed.set_value(credential.token);
      },
      nullptr);

  auto future = refreshed.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(future.get(), "token-2");
  refresher.stop();
  EXPECT_NE(refresher.token(), "token-1");
}

TEST(TokenRefresherTest, RecoversAfterFailedRefresh) {
  auto source = std::make_shared<ScriptedSource>(milliseconds(100));
  TokenRefresher refresher(source, 0.5, fast_retry(3));
  ASSERT_TRUE(refresher.fetch_initial().ok());
  source->push_failure(ErrorCode::Unavailable);

  std::promise<std::string> refreshed;
  std::atomic<bool> once{false};
  refresher.start(
      [&](const Credential& credential) {
        if (!once.exchange(true)) refreshed.set_value(credential.token);
      },
      [](const Status&) { FAIL() << "refresh should recover"; });

  auto future = refreshed.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(future.get(), "token-3");
  refresher.stop();
}

TEST(TokenRefresherTest, FatalAfterRetryBudget) {
  auto source = std::make_shared<ScriptedSource>(milliseconds(50));
  TokenRefresher refresher(source, 0.5, fast_retry(2));
  ASSERT_TRUE(refresher.fetch_initial().ok());
  source->fail_forever();

  std::promise<ErrorCode> fatal;
  refresher.start(nullptr, [&fatal](const Status& status) { fatal.set_value(status.code); });

  auto future = fatal.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(future.get(), ErrorCode::Unavailable);
  // initial fetch, first attempt and two retries
  EXPECT_EQ(source->calls(), 4);
  refresher.stop();
}

TEST(TokenRefresherTest, StopInterruptsWait) {
  auto source = std::make_shared<ScriptedSource>(std::chrono::hours(1));
  TokenRefresher refresher(source, 0.8, fast_retry(3));
  ASSERT_TRUE(refresher.fetch_initial().ok());
  refresher.start(nullptr, nullptr);

  auto started = std::chrono::steady_clock::now();
  refresher.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
  EXPECT_EQ(source->calls(), 1);
}

// --- CredentialSourceTest ---

TEST(CredentialSourceTest, StaticTokenExpiry) {
  Timestamp now = from_unix_seconds(1740823200);
  Clock clock = [&now] { return now; };

  Claims claims;
  claims.subject = "agent";
  claims.issued_at = now;
  claims.expiry = now + std::chrono::minutes(10);
  auto jwt = sign_hs256(claims, "k");

  StaticTokenSource source(jwt, clock);
  auto credential = source.fetch();
  ASSERT_TRUE(credential.ok());
  EXPECT_EQ(credential.value->expiry, claims.expiry);
  EXPECT_EQ(peek_expiry(jwt).value(), claims.expiry);

  now += std::chrono::minutes(11);
  EXPECT_EQ(source.fetch().code(), ErrorCode::Expired);
}

TEST(CredentialSourceTest, OpaqueStaticToken) {
  Timestamp now = from_unix_seconds(1740823200);
  StaticTokenSource source("opaque", [now] { return now; });
  auto credential = source.fetch();
  ASSERT_TRUE(credential.ok());
  EXPECT_EQ(credential.value->expiry, now + std::chrono::hours(24));
  EXPECT_FALSE(peek_expiry("opaque").has_value());

  EXPECT_EQ(StaticTokenSource("").fetch().code(), ErrorCode::Unauthorized);
}

TEST(CredentialSourceTest, Selection) {
  EXPECT_EQ(make_credential_source(nullptr, "", "", "", "").code(), ErrorCode::InvalidArgument);

  auto static_source = make_credential_source(nullptr, "", "", "", "tok");
  ASSERT_TRUE(static_source.ok());
  EXPECT_NE(dynamic_cast<StaticTokenSource*>(static_source.value->get()), nullptr);

  auto grant = make_credential_source(nullptr, "http://idp/token", "agent", "secret", "tok");
  ASSERT_TRUE(grant.ok());
  EXPECT_NE(dynamic_cast<ClientCredentialsSource*>(grant.value->get()), nullptr);
}
