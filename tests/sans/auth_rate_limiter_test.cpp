#include "sans/auth_rate_limiter.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace sans {
namespace {

using test::make_response;
using test::quota_headers;

HttpResponse session_response(const std::string& token, const std::string& pin) {
    auto headers = quota_headers("40", "30");
    headers.emplace("X-Autologin", token);
    headers.emplace("X-Pin", pin);
    return make_response(200, headers);
}

TEST(AuthRateLimiterTest, SendsPasswordWithoutSession) {
    AuthRateLimiter limiter("testlandia", "hunter2");

    auto fields = limiter.prepare_request();
    EXPECT_EQ(find_header(fields, "X-Password"), "hunter2");
    EXPECT_FALSE(find_header(fields, "X-Autologin").has_value());
    EXPECT_FALSE(find_header(fields, "X-Pin").has_value());
    EXPECT_FALSE(limiter.has_session());
}

TEST(AuthRateLimiterTest, IssuedTokenReplacesPassword) {
    AuthRateLimiter limiter("testlandia", "hunter2");
    limiter.observe(session_response("autologin-token", "1234"));

    auto fields = limiter.prepare_request();
    EXPECT_FALSE(find_header(fields, "X-Password").has_value());
    EXPECT_EQ(find_header(fields, "X-Autologin"), "autologin-token");
    EXPECT_EQ(find_header(fields, "X-Pin"), "1234");
    EXPECT_EQ(limiter.autologin(), "autologin-token");
}

TEST(AuthRateLimiterTest, TokenPersistsAcrossResponsesWithoutOne) {
    AuthRateLimiter limiter("testlandia", "hunter2");
    limiter.observe(session_response("autologin-token", "1234"));
    limiter.observe(make_response(200, quota_headers("39", "30")));

    auto fields = limiter.prepare_request();
    EXPECT_FALSE(find_header(fields, "X-Password").has_value());
    EXPECT_EQ(find_header(fields, "X-Autologin"), "autologin-token");
}

TEST(AuthRateLimiterTest, InvalidateRestoresPassword) {
    AuthRateLimiter limiter("testlandia", "hunter2");
    limiter.observe(session_response("autologin-token", "1234"));
    limiter.invalidate();

    auto fields = limiter.prepare_request();
    EXPECT_EQ(find_header(fields, "X-Password"), "hunter2");
    EXPECT_FALSE(find_header(fields, "X-Autologin").has_value());
    EXPECT_FALSE(find_header(fields, "X-Pin").has_value());
}

TEST(AuthRateLimiterTest, RejectionInvalidatesAndSignals) {
    AuthRateLimiter limiter("testlandia", "hunter2");
    limiter.observe(session_response("stale-token", "1234"));

    std::vector<LimiterSignal> signals;
    limiter.set_signal_callback([&signals](const LimiterSignal& signal) { signals.push_back(signal); });

    EXPECT_EQ(find_header(limiter.prepare_request(), "X-Autologin"), "stale-token");
    limiter.observe(make_response(403, quota_headers("38", "30")));

    EXPECT_FALSE(limiter.has_session());
    ASSERT_EQ(signals.size(), 1u);
    EXPECT_EQ(signals[0].kind, SignalKind::AUTH_REJECTED);
    EXPECT_EQ(signals[0].detail, "testlandia");
    EXPECT_EQ(find_header(limiter.prepare_request(), "X-Password"), "hunter2");
}

TEST(AuthRateLimiterTest, ForbiddenWithoutCredentialIsNotARejection) {
    AuthRateLimiter limiter("", "");

    std::vector<SignalKind> kinds;
    limiter.set_signal_callback([&kinds](const LimiterSignal& signal) { kinds.push_back(signal.kind); });

    EXPECT_TRUE(limiter.prepare_request().empty());
    limiter.observe(make_response(403, quota_headers("38", "30")));

    EXPECT_TRUE(kinds.empty());
    EXPECT_EQ(limiter.quota()->remaining, 38);
}

TEST(AuthRateLimiterTest, RejectionCountsOnlyForThePreparedRequest) {
    AuthRateLimiter limiter("testlandia", "hunter2");

    std::vector<SignalKind> kinds;
    limiter.set_signal_callback([&kinds](const LimiterSignal& signal) { kinds.push_back(signal.kind); });

    limiter.prepare_request();
    limiter.observe(make_response(200, session_response("autologin-token", "1234").headers));
    ASSERT_TRUE(limiter.has_session());

    // No request was prepared since the last response, so nothing was sent to reject
    limiter.observe(make_response(403, quota_headers("37", "30")));
    EXPECT_TRUE(kinds.empty());
    EXPECT_TRUE(limiter.has_session());
}

TEST(AuthRateLimiterTest, ThrottlingKeepsSession) {
    AuthRateLimiter limiter("testlandia", "hunter2");
    limiter.observe(session_response("autologin-token", "1234"));

    std::vector<SignalKind> kinds;
    limiter.set_signal_callback([&kinds](const LimiterSignal& signal) { kinds.push_back(signal.kind); });

    auto headers = quota_headers("0", "30");
    headers.emplace("Retry-After", "5");
    limiter.observe(make_response(429, headers));

    EXPECT_TRUE(limiter.has_session());
    ASSERT_EQ(kinds.size(), 1u);
    EXPECT_EQ(kinds[0], SignalKind::THROTTLED);
}

TEST(AuthRateLimiterTest, FailedResponseDoesNotCacheToken) {
    AuthRateLimiter limiter("testlandia", "hunter2");
    auto headers = quota_headers("40", "30");
    headers.emplace("X-Autologin", "bogus");
    limiter.observe(make_response(500, headers));

    EXPECT_FALSE(limiter.has_session());
}

TEST(AuthRateLimiterTest, ResumesFromSavedSession) {
    Credential credential{"testlandia", "", "saved-token", std::nullopt};
    AuthRateLimiter limiter(credential);

    auto fields = limiter.prepare_request();
    EXPECT_EQ(find_header(fields, "X-Autologin"), "saved-token");
    EXPECT_FALSE(find_header(fields, "X-Password").has_value());
    EXPECT_EQ(limiter.identity(), "testlandia");
}

TEST(AuthRateLimiterTest, ResetCredentialDropsSession) {
    AuthRateLimiter limiter("", "");
    EXPECT_TRUE(limiter.prepare_request().empty());

    limiter.observe(session_response("autologin-token", "1234"));
    limiter.reset_credential("testlandia", "hunter2");

    EXPECT_FALSE(limiter.has_session());
    EXPECT_EQ(limiter.identity(), "testlandia");
    EXPECT_EQ(find_header(limiter.prepare_request(), "X-Password"), "hunter2");
}

TEST(AuthRateLimiterTest, CustomHeaderNames) {
    CredentialHeaders names{"X-Secret", "X-Session", "X-Session-Pin"};
    AuthRateLimiter limiter("testlandia", "hunter2", {}, names);
    EXPECT_EQ(find_header(limiter.prepare_request(), "X-Secret"), "hunter2");

    auto headers = quota_headers("40", "30");
    headers.emplace("X-Session", "abc");
    limiter.observe(make_response(200, headers));
    EXPECT_EQ(find_header(limiter.prepare_request(), "X-Session"), "abc");
}

TEST(AuthRateLimiterTest, StillPacesLikeBaseLimiter) {
    AuthRateLimiter limiter("testlandia", "hunter2");
    auto observed_at = Clock::now();
    limiter.observe(make_response(200, quota_headers("0", "0.2")));

    auto permit = limiter.acquire();
    EXPECT_GE(permit.granted_at() - observed_at, std::chrono::milliseconds(200));
}

}  // namespace
}  // namespace sans
