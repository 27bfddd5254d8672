#include "sans/client.hpp"

#include "sans/auth_rate_limiter.hpp"
#include "sans/event_loop.hpp"
#include "sans/exceptions.hpp"
#include "sans/url.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

namespace sans {
namespace {

using namespace std::chrono_literals;
using test::FakeTransport;
using test::make_response;
using test::quota_headers;

class ClientTest : public ::testing::Test {
protected:
    ClientConfig config(const std::string& agent = "Testlandia") {
        ClientConfig c;
        c.user_agent = agent;
        return c;
    }

    std::shared_ptr<FakeTransport> transport_ = std::make_shared<FakeTransport>();
    RateLimiter limiter_;
};

TEST_F(ClientTest, RequiresUserAgent) {
    Client client(config(""), limiter_, transport_);

    EXPECT_THROW(client.send(nation("testlandia")), AgentNotSetException);
    EXPECT_TRUE(transport_->requests().empty());

    // The failed attempt must not keep the limiter busy
    EXPECT_TRUE(limiter_.try_acquire_for(1s).has_value());
}

TEST_F(ClientTest, DecoratesUserAgent) {
    Client client(config(), limiter_, transport_);
    client.send(nation("testlandia"));

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(find_header(requests[0].headers, "User-Agent"), std::string("Testlandia sans/") + kVersion);
    EXPECT_EQ(client.user_agent(), requests[0].headers.at("User-Agent"));
}

TEST_F(ClientTest, ApiResponsesUpdateQuota) {
    Client client(config(), limiter_, transport_);
    transport_->push(make_response(200, quota_headers("7", "30")));

    auto response = client.send(world({"numnations"}));

    EXPECT_EQ(response.status_code, 200);
    ASSERT_TRUE(limiter_.quota().has_value());
    EXPECT_EQ(limiter_.quota()->remaining, 7);
    EXPECT_EQ(limiter_.waiting(), 0u);
}

TEST_F(ClientTest, DumpsBypassTheLimiter) {
    Client client(config(), limiter_, transport_);

    // Holding the only permit would block any paced request
    auto gate = limiter_.acquire();
    auto response = client.send(nations_dump());

    EXPECT_EQ(response.status_code, 200);
    EXPECT_FALSE(limiter_.quota().has_value());
    ASSERT_EQ(transport_->requests().size(), 1u);
    EXPECT_TRUE(transport_->requests()[0].headers.contains("User-Agent"));
}

TEST_F(ClientTest, ApiRequestsWaitForQuotaReset) {
    Client client(config(), limiter_, transport_);
    transport_->push(make_response(200, quota_headers("0", "0.2")));

    client.send(world({"numnations"}));
    auto after_first = Clock::now();
    client.send(world({"numnations"}));

    EXPECT_GE(Clock::now() - after_first, 190ms);
    EXPECT_EQ(transport_->requests().size(), 2u);
}

TEST_F(ClientTest, CredentialsSwitchGetToPost) {
    Client client(config(), limiter_, transport_);
    AuthRateLimiter auth("testlandia", "hunter2");

    client.send(nation("testlandia", {"notices"}), auth);

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(find_header(requests[0].headers, "X-Password"), "hunter2");
}

TEST_F(ClientTest, UnauthenticatedRequestsStayGet) {
    Client client(config(), limiter_, transport_);
    client.send(nation("testlandia", {"name"}));

    EXPECT_EQ(transport_->requests()[0].method, "GET");
    EXPECT_FALSE(transport_->requests()[0].headers.contains("X-Password"));
}

TEST_F(ClientTest, IssuedTokenUsedOnNextRequest) {
    Client client(config(), limiter_, transport_);
    AuthRateLimiter auth("testlandia", "hunter2");

    auto headers = quota_headers("40", "30");
    headers.emplace("X-Autologin", "autologin-token");
    headers.emplace("X-Pin", "98765");
    transport_->push(make_response(200, headers));

    client.send(nation("testlandia", {"ping"}), auth);
    client.send(nation("testlandia", {"notices"}), auth);

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_FALSE(requests[1].headers.contains("X-Password"));
    EXPECT_EQ(find_header(requests[1].headers, "X-Autologin"), "autologin-token");
    EXPECT_EQ(find_header(requests[1].headers, "X-Pin"), "98765");
}

TEST_F(ClientTest, RejectedCredentialRaisesAndClearsSession) {
    Client client(config(), limiter_, transport_);
    AuthRateLimiter auth(Credential{"testlandia", "hunter2", "stale-token", "1111"});

    transport_->push(make_response(403, quota_headers("40", "30")));

    EXPECT_THROW(client.send(nation("testlandia", {"notices"}), auth), AuthRejectedException);
    EXPECT_FALSE(auth.has_session());

    // Next attempt falls back to the password
    client.send(nation("testlandia", {"notices"}), auth);
    EXPECT_EQ(find_header(transport_->requests().back().headers, "X-Password"), "hunter2");
}

TEST_F(ClientTest, ForbiddenWithoutCredentialsIsReturned) {
    Client client(config(), limiter_, transport_);
    transport_->push(make_response(403, quota_headers("40", "30")));

    auto response = client.send(nation("testlandia", {"notices"}));
    EXPECT_EQ(response.status_code, 403);
    EXPECT_THROW(response.raise_for_status(), ForbiddenException);
}

TEST_F(ClientTest, StaticCredentialPacedByClientLimiter) {
    Client client(config(), limiter_, transport_);
    StaticCredential password("hunter2");
    transport_->push(make_response(200, quota_headers("12", "30")));

    client.send(nation("testlandia", {"notices"}), client.limiter(), password);

    EXPECT_EQ(find_header(transport_->requests()[0].headers, "X-Password"), "hunter2");
    EXPECT_EQ(limiter_.quota()->remaining, 12);
}

TEST_F(ClientTest, TransportFailureReleasesPermit) {
    Client client(config(), limiter_, transport_);
    transport_->push_failure(std::make_exception_ptr(TransportException("connection refused")));

    EXPECT_THROW(client.send(world({"numnations"})), TransportException);
    EXPECT_TRUE(limiter_.try_acquire_for(1s).has_value());
}

TEST_F(ClientTest, SendAsyncOnEventLoop) {
    Client client(config(), limiter_, transport_);
    EventLoop loop;
    transport_->push(make_response(200, quota_headers("20", "30"), "<NATION/>"));

    auto response = loop.run_until_complete(client.send_async(nation("testlandia"), loop));

    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, "<NATION/>");
    EXPECT_EQ(limiter_.quota()->remaining, 20);
}

TEST_F(ClientTest, SendAsyncWithCredentials) {
    Client client(config(), limiter_, transport_);
    AuthRateLimiter auth("testlandia", "hunter2");
    EventLoop loop;

    transport_->push(make_response(403, quota_headers("20", "30")));

    EXPECT_THROW(
        loop.run_until_complete(client.send_async(nation("testlandia", {"notices"}), loop, auth)),
        AuthRejectedException
    );
    EXPECT_EQ(transport_->requests()[0].method, "POST");
}

TEST_F(ClientTest, IsApiRequestIgnoresQuery) {
    Client client(config(), limiter_, transport_);
    EXPECT_TRUE(client.is_api_request(nation("testlandia")));
    EXPECT_TRUE(client.is_api_request(world()));
    EXPECT_FALSE(client.is_api_request(regions_dump()));
}

}  // namespace
}  // namespace sans
