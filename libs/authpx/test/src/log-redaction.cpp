#include <catch2/catch_all.hpp>

#include <algorithm>
#include <deque>
#include <sstream>

#include "spdlog/sinks/ostream_sink.h"

#include "authpx/proxy-service.hpp"
#include "manual-clock.hpp"

using namespace authpx;

namespace
{

constexpr auto CLIENT_SECRET = "log-secret-value-5678";

/**
 * Records everything the process logger writes while in scope,
 * at trace level.
 */
class LogCapture
{
public:
    LogCapture()
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_))
        , level_(pxhttp::log().level())
    {
        pxhttp::log().sinks().push_back(sink_);
        pxhttp::log().set_level(spdlog::level::trace);
    }

    ~LogCapture()
    {
        auto& sinks = pxhttp::log().sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        pxhttp::log().set_level(level_);
    }

    std::string text()
    {
        pxhttp::log().flush();
        return stream_.str();
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum level_;
};

}

TEST_CASE("Credentials never reach the log", "[log-redaction]") {
    auto clientAuth = GENERATE(OAuth2TokenFetcher::ClientAuth::Post, OAuth2TokenFetcher::ClientAuth::Basic);

    LogCapture capture;
    ManualClock clock;

    int tokenRequests = 0;
    bool tokenFailure = false;
    std::deque<int> upstreamStatuses;

    auto mock = std::make_unique<pxhttp::MockHttpClient>();
    mock->postFun = [&](std::string_view, pxhttp::OptionalBodyAndContentType const&, pxhttp::Config const&) {
        pxhttp::IHttpClient::Result result;
        auto number = ++tokenRequests;
        if (tokenFailure) {
            result.status = 401;
            result.content = std::string(R"({"error":"invalid_client","error_description":"secret )")
                + CLIENT_SECRET + R"( is not valid"})";
            return result;
        }
        result.status = 200;
        result.content = R"({"access_token":"token-)" + std::to_string(number) + R"(","expires_in":300})";
        return result;
    };
    mock->sendFun = [&](pxhttp::IHttpClient::Request const&) {
        pxhttp::IHttpClient::Result result;
        result.status = 200;
        if (!upstreamStatuses.empty()) {
            result.status = upstreamStatuses.front();
            upstreamStatuses.pop_front();
        }
        result.content = R"({"height":812345})";
        result.headers.emplace("Content-Type", "application/json");
        return result;
    };

    ProxySettings settings;
    settings.upstream = "https://esplora.example.com/api";
    settings.tokenUrl = "https://login.example.com/token";
    settings.clientId = "proxy-client";
    settings.clientSecret = CLIENT_SECRET;
    settings.clientAuth = clientAuth;
    settings.dumpBodyBytes = 64;
    ProxyService service(settings, std::move(mock), clock);

    InboundRequest inbound;
    inbound.method = "GET";
    inbound.target = "/blocks/tip/height";
    inbound.headers.emplace("Accept", "application/json");

    SECTION("Failed token fetch") {
        tokenFailure = true;
        auto response = service.handle(inbound);
        REQUIRE(response);
        REQUIRE(response->status == 503);
    }

    SECTION("Forwarded request") {
        auto response = service.handle(inbound);
        REQUIRE(response);
        REQUIRE(response->status == 200);
        REQUIRE(tokenRequests == 1);
    }

    SECTION("Rejected token is refreshed") {
        upstreamStatuses = {401};
        auto response = service.handle(inbound);
        REQUIRE(response);
        REQUIRE(response->status == 200);
        REQUIRE(tokenRequests == 2);
    }

    auto text = capture.text();
    REQUIRE_FALSE(text.empty());
    REQUIRE(text.find(CLIENT_SECRET) == std::string::npos);
    for (auto number = 1; number <= tokenRequests; ++number)
        REQUIRE(text.find("token-" + std::to_string(number)) == std::string::npos);
}
