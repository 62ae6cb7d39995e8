#include <catch2/catch_all.hpp>

#include <map>

#include "authpx/token-fetcher.hpp"
#include "manual-clock.hpp"

using namespace authpx;
using namespace std::chrono_literals;

namespace
{

std::map<std::string, std::string> parseForm(std::string const& body)
{
    std::map<std::string, std::string> params;
    std::string::size_type begin = 0;
    while (begin < body.size()) {
        auto end = body.find('&', begin);
        if (end == std::string::npos)
            end = body.size();
        auto pair = body.substr(begin, end - begin);
        auto eq = pair.find('=');
        params[pair.substr(0, eq)] = eq == std::string::npos ? "" : pair.substr(eq + 1);
        begin = end + 1;
    }
    return params;
}

pxhttp::IHttpClient::Result reply(int status, std::string content)
{
    pxhttp::IHttpClient::Result result;
    result.status = status;
    result.content = std::move(content);
    return result;
}

OAuth2TokenFetcher::Options defaultOptions()
{
    OAuth2TokenFetcher::Options options;
    options.tokenUrl = "https://login.example.com/token";
    options.clientId = "proxy-client";
    options.clientSecret = "s3cr3t&value";
    options.scope = "openid";
    return options;
}

}

TEST_CASE("Token request carries the client credentials grant", "[token-fetcher]") {
    ManualClock clock;
    pxhttp::MockHttpClient client;

    std::string requestedUri;
    std::string requestBody;
    std::string contentType;
    pxhttp::Config requestConf;
    client.postFun = [&](std::string_view uri, pxhttp::OptionalBodyAndContentType const& body, pxhttp::Config const& config) {
        requestedUri = std::string(uri);
        requestBody = body->body;
        contentType = body->contentType;
        requestConf = config;
        return reply(200, R"({"access_token":"tok-1","token_type":"Bearer","expires_in":300})");
    };

    SECTION("client_secret_post") {
        auto options = defaultOptions();
        options.audience = "https://api.example.com";
        OAuth2TokenFetcher fetcher(options, client, clock);

        auto token = fetcher.fetch();
        REQUIRE(token.value == "tok-1");
        REQUIRE(requestedUri == "https://login.example.com/token");
        REQUIRE(contentType == "application/x-www-form-urlencoded");
        REQUIRE(requestBody.rfind("grant_type=client_credentials", 0) == 0);

        auto params = parseForm(requestBody);
        REQUIRE(params["client_id"] == "proxy-client");
        REQUIRE(params["client_secret"] == "s3cr3t%26value");
        REQUIRE(params["scope"] == "openid");
        REQUIRE(params["audience"] == "https%3A%2F%2Fapi.example.com");
        REQUIRE(requestConf.headers.count("Authorization") == 0);
    }

    SECTION("client_secret_basic") {
        auto options = defaultOptions();
        options.clientAuth = OAuth2TokenFetcher::ClientAuth::Basic;
        options.scope.clear();
        OAuth2TokenFetcher fetcher(options, client, clock);

        fetcher.fetch();
        auto params = parseForm(requestBody);
        REQUIRE(params.count("client_id") == 0);
        REQUIRE(params.count("client_secret") == 0);
        REQUIRE(params.count("scope") == 0);

        auto auth = requestConf.headers.find("Authorization");
        REQUIRE(auth != requestConf.headers.end());
        REQUIRE(auth->second.rfind("Basic ", 0) == 0);
    }

    SECTION("Configured HTTP headers are kept") {
        auto options = defaultOptions();
        options.httpConfig.headers.emplace("X-Trace", "1");
        OAuth2TokenFetcher fetcher(options, client, clock);

        fetcher.fetch();
        REQUIRE(requestConf.headers.find("X-Trace")->second == "1");
    }
}

TEST_CASE("Token expiry accounts for the margin", "[token-fetcher]") {
    ManualClock clock;
    pxhttp::MockHttpClient client;
    std::string response;
    client.postFun = [&](std::string_view, pxhttp::OptionalBodyAndContentType const&, pxhttp::Config const&) {
        return reply(200, response);
    };

    auto options = defaultOptions();
    options.expiryMargin = 20s;
    OAuth2TokenFetcher fetcher(options, client, clock);

    SECTION("Regular lifetime") {
        response = R"({"access_token":"tok","expires_in":300})";
        auto token = fetcher.fetch();
        REQUIRE(token.expiresAt == clock.now() + 280s);
        REQUIRE(token.isValidAt(clock.now() + 279s));
        REQUIRE_FALSE(token.isValidAt(clock.now() + 280s));
    }

    SECTION("Lifetime as string") {
        response = R"({"access_token":"tok","expires_in":"120"})";
        REQUIRE(fetcher.fetch().expiresAt == clock.now() + 100s);
    }

    SECTION("Lifetime below the margin") {
        response = R"({"access_token":"tok","expires_in":10})";
        auto token = fetcher.fetch();
        REQUIRE(token.expiresAt == clock.now());
        REQUIRE_FALSE(token.isValidAt(clock.now()));
    }

    SECTION("Negative lifetime") {
        response = R"({"access_token":"tok","expires_in":-5})";
        REQUIRE(fetcher.fetch().expiresAt == clock.now());
    }

    SECTION("Lifetime beyond the clock range") {
        response = R"({"access_token":"tok","expires_in":9300000000})";
        auto token = fetcher.fetch();
        REQUIRE(token.expiresAt == clock.now() + 24h * 365 - 20s);
        REQUIRE(token.isValidAt(clock.now() + 24h * 364));
    }
}

TEST_CASE("Token endpoint failures are classified", "[token-fetcher]") {
    ManualClock clock;
    pxhttp::MockHttpClient client;
    pxhttp::IHttpClient::Result result;
    client.postFun = [&](std::string_view, pxhttp::OptionalBodyAndContentType const&, pxhttp::Config const&) {
        return result;
    };
    OAuth2TokenFetcher fetcher(defaultOptions(), client, clock);

    auto expectFailure = [&](FetchError::Kind kind, int status) {
        try {
            fetcher.fetch();
            FAIL("fetch() did not throw");
        }
        catch (FetchError const& e) {
            REQUIRE(e.kind == kind);
            REQUIRE(e.status == status);
            REQUIRE(std::string(e.what()).find("s3cr3t") == std::string::npos);
        }
    };

    SECTION("Transport failure") {
        result.error = "Could not establish connection";
        expectFailure(FetchError::Kind::Network, 0);
    }

    SECTION("Rejected credentials") {
        result = reply(401, R"({"error":"invalid_client"})");
        expectFailure(FetchError::Kind::Unauthorized, 401);
    }

    SECTION("Rejected credentials with status 400") {
        result = reply(400, R"({"error":"unauthorized_client","error_description":"nope"})");
        expectFailure(FetchError::Kind::Unauthorized, 400);
    }

    SECTION("Other client errors") {
        result = reply(400, R"({"error":"invalid_scope"})");
        expectFailure(FetchError::Kind::Network, 400);
    }

    SECTION("Server errors") {
        result = reply(503, "<html>maintenance</html>");
        expectFailure(FetchError::Kind::Network, 503);
    }

    SECTION("Body is not JSON") {
        result = reply(200, "{not json");
        expectFailure(FetchError::Kind::MalformedResponse, 200);
    }

    SECTION("Body is not an object") {
        result = reply(200, R"(["tok"])");
        expectFailure(FetchError::Kind::MalformedResponse, 200);
    }

    SECTION("access_token missing") {
        result = reply(200, R"({"token_type":"Bearer","expires_in":300})");
        expectFailure(FetchError::Kind::MalformedResponse, 200);
    }

    SECTION("access_token empty") {
        result = reply(200, R"({"access_token":"","expires_in":300})");
        expectFailure(FetchError::Kind::MalformedResponse, 200);
    }

    SECTION("expires_in missing") {
        result = reply(200, R"({"access_token":"tok"})");
        expectFailure(FetchError::Kind::MalformedResponse, 200);
    }

    SECTION("expires_in not a number") {
        result = reply(200, R"({"access_token":"tok","expires_in":"soon"})");
        expectFailure(FetchError::Kind::MalformedResponse, 200);
    }
}

TEST_CASE("Each fetch is a single exchange", "[token-fetcher]") {
    ManualClock clock;
    pxhttp::MockHttpClient client;
    int calls = 0;
    client.postFun = [&](std::string_view, pxhttp::OptionalBodyAndContentType const&, pxhttp::Config const&) {
        ++calls;
        return reply(500, "");
    };
    OAuth2TokenFetcher fetcher(defaultOptions(), client, clock);

    REQUIRE_THROWS_AS(fetcher.fetch(), FetchError);
    REQUIRE(calls == 1);
}
