#include "token-fetcher.hpp"

#include <algorithm>

#include <stx/format.h>
#include "yaml-cpp/yaml.h"

using namespace std::chrono;

namespace authpx
{

namespace
{

constexpr auto GRANT_TYPE_CLIENT_CREDENTIALS = "client_credentials";
constexpr auto FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";

/**
 * Upper bound for announced token lifetimes. Keeps `expires_in` values
 * far beyond any real token within the range of the clock.
 */
constexpr long long MAX_LIFETIME_SECS = 365LL * 24 * 60 * 60;

/**
 * Read the OAuth2 `error` code (RFC 6749 §5.2) of an error response,
 * or an empty string if the body does not carry one.
 */
std::string oauthErrorCode(std::string const& content)
{
    try {
        auto node = YAML::Load(content);
        if (node.IsMap()) {
            if (auto error = node["error"])
                return error.as<std::string>();
        }
    }
    catch (YAML::Exception const&) {
        // Not an OAuth2 error document.
    }
    return {};
}

FetchError::Kind classifyStatus(int status, std::string const& errorCode)
{
    if (status == 401 || status == 403)
        return FetchError::Kind::Unauthorized;
    if (status == 400 && (errorCode == "invalid_client" || errorCode == "unauthorized_client"))
        return FetchError::Kind::Unauthorized;
    return FetchError::Kind::Network;
}

}

OAuth2TokenFetcher::OAuth2TokenFetcher(Options options,
                                       pxhttp::IHttpClient& client,
                                       IClock const& clock)
    : options_(std::move(options))
    , client_(client)
    , clock_(clock)
{}

std::string OAuth2TokenFetcher::buildRequestBody() const
{
    using pxhttp::URIComponents;

    std::string body = std::string("grant_type=") + GRANT_TYPE_CLIENT_CREDENTIALS;
    if (options_.clientAuth == ClientAuth::Post) {
        body += "&client_id=" + URIComponents::encode(options_.clientId);
        body += "&client_secret=" + URIComponents::encode(options_.clientSecret);
    }
    if (!options_.scope.empty())
        body += "&scope=" + URIComponents::encode(options_.scope);
    if (!options_.audience.empty())
        body += "&audience=" + URIComponents::encode(options_.audience);
    return body;
}

AccessToken OAuth2TokenFetcher::fetch()
{
    using pxhttp::log;
    using pxhttp::logRuntimeError;

    auto requestConf = options_.httpConfig;
    if (options_.clientAuth == ClientAuth::Basic) {
        requestConf.headers.insert(httplib::make_basic_authentication_header(
            pxhttp::URIComponents::encode(options_.clientId),
            pxhttp::URIComponents::encode(options_.clientSecret)));
    }

    log().debug("[OAuth2] Requesting token: url={}, client_id={}", options_.tokenUrl, options_.clientId);

    pxhttp::IHttpClient::Result res;
    try {
        res = client_.post(
            options_.tokenUrl,
            pxhttp::BodyAndContentType{buildRequestBody(), FORM_CONTENT_TYPE},
            requestConf);
    }
    catch (pxhttp::URIError const& e) {
        throw logRuntimeError<FetchError>(
            stx::format("[OAuth2] Invalid token endpoint URL: {}", e.what()),
            FetchError::Kind::Network, 0);
    }

    if (res.status == 0) {
        throw logRuntimeError<FetchError>(
            stx::format("[OAuth2] Token endpoint unreachable: {}", res.error),
            FetchError::Kind::Network, 0);
    }

    if (res.status < 200 || res.status >= 300) {
        auto errorCode = oauthErrorCode(res.content);
        auto kind = classifyStatus(res.status, errorCode);
        throw logRuntimeError<FetchError>(
            stx::format("[OAuth2] Token endpoint returned status {} ({}).",
                res.status, errorCode.empty() ? std::string("no error code") : errorCode),
            kind, res.status);
    }

    log().debug("[OAuth2] Token endpoint response: status={}, body_size={}", res.status, res.content.size());

    std::string accessToken;
    long long expiresIn = 0;
    try {
        auto json = YAML::Load(res.content);
        if (!json.IsMap())
            throw logRuntimeError<FetchError>(
                "[OAuth2] Token response is not a JSON object.",
                FetchError::Kind::MalformedResponse, res.status);

        if (auto accessTokenNode = json["access_token"])
            accessToken = accessTokenNode.as<std::string>();
        if (accessToken.empty())
            throw logRuntimeError<FetchError>(
                "[OAuth2] access_token missing in token response.",
                FetchError::Kind::MalformedResponse, res.status);

        auto expiresInNode = json["expires_in"];
        if (!expiresInNode)
            throw logRuntimeError<FetchError>(
                "[OAuth2] expires_in missing in token response.",
                FetchError::Kind::MalformedResponse, res.status);
        expiresIn = expiresInNode.as<long long>();
    }
    catch (YAML::Exception const& e) {
        throw logRuntimeError<FetchError>(
            stx::format("[OAuth2] Could not parse token response: {}", e.msg),
            FetchError::Kind::MalformedResponse, res.status);
    }

    // A lifetime which does not exceed the margin yields a token that is
    // already due for renewal: the next caller fetches again.
    auto lifetime = std::max(seconds(std::clamp(expiresIn, 0LL, MAX_LIFETIME_SECS)) - options_.expiryMargin, seconds::zero());
    auto now = clock_.now();
    AccessToken token{std::move(accessToken), now + duration_cast<IClock::duration>(lifetime)};

    log().debug("[OAuth2] Token minted, valid for {}s.", duration_cast<seconds>(token.expiresAt - now).count());
    return token;
}

}
