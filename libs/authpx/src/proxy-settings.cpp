#include "proxy-settings.hpp"
#include "upstream-target.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <tuple>

#include "stx/format.h"
#include "yaml-cpp/yaml.h"

namespace authpx
{

using pxhttp::log;
using pxhttp::logRuntimeError;

namespace
{

std::string getEnvSafe(char const* env)
{
    auto value = std::getenv(env);
    if (value)
        return std::string(value);
    return std::string();
}

std::size_t parseCount(std::string const& value, char const* what)
{
    try {
        std::size_t consumed = 0;
        auto result = std::stoull(value, &consumed);
        if (consumed != value.size())
            throw std::invalid_argument(value);
        return static_cast<std::size_t>(result);
    }
    catch (std::exception const&) {
        throw logRuntimeError<ConfigError>(stx::format("[ProxySettings] Invalid value '{}' for {}.", value, what));
    }
}

OAuth2TokenFetcher::ClientAuth parseClientAuth(std::string const& value)
{
    if (value == "post" || value == "client_secret_post")
        return OAuth2TokenFetcher::ClientAuth::Post;
    if (value == "basic" || value == "client_secret_basic")
        return OAuth2TokenFetcher::ClientAuth::Basic;
    throw logRuntimeError<ConfigError>(
        stx::format("[ProxySettings] Unknown oauth2.client-auth '{}', expected 'post' or 'basic'.", value));
}

std::chrono::seconds nonNegativeSeconds(YAML::Node const& node, char const* what)
{
    auto value = node.as<long long>();
    if (value < 0)
        throw logRuntimeError<ConfigError>(stx::format("[ProxySettings] {} must not be negative.", what));
    return std::chrono::seconds(value);
}

}

ProxySettings ProxySettings::fromYaml(std::string const& yaml)
{
    ProxySettings settings;
    try {
        auto document = YAML::Load(yaml);
        if (!document || document.IsNull())
            return settings;
        if (!document.IsMap())
            throw logRuntimeError<ConfigError>("[ProxySettings] Settings document must be a YAML map.");

        if (auto node = document["upstream"])
            settings.upstream = node.as<std::string>();
        if (auto node = document["bind"])
            std::tie(settings.bindHost, settings.bindPort) = parseBindAddress(node.as<std::string>());
        if (auto node = document["threads"])
            settings.threads = node.as<std::size_t>();
        if (auto node = document["log-level"])
            settings.logLevel = node.as<std::string>();
        if (auto node = document["dump-body-bytes"])
            settings.dumpBodyBytes = node.as<std::size_t>();

        if (auto oauth2 = document["oauth2"]) {
            if (auto node = oauth2["token-url"])
                settings.tokenUrl = node.as<std::string>();
            if (auto node = oauth2["client-id"])
                settings.clientId = node.as<std::string>();
            if (auto node = oauth2["client-secret"])
                settings.clientSecret = node.as<std::string>();
            if (auto node = oauth2["client-secret-keychain"])
                settings.clientSecretKeychain = node.as<std::string>();
            if (auto node = oauth2["scope"])
                settings.scope = node.as<std::string>();
            if (auto node = oauth2["audience"])
                settings.audience = node.as<std::string>();
            if (auto node = oauth2["client-auth"])
                settings.clientAuth = parseClientAuth(node.as<std::string>());
            if (auto node = oauth2["expiry-margin-secs"])
                settings.expiryMargin = nonNegativeSeconds(node, "oauth2.expiry-margin-secs");
        }

        if (auto refresh = document["refresh"]) {
            if (auto node = refresh["lead-secs"])
                settings.refresh.refreshLead = nonNegativeSeconds(node, "refresh.lead-secs");
            if (auto node = refresh["backoff-secs"])
                settings.refresh.retryBackoff = nonNegativeSeconds(node, "refresh.backoff-secs");
            if (auto node = refresh["min-interval-secs"])
                settings.refresh.minInterval = nonNegativeSeconds(node, "refresh.min-interval-secs");
        }

        settings.http = pxhttp::Config::fromNode(document["http"]);
    }
    catch (YAML::Exception const& e) {
        throw logRuntimeError<ConfigError>(stx::format("[ProxySettings] Could not parse settings: {}", e.what()));
    }
    return settings;
}

ProxySettings ProxySettings::fromFile(std::string const& path)
{
    std::ifstream file(path);
    if (!file)
        throw logRuntimeError<ConfigError>(stx::format("[ProxySettings] Cannot open settings file '{}'.", path));

    log().debug("Loading proxy settings from '{}'...", path);
    std::stringstream contents;
    contents << file.rdbuf();
    return fromYaml(contents.str());
}

void ProxySettings::applyEnvironment()
{
    if (auto value = getEnvSafe("ESPLORA_UPSTREAM"); !value.empty())
        upstream = value;
    if (auto value = getEnvSafe("OIDC_TOKEN_URL"); !value.empty())
        tokenUrl = value;
    if (auto value = getEnvSafe("ESPLORA_CLIENT_ID"); !value.empty())
        clientId = value;
    if (auto value = getEnvSafe("ESPLORA_CLIENT_SECRET"); !value.empty())
        clientSecret = value;
    if (auto value = getEnvSafe("OIDC_SCOPE"); !value.empty())
        scope = value;
    if (auto value = getEnvSafe("BIND"); !value.empty())
        std::tie(bindHost, bindPort) = parseBindAddress(value);
    if (auto value = getEnvSafe("AUTHPX_THREADS"); !value.empty())
        threads = parseCount(value, "AUTHPX_THREADS");
    if (auto value = getEnvSafe("AUTHPX_LOG_LEVEL"); !value.empty())
        logLevel = value;
    if (auto value = getEnvSafe("AUTHPX_DUMP_BODY_BYTES"); !value.empty())
        dumpBodyBytes = parseCount(value, "AUTHPX_DUMP_BODY_BYTES");
    http.applyEnvironment();
}

void ProxySettings::resolveSecrets()
{
    if (!clientSecret.empty() || clientSecretKeychain.empty())
        return;
    try {
        clientSecret = pxhttp::secret::load(clientSecretKeychain, clientId);
    }
    catch (std::runtime_error const& e) {
        throw logRuntimeError<ConfigError>(
            stx::format("[ProxySettings] Could not load client secret from keychain: {}", e.what()));
    }
}

void ProxySettings::validate() const
{
    try {
        UpstreamTarget target(upstream);
        auto tokenUri = pxhttp::URIComponents::fromStrRfc3986(tokenUrl);
        if (tokenUri.scheme != "http" && tokenUri.scheme != "https")
            throw logRuntimeError<ConfigError>(
                stx::format("[ProxySettings] Unsupported scheme '{}' for the token URL.", tokenUri.scheme));
    }
    catch (pxhttp::URIError const& e) {
        throw ConfigError(e.what());
    }

    if (clientId.empty())
        throw logRuntimeError<ConfigError>("[ProxySettings] oauth2.client-id (ESPLORA_CLIENT_ID) is required.");
    if (clientSecret.empty())
        throw logRuntimeError<ConfigError>(
            "[ProxySettings] oauth2.client-secret (ESPLORA_CLIENT_SECRET) or oauth2.client-secret-keychain is required.");
    if (bindHost.empty() || bindPort == 0)
        throw logRuntimeError<ConfigError>("[ProxySettings] bind must be a host:port address.");
    if (threads == 0)
        throw logRuntimeError<ConfigError>("[ProxySettings] threads must be at least 1.");
    if (refresh.minInterval.count() == 0)
        throw logRuntimeError<ConfigError>("[ProxySettings] refresh.min-interval-secs must be at least 1.");
    if (http.timeoutSecs <= 0)
        throw logRuntimeError<ConfigError>("[ProxySettings] http.timeout-secs must be positive.");
}

OAuth2TokenFetcher::Options ProxySettings::fetcherOptions() const
{
    OAuth2TokenFetcher::Options options;
    options.tokenUrl = tokenUrl;
    options.clientId = clientId;
    options.clientSecret = clientSecret;
    options.scope = scope;
    options.audience = audience;
    options.clientAuth = clientAuth;
    options.expiryMargin = expiryMargin;
    options.httpConfig = http;
    return options;
}

std::string ProxySettings::toSafeString() const
{
    std::ostringstream out;
    out << "upstream=" << upstream
        << ", bind=" << bindHost << ":" << bindPort
        << ", threads=" << threads
        << ", token-url=" << tokenUrl
        << ", client-id=" << clientId
        << ", client-secret=" << (clientSecret.empty() ? "<unset>" : "***");
    if (!clientSecretKeychain.empty())
        out << ", client-secret-keychain=" << clientSecretKeychain;
    if (!scope.empty())
        out << ", scope=" << scope;
    if (!audience.empty())
        out << ", audience=" << audience;
    out << ", client-auth=" << (clientAuth == OAuth2TokenFetcher::ClientAuth::Basic ? "basic" : "post")
        << ", refresh-lead=" << refresh.refreshLead.count() << "s"
        << ", retry-backoff=" << refresh.retryBackoff.count() << "s"
        << ", dump-body-bytes=" << dumpBodyBytes
        << ", http={" << http.toSafeString() << "}";
    return out.str();
}

std::pair<std::string, std::uint16_t> ProxySettings::parseBindAddress(std::string const& address)
{
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size())
        throw logRuntimeError<ConfigError>(
            stx::format("[ProxySettings] Bind address '{}' is not of the form host:port.", address));

    auto host = address.substr(0, colon);
    if (host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);

    auto port = parseCount(address.substr(colon + 1), "the bind port");
    if (port == 0 || port > 65535)
        throw logRuntimeError<ConfigError>(
            stx::format("[ProxySettings] Bind port of '{}' is out of range.", address));
    return {host, static_cast<std::uint16_t>(port)};
}

}
