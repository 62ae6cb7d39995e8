#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "pxhttp/http-settings.hpp"
#include "token-fetcher.hpp"
#include "refresh-scheduler.hpp"

namespace authpx
{

/**
 * Process settings, immutable once the service is started.
 *
 * Loaded from a YAML document, then overridden by environment variables:
 *
 *   upstream: https://enterprise.blockstream.info/api     # ESPLORA_UPSTREAM
 *   bind: 127.0.0.1:3002                                  # BIND
 *   threads: 8                                            # AUTHPX_THREADS
 *   log-level: info                                       # AUTHPX_LOG_LEVEL
 *   dump-body-bytes: 0                                    # AUTHPX_DUMP_BODY_BYTES
 *   oauth2:
 *     token-url: https://login.example.com/token          # OIDC_TOKEN_URL
 *     client-id: my-client                                # ESPLORA_CLIENT_ID
 *     client-secret: ...                                  # ESPLORA_CLIENT_SECRET
 *     client-secret-keychain: <service>
 *     scope: openid                                       # OIDC_SCOPE
 *     audience: ...
 *     client-auth: post | basic
 *     expiry-margin-secs: 20
 *   refresh:
 *     lead-secs: 30
 *     backoff-secs: 5
 *     min-interval-secs: 1
 *   http:                                                 # see pxhttp::Config
 *     timeout-secs: 60                                    # HTTP_TIMEOUT
 *     ssl-strict: true                                    # HTTP_SSL_STRICT
 */
struct ProxySettings
{
    static constexpr auto DEFAULT_UPSTREAM = "https://enterprise.blockstream.info/api";
    static constexpr auto DEFAULT_TOKEN_URL =
        "https://login.blockstream.com/realms/blockstream-public/protocol/openid-connect/token";

    std::string upstream = DEFAULT_UPSTREAM;
    std::string bindHost = "127.0.0.1";
    std::uint16_t bindPort = 3002;
    std::size_t threads = 8;
    std::string logLevel = "info";
    std::size_t dumpBodyBytes = 0;

    std::string tokenUrl = DEFAULT_TOKEN_URL;
    std::string clientId;
    std::string clientSecret;
    std::string clientSecretKeychain;
    std::string scope = "openid";
    std::string audience;
    OAuth2TokenFetcher::ClientAuth clientAuth = OAuth2TokenFetcher::ClientAuth::Post;
    std::chrono::seconds expiryMargin{20};

    RefreshScheduler::Options refresh;
    pxhttp::Config http;

    /**
     * Parse a YAML document. Missing keys keep their defaults.
     * Throws ConfigError.
     */
    static ProxySettings fromYaml(std::string const& yaml);

    /**
     * Parse a YAML file. Throws ConfigError.
     */
    static ProxySettings fromFile(std::string const& path);

    /**
     * Apply environment variable overrides. Throws ConfigError.
     */
    void applyEnvironment();

    /**
     * Resolve keychain references into the secret they name.
     * Throws ConfigError.
     */
    void resolveSecrets();

    /**
     * Check completeness and consistency. Throws ConfigError.
     */
    void validate() const;

    /**
     * Options for the token fetcher derived from these settings.
     */
    OAuth2TokenFetcher::Options fetcherOptions() const;

    /**
     * Summary for logging, with secrets masked.
     */
    std::string toSafeString() const;

    /**
     * Parse "host:port" (IPv6 hosts in brackets). Throws ConfigError.
     */
    static std::pair<std::string, std::uint16_t> parseBindAddress(std::string const& address);
};

}
