#pragma once

#include <httplib.h>
#include <optional>
#include <map>
#include <string>
#include <ctime>

#include "yaml-cpp/yaml.h"

namespace pxhttp
{

/**
 * Orders header names case-insensitively (RFC 7230 §3.2).
 */
struct CaseInsensitiveLess
{
    bool operator()(std::string const& a, std::string const& b) const;
};

/**
 * Compare two header names case-insensitively.
 */
bool headerNameEquals(std::string const& a, std::string const& b);

using Headers = std::multimap<std::string, std::string, CaseInsensitiveLess>;

/**
 * Render headers for diagnostic output, with the values of credential
 * headers (Authorization, Proxy-Authorization, Cookie, X-Api-Key) masked.
 */
std::string redactHeaders(Headers const& headers);

/**
 * Settings for outbound HTTP connections, including:
 *   - Extra Headers
 *   - Optional Proxy-Config
 *   - Timeouts
 *   - TLS certificate verification
 */
struct Config
{
    struct Proxy {
        std::string host;
        int port = 0;
        std::string user;
        std::string password;
        std::string keychain;
    };

    std::optional<Proxy> proxy;
    Headers headers;
    std::time_t timeoutSecs = 60;
    bool sslCertStrict = true;
    std::string caCertPath;

    /**
     * Parse a YAML map node (the `http` section of the proxy settings).
     * Unknown keys are ignored. Throws YAML::Exception on type errors.
     */
    static Config fromNode(YAML::Node const& node);

    /**
     * Apply HTTP_TIMEOUT and HTTP_SSL_STRICT environment overrides.
     */
    void applyEnvironment();

    /**
     * Apply this configuration to an httplib client.
     * May read keychain passwords which can block and require user interaction.
     */
    void apply(httplib::Client& cl) const;

    /**
     * Create a human-readable summary of this configuration for logging,
     * with sensitive values (proxy passwords, credential headers) masked.
     */
    std::string toSafeString() const;
};

struct secret
{
    /**
     * Read password from system keychain.
     * Throws std::runtime_error when keychain support is not compiled in.
     */
    static std::string load(
        const std::string& service,
        const std::string& user);
};

}
