#pragma once

#include <string>
#include <stdexcept>
#include <cstdint>

namespace pxhttp
{

struct URIError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Components of an absolute URI or of a request target.
 *
 * Path and query are kept in their raw (still percent-encoded) form,
 * so that a target can be relayed without changing its meaning.
 */
struct URIComponents
{
    std::string scheme;
    std::string host;
    std::string path;
    std::uint16_t port = 0u;
    std::string query;

    URIComponents() = default;

    /**
     * Split RFC3986 URI into parts. User info and fragment are dropped.
     *
     * See https://tools.ietf.org/html/rfc3986
     *
     * Throws URIError.
     */
    static URIComponents fromStrRfc3986(std::string const& uriString);

    /**
     * Split an origin-form request target ("/a/b?c=d") into path
     * and query. No leading scheme, host or port info must be present.
     *
     * Throws URIError.
     */
    static URIComponents fromStrPath(std::string const& pathAndQueryString);

    /**
     * Port which is implied by the scheme (80 for http, 443 for https),
     * or 0 for unknown schemes.
     */
    std::uint16_t defaultPort() const;

    /**
     * Build the final URI string.
     *
     * Throws URIError.
     */
    std::string build() const; /* Full URI */
    std::string buildPath() const; /* URI path + query */
    std::string buildHost() const; /* Scheme + host + port */

    /**
     * Value for a Host header addressing this URI's authority. The port
     * is only included if it differs from the scheme default.
     */
    std::string buildHostHeader() const;

    /**
     * Helper function for URL encoding a string.
     */
    static std::string encode(std::string str);
};

}
