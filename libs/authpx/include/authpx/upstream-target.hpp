#pragma once

#include <string>

#include "pxhttp/uri.hpp"

namespace authpx
{

/**
 * The upstream API base URL, e.g. `https://enterprise.blockstream.info/api`.
 * Immutable after construction and shared by all requests.
 */
class UpstreamTarget
{
public:
    /**
     * Parse the base URL. Only http and https are accepted; a query or
     * fragment on the base URL is rejected.
     * Throws pxhttp::URIError.
     */
    explicit UpstreamTarget(std::string const& baseUrl);

    /** Scheme, host and port, e.g. `https://host:8443`. */
    std::string origin() const;

    /** Host header value for upstream requests. */
    std::string const& hostHeader() const { return hostHeader_; }

    /** Base path without trailing slash, empty for the root. */
    std::string const& basePath() const { return basePath_; }

    /**
     * Absolute upstream URI for an inbound request target (`/path?query`).
     * The raw query is kept verbatim.
     * Throws pxhttp::URIError.
     */
    std::string resolve(std::string const& inboundTarget) const;

    /**
     * Prefix `inboundPath` with `basePath`, unless the inbound path
     * already starts with the base path at a segment boundary: a client
     * configured with the full base URL must not produce `/api/api/...`.
     */
    static std::string joinPaths(std::string const& basePath, std::string const& inboundPath);

private:
    pxhttp::URIComponents uri_;
    std::string basePath_;
    std::string hostHeader_;
};

}
