#pragma once

#include <cstddef>
#include <string>

#include "pxhttp/http-client.hpp"
#include "token-cache.hpp"
#include "upstream-target.hpp"

namespace authpx
{

/**
 * A request as received by the proxy listener.
 */
struct InboundRequest
{
    std::string method;
    std::string target;  // Raw request target, "/path?query"
    pxhttp::Headers headers;
    std::string body;

    // Reports whether the caller has closed its connection.
    pxhttp::CancellationProbe isCancelled;
};

/**
 * A response as relayed back to the caller.
 */
struct ForwardedResponse
{
    int status = 0;
    pxhttp::Headers headers;
    std::string body;
};

/**
 * Relays inbound requests to the upstream API, authenticated with the
 * token from the TokenCache.
 *
 * If upstream rejects the token (401/403), the token is force-refreshed
 * and the request is re-issued exactly once; the outcome of that second
 * attempt is relayed, whatever it is.
 */
class RequestForwarder
{
public:
    struct Options
    {
        // Log this many leading bytes of every response body (0: off).
        std::size_t dumpBodyBytes = 0;
        pxhttp::Config httpConfig;
    };

    RequestForwarder(UpstreamTarget upstream,
                     TokenCache& tokens,
                     pxhttp::IHttpClient& client,
                     Options options);

    /**
     * Throws FetchError if no token can be obtained, UpstreamError if
     * upstream cannot be reached or the caller went away, and
     * pxhttp::URIError if the inbound target is not a valid path.
     */
    ForwardedResponse forward(InboundRequest const& inbound);

    /**
     * Derive the upstream request, without credentials.
     */
    pxhttp::IHttpClient::Request buildOutboundRequest(InboundRequest const& inbound) const;

    UpstreamTarget const& upstream() const { return upstream_; }

    /**
     * Inbound headers minus hop-by-hop, Host, Content-Length
     * and Authorization.
     */
    static pxhttp::Headers filterRequestHeaders(pxhttp::Headers const& headers);

    /**
     * Upstream response headers minus hop-by-hop and Content-Length.
     */
    static pxhttp::Headers filterResponseHeaders(pxhttp::Headers const& headers);

    static bool isTokenRejection(int status) { return status == 401 || status == 403; }

private:
    pxhttp::IHttpClient::Result send(pxhttp::IHttpClient::Request request,
                                     AccessToken const& token,
                                     InboundRequest const& inbound);
    ForwardedResponse relay(InboundRequest const& inbound, pxhttp::IHttpClient::Result&& result) const;

    UpstreamTarget const upstream_;
    TokenCache& tokens_;
    pxhttp::IHttpClient& client_;
    Options const options_;
};

}
