#include "request-forwarder.hpp"

#include <algorithm>
#include <set>

#include "stx/format.h"

namespace authpx
{

using pxhttp::Headers;
using pxhttp::IHttpClient;
using pxhttp::log;

namespace
{

/**
 * Headers which only apply to a single connection (RFC 7230 §6.1).
 */
std::set<std::string, pxhttp::CaseInsensitiveLess> const HOP_BY_HOP_HEADERS{
    "Connection",
    "Keep-Alive",
    "Proxy-Authenticate",
    "Proxy-Authorization",
    "Proxy-Connection",
    "TE",
    "Trailer",
    "Transfer-Encoding",
    "Upgrade",
};

/**
 * Header names listed as connection options in Connection headers.
 */
std::set<std::string, pxhttp::CaseInsensitiveLess> connectionOptions(Headers const& headers)
{
    std::set<std::string, pxhttp::CaseInsensitiveLess> result;
    auto range = headers.equal_range("Connection");
    for (auto it = range.first; it != range.second; ++it) {
        std::string::size_type begin = 0;
        while (begin <= it->second.size()) {
            auto end = it->second.find(',', begin);
            if (end == std::string::npos)
                end = it->second.size();
            auto option = it->second.substr(begin, end - begin);
            option.erase(0, option.find_first_not_of(" \t"));
            option.erase(option.find_last_not_of(" \t") + 1);
            if (!option.empty())
                result.insert(option);
            begin = end + 1;
        }
    }
    return result;
}

Headers withoutHeaders(Headers const& headers, std::set<std::string, pxhttp::CaseInsensitiveLess> const& excluded)
{
    auto options = connectionOptions(headers);
    Headers result;
    for (auto const& [name, value] : headers) {
        if (HOP_BY_HOP_HEADERS.count(name) || options.count(name) || excluded.count(name))
            continue;
        result.emplace(name, value);
    }
    return result;
}

bool carriesNoBody(std::string const& method)
{
    return method == "GET" || method == "HEAD";
}

enum class ForwardState {
    FirstAttempt,
    ForceRefresh,
    SecondAttempt,
    Done
};

}

RequestForwarder::RequestForwarder(UpstreamTarget upstream,
                                   TokenCache& tokens,
                                   pxhttp::IHttpClient& client,
                                   Options options)
    : upstream_(std::move(upstream))
    , tokens_(tokens)
    , client_(client)
    , options_(std::move(options))
{}

Headers RequestForwarder::filterRequestHeaders(Headers const& headers)
{
    return withoutHeaders(headers, {"Host", "Content-Length", "Authorization"});
}

Headers RequestForwarder::filterResponseHeaders(Headers const& headers)
{
    return withoutHeaders(headers, {"Content-Length", "Authorization"});
}

IHttpClient::Request RequestForwarder::buildOutboundRequest(InboundRequest const& inbound) const
{
    IHttpClient::Request outbound;
    outbound.method = inbound.method;
    outbound.uri = upstream_.resolve(inbound.target);
    outbound.headers = filterRequestHeaders(inbound.headers);
    outbound.headers.emplace("Host", upstream_.hostHeader());
    if (!carriesNoBody(inbound.method))
        outbound.body = inbound.body;
    return outbound;
}

ForwardedResponse RequestForwarder::forward(InboundRequest const& inbound)
{
    auto outbound = buildOutboundRequest(inbound);
    auto token = tokens_.getValid();

    // Attempt1 -> (401/403) -> ForceRefresh -> Attempt2 -> Done
    IHttpClient::Result result;
    auto state = ForwardState::FirstAttempt;
    while (state != ForwardState::Done) {
        switch (state) {
        case ForwardState::FirstAttempt:
            result = send(outbound, token, inbound);
            state = isTokenRejection(result.status) ? ForwardState::ForceRefresh : ForwardState::Done;
            break;

        case ForwardState::ForceRefresh:
            log().warn("[Forwarder] Upstream rejected the token with status {}, refreshing it once.", result.status);
            try {
                token = tokens_.forceRefresh();
                state = ForwardState::SecondAttempt;
            }
            catch (FetchError const& e) {
                log().warn("[Forwarder] Forced refresh failed ({}), relaying the rejection.", toString(e.kind));
                state = ForwardState::Done;
            }
            break;

        case ForwardState::SecondAttempt:
            result = send(outbound, token, inbound);
            state = ForwardState::Done;
            break;

        case ForwardState::Done:
            break;
        }
    }

    return relay(inbound, std::move(result));
}

IHttpClient::Result RequestForwarder::send(IHttpClient::Request request,
                                           AccessToken const& token,
                                           InboundRequest const& inbound)
{
    request.headers.emplace("Authorization", "Bearer " + token.value);
    if (log().should_log(spdlog::level::trace))
        log().trace("[Forwarder] {} {} headers={}", request.method, request.uri, pxhttp::redactHeaders(request.headers));

    auto result = client_.send(request, options_.httpConfig, inbound.isCancelled);

    if (result.cancelled)
        throw UpstreamError(UpstreamError::Kind::Cancelled,
            stx::format("[Forwarder] {} {} abandoned by the caller.", inbound.method, inbound.target));
    if (result.incomplete)
        throw pxhttp::logRuntimeError<UpstreamError>(
            stx::format("[Forwarder] Response body of {} {} broke off: {}", request.method, request.uri, result.error),
            UpstreamError::Kind::BodyStreamFailure);
    if (result.status == 0)
        throw pxhttp::logRuntimeError<UpstreamError>(
            stx::format("[Forwarder] Upstream unreachable for {} {}: {}", request.method, request.uri, result.error),
            UpstreamError::Kind::Network);
    if (result.status < 100 || result.status > 599)
        throw pxhttp::logRuntimeError<UpstreamError>(
            stx::format("[Forwarder] Upstream answered {} {} with invalid status {}", request.method, request.uri, result.status),
            UpstreamError::Kind::NonSuccessStatus);

    return result;
}

ForwardedResponse RequestForwarder::relay(InboundRequest const& inbound, IHttpClient::Result&& result) const
{
    log().debug("[Forwarder] {} {} -> {} ({} bytes)", inbound.method, inbound.target, result.status, result.content.size());

    if (options_.dumpBodyBytes > 0) {
        auto length = std::min(options_.dumpBodyBytes, result.content.size());
        log().info("[Forwarder] {} {} body[0..{}]: {}",
            inbound.method, inbound.target, length, std::string_view(result.content).substr(0, length));
    }

    ForwardedResponse response;
    response.status = result.status;
    response.headers = filterResponseHeaders(result.headers);
    response.body = std::move(result.content);
    return response;
}

}
