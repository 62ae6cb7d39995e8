#include "upstream-target.hpp"

#include "pxhttp/log.hpp"
#include "stx/format.h"

namespace authpx
{

UpstreamTarget::UpstreamTarget(std::string const& baseUrl)
    : uri_(pxhttp::URIComponents::fromStrRfc3986(baseUrl))
{
    using pxhttp::logRuntimeError;
    using pxhttp::URIError;

    if (uri_.scheme != "http" && uri_.scheme != "https")
        throw logRuntimeError<URIError>(
            stx::format("[UpstreamTarget] Unsupported scheme '{}' in '{}'", uri_.scheme, baseUrl));
    if (!uri_.query.empty() || baseUrl.find('#') != std::string::npos)
        throw logRuntimeError<URIError>(
            stx::format("[UpstreamTarget] Base URL '{}' must not carry a query or fragment", baseUrl));

    basePath_ = uri_.path;
    while (!basePath_.empty() && basePath_.back() == '/')
        basePath_.pop_back();
    hostHeader_ = uri_.buildHostHeader();
}

std::string UpstreamTarget::origin() const
{
    return uri_.buildHost();
}

std::string UpstreamTarget::joinPaths(std::string const& basePath, std::string const& inboundPath)
{
    auto path = inboundPath.empty() ? std::string("/") : inboundPath;
    if (path.front() != '/')
        path.insert(path.begin(), '/');

    if (basePath.empty())
        return path;

    // Exactly one shared prefix is dropped, so "/api/api/x" stays intact
    // below a base of "/api".
    auto const sharesPrefix = path.compare(0, basePath.size(), basePath) == 0 &&
        (path.size() == basePath.size() || path[basePath.size()] == '/');
    if (sharesPrefix)
        return path;

    return basePath + path;
}

std::string UpstreamTarget::resolve(std::string const& inboundTarget) const
{
    auto target = inboundTarget.empty() || inboundTarget.front() == '/'
        ? pxhttp::URIComponents::fromStrPath(inboundTarget.empty() ? std::string("/") : inboundTarget)
        : pxhttp::URIComponents::fromStrRfc3986(inboundTarget);  // absolute-form

    auto outbound = uri_;
    outbound.path = joinPaths(basePath_, target.path);
    outbound.query = target.query;
    return outbound.build();
}

}
