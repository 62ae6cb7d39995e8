#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <functional>
#include <optional>

#include "http-settings.hpp"
#include "uri.hpp"
#include "log.hpp"

namespace pxhttp
{

struct BodyAndContentType {
    std::string body;
    std::string contentType;
};

using OptionalBodyAndContentType = std::optional<BodyAndContentType>;

/**
 * Probe which reports whether the party waiting for a response has gone
 * away. Polled while a response body is received.
 */
using CancellationProbe = std::function<bool()>;

class IHttpClient
{
public:

    struct Request {
        std::string method;
        std::string uri;      /* Absolute URI, query still encoded */
        Headers headers;
        std::string body;
    };

    /**
     * Outcome of an exchange. A status of 0 means that no complete HTTP
     * response was received, in which case `error` describes the transport
     * failure and `incomplete` tells whether the response head had already
     * arrived when the exchange broke off.
     */
    struct Result {
        int status = 0;
        std::string content;
        Headers headers;
        std::string error;
        bool cancelled = false;
        bool incomplete = false;
    };

    virtual ~IHttpClient() = default;

    /**
     * Perform an arbitrary request. If `cancelled` is set and returns true
     * while the response is received, the exchange is aborted and the
     * result is flagged as cancelled.
     */
    virtual Result send(const Request& request,
                        const Config& config,
                        const CancellationProbe& cancelled) = 0;

    virtual Result post(const std::string& uri,
                        const OptionalBodyAndContentType& body,
                        const Config& config) = 0;
};

/**
 * Client based on httplib. Connections are kept alive and reused for
 * later exchanges with the same origin and settings. At most 32 idle
 * connections are kept per origin, each for at most 45 seconds.
 */
class HttpLibHttpClient : public IHttpClient
{
public:
    HttpLibHttpClient();
    ~HttpLibHttpClient() override;

    Result send(const Request& request,
                const Config& config,
                const CancellationProbe& cancelled) override;
    Result post(const std::string& uri,
                const OptionalBodyAndContentType& body,
                const Config& config) override;

private:
    struct ConnectionPool;
    std::unique_ptr<ConnectionPool> pool_;
};

class MockHttpClient : public IHttpClient
{
public:
    std::function<
        IHttpClient::Result(Request const& /* request */)
    > sendFun;
    std::function<
        IHttpClient::Result(
            std::string_view /* uri */,
            OptionalBodyAndContentType const& /* body */,
            Config const& config /* config */
    )> postFun;

    Result send(const Request& request,
                const Config& config,
                const CancellationProbe& cancelled) override;
    Result post(const std::string& uri,
                const OptionalBodyAndContentType& body,
                const Config& config) override;
};

}
