#include "proxy-service.hpp"

namespace authpx
{

using pxhttp::log;

namespace
{

ProxySettings validated(ProxySettings settings)
{
    settings.validate();
    return settings;
}

/**
 * Entries which httplib's server adds to every request's header map.
 * They describe the inbound connection and are not sent by the caller.
 */
bool isConnectionInfo(std::string const& name)
{
    return name == "REMOTE_ADDR" || name == "REMOTE_PORT" || name == "LOCAL_ADDR" || name == "LOCAL_PORT";
}

RequestForwarder::Options forwarderOptions(ProxySettings const& settings)
{
    RequestForwarder::Options options;
    options.dumpBodyBytes = settings.dumpBodyBytes;
    options.httpConfig = settings.http;
    return options;
}

}

ForwardedResponse errorResponse(int status, std::string const& error, std::string const& detail)
{
    ForwardedResponse response;
    response.status = status;
    response.headers.emplace("Content-Type", "application/json");
    response.body = R"({"error":")" + error + R"(","detail":")" + detail + R"("})";
    return response;
}

ProxyService::ProxyService(ProxySettings settings,
                           std::unique_ptr<pxhttp::IHttpClient> client,
                           IClock const& clock)
    : settings_(validated(std::move(settings)))
    , client_(std::move(client))
    , fetcher_(settings_.fetcherOptions(), *client_, clock)
    , cache_(fetcher_, clock)
    , scheduler_(cache_, settings_.refresh, clock)
    , forwarder_(UpstreamTarget(settings_.upstream), cache_, *client_, forwarderOptions(settings_))
{
    log().info("[ProxyService] {}", settings_.toSafeString());
    registerHandlers();
}

ProxyService::~ProxyService()
{
    stop();
}

std::optional<ForwardedResponse> ProxyService::handle(InboundRequest const& inbound)
{
    try {
        return forwarder_.forward(inbound);
    }
    catch (FetchError const& e) {
        return errorResponse(503, "token_unavailable", toString(e.kind));
    }
    catch (UpstreamError const& e) {
        if (e.kind == UpstreamError::Kind::Cancelled) {
            log().debug("{}", e.what());
            return {};
        }
        return errorResponse(502, "upstream_unavailable", toString(e.kind));
    }
    catch (pxhttp::URIError const& e) {
        log().warn("[ProxyService] Rejected request target of {} {}: {}", inbound.method, inbound.target, e.what());
        return errorResponse(400, "bad_request", "invalid request target");
    }
}

void ProxyService::registerHandlers()
{
    auto handler = [this](httplib::Request const& req, httplib::Response& res) { serve(req, res); };
    server_.Get(".*", handler);
    server_.Post(".*", handler);
    server_.Put(".*", handler);
    server_.Patch(".*", handler);
    server_.Delete(".*", handler);
    server_.Options(".*", handler);

    server_.set_exception_handler([](httplib::Request const& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        }
        catch (std::exception const& e) {
            log().error("[ProxyService] Unhandled failure for {} {}: {}", req.method, req.target, e.what());
        }
        auto response = errorResponse(500, "internal_error", "unexpected failure");
        res.status = response.status;
        res.set_content(response.body, "application/json");
    });

    auto threads = settings_.threads;
    server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
}

void ProxyService::serve(httplib::Request const& req, httplib::Response& res)
{
    InboundRequest inbound;
    inbound.method = req.method;
    inbound.target = req.target;
    for (auto const& [name, value] : req.headers) {
        if (!isConnectionInfo(name))
            inbound.headers.emplace(name, value);
    }
    inbound.body = req.body;
    inbound.isCancelled = [&req] {
        return req.is_connection_closed && req.is_connection_closed();
    };

    auto response = handle(inbound);
    if (!response) {
        // The connection is gone, whatever is set here is discarded.
        res.status = 499;
        return;
    }

    res.status = response->status;
    auto& headers = response->headers;
    auto encoded = headers.find("Content-Encoding") != headers.end();
    if (!encoded || response->body.empty()) {
        for (auto const& [name, value] : headers)
            res.headers.emplace(name, value);
        res.body = std::move(response->body);
        return;
    }

    // An already encoded body goes out through a sized content provider,
    // which httplib writes as it is instead of compressing it again.
    std::string contentType;
    for (auto const& [name, value] : headers) {
        if (pxhttp::headerNameEquals(name, "Content-Type"))
            contentType = value;
        else
            res.headers.emplace(name, value);
    }
    auto body = std::make_shared<std::string>(std::move(response->body));
    res.set_content_provider(body->size(), contentType,
        [body](size_t offset, size_t length, httplib::DataSink& sink) {
            return sink.write(body->data() + offset, length);
        });
}

bool ProxyService::bind()
{
    if (!server_.bind_to_port(settings_.bindHost, settings_.bindPort)) {
        log().error("[ProxyService] Cannot bind to {}:{}.", settings_.bindHost, settings_.bindPort);
        return false;
    }
    bound_ = true;
    log().info("[ProxyService] Listening on {}:{}, relaying to {}.",
        settings_.bindHost, settings_.bindPort, forwarder_.upstream().origin());
    return true;
}

void ProxyService::run()
{
    if (!bound_)
        throw pxhttp::logRuntimeError("[ProxyService] run() requires a bound listener.");

    {
        std::lock_guard lock(stateMutex_);
        if (stopped_) {
            log().info("[ProxyService] Stopped before serving.");
            return;
        }
        listening_ = true;
    }

    scheduler_.start();
    server_.listen_after_bind();
    scheduler_.stop();

    {
        std::lock_guard lock(stateMutex_);
        listening_ = false;
    }
    log().info("[ProxyService] Stopped.");
}

void ProxyService::stop()
{
    {
        std::unique_lock lock(stateMutex_);
        stopped_ = true;

        // run() may not have entered its accept loop yet, and httplib
        // ignores stop() until it has.
        while (listening_ && !server_.is_running()) {
            lock.unlock();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            lock.lock();
        }
    }
    server_.stop();
    scheduler_.stop();
}

}
