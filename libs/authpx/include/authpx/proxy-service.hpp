#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <httplib.h>

#include "proxy-settings.hpp"
#include "request-forwarder.hpp"

namespace authpx
{

/**
 * The proxy process: listener, token cache, refresh loop and forwarder.
 *
 * Every inbound request on any path and method is relayed to the upstream
 * API with a bearer token attached. Failures which leave no upstream
 * response to relay are answered locally:
 *
 *   - 503 if no token can be obtained,
 *   - 502 if upstream cannot be reached or its response breaks off,
 *   - 400 if the request target is not a valid path.
 *
 * Nothing is written to a caller which went away.
 */
class ProxyService
{
public:
    /**
     * Throws ConfigError if the settings are incomplete.
     */
    ProxyService(ProxySettings settings,
                 std::unique_ptr<pxhttp::IHttpClient> client,
                 IClock const& clock = SteadyClock::instance());
    ~ProxyService();

    ProxyService(ProxyService const&) = delete;
    ProxyService& operator=(ProxyService const&) = delete;

    /**
     * Relay a single request. Returns no response if the caller went away
     * before the exchange completed.
     */
    std::optional<ForwardedResponse> handle(InboundRequest const& inbound);

    /**
     * Bind the listening socket. Returns false if the address is unavailable.
     */
    bool bind();

    /**
     * Start the refresh loop and serve requests until stop() is called.
     * Requires a successful bind(). Returns at once if stop() was
     * already called.
     */
    void run();

    /**
     * Stop accepting requests and stop the refresh loop. Safe to call from
     * any thread, and more than once.
     */
    void stop();

    TokenCache& tokens() { return cache_; }
    RefreshScheduler& scheduler() { return scheduler_; }
    ProxySettings const& settings() const { return settings_; }

private:
    void registerHandlers();
    void serve(httplib::Request const& req, httplib::Response& res);

    ProxySettings const settings_;
    std::unique_ptr<pxhttp::IHttpClient> client_;
    OAuth2TokenFetcher fetcher_;
    TokenCache cache_;
    RefreshScheduler scheduler_;
    RequestForwarder forwarder_;
    httplib::Server server_;
    std::atomic<bool> bound_{false};

    std::mutex stateMutex_;
    bool stopped_ = false;
    bool listening_ = false;
};

/**
 * Locally generated answer for requests which could not be relayed.
 */
ForwardedResponse errorResponse(int status, std::string const& error, std::string const& detail);

}
