#include "http-client.hpp"
#include "uri.hpp"

#include <httplib.h>

#include <chrono>
#include <map>
#include <mutex>
#include <sstream>
#include <vector>

namespace
{

constexpr std::size_t MAX_IDLE_PER_ORIGIN = 32;
constexpr std::chrono::seconds IDLE_TIMEOUT{45};

httplib::Headers toHttpLibHeaders(pxhttp::Headers const& headers, pxhttp::Config const& config)
{
    httplib::Headers result{headers.begin(), headers.end()};
    for (auto const& [name, value] : config.headers) {
        if (headers.find(name) == headers.end())
            result.emplace(name, value);
    }
    return result;
}

auto makeClient(pxhttp::URIComponents const& uri, pxhttp::Config const& config)
{
    auto client = std::make_unique<httplib::Client>(uri.buildHost());
    config.apply(*client);

    // Responses are relayed as they are: redirects are left to the
    // caller, bodies stay compressed and targets stay encoded.
    client->set_follow_location(false);
    client->set_decompress(false);
    client->set_url_encode(false);
    client->set_keep_alive(true);
    return client;
}

/**
 * Identifies the connections which can be shared: same origin, and the
 * same settings applied by Config::apply. Headers are sent per request.
 */
std::string poolKey(pxhttp::URIComponents const& uri, pxhttp::Config const& config)
{
    std::ostringstream key;
    key << uri.buildHost() << '\n'
        << config.timeoutSecs << '\n'
        << config.sslCertStrict << '\n'
        << config.caCertPath;
    if (config.proxy) {
        key << '\n' << config.proxy->host << ':' << config.proxy->port
            << '\n' << config.proxy->user
            << '\n' << config.proxy->password
            << '\n' << config.proxy->keychain;
    }
    return key.str();
}

}

namespace pxhttp
{

using Result = HttpLibHttpClient::Result;

struct HttpLibHttpClient::ConnectionPool
{
    using Clock = std::chrono::steady_clock;

    struct IdleClient {
        std::unique_ptr<httplib::Client> client;
        Clock::time_point since;
    };

    std::mutex mutex;
    std::map<std::string, std::vector<IdleClient>> idle;

    /**
     * Take the most recently used idle client for the key, or return
     * nullptr if there is none which is still fresh.
     */
    std::unique_ptr<httplib::Client> checkOut(std::string const& key)
    {
        std::lock_guard lock(mutex);
        auto it = idle.find(key);
        if (it == idle.end())
            return nullptr;

        auto now = Clock::now();
        auto& clients = it->second;
        while (!clients.empty()) {
            auto entry = std::move(clients.back());
            clients.pop_back();
            if (now - entry.since < IDLE_TIMEOUT)
                return std::move(entry.client);
        }
        return nullptr;
    }

    void checkIn(std::string const& key, std::unique_ptr<httplib::Client> client)
    {
        std::lock_guard lock(mutex);
        auto& clients = idle[key];
        if (clients.size() < MAX_IDLE_PER_ORIGIN)
            clients.push_back({std::move(client), Clock::now()});
    }
};

HttpLibHttpClient::HttpLibHttpClient()
    : pool_(std::make_unique<ConnectionPool>())
{}

HttpLibHttpClient::~HttpLibHttpClient() = default;

Result HttpLibHttpClient::send(const Request& request,
                               const Config& config,
                               const CancellationProbe& cancelled)
{
    Result result;
    if (cancelled && cancelled()) {
        result.cancelled = true;
        result.error = "Canceled";
        return result;
    }

    auto uri = URIComponents::fromStrRfc3986(request.uri);
    auto key = poolKey(uri, config);
    auto client = pool_->checkOut(key);
    if (!client)
        client = makeClient(uri, config);
    if (log().should_log(spdlog::level::debug)) {
        log().debug("  ... {} {}", request.method, uri.build());
    }

    httplib::Request req;
    req.method = request.method;
    req.path = uri.buildPath();
    req.headers = toHttpLibHeaders(request.headers, config);
    req.body = request.body;

    bool aborted = false;
    bool headReceived = false;
    req.response_handler = [&](const httplib::Response&) {
        headReceived = true;
        return true;
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t, uint64_t) {
        if (cancelled && cancelled()) {
            aborted = true;
            return false;
        }
        result.content.append(data, length);
        return true;
    };

    auto response = client->send(req);
    if (!response) {
        result.content.clear();
        result.cancelled = aborted;
        result.incomplete = headReceived;
        result.error = httplib::to_string(response.error());
        return result;
    }

    result.status = response->status;
    result.headers.insert(response->headers.begin(), response->headers.end());

    // Failed exchanges drop their client, along with its connection.
    pool_->checkIn(key, std::move(client));
    return result;
}

Result HttpLibHttpClient::post(const std::string& uri,
                               const OptionalBodyAndContentType& body,
                               const Config& config)
{
    Request request;
    request.method = "POST";
    request.uri = uri;
    if (body) {
        request.body = body->body;
        request.headers.emplace("Content-Type", body->contentType);
    }
    return send(request, config, {});
}

Result MockHttpClient::send(const Request& request,
                            const Config& config,
                            const CancellationProbe& cancelled)
{
    if (cancelled && cancelled()) {
        Result result;
        result.cancelled = true;
        result.error = "Canceled";
        return result;
    }
    if (sendFun)
        return sendFun(request);
    return {};
}

Result MockHttpClient::post(const std::string& uri,
                            const OptionalBodyAndContentType& body,
                            const Config& config)
{
    if (postFun)
        return postFun(uri, body, config);
    return {};
}

}
