#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <optional>

#include "token-fetcher.hpp"

namespace authpx
{

/**
 * Holds the current bearer token and serializes its renewal.
 *
 * At most one fetch is in flight at any time: every caller which needs a
 * new token while a fetch is running waits for that fetch's outcome, be it
 * a token or a FetchError. The fetch runs on the thread of the caller which
 * started it and is never interrupted on behalf of any other waiter.
 */
class TokenCache
{
public:
    using RefreshListener = std::function<void(IClock::time_point /* expiresAt */)>;

    TokenCache(ITokenFetcher& fetcher, IClock const& clock = SteadyClock::instance());

    /**
     * Return the cached token if it is still valid, otherwise fetch
     * (or join the running fetch). Throws FetchError.
     */
    AccessToken getValid();

    /**
     * Fetch a new token regardless of the cached one, or join the running
     * fetch. A failed refresh leaves the cached token untouched.
     * Throws FetchError.
     */
    AccessToken forceRefresh();

    /**
     * Expiry of the cached token, if there is one.
     */
    std::optional<IClock::time_point> expiresAt() const;

    /**
     * Register a callback which is invoked after every successful fetch.
     * It is called outside of the cache lock and must not throw.
     */
    void setRefreshListener(RefreshListener listener);

private:
    AccessToken awaitFetch(std::unique_lock<std::mutex>& lock);

    ITokenFetcher& fetcher_;
    IClock const& clock_;

    mutable std::mutex mutex_;
    std::optional<AccessToken> current_;
    std::optional<std::shared_future<AccessToken>> inflight_;
    RefreshListener listener_;
};

}
