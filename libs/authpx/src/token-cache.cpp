#include "token-cache.hpp"

namespace authpx
{

TokenCache::TokenCache(ITokenFetcher& fetcher, IClock const& clock)
    : fetcher_(fetcher)
    , clock_(clock)
{}

AccessToken TokenCache::getValid()
{
    std::unique_lock lock(mutex_);
    if (current_ && current_->isValidAt(clock_.now()))
        return *current_;

    if (current_)
        pxhttp::log().debug("[TokenCache] Cached token expired, fetching a new one...");
    else
        pxhttp::log().debug("[TokenCache] No cached token, fetching one...");
    return awaitFetch(lock);
}

AccessToken TokenCache::forceRefresh()
{
    std::unique_lock lock(mutex_);
    pxhttp::log().debug("[TokenCache] Forced refresh requested.");
    return awaitFetch(lock);
}

std::optional<IClock::time_point> TokenCache::expiresAt() const
{
    std::lock_guard lock(mutex_);
    if (current_)
        return current_->expiresAt;
    return {};
}

void TokenCache::setRefreshListener(RefreshListener listener)
{
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

AccessToken TokenCache::awaitFetch(std::unique_lock<std::mutex>& lock)
{
    // Join a fetch which is already running.
    if (inflight_) {
        auto pending = *inflight_;
        lock.unlock();
        pxhttp::log().debug("[TokenCache] Waiting for running fetch.");
        return pending.get();
    }

    std::promise<AccessToken> promise;
    inflight_ = promise.get_future().share();
    lock.unlock();

    std::optional<AccessToken> token;
    try {
        token = fetcher_.fetch();
    }
    catch (...) {
        // Waiters receive the same error; the cached token is kept.
        lock.lock();
        inflight_.reset();
        lock.unlock();
        promise.set_exception(std::current_exception());
        throw;
    }

    RefreshListener listener;
    lock.lock();
    current_ = token;
    inflight_.reset();
    listener = listener_;
    lock.unlock();

    promise.set_value(*token);
    if (listener)
        listener(token->expiresAt);
    return *token;
}

}
