#include "refresh-scheduler.hpp"

#include <algorithm>

using namespace std::chrono;

namespace authpx
{

RefreshScheduler::RefreshScheduler(TokenCache& cache,
                                   Options options,
                                   IClock const& clock)
    : cache_(cache)
    , options_(options)
    , clock_(clock)
{
    cache_.setRefreshListener([this](IClock::time_point expiresAt) {
        onTokenRefreshed(expiresAt);
    });
}

RefreshScheduler::~RefreshScheduler()
{
    stop();
    cache_.setRefreshListener({});
}

void RefreshScheduler::start()
{
    std::lock_guard lock(mutex_);
    if (thread_.joinable())
        return;
    stopping_ = false;
    deadline_.reset();
    thread_ = std::thread([this] { loop(); });
    pxhttp::log().debug("[RefreshScheduler] Started.");
}

void RefreshScheduler::stop()
{
    std::thread worker;
    {
        std::lock_guard lock(mutex_);
        if (!thread_.joinable())
            return;
        stopping_ = true;
        worker = std::move(thread_);
    }
    wakeup_.notify_all();
    worker.join();
    pxhttp::log().debug("[RefreshScheduler] Stopped.");
}

bool RefreshScheduler::isRunning() const
{
    std::lock_guard lock(mutex_);
    return thread_.joinable() && !stopping_;
}

std::optional<IClock::time_point> RefreshScheduler::nextRefresh() const
{
    std::lock_guard lock(mutex_);
    return deadline_;
}

IClock::duration RefreshScheduler::delayUntilRefresh(IClock::time_point expiresAt) const
{
    auto delay = expiresAt - clock_.now() - options_.refreshLead;
    return std::max<IClock::duration>(delay, options_.minInterval);
}

IClock::duration RefreshScheduler::runCycle()
{
    IClock::duration delay = options_.retryBackoff;
    try {
        auto token = cache_.forceRefresh();
        delay = delayUntilRefresh(token.expiresAt);
        pxhttp::log().info("[RefreshScheduler] Token refreshed, next refresh in {}s.",
            duration_cast<seconds>(delay).count());
    }
    catch (FetchError const& e) {
        pxhttp::log().warn("[RefreshScheduler] Token refresh failed ({}), retrying in {}s.",
            toString(e.kind), options_.retryBackoff.count());
    }
    catch (std::exception const& e) {
        pxhttp::log().error("[RefreshScheduler] Unexpected refresh failure: {}; retrying in {}s.",
            e.what(), options_.retryBackoff.count());
    }
    return std::max<IClock::duration>(delay, options_.minInterval);
}

void RefreshScheduler::onTokenRefreshed(IClock::time_point expiresAt)
{
    {
        std::lock_guard lock(mutex_);
        deadline_ = clock_.now() + delayUntilRefresh(expiresAt);
    }
    wakeup_.notify_all();
}

void RefreshScheduler::loop()
{
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        auto now = clock_.now();
        if (deadline_ && now < *deadline_) {
            // Re-evaluated after every wake-up: the deadline may have
            // been moved by a traffic-triggered fetch.
            wakeup_.wait_for(lock, *deadline_ - now);
            continue;
        }

        lock.unlock();
        auto delay = runCycle();
        lock.lock();
        deadline_ = clock_.now() + delay;
    }
}

}
