#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

#include "token-cache.hpp"

namespace authpx
{

/**
 * Background loop which renews the cached token shortly before it
 * expires, so that requests rarely wait for the identity provider.
 *
 * Fetches triggered by request traffic re-plan the next wake-up through
 * the cache's refresh listener. Failed refreshes are retried after a
 * fixed backoff.
 */
class RefreshScheduler
{
public:
    struct Options
    {
        std::chrono::seconds refreshLead{30};   // Renew this long before expiry
        std::chrono::seconds retryBackoff{5};   // Delay after a failed refresh
        std::chrono::seconds minInterval{1};    // Lower bound for any delay
    };

    RefreshScheduler(TokenCache& cache,
                     Options options,
                     IClock const& clock = SteadyClock::instance());
    ~RefreshScheduler();

    RefreshScheduler(RefreshScheduler const&) = delete;
    RefreshScheduler& operator=(RefreshScheduler const&) = delete;

    /**
     * Start the background thread. The first refresh runs immediately.
     */
    void start();

    /**
     * Stop the background thread. A refresh which is in progress
     * completes first.
     */
    void stop();

    bool isRunning() const;

    /**
     * Perform one refresh and return the delay until the next one.
     * Never throws: failures are logged and yield the retry backoff.
     */
    IClock::duration runCycle();

    /**
     * Delay until a token expiring at `expiresAt` should be renewed.
     */
    IClock::duration delayUntilRefresh(IClock::time_point expiresAt) const;

    /**
     * Instant of the next planned refresh, if one is planned.
     */
    std::optional<IClock::time_point> nextRefresh() const;

private:
    void loop();
    void onTokenRefreshed(IClock::time_point expiresAt);

    TokenCache& cache_;
    Options const options_;
    IClock const& clock_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::optional<IClock::time_point> deadline_;
    bool stopping_ = false;
    std::thread thread_;
};

}
