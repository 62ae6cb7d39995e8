#pragma once

#include <chrono>

namespace authpx
{

/**
 * Monotonic time source. Everything that reasons about token lifetimes
 * reads the time through this interface, so tests can control it.
 */
class IClock
{
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock final : public IClock
{
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }

    /** Shared process-wide instance. */
    static SteadyClock const& instance();
};

}
