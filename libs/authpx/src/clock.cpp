#include "clock.hpp"

namespace authpx
{

SteadyClock const& SteadyClock::instance()
{
    static SteadyClock clock;
    return clock;
}

}
