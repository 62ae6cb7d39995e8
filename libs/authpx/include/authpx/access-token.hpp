#pragma once

#include <string>

#include "clock.hpp"

namespace authpx
{

/**
 * Bearer token minted by the identity provider.
 * The value is a secret: it is only ever placed into the
 * Authorization header of upstream requests.
 */
struct AccessToken
{
    std::string value;
    IClock::time_point expiresAt;

    bool isValidAt(IClock::time_point now) const { return now < expiresAt; }
};

}
