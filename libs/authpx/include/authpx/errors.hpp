#pragma once

#include <stdexcept>
#include <string>

namespace authpx
{

/**
 * Failure to obtain a token from the identity provider.
 */
struct FetchError : std::runtime_error
{
    enum class Kind {
        Network,           // Transport failure or identity provider server error
        Unauthorized,      // Client credentials were rejected
        MalformedResponse  // Token response lacks usable fields
    };

    Kind kind;
    int status;  // HTTP status of the token response, 0 if none was received

    FetchError(Kind kind, int status, std::string const& message)
        : std::runtime_error(message)
        , kind(kind)
        , status(status)
    {}
};

/**
 * Failure to relay a request to the upstream API.
 */
struct UpstreamError : std::runtime_error
{
    enum class Kind {
        Network,           // Upstream could not be reached
        NonSuccessStatus,  // Upstream answered with a status that cannot be relayed
        BodyStreamFailure, // Response body could not be received completely
        Cancelled          // The inbound caller went away
    };

    Kind kind;

    UpstreamError(Kind kind, std::string const& message)
        : std::runtime_error(message)
        , kind(kind)
    {}
};

/**
 * Invalid proxy settings.
 */
struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

char const* toString(FetchError::Kind kind);
char const* toString(UpstreamError::Kind kind);

}
