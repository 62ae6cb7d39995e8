#include "errors.hpp"

namespace authpx
{

char const* toString(FetchError::Kind kind)
{
    switch (kind) {
    case FetchError::Kind::Network: return "network";
    case FetchError::Kind::Unauthorized: return "unauthorized";
    case FetchError::Kind::MalformedResponse: return "malformed-response";
    }
    return "unknown";
}

char const* toString(UpstreamError::Kind kind)
{
    switch (kind) {
    case UpstreamError::Kind::Network: return "network";
    case UpstreamError::Kind::NonSuccessStatus: return "non-success-status";
    case UpstreamError::Kind::BodyStreamFailure: return "body-stream-failure";
    case UpstreamError::Kind::Cancelled: return "cancelled";
    }
    return "unknown";
}

}
