#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "spdlog/spdlog.h"

namespace pxhttp
{

/**
 * Obtain global logger, which is initialized from
 * the following environment variables:
 *  - AUTHPX_LOG_LEVEL
 *  - AUTHPX_LOG_FILE
 *  - AUTHPX_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Set the level of the global logger by name
 * (error, warn, info, debug, trace, off).
 * Returns false if the name is not recognized.
 */
bool setLogLevel(std::string const& levelName);

/**
 * Mask a secret for diagnostic output. Keeps at most the first
 * four characters of long values, so that log lines stay correlatable
 * without ever containing the full secret.
 */
std::string redact(std::string_view secret);

/**
 * Log a runtime error and return the throwable object.
 * @param what Runtime error message.
 * @return std::runtime_error to throw.
 */
template<typename error_t = std::runtime_error, typename... args_t>
error_t logRuntimeError(std::string const& what, args_t&&... args) {
    log().error(what);
    return error_t(std::forward<args_t>(args)..., what);
}

}
