#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>

#include "config.hpp"

namespace attribution::logging {

/** Name of the shared logger. */
inline constexpr const char* kLoggerName = "attributor";

/**
 * (Re)create the shared logger: colored console sink plus an optional file
 * sink, level and pattern from `cfg`.
 */
void init(const LoggingConfig& cfg);

/** Shared logger; created with console-only defaults on first use. */
std::shared_ptr<spdlog::logger> get();

} // namespace attribution::logging

#endif // LOGGING_HPP
