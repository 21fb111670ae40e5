#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace toolhost::log {

/// Library-wide diagnostic logger. Defaults to a stderr sink named "toolhost"
/// because stdout is reserved for the stdio transport.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger (e.g. with a file or async logger).
void set_logger(std::shared_ptr<spdlog::logger> logger);

/// Map a spdlog level name to its enum. Throws ConfigError on an unknown name.
spdlog::level::level_enum parse_level(const std::string& level);

/// Set verbosity from a spdlog level name ("trace", "debug", "info", "warn",
/// "err", "critical", "off"). Throws ConfigError on an unknown name.
void set_level(const std::string& level);

} // namespace toolhost::log
