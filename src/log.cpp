#include "toolhost/log.hpp"
#include "toolhost/error.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace toolhost::log {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current;

std::shared_ptr<spdlog::logger> make_default() {
    // Not registered globally so embedding applications may own "toolhost".
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto l = std::make_shared<spdlog::logger>("toolhost", std::move(sink));
    l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
    l->set_level(spdlog::level::info);
    return l;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current) current = make_default();
    return current;
}

void set_logger(std::shared_ptr<spdlog::logger> l) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current = std::move(l);
}

spdlog::level::level_enum parse_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + level);
    }
    return lvl;
}

void set_level(const std::string& level) {
    logger()->set_level(parse_level(level));
}

} // namespace toolhost::log
