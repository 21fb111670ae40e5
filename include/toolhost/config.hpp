#pragma once
#include "server.hpp"
#include "transport/http_transport.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolhost {

/// Server, executor and transport options assembled from a JSON document and
/// TOOLHOST_* environment variables. Every loader throws ConfigError on a
/// value of the wrong type or out of range.
struct Settings {
    Server::Options server;
    HttpServerTransport::Options http;
    std::string log_level = "info";

    /// Defaults overlaid with `j`.
    static Settings from_json(const nlohmann::json& j);

    /// Defaults overlaid with the JSON file at `path`.
    static Settings from_file(const std::string& path);

    /// Defaults overlaid with the environment.
    static Settings from_env();

    /// Overlay keys present in `j`; absent keys keep their current value.
    void apply_json(const nlohmann::json& j);

    /// Overlay TOOLHOST_LOG_LEVEL, TOOLHOST_MAX_CONCURRENCY,
    /// TOOLHOST_ADMISSION_TIMEOUT_MS and TOOLHOST_CALL_TIMEOUT_MS.
    void apply_env();

    /// Push log_level into the library logger.
    void apply_logging() const;
};

} // namespace toolhost
