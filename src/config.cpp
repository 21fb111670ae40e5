#include "toolhost/config.hpp"
#include "toolhost/error.hpp"
#include "toolhost/log.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace toolhost {

namespace {

template <typename T>
T read(const nlohmann::json& j, const char* key) {
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError(std::string("Invalid type for config key '") + key + "'");
    }
}

size_t read_count(const nlohmann::json& j, const char* key, size_t min) {
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < static_cast<int64_t>(min)) {
        throw ConfigError(std::string("Config key '") + key + "' must be an integer >= "
                          + std::to_string(min));
    }
    return v.get<size_t>();
}

std::chrono::milliseconds read_ms(const nlohmann::json& j, const char* key) {
    return std::chrono::milliseconds(read_count(j, key, 0));
}

size_t parse_env_count(const char* name, const std::string& value, size_t min) {
    size_t pos = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != value.size() || value[0] == '-' || n < min
        || n > std::numeric_limits<size_t>::max()) {
        throw ConfigError(std::string("Environment variable ") + name
                          + " must be an integer >= " + std::to_string(min) + ", got '" + value + "'");
    }
    return static_cast<size_t>(n);
}

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

} // anonymous namespace

Settings Settings::from_json(const nlohmann::json& j) {
    Settings s;
    s.apply_json(j);
    return s;
}

Settings Settings::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    return from_json(j);
}

Settings Settings::from_env() {
    Settings s;
    s.apply_env();
    return s;
}

void Settings::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    if (j.contains("server_name")) server.server_info.name = read<std::string>(j, "server_name");
    if (j.contains("server_version")) server.server_info.version = read<std::string>(j, "server_version");
    if (j.contains("instructions")) server.instructions = read<std::string>(j, "instructions");

    if (j.contains("log_level")) {
        auto level = read<std::string>(j, "log_level");
        log::parse_level(level);
        log_level = level;
    }

    auto& exec = server.executor;
    if (j.contains("max_concurrent_handlers")) {
        exec.max_concurrent_handlers = read_count(j, "max_concurrent_handlers", 1);
    }
    if (j.contains("admission")) {
        auto policy = read<std::string>(j, "admission");
        if (policy == "wait") {
            exec.admission = AdmissionPolicy::Wait;
        } else if (policy == "reject") {
            exec.admission = AdmissionPolicy::Reject;
        } else {
            throw ConfigError("admission must be \"wait\" or \"reject\", got \"" + policy + "\"");
        }
    }
    if (j.contains("admission_timeout_ms")) exec.admission_timeout = read_ms(j, "admission_timeout_ms");
    if (j.contains("call_timeout_ms")) exec.call_timeout = read_ms(j, "call_timeout_ms");
    if (j.contains("cancel_grace_ms")) exec.cancel_grace = read_ms(j, "cancel_grace_ms");

    if (j.contains("worker_threads")) server.worker_threads = read_count(j, "worker_threads", 1);
    if (j.contains("max_pending_requests")) {
        server.max_pending_requests = read_count(j, "max_pending_requests", 1);
    }
    if (j.contains("page_size")) server.page_size = read_count(j, "page_size", 1);
    if (j.contains("drain_timeout_ms")) server.drain_timeout = read_ms(j, "drain_timeout_ms");

    if (j.contains("registration")) {
        auto policy = read<std::string>(j, "registration");
        if (policy == "strict") {
            server.registration = RegistrationPolicy::Strict;
        } else if (policy == "replace") {
            server.registration = RegistrationPolicy::Replace;
        } else {
            throw ConfigError("registration must be \"strict\" or \"replace\", got \"" + policy + "\"");
        }
    }
    if (j.contains("unknown_arguments")) {
        auto mode = read<std::string>(j, "unknown_arguments");
        if (mode == "reject") {
            server.router.unknown_arguments = UnknownArguments::Reject;
        } else if (mode == "ignore") {
            server.router.unknown_arguments = UnknownArguments::Ignore;
        } else {
            throw ConfigError("unknown_arguments must be \"reject\" or \"ignore\", got \"" + mode + "\"");
        }
    }

    if (j.contains("capabilities")) {
        const auto& caps = j.at("capabilities");
        if (!caps.is_object()) throw ConfigError("capabilities must be an object");
        auto& flags = server.capabilities;
        if (caps.contains("tools")) flags.tools = read<bool>(caps, "tools");
        if (caps.contains("resources")) flags.resources = read<bool>(caps, "resources");
        if (caps.contains("prompts")) flags.prompts = read<bool>(caps, "prompts");
        if (caps.contains("resources_subscribe")) {
            flags.resources_subscribe = read<bool>(caps, "resources_subscribe");
        }
        if (caps.contains("list_changed")) flags.list_changed = read<bool>(caps, "list_changed");
    }

    if (j.contains("http")) {
        const auto& h = j.at("http");
        if (!h.is_object()) throw ConfigError("http must be an object");
        if (h.contains("host")) http.host = read<std::string>(h, "host");
        if (h.contains("port")) {
            auto port = read_count(h, "port", 0);
            if (port > 65535) throw ConfigError("http.port must be <= 65535");
            http.port = static_cast<uint16_t>(port);
        }
        if (h.contains("path")) {
            http.endpoint_path = read<std::string>(h, "path");
            if (http.endpoint_path.empty() || http.endpoint_path[0] != '/') {
                throw ConfigError("http.path must start with '/'");
            }
        }
        if (h.contains("allowed_origins")) {
            http.allowed_origins = read<std::vector<std::string>>(h, "allowed_origins");
        }
    }
}

void Settings::apply_env() {
    if (auto v = env("TOOLHOST_LOG_LEVEL")) {
        log::parse_level(*v);
        log_level = *v;
    }
    if (auto v = env("TOOLHOST_MAX_CONCURRENCY")) {
        server.executor.max_concurrent_handlers = parse_env_count("TOOLHOST_MAX_CONCURRENCY", *v, 1);
    }
    if (auto v = env("TOOLHOST_ADMISSION_TIMEOUT_MS")) {
        server.executor.admission_timeout = std::chrono::milliseconds(
            parse_env_count("TOOLHOST_ADMISSION_TIMEOUT_MS", *v, 0));
    }
    if (auto v = env("TOOLHOST_CALL_TIMEOUT_MS")) {
        server.executor.call_timeout = std::chrono::milliseconds(
            parse_env_count("TOOLHOST_CALL_TIMEOUT_MS", *v, 0));
    }
}

void Settings::apply_logging() const {
    log::set_level(log_level);
}

} // namespace toolhost
