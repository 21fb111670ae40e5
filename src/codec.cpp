#include "toolhost/codec.hpp"
#include "toolhost/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace toolhost {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) return nlohmann::json(as_int.value());
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) return nlohmann::json(as_uint.value());
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_document(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    try {
        auto root = doc.get_value();
        if (root.error()) throw ParseError("Failed to get document value");
        nlohmann::json j = to_nlohmann(root.value());
        if (!doc.at_end()) throw ParseError("Trailing content after JSON value");
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
}

[[noreturn]] void invalid(const std::string& msg) {
    throw ProtocolError(error::InvalidRequest, msg);
}

RequestId read_id(const nlohmann::json& j) {
    const auto& id = j.at("id");
    if (id.is_number_integer()) return id.get<int64_t>();
    if (id.is_string()) return id.get<std::string>();
    invalid("'id' must be an integer or string");
}

} // anonymous namespace

bool Codec::is_batch(std::string_view raw) noexcept {
    for (char c : raw) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
        return c == '[';
    }
    return false;
}

JsonRpcMessage Codec::classify(const nlohmann::json& j) {
    if (!j.is_object()) {
        invalid("Message must be a JSON object");
    }
    if (!j.contains("jsonrpc") || !j.at("jsonrpc").is_string()
        || j.at("jsonrpc").get<std::string>() != JSONRPC_VERSION) {
        invalid("Invalid or missing 'jsonrpc' field, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method) {
        if (!j.at("method").is_string()) invalid("'method' must be a string");
        if (j.contains("params") && !j.at("params").is_object() && !j.at("params").is_array()) {
            invalid("'params' must be an object or array");
        }
    }

    if (has_method && has_id) {
        if (j.at("id").is_null()) invalid("Request ID must not be null");
        JsonRpcRequest req;
        req.id = read_id(j);
        req.method = j.at("method").get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }
    if (has_method) {
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }
    if (has_id) {
        JsonRpcResponse resp;
        if (!j.at("id").is_null()) resp.id = read_id(j);
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                invalid(std::string("Malformed error object: ") + e.what());
            }
        }
        return resp;
    }
    invalid("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return classify(parse_document(raw));
}

std::vector<JsonRpcMessage> Codec::parse_batch(std::string_view raw) {
    nlohmann::json j = parse_document(raw);
    if (!j.is_array()) {
        invalid("Batch must be a JSON array");
    }
    if (j.empty()) {
        invalid("Batch must not be empty");
    }

    std::vector<JsonRpcMessage> messages;
    messages.reserve(j.size());
    for (const auto& item : j) {
        messages.push_back(classify(item));
    }
    return messages;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::string Codec::serialize_batch(const std::vector<JsonRpcMessage>& msgs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& msg : msgs) {
        nlohmann::json j;
        to_json(j, msg);
        arr.push_back(std::move(j));
    }
    return arr.dump();
}

} // namespace toolhost
