#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>
#include <vector>

namespace toolhost {

class Codec {
public:
    /// Parse raw JSON bytes into a message.
    /// Throws ParseError on malformed JSON and ProtocolError (InvalidRequest)
    /// on a well-formed document that is not a JSON-RPC 2.0 message.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse a batch of messages (JSON array).
    [[nodiscard]] static std::vector<JsonRpcMessage> parse_batch(std::string_view raw);

    /// True if the payload's first significant character opens an array.
    [[nodiscard]] static bool is_batch(std::string_view raw) noexcept;

    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);
    [[nodiscard]] static std::string serialize_batch(const std::vector<JsonRpcMessage>& msgs);

    /// Classify an already parsed object.
    [[nodiscard]] static JsonRpcMessage classify(const nlohmann::json& j);
};

} // namespace toolhost
