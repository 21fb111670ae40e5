#pragma once
#include "error.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>

namespace toolhost::formatter {

/// Wrap an invocation outcome in a JSON-RPC response for `id`.
[[nodiscard]] JsonRpcResponse format(const RequestId& id, const InvocationResult& result);

/// Wire shape of a success payload. Content blocks keep handler order.
[[nodiscard]] nlohmann::json to_json(const SuccessContent& content);

[[nodiscard]] JsonRpcError to_error(const ErrorEnvelope& envelope);

/// One entry of tools/list, resources/list, resources/templates/list or
/// prompts/list.
[[nodiscard]] nlohmann::json describe(Category category, const CapabilityDescriptor& descriptor);

/// InvalidParams envelope carrying {"errors": [{"field", "message"}, ...]}.
[[nodiscard]] ErrorEnvelope from_validation(const ValidationError& e);

} // namespace toolhost::formatter
