#pragma once
#include "json_rpc.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace toolhost {

/// Emits completed responses in the order their requests arrived, for
/// transports that cannot correlate out-of-order replies.
class ResponseSequencer {
public:
    using Sink = std::function<void(const JsonRpcMessage&)>;

    explicit ResponseSequencer(Sink sink);

    /// Claim the next position in arrival order.
    uint64_t reserve();

    /// Record the outcome for `ticket` and flush every ready response in
    /// order. std::nullopt marks a slot that produces no output.
    void complete(uint64_t ticket, std::optional<JsonRpcMessage> message);

    /// Completed responses still waiting on an earlier ticket.
    size_t buffered() const;

private:
    Sink sink_;
    mutable std::mutex mutex_;
    uint64_t next_ticket_ = 0;
    uint64_t next_emit_ = 0;
    std::map<uint64_t, std::optional<JsonRpcMessage>> ready_;
};

} // namespace toolhost
