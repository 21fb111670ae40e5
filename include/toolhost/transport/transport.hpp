#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace toolhost {

/// Callback for incoming messages
using MessageCallback = std::function<void(JsonRpcMessage)>;
/// Receives ParseError / ProtocolError for undecodable input and
/// TransportError for I/O failures.
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until shutdown or peer disconnect.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Send a message to the remote peer. Throws TransportError once shut down.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Graceful shutdown; unblocks start().
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /// False when responses must be written in request arrival order.
    [[nodiscard]] virtual bool supports_correlation() const { return true; }
};

} // namespace toolhost
