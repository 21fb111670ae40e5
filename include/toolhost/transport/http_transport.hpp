#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace toolhost {

/// HTTP server transport. Each POST carries one JSON-RPC message or a batch;
/// the reply body holds the correlated responses, or 202 when the POST only
/// carried notifications.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;          // 0 binds an ephemeral port
        std::string endpoint_path = "/mcp";
        std::vector<std::string> allowed_origins;
        std::chrono::milliseconds response_timeout{60000};
    };

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Bound port; valid once the server is listening.
    uint16_t port() const { return bound_port_.load(); }

    /// Block until the listener is up or `timeout` elapses.
    bool wait_until_listening(std::chrono::milliseconds timeout) const;

    size_t session_count() const;

private:
    struct PendingReply {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<JsonRpcResponse> response;
        bool closed = false;
    };

    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    bool validate_origin(const std::string& origin) const;

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};

    mutable std::mutex sessions_mutex_;
    std::set<std::string> sessions_;

    std::mutex pending_mutex_;
    std::map<std::string, std::shared_ptr<PendingReply>> pending_;

    MessageCallback message_callback_;
    ErrorCallback error_callback_;
};

} // namespace toolhost
