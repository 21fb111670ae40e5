#include "toolhost/transport/http_transport.hpp"
#include "toolhost/error.hpp"
#include "toolhost/log.hpp"
#include "toolhost/version.hpp"

#include <httplib.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

namespace toolhost {

namespace {

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

void set_error(httplib::Response& res, int status, int code, const std::string& message) {
    JsonRpcResponse resp;
    resp.error = JsonRpcError{code, message, std::nullopt};
    res.status = status;
    res.set_content(Codec::serialize(resp), "application/json");
}

} // anonymous namespace

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    for (const auto& allowed : opts_.allowed_origins) {
        if (origin == allowed) return true;
    }
    return false;
}

size_t HttpServerTransport::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    // DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        set_error(res, 403, error::InvalidRequest, "Invalid origin");
        return;
    }

    auto proto_ver = req.get_header_value("MCP-Protocol-Version");
    if (!proto_ver.empty() && proto_ver != std::string(PROTOCOL_VERSION)) {
        set_error(res, 400, error::InvalidRequest, "Unsupported protocol version: " + proto_ver);
        return;
    }

    std::string session_id = req.get_header_value("Mcp-Session-Id");
    if (session_id.empty()) {
        session_id = generate_uuid();
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.insert(session_id);
    } else {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.count(session_id) == 0) {
            set_error(res, 404, error::InvalidRequest, "Session not found");
            return;
        }
    }
    res.set_header("Mcp-Session-Id", session_id);

    const bool batch = Codec::is_batch(req.body);
    std::vector<JsonRpcMessage> messages;
    try {
        if (batch) {
            messages = Codec::parse_batch(req.body);
        } else {
            messages.push_back(Codec::parse(req.body));
        }
    } catch (const ParseError& e) {
        set_error(res, 400, error::ParseError, e.what());
        return;
    } catch (const ProtocolError& e) {
        set_error(res, 400, e.code, e.what());
        return;
    }

    // Register every request before dispatching so that a fast response
    // cannot arrive ahead of its slot.
    std::vector<std::pair<RequestId, std::shared_ptr<PendingReply>>> waits;
    std::vector<nlohmann::json> immediate;
    std::vector<JsonRpcMessage> accepted;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (auto& msg : messages) {
            if (const auto* r = std::get_if<JsonRpcRequest>(&msg)) {
                auto key = request_key(r->id);
                if (pending_.count(key) > 0) {
                    JsonRpcResponse dup;
                    dup.id = r->id;
                    dup.error = JsonRpcError{error::InvalidRequest,
                                             "Duplicate request id", std::nullopt};
                    nlohmann::json j;
                    to_json(j, dup);
                    immediate.push_back(std::move(j));
                    continue;
                }
                auto slot = std::make_shared<PendingReply>();
                pending_[key] = slot;
                waits.emplace_back(r->id, slot);
            }
            accepted.push_back(std::move(msg));
        }
    }

    for (auto& msg : accepted) {
        if (message_callback_) message_callback_(std::move(msg));
    }

    nlohmann::json replies = nlohmann::json::array();
    for (auto& j : immediate) replies.push_back(std::move(j));

    for (auto& [id, slot] : waits) {
        std::optional<JsonRpcResponse> resp;
        {
            std::unique_lock<std::mutex> lock(slot->mutex);
            slot->cv.wait_for(lock, opts_.response_timeout,
                              [&slot] { return slot->response.has_value() || slot->closed; });
            resp = slot->response;
        }
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_.erase(request_key(id));
        }
        if (!resp) {
            log::logger()->warn("no response for HTTP request {} within {} ms",
                                request_key(id), opts_.response_timeout.count());
            resp = JsonRpcResponse{id, std::nullopt,
                                   JsonRpcError{error::RequestTimeout,
                                                "No response before transport timeout or shutdown",
                                                std::nullopt}};
        }
        nlohmann::json j;
        to_json(j, *resp);
        replies.push_back(std::move(j));
    }

    if (replies.empty()) {
        res.status = 202;
        return;
    }
    res.status = 200;
    if (batch) {
        res.set_content(replies.dump(), "application/json");
    } else {
        res.set_content(replies.front().dump(), "application/json");
    }
}

void HttpServerTransport::setup_routes() {
    const std::string path = opts_.endpoint_path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });

    // No server-initiated stream; notifications are not delivered over HTTP.
    server_->Get(path, [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST, DELETE");
    });

    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        std::string session_id = req.get_header_value("Mcp-Session-Id");
        if (session_id.empty()) {
            res.status = 400;
            return;
        }
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.erase(session_id) == 0) {
            res.status = 404;
            return;
        }
        log::logger()->info("HTTP session {} closed by client", session_id);
        res.status = 200;
    });
}

void HttpServerTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    if (running_.exchange(true)) return;

    message_callback_ = std::move(on_message);
    error_callback_ = std::move(on_error);
    setup_routes();

    int port = opts_.port;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (!server_->bind_to_port(opts_.host, opts_.port)) {
        port = -1;
    }
    if (port < 0) {
        running_ = false;
        throw TransportError("Failed to bind HTTP server on " + opts_.host + ":"
                             + std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);
    log::logger()->info("HTTP transport listening on {}:{}{}", opts_.host, port, opts_.endpoint_path);

    // Blocks until stop()
    if (!server_->listen_after_bind() && running_) {
        running_ = false;
        throw TransportError("HTTP server on " + opts_.host + " stopped unexpectedly");
    }
    running_ = false;
}

bool HttpServerTransport::wait_until_listening(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!server_->is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

void HttpServerTransport::send(const JsonRpcMessage& msg) {
    const auto* resp = std::get_if<JsonRpcResponse>(&msg);
    if (!resp || !resp->id) {
        log::logger()->debug("HTTP transport has no stream for uncorrelated message");
        return;
    }

    std::shared_ptr<PendingReply> slot;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(request_key(*resp->id));
        if (it == pending_.end()) {
            log::logger()->debug("dropping response {} with no waiting HTTP request",
                                 request_key(*resp->id));
            return;
        }
        slot = it->second;
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->response = *resp;
    }
    slot->cv.notify_all();
}

void HttpServerTransport::shutdown() {
    if (!running_.exchange(false)) return;
    server_->stop();

    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& [key, slot] : pending_) {
        {
            std::lock_guard<std::mutex> slock(slot->mutex);
            slot->closed = true;
        }
        slot->cv.notify_all();
    }
}

bool HttpServerTransport::is_connected() const {
    return running_;
}

} // namespace toolhost
