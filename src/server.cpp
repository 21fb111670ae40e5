#include "toolhost/server.hpp"
#include "toolhost/error.hpp"
#include "toolhost/formatter.hpp"
#include "toolhost/log.hpp"
#include "toolhost/sequencer.hpp"
#include "toolhost/transport/stdio_transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace toolhost {

namespace {

JsonRpcResponse error_response(std::optional<RequestId> id, int code, std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

const char* list_changed_method(Category c) {
    switch (c) {
        case Category::Tool:     return "notifications/tools/list_changed";
        case Category::Resource: return "notifications/resources/list_changed";
        case Category::Prompt:   return "notifications/prompts/list_changed";
    }
    return "";
}

} // anonymous namespace

// ----------- Server::Impl -----------

struct Server::Impl : std::enable_shared_from_this<Server::Impl> {
    Options opts;
    CapabilityRegistry registry;
    Executor executor;
    Router router;

    mutable std::mutex session_mutex;
    std::shared_ptr<const Session> session;
    std::optional<Implementation> client_info;
    ClientCapabilities client_caps;
    std::atomic<LifecyclePhase> phase{LifecyclePhase::Uninitialized};

    std::mutex subs_mutex;
    std::set<std::string> subscribed_uris;

    // Transport reference for sending outbound messages
    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    std::unique_ptr<ResponseSequencer> sequencer;

    std::atomic<bool> running{false};
    std::atomic<bool> served{false};
    std::atomic<LogLevel> min_log_level{LogLevel::Info};

    // Worker pool
    std::vector<std::thread> thread_pool;
    std::queue<std::function<void()>> task_queue;
    std::mutex pool_mutex;
    std::condition_variable pool_cv;
    bool pool_running{false};

    // In-flight invocations by request key
    mutable std::mutex inflight_mutex;
    std::unordered_map<std::string, CancellationSource> inflight;

    explicit Impl(Options o)
        : opts(std::move(o))
        , registry(opts.registration)
        , executor(opts.executor)
        , router(registry, executor, opts.router)
        , session(std::make_shared<Session>(opts.server_info,
                                                  negotiate(registry, opts.capabilities),
                                                  opts.instructions)) {
    }

    ~Impl() {
        stop_thread_pool();
    }

    // ---- worker pool ----

    void start_thread_pool() {
        std::lock_guard<std::mutex> lock(pool_mutex);
        pool_running = true;
        // Each invocation holds a worker while its handler runs, so the pool
        // must outnumber the executor's slots for admission to be decided there.
        const size_t n = std::max(opts.worker_threads, opts.executor.max_concurrent_handlers + 1);
        if (n != opts.worker_threads) {
            log::logger()->debug("worker pool raised from {} to {} threads", opts.worker_threads, n);
        }
        for (size_t i = 0; i < n; ++i) {
            thread_pool.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(pool_mutex);
                        pool_cv.wait(lock, [this] {
                            return !task_queue.empty() || !pool_running;
                        });
                        // Drain queued work before exiting so every request is answered.
                        if (task_queue.empty()) return;
                        task = std::move(task_queue.front());
                        task_queue.pop();
                    }
                    task();
                }
            });
        }
    }

    void stop_thread_pool() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            pool_running = false;
        }
        pool_cv.notify_all();
        for (auto& t : thread_pool) {
            if (t.joinable()) t.join();
        }
        thread_pool.clear();
    }

    /// False when the queue already holds max_pending_requests tasks.
    bool dispatch_to_pool(std::function<void()> fn) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex);
            if (!pool_running || task_queue.size() >= opts.max_pending_requests) return false;
            task_queue.push(std::move(fn));
        }
        pool_cv.notify_one();
        return true;
    }

    // ---- outbound ----

    void send_message(const JsonRpcMessage& msg) {
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) return;
        try {
            transport->send(msg);
        } catch (const TransportError& e) {
            log::logger()->debug("dropping outbound message: {}", e.what());
        }
    }

    void send_notification(const std::string& method,
                           std::optional<nlohmann::json> params = std::nullopt) {
        send_message(JsonRpcNotification{method, std::move(params)});
    }

    /// Claim an output position before any work is done for a request.
    uint64_t reserve_slot() {
        return sequencer ? sequencer->reserve() : 0;
    }

    void deliver(uint64_t ticket, JsonRpcResponse resp) {
        if (sequencer) {
            sequencer->complete(ticket, JsonRpcMessage{std::move(resp)});
        } else {
            send_message(resp);
        }
    }

    void emit_log(LogLevel level, const std::string& logger, const nlohmann::json& data) {
        if (level < min_log_level.load()) return;
        if (!running) return;
        nlohmann::json params = {{"level", level}, {"data", data}};
        if (!logger.empty()) params["logger"] = logger;
        send_notification("notifications/message", std::move(params));
    }

    ContextHooks hooks() {
        std::weak_ptr<Impl> weak = weak_from_this();
        ContextHooks h;
        h.notify = [weak](const JsonRpcNotification& n) {
            if (auto self = weak.lock()) self->send_message(n);
        };
        h.log = [weak](LogLevel level, const std::string& logger, const nlohmann::json& data) {
            if (auto self = weak.lock()) self->emit_log(level, logger, data);
        };
        return h;
    }

    // ---- session ----

    std::shared_ptr<const Session> current_session() const {
        std::lock_guard<std::mutex> lock(session_mutex);
        return session;
    }

    ServerCapabilities renegotiate() {
        auto caps = negotiate(registry, opts.capabilities);
        std::lock_guard<std::mutex> lock(session_mutex);
        session = std::make_shared<Session>(session->with_capabilities(caps));
        return caps;
    }

    void on_registry_changed(Category c) {
        if (running && opts.capabilities.list_changed
            && current_session()->capabilities().advertises(c)) {
            send_notification(list_changed_method(c));
        }
    }

    // ---- discovery ----

    HandlerResult list_page(Category category, const char* key, bool templates,
                            const nlohmann::json& params) {
        if (!current_session()->capabilities().advertises(category)) {
            return JsonRpcError{error::MethodNotFound,
                                "Capability not supported: " + std::string(category_name(category)),
                                std::nullopt};
        }

        size_t start = 0;
        if (params.contains("cursor") && !params.at("cursor").is_null()) {
            const auto& cursor = params.at("cursor");
            bool valid = cursor.is_string() && !cursor.get<std::string>().empty();
            if (valid) {
                const auto s = cursor.get<std::string>();
                valid = s.size() <= 18 && s.find_first_not_of("0123456789") == std::string::npos;
                if (valid) start = std::stoull(s);
            }
            if (!valid) {
                return JsonRpcError{error::InvalidParams, "Invalid cursor", std::nullopt};
            }
        }

        std::vector<DescriptorPtr> items;
        for (const auto& d : registry.list(category)) {
            if (category != Category::Resource || d->is_template() == templates) {
                items.push_back(d);
            }
        }

        const size_t page_size = opts.page_size == 0 ? items.size() : opts.page_size;
        nlohmann::json entries = nlohmann::json::array();
        size_t end = start;
        if (start < items.size()) {
            end = std::min(start + page_size, items.size());
            for (size_t i = start; i < end; ++i) {
                entries.push_back(formatter::describe(category, *items[i]));
            }
        }
        nlohmann::json result = {{key, std::move(entries)}};
        if (end < items.size()) result["nextCursor"] = std::to_string(end);
        return result;
    }

    bool subscriptions_enabled() const {
        const auto& res = current_session()->capabilities().resources;
        return res && res->value("subscribe", false);
    }

    // ---- control methods ----

    void setup_handlers() {
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            if (phase.load() != LifecyclePhase::Uninitialized) {
                return JsonRpcError{error::InvalidRequest, "Server already initialized", std::nullopt};
            }

            std::optional<Implementation> info;
            if (params.contains("clientInfo")) info = params.at("clientInfo").get<Implementation>();
            ClientCapabilities caps;
            if (params.contains("capabilities")) caps = params.at("capabilities").get<ClientCapabilities>();
            {
                std::lock_guard<std::mutex> lock(session_mutex);
                client_info = info;
                client_caps = std::move(caps);
            }
            phase = LifecyclePhase::Initializing;
            log::logger()->info("client '{}' initializing (protocol {})",
                                info ? info->name : "unknown",
                                params.value("protocolVersion", std::string("unspecified")));

            nlohmann::json j;
            to_json(j, current_session()->initialize_result());
            return j;
        });

        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            auto expected = LifecyclePhase::Initializing;
            if (phase.compare_exchange_strong(expected, LifecyclePhase::Ready)) {
                log::logger()->info("session ready");
            }
        });

        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        router.on_request("tools/list", [this](const nlohmann::json& params) {
            return list_page(Category::Tool, "tools", false, params);
        });
        router.on_request("resources/list", [this](const nlohmann::json& params) {
            return list_page(Category::Resource, "resources", false, params);
        });
        router.on_request("resources/templates/list", [this](const nlohmann::json& params) {
            return list_page(Category::Resource, "resourceTemplates", true, params);
        });
        router.on_request("prompts/list", [this](const nlohmann::json& params) {
            return list_page(Category::Prompt, "prompts", false, params);
        });

        router.on_request("resources/subscribe", [this](const nlohmann::json& params) -> HandlerResult {
            if (!subscriptions_enabled()) {
                return JsonRpcError{error::MethodNotFound, "Resource subscriptions not supported",
                                    std::nullopt};
            }
            if (!params.contains("uri") || !params.at("uri").is_string()) {
                return JsonRpcError{error::InvalidParams, "Missing required parameter: uri", std::nullopt};
            }
            std::lock_guard<std::mutex> lock(subs_mutex);
            subscribed_uris.insert(params.at("uri").get<std::string>());
            return nlohmann::json::object();
        });

        router.on_request("resources/unsubscribe", [this](const nlohmann::json& params) -> HandlerResult {
            if (!subscriptions_enabled()) {
                return JsonRpcError{error::MethodNotFound, "Resource subscriptions not supported",
                                    std::nullopt};
            }
            if (!params.contains("uri") || !params.at("uri").is_string()) {
                return JsonRpcError{error::InvalidParams, "Missing required parameter: uri", std::nullopt};
            }
            std::lock_guard<std::mutex> lock(subs_mutex);
            subscribed_uris.erase(params.at("uri").get<std::string>());
            return nlohmann::json::object();
        });

        router.on_request("logging/setLevel", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.contains("level") || !params.at("level").is_string()) {
                return JsonRpcError{error::InvalidParams, "Missing required parameter: level", std::nullopt};
            }
            try {
                min_log_level = log_level_from_string(params.at("level").get<std::string>());
            } catch (const std::invalid_argument& e) {
                return JsonRpcError{error::InvalidParams, e.what(), std::nullopt};
            }
            return nlohmann::json::object();
        });

        router.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
            if (!params.contains("requestId")) return;
            RequestId id;
            from_json(params.at("requestId"), id);
            cancel(request_key(id), CancelReason::Client);
        });
    }

    // ---- in-flight tracking ----

    bool cancel(const std::string& key, CancelReason reason) {
        std::lock_guard<std::mutex> lock(inflight_mutex);
        auto it = inflight.find(key);
        if (it == inflight.end()) return false;
        if (it->second.cancel(reason)) {
            log::logger()->debug("request {} {}", key, cancel_reason_name(reason));
        }
        return true;
    }

    void cancel_all(CancelReason reason) {
        std::lock_guard<std::mutex> lock(inflight_mutex);
        for (auto& [key, source] : inflight) source.cancel(reason);
        if (!inflight.empty()) {
            log::logger()->info("cancelled {} in-flight request(s): {}",
                                inflight.size(), cancel_reason_name(reason));
        }
    }

    void finish_request(const std::string& key) {
        std::lock_guard<std::mutex> lock(inflight_mutex);
        inflight.erase(key);
    }

    // ---- inbound ----

    void on_message(JsonRpcMessage msg) {
        if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            router.handle_notification(*notif);
            return;
        }
        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            handle_request(std::move(*req));
            return;
        }
        log::logger()->debug("ignoring response from client; no outbound requests are issued");
    }

    void handle_request(JsonRpcRequest req) {
        const uint64_t ticket = reserve_slot();
        log::logger()->debug("-> {} {}", req.method, request_key(req.id));

        auto ph = phase.load();
        if (ph == LifecyclePhase::ShuttingDown || ph == LifecyclePhase::Closed) {
            deliver(ticket, error_response(req.id, error::InvalidRequest, "server is shutting down"));
            return;
        }
        if (ph == LifecyclePhase::Uninitialized && req.method != "initialize" && req.method != "ping") {
            deliver(ticket, error_response(req.id, error::InvalidRequest, "server not initialized"));
            return;
        }

        // Control methods are cheap and order-sensitive; answer them inline.
        if (!invocation_category(req.method)) {
            RequestContext ctx(current_session(), CancellationSource{}, req.id, hooks());
            deliver(ticket, router.handle_request(req, ctx));
            return;
        }

        const std::string key = request_key(req.id);
        CancellationSource source;
        {
            std::lock_guard<std::mutex> lock(inflight_mutex);
            if (!inflight.emplace(key, source).second) {
                deliver(ticket, error_response(req.id, error::InvalidRequest,
                                               "Duplicate request id: " + key));
                return;
            }
        }

        const auto queued_at = std::chrono::steady_clock::now();
        bool queued = dispatch_to_pool([this, req, source, ticket, key, queued_at]() {
            // Time spent waiting for a worker counts against admission.
            const auto admission = opts.executor.admission_timeout;
            if (admission.count() > 0 && std::chrono::steady_clock::now() - queued_at > admission) {
                finish_request(key);
                log::logger()->warn("request {} waited more than {} ms for a worker", key,
                                    admission.count());
                deliver(ticket, exhausted_response(req.id, "Too many concurrent requests"));
                return;
            }
            RequestContext ctx(current_session(), source, req.id, hooks());
            auto resp = router.handle_request(req, ctx);
            finish_request(key);
            log::logger()->debug("<- {} {}{}", req.method, key, resp.error ? " (error)" : "");
            deliver(ticket, std::move(resp));
        });
        if (!queued) {
            finish_request(key);
            log::logger()->warn("request queue full ({}), rejecting {}", opts.max_pending_requests, key);
            deliver(ticket, exhausted_response(req.id, "Request queue is full"));
        }
    }

    JsonRpcResponse exhausted_response(const RequestId& id, std::string message) const {
        JsonRpcResponse resp = error_response(id, error::ResourceExhausted, std::move(message));
        resp.error->data = nlohmann::json{{"retryable", true},
                                          {"limit", opts.executor.max_concurrent_handlers}};
        return resp;
    }

    void on_transport_error(std::exception_ptr eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const ParseError& e) {
            log::logger()->warn("parse error: {}", e.what());
            deliver(reserve_slot(), error_response(std::nullopt, error::ParseError, e.what()));
        } catch (const ProtocolError& e) {
            log::logger()->warn("invalid message: {}", e.what());
            deliver(reserve_slot(), error_response(std::nullopt, e.code, e.what()));
        } catch (const std::exception& e) {
            log::logger()->error("transport error: {}", e.what());
        }
    }

    void finish(ITransport* t) {
        phase = LifecyclePhase::ShuttingDown;
        log::logger()->info("transport closed, shutting down");
        cancel_all(CancelReason::Disconnect);
        executor.close();
        stop_thread_pool();
        if (!executor.wait_idle(opts.drain_timeout)) {
            log::logger()->warn("{} abandoned handler(s) still running after {} ms",
                                executor.active(), opts.drain_timeout.count());
        }
        running = false;
        t->shutdown();
        {
            std::lock_guard<std::mutex> lock(transport_mutex);
            transport = nullptr;
        }
        phase = LifecyclePhase::Closed;
    }
};

// ----------- Server -----------

Server::Server() : Server(Options{}) {}

Server::Server(Options opts)
    : impl_(std::make_shared<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

Server::~Server() {
    if (impl_) {
        shutdown();
        impl_->stop_thread_pool();
    }
}

void Server::add(Category category, CapabilityDescriptor descriptor) {
    impl_->registry.add(category, std::move(descriptor));
    impl_->on_registry_changed(category);
}

void Server::add_tool(ToolSpec spec, ToolHandler handler) {
    if (!handler) throw std::invalid_argument("Tool '" + spec.name + "' has no handler");
    CapabilityDescriptor d;
    d.name = std::move(spec.name);
    d.title = std::move(spec.title);
    d.description = std::move(spec.description);
    d.params = std::move(spec.params);
    d.annotations = std::move(spec.annotations);
    d.handler = [h = std::move(handler)](RequestContext& ctx, const nlohmann::json& args)
        -> InvocationResult {
        return SuccessContent{h(ctx, args)};
    };
    add(Category::Tool, std::move(d));
}

void Server::add_resource(ResourceSpec spec, ResourceHandler handler) {
    if (!handler) throw std::invalid_argument("Resource '" + spec.uri + "' has no handler");
    CapabilityDescriptor d;
    d.name = std::move(spec.uri);
    d.title = std::move(spec.title);
    d.description = std::move(spec.description);
    d.mime_type = std::move(spec.mime_type);
    d.params = std::move(spec.params);
    d.annotations = std::move(spec.annotations);
    if (d.params.empty()) {
        for (auto& var : uri_template_variables(d.name)) {
            d.params.push_back(ParamSpec{var, "", ParamType::String, true, std::nullopt});
        }
    }
    d.handler = [h = std::move(handler)](RequestContext& ctx, const nlohmann::json& vars)
        -> InvocationResult {
        return SuccessContent{h(ctx, ctx.target(), vars)};
    };
    add(Category::Resource, std::move(d));
}

void Server::add_prompt(PromptSpec spec, PromptHandler handler) {
    if (!handler) throw std::invalid_argument("Prompt '" + spec.name + "' has no handler");
    CapabilityDescriptor d;
    d.name = std::move(spec.name);
    d.title = std::move(spec.title);
    d.description = std::move(spec.description);
    d.params = std::move(spec.params);
    d.handler = [h = std::move(handler)](RequestContext& ctx, const nlohmann::json& args)
        -> InvocationResult {
        return SuccessContent{h(ctx, args)};
    };
    add(Category::Prompt, std::move(d));
}

bool Server::remove_tool(const std::string& name) {
    bool removed = impl_->registry.remove(Category::Tool, name);
    if (removed) impl_->on_registry_changed(Category::Tool);
    return removed;
}

bool Server::remove_resource(const std::string& uri) {
    bool removed = impl_->registry.remove(Category::Resource, uri);
    if (removed) impl_->on_registry_changed(Category::Resource);
    return removed;
}

bool Server::remove_prompt(const std::string& name) {
    bool removed = impl_->registry.remove(Category::Prompt, name);
    if (removed) impl_->on_registry_changed(Category::Prompt);
    return removed;
}

const CapabilityRegistry& Server::registry() const {
    return impl_->registry;
}

ServerCapabilities Server::renegotiate() {
    return impl_->renegotiate();
}

std::shared_ptr<const Session> Server::session() const {
    return impl_->current_session();
}

LifecyclePhase Server::phase() const {
    return impl_->phase.load();
}

std::optional<Implementation> Server::client_info() const {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    return impl_->client_info;
}

ClientCapabilities Server::client_capabilities() const {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    return impl_->client_caps;
}

void Server::notify_resource_updated(const std::string& uri) {
    bool subscribed = false;
    {
        std::lock_guard<std::mutex> lock(impl_->subs_mutex);
        subscribed = impl_->subscribed_uris.count(uri) > 0;
    }
    if (subscribed && impl_->running) {
        impl_->send_notification("notifications/resources/updated", nlohmann::json{{"uri", uri}});
    }
}

void Server::log(LogLevel level, const std::string& logger, const nlohmann::json& data) {
    impl_->emit_log(level, logger, data);
}

void Server::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) throw std::invalid_argument("Server::serve requires a transport");
    if (impl_->served.exchange(true)) {
        throw Error("Server::serve may only be called once");
    }

    auto* t = transport.get();
    if (!t->supports_correlation()) {
        Impl* impl = impl_.get();
        impl_->sequencer = std::make_unique<ResponseSequencer>(
            [impl](const JsonRpcMessage& m) { impl->send_message(m); });
    }
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
    }

    // Startup negotiation: capabilities reflect everything registered so far.
    auto caps = impl_->renegotiate();
    nlohmann::json caps_j = caps;
    log::logger()->info("serving {} {} with capabilities {}",
                        impl_->opts.server_info.name, impl_->opts.server_info.version,
                        caps_j.dump());

    impl_->running = true;
    impl_->start_thread_pool();

    try {
        t->start([this](JsonRpcMessage msg) { impl_->on_message(std::move(msg)); },
                 [this](std::exception_ptr e) { impl_->on_transport_error(e); });
    } catch (const TransportError& e) {
        log::logger()->error("transport failed: {}", e.what());
        impl_->finish(t);
        throw;
    }
    impl_->finish(t);
}

void Server::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void Server::serve_http(HttpServerTransport::Options opts) {
    serve(std::make_unique<HttpServerTransport>(std::move(opts)));
}

void Server::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool Server::is_running() const {
    return impl_->running;
}

size_t Server::in_flight() const {
    std::lock_guard<std::mutex> lock(impl_->inflight_mutex);
    return impl_->inflight.size();
}

size_t Server::active_handlers() const {
    return impl_->executor.active();
}

} // namespace toolhost
