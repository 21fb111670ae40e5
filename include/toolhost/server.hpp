#pragma once
#include "context.hpp"
#include "executor.hpp"
#include "negotiator.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "schema.hpp"
#include "session.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include "transport/http_transport.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

/// Typed handler signatures. Arguments arrive validated against the
/// declared parameters; throwing is allowed and becomes an error response.
using ToolHandler = std::function<CallToolResult(RequestContext& ctx,
                                                 const nlohmann::json& arguments)>;
/// `variables` holds the URI template captures (empty for exact URIs).
using ResourceHandler = std::function<ReadResourceResult(RequestContext& ctx,
                                                         const std::string& uri,
                                                         const nlohmann::json& variables)>;
using PromptHandler = std::function<GetPromptResult(RequestContext& ctx,
                                                    const nlohmann::json& arguments)>;

struct ToolSpec {
    std::string name;
    std::optional<std::string> title;
    std::string description;
    std::vector<ParamSpec> params;
    std::optional<nlohmann::json> annotations;
};

/// `uri` may be a URI template such as "file:///{path}"; its variables are
/// declared as required string parameters unless `params` says otherwise.
struct ResourceSpec {
    std::string uri;
    std::optional<std::string> title;
    std::string description;
    std::optional<std::string> mime_type;
    std::vector<ParamSpec> params;
    std::optional<nlohmann::json> annotations;
};

struct PromptSpec {
    std::string name;
    std::optional<std::string> title;
    std::string description;
    std::vector<ParamSpec> params;
};

class Server {
public:
    struct Options {
        Implementation server_info{"toolhost", std::nullopt, std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        CapabilityFlags capabilities;
        RegistrationPolicy registration = RegistrationPolicy::Strict;
        Router::Options router;
        Executor::Options executor;
        /// Lower bound; the pool always has one worker more than
        /// executor.max_concurrent_handlers.
        size_t worker_threads = 4;
        size_t max_pending_requests = 256;
        size_t page_size = 50;
        /// How long serve() waits for abandoned handlers once the transport closes.
        std::chrono::milliseconds drain_timeout{5000};
    };

    Server();
    explicit Server(Options opts);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ---- Registration ----
    void add_tool(ToolSpec spec, ToolHandler handler);
    void add_resource(ResourceSpec spec, ResourceHandler handler);
    void add_prompt(PromptSpec spec, PromptHandler handler);

    /// Register a raw descriptor with a type-erased handler.
    void add(Category category, CapabilityDescriptor descriptor);

    bool remove_tool(const std::string& name);
    bool remove_resource(const std::string& uri);
    bool remove_prompt(const std::string& name);

    const CapabilityRegistry& registry() const;

    // ---- Capabilities and session ----

    /// Recompute the advertisement from the current registry. Capabilities
    /// are otherwise fixed when the server is constructed.
    ServerCapabilities renegotiate();

    std::shared_ptr<const Session> session() const;
    LifecyclePhase phase() const;

    /// What the client sent in initialize; empty before that.
    std::optional<Implementation> client_info() const;
    ClientCapabilities client_capabilities() const;

    // ---- Outbound notifications ----
    void notify_resource_updated(const std::string& uri);

    /// notifications/message, filtered by the level set via logging/setLevel.
    void log(LogLevel level, const std::string& logger, const nlohmann::json& data);

    // ---- Transport ----

    /// Serve until the transport closes or shutdown() is called. A server
    /// serves once: afterwards it is Closed.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();
    void serve_http(HttpServerTransport::Options opts);
    void shutdown();

    bool is_running() const;

    /// Requests currently dispatched and not yet answered.
    size_t in_flight() const;

    /// Handler threads still running, including abandoned ones.
    size_t active_handlers() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace toolhost
