#pragma once
#include "context.hpp"
#include "executor.hpp"
#include "json_rpc.hpp"
#include "registry.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace toolhost {

/// Control methods (initialize, */list, ping, ...) answer with raw JSON.
using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method that invokes a registered capability in `category`.
std::optional<Category> invocation_category(const std::string& method);

/// Turns requests into invocations: decode, resolve, validate, execute,
/// format. The category always comes from the method, never the target.
class Router {
public:
    struct Options {
        UnknownArguments unknown_arguments = UnknownArguments::Reject;
    };

    Router(const CapabilityRegistry& registry, Executor& executor);
    Router(const CapabilityRegistry& registry, Executor& executor, Options opts);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// Register a control request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    [[nodiscard]] bool has_handler(const std::string& method) const;

    /// Map a method and its params onto an InvocationRequest. Unknown or
    /// unadvertised categories yield MethodNotFound; a missing name/uri or
    /// malformed arguments yield InvalidParams.
    [[nodiscard]] std::variant<InvocationRequest, ErrorEnvelope>
    decode(const std::string& method, const nlohmann::json& params,
           const ServerCapabilities& capabilities) const;

    /// Resolve, validate and execute an already decoded request.
    [[nodiscard]] InvocationResult route(const InvocationRequest& request, RequestContext& ctx);

    /// Full request path; always produces a response.
    [[nodiscard]] JsonRpcResponse handle_request(const JsonRpcRequest& request,
                                                 RequestContext& ctx);

    /// Notifications never produce a response; handler failures are logged.
    void handle_notification(const JsonRpcNotification& notification);

    /// Dispatch an incoming message. Returns a response for requests.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg,
                                                         RequestContext& ctx);

    const Options& options() const noexcept { return opts_; }

private:
    DescriptorPtr resolve(const InvocationRequest& request, nlohmann::json& arguments) const;

    const CapabilityRegistry& registry_;
    Executor& executor_;
    Options opts_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace toolhost
