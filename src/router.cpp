#include "toolhost/router.hpp"
#include "toolhost/error.hpp"
#include "toolhost/formatter.hpp"
#include "toolhost/log.hpp"

namespace toolhost {

namespace {

ErrorEnvelope invalid_params(std::string message) {
    return ErrorEnvelope{error::InvalidParams, std::move(message), std::nullopt};
}

JsonRpcResponse error_response(const RequestId& id, JsonRpcError err) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = std::move(err);
    return resp;
}

} // anonymous namespace

std::optional<Category> invocation_category(const std::string& method) {
    if (method == "tools/call") return Category::Tool;
    if (method == "resources/read") return Category::Resource;
    if (method == "prompts/get") return Category::Prompt;
    return std::nullopt;
}

Router::Router(const CapabilityRegistry& registry, Executor& executor)
    : Router(registry, executor, Options{}) {}

Router::Router(const CapabilityRegistry& registry, Executor& executor, Options opts)
    : registry_(registry), executor_(executor), opts_(opts) {}

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    if (invocation_category(method)) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::variant<InvocationRequest, ErrorEnvelope>
Router::decode(const std::string& method, const nlohmann::json& params,
               const ServerCapabilities& capabilities) const {
    auto category = invocation_category(method);
    if (!category) {
        return ErrorEnvelope{error::MethodNotFound, "Method not found: " + method, std::nullopt};
    }
    if (!capabilities.advertises(*category)) {
        return ErrorEnvelope{error::MethodNotFound,
                             "Capability not supported: " + std::string(category_name(*category)),
                             std::nullopt};
    }
    if (!params.is_null() && !params.is_object()) {
        return invalid_params("params must be an object");
    }

    const char* key = *category == Category::Resource ? "uri" : "name";
    if (!params.is_object() || !params.contains(key) || !params.at(key).is_string()) {
        return invalid_params(std::string("Missing required parameter: ") + key);
    }

    InvocationRequest req;
    req.category = *category;
    req.target = params.at(key).get<std::string>();
    if (*category != Category::Resource && params.contains("arguments")) {
        const auto& args = params.at("arguments");
        if (!args.is_null()) {
            if (!args.is_object()) return invalid_params("arguments must be an object");
            req.arguments = args;
        }
    }
    return req;
}

DescriptorPtr Router::resolve(const InvocationRequest& request, nlohmann::json& arguments) const {
    auto d = registry_.find(request.category, request.target);
    if (request.category != Category::Resource) return d;

    // Exact URIs win over templates.
    if (d && !d->is_template()) return d;
    if (auto match = registry_.match_template(request.target)) {
        arguments = std::move(match->variables);
        return match->descriptor;
    }
    return nullptr;
}

InvocationResult Router::route(const InvocationRequest& request, RequestContext& ctx) {
    nlohmann::json arguments = request.arguments;
    auto descriptor = resolve(request, arguments);
    if (!descriptor) {
        return ErrorEnvelope{
            error::InvalidParams,
            "Unknown " + std::string(category_name(request.category)) + " target: " + request.target,
            nlohmann::json{{"reason", "unknown target"}, {"target", request.target}}
        };
    }

    ctx.set_target(request.category, request.target);

    nlohmann::json validated;
    try {
        validated = schema::validate(descriptor->params, arguments, opts_.unknown_arguments);
    } catch (const ValidationError& e) {
        log::logger()->debug("rejected {} '{}': {}", category_name(request.category),
                             request.target, e.what());
        return formatter::from_validation(e);
    }

    return executor_.invoke(descriptor, validated, ctx);
}

JsonRpcResponse Router::handle_request(const JsonRpcRequest& request, RequestContext& ctx) {
    const nlohmann::json params = request.params ? *request.params : nlohmann::json::object();

    if (invocation_category(request.method)) {
        auto decoded = decode(request.method, params, ctx.session().capabilities());
        if (auto* err = std::get_if<ErrorEnvelope>(&decoded)) {
            return formatter::format(request.id, *err);
        }
        if (params.is_object() && params.contains("_meta") && params.at("_meta").is_object()) {
            const auto& meta = params.at("_meta");
            if (meta.contains("progressToken")) ctx.set_progress_token(meta.at("progressToken"));
        }
        auto result = route(std::get<InvocationRequest>(decoded), ctx);
        return formatter::format(request.id, result);
    }

    // Hold the lock only to look up the handler
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(request.method);
        if (it == request_handlers_.end()) {
            return error_response(request.id, JsonRpcError{
                error::MethodNotFound, "Method not found: " + request.method, std::nullopt});
        }
        handler = it->second;
    }

    try {
        auto result = handler(params);
        JsonRpcResponse resp;
        resp.id = request.id;
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp.result = std::move(*ok);
        } else {
            resp.error = std::get<JsonRpcError>(std::move(result));
        }
        return resp;
    } catch (const ProtocolError& e) {
        return error_response(request.id, JsonRpcError{e.code, e.what(), e.detail});
    } catch (const nlohmann::json::exception& e) {
        return error_response(request.id, JsonRpcError{
            error::InvalidParams, "Invalid params for " + request.method,
            nlohmann::json(e.what())});
    } catch (const std::exception& e) {
        log::logger()->error("control method '{}' failed: {}", request.method, e.what());
        return error_response(request.id, JsonRpcError{error::InternalError, e.what(), std::nullopt});
    }
}

void Router::handle_notification(const JsonRpcNotification& notification) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notification.method);
        if (it == notification_handlers_.end()) {
            log::logger()->debug("ignoring notification '{}'", notification.method);
            return;
        }
        handler = it->second;
    }
    try {
        handler(notification.params ? *notification.params : nlohmann::json::object());
    } catch (const std::exception& e) {
        log::logger()->warn("notification '{}' failed: {}", notification.method, e.what());
    }
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg, RequestContext& ctx) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return JsonRpcMessage{handle_request(*req, ctx)};
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        handle_notification(*notif);
    }
    // Responses from the peer are not routed.
    return std::nullopt;
}

} // namespace toolhost
