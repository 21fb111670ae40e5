#include "toolhost/context.hpp"

namespace toolhost {

RequestContext::RequestContext(std::shared_ptr<const Session> session,
                               CancellationSource cancellation,
                               std::optional<RequestId> request_id,
                               ContextHooks hooks)
    : session_(std::move(session))
    , cancellation_(std::move(cancellation))
    , request_id_(std::move(request_id))
    , hooks_(std::move(hooks)) {
}

void RequestContext::set_target(Category category, std::string target) {
    category_ = category;
    target_ = std::move(target);
}

void RequestContext::report_progress(double progress,
                                     std::optional<double> total,
                                     std::optional<std::string> message) const {
    if (!progress_token_ || !hooks_.notify) return;

    nlohmann::json params = {
        {"progressToken", *progress_token_},
        {"progress", progress}
    };
    if (total) params["total"] = *total;
    if (message) params["message"] = *message;
    hooks_.notify(JsonRpcNotification{"notifications/progress", std::move(params)});
}

void RequestContext::log(LogLevel level, const nlohmann::json& data) const {
    if (!hooks_.log) return;
    hooks_.log(level, target_, data);
}

} // namespace toolhost
