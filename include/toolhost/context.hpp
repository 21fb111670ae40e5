#pragma once
#include "cancellation.hpp"
#include "json_rpc.hpp"
#include "session.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace toolhost {

/// Outbound hooks a handler may use while it runs. Both may be empty
/// (e.g. when the router is driven directly in tests).
struct ContextHooks {
    std::function<void(const JsonRpcNotification&)> notify;
    std::function<void(LogLevel, const std::string& logger, const nlohmann::json& data)> log;
};

/// Per-invocation view handed to handlers: read-only session, cancellation
/// signal, request identity, and progress/log reporting.
class RequestContext {
public:
    RequestContext(std::shared_ptr<const Session> session,
                   CancellationSource cancellation,
                   std::optional<RequestId> request_id = std::nullopt,
                   ContextHooks hooks = {});

    const Session& session() const noexcept { return *session_; }

    CancellationToken cancellation() const { return cancellation_.token(); }
    bool is_cancelled() const noexcept { return cancellation_.is_cancelled(); }

    /// Write side of the request's cancellation signal; used by the executor
    /// to fire the per-call timeout.
    CancellationSource& cancellation_source() noexcept { return cancellation_; }

    const std::optional<RequestId>& request_id() const noexcept { return request_id_; }

    Category category() const noexcept { return category_; }
    const std::string& target() const noexcept { return target_; }
    void set_target(Category category, std::string target);

    void set_progress_token(nlohmann::json token) { progress_token_ = std::move(token); }
    const std::optional<nlohmann::json>& progress_token() const noexcept { return progress_token_; }

    /// Emits notifications/progress if the client supplied a progress token.
    void report_progress(double progress,
                         std::optional<double> total = std::nullopt,
                         std::optional<std::string> message = std::nullopt) const;

    /// Client-visible log message (notifications/message), subject to the
    /// level set through logging/setLevel.
    void log(LogLevel level, const nlohmann::json& data) const;

private:
    std::shared_ptr<const Session> session_;
    CancellationSource cancellation_;
    std::optional<RequestId> request_id_;
    ContextHooks hooks_;
    Category category_{Category::Tool};
    std::string target_;
    std::optional<nlohmann::json> progress_token_;
};

} // namespace toolhost
