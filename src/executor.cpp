#include "toolhost/executor.hpp"
#include "toolhost/error.hpp"
#include "toolhost/formatter.hpp"
#include "toolhost/log.hpp"

#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace toolhost {

namespace {

constexpr std::chrono::milliseconds kPollInterval{5};

ErrorEnvelope cancelled_envelope(CancelReason reason) {
    return ErrorEnvelope{error::RequestCancelled, "Request cancelled",
                         nlohmann::json{{"reason", std::string(cancel_reason_name(reason))}}};
}

ErrorEnvelope interrupted_envelope(CancelReason reason, std::chrono::milliseconds timeout) {
    if (reason == CancelReason::Timeout) {
        return ErrorEnvelope{error::RequestTimeout, "Request timed out",
                             nlohmann::json{{"timeoutMs", timeout.count()}}};
    }
    return cancelled_envelope(reason);
}

// Shared between invoke() and the handler thread; outlives either side.
struct Call {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::optional<InvocationResult> result;
};

} // anonymous namespace

// ---------- ConcurrencyLimiter ----------

ConcurrencyLimiter::Slot& ConcurrencyLimiter::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        reset();
        owner_ = std::move(other.owner_);
    }
    return *this;
}

void ConcurrencyLimiter::Slot::reset() {
    if (owner_) {
        owner_->release();
        owner_.reset();
    }
}

std::shared_ptr<ConcurrencyLimiter> ConcurrencyLimiter::create(size_t limit) {
    if (limit == 0) {
        throw std::invalid_argument("Concurrency limit must be at least 1");
    }
    return std::shared_ptr<ConcurrencyLimiter>(new ConcurrencyLimiter(limit));
}

ConcurrencyLimiter::Slot ConcurrencyLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || in_use_ >= limit_) return Slot{};
    ++in_use_;
    return Slot(shared_from_this());
}

ConcurrencyLimiter::Slot ConcurrencyLimiter::acquire_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ok = cv_.wait_for(lock, timeout, [this] { return closed_ || in_use_ < limit_; });
    if (!ok || closed_) return Slot{};
    ++in_use_;
    return Slot(shared_from_this());
}

void ConcurrencyLimiter::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ConcurrencyLimiter::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return in_use_ == 0; });
}

size_t ConcurrencyLimiter::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

void ConcurrencyLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_all();
}

// ---------- Executor ----------

Executor::Executor() : Executor(Options{}) {}

Executor::Executor(Options opts)
    : opts_(opts)
    , limiter_(ConcurrencyLimiter::create(opts.max_concurrent_handlers)) {
}

Executor::~Executor() {
    close();
}

void Executor::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    limiter_->close();
}

bool Executor::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool Executor::wait_idle(std::chrono::milliseconds timeout) {
    return limiter_->wait_idle(timeout);
}

size_t Executor::active() const {
    return limiter_->in_use();
}

InvocationResult Executor::invoke(const DescriptorPtr& descriptor,
                                  const nlohmann::json& arguments,
                                  RequestContext& ctx) {
    if (is_closed()) {
        return ErrorEnvelope{error::InvalidRequest, "server is shutting down", std::nullopt};
    }

    auto slot = opts_.admission == AdmissionPolicy::Wait
        ? limiter_->acquire_for(opts_.admission_timeout)
        : limiter_->try_acquire();
    if (!slot) {
        if (is_closed()) {
            return ErrorEnvelope{error::InvalidRequest, "server is shutting down", std::nullopt};
        }
        log::logger()->warn("admission rejected for '{}': {} handlers busy",
                            descriptor->name, limiter_->limit());
        return ErrorEnvelope{error::ResourceExhausted, "Too many concurrent requests",
                             nlohmann::json{{"retryable", true},
                                            {"limit", limiter_->limit()}}};
    }

    auto token = ctx.cancellation();
    if (token.is_cancelled()) {
        return cancelled_envelope(token.reason());
    }

    auto call = std::make_shared<Call>();
    // The handler gets its own copy of the context so an abandoned thread
    // never touches the caller's stack.
    auto run_ctx = std::make_shared<RequestContext>(ctx);

    try {
        std::thread([call, run_ctx, descriptor, arguments, slot = std::move(slot)]() mutable {
            auto result = run_contained(*descriptor, arguments, *run_ctx);
            slot.reset();
            {
                std::lock_guard<std::mutex> lock(call->mutex);
                call->result = std::move(result);
                call->done = true;
            }
            call->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        log::logger()->error("failed to start handler thread for '{}': {}",
                             descriptor->name, e.what());
        return ErrorEnvelope{error::InternalError, "Internal error", nlohmann::json(e.what())};
    }

    using clock = std::chrono::steady_clock;
    const bool timed = opts_.call_timeout.count() > 0;
    const auto deadline = clock::now() + opts_.call_timeout;

    std::unique_lock<std::mutex> lock(call->mutex);
    while (!call->done) {
        if (token.is_cancelled()) break;
        auto now = clock::now();
        if (timed && now >= deadline) {
            ctx.cancellation_source().cancel(CancelReason::Timeout);
            break;
        }
        auto wake = now + kPollInterval;
        if (timed && deadline < wake) wake = deadline;
        call->cv.wait_until(lock, wake);
    }
    if (call->done) {
        return std::move(*call->result);
    }

    // Cancellation fired while the handler was still running.
    const CancelReason reason = token.reason();
    bool finished = call->cv.wait_for(lock, opts_.cancel_grace, [&call] { return call->done; });
    if (finished) {
        log::logger()->debug("handler '{}' stopped after cancellation ({})",
                             descriptor->name, cancel_reason_name(reason));
    } else {
        log::logger()->warn("abandoning handler '{}' after {} ms grace ({})",
                            descriptor->name, opts_.cancel_grace.count(),
                            cancel_reason_name(reason));
    }
    return interrupted_envelope(reason, opts_.call_timeout);
}

InvocationResult run_contained(const CapabilityDescriptor& descriptor,
                               const nlohmann::json& arguments,
                               RequestContext& ctx) {
    try {
        return descriptor.handler(ctx, arguments);
    } catch (const ProtocolError& e) {
        return ErrorEnvelope{e.code, e.what(), e.detail};
    } catch (const CancelledError&) {
        return cancelled_envelope(ctx.cancellation().reason());
    } catch (const ValidationError& e) {
        return formatter::from_validation(e);
    } catch (const NotFoundError& e) {
        return ErrorEnvelope{error::ResourceNotFound, e.what(), std::nullopt};
    } catch (const std::exception& e) {
        log::logger()->error("handler '{}' failed: {}", descriptor.name, e.what());
        return ErrorEnvelope{error::InternalError, "Internal error", nlohmann::json(e.what())};
    } catch (...) {
        log::logger()->error("handler '{}' threw a non-standard exception", descriptor.name);
        return ErrorEnvelope{error::InternalError, "Internal error",
                             nlohmann::json("unknown exception")};
    }
}

} // namespace toolhost
