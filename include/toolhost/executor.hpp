#pragma once
#include "context.hpp"
#include "registry.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace toolhost {

enum class AdmissionPolicy {
    Wait,    // block up to admission_timeout for a free slot
    Reject   // fail at once when all slots are busy
};

/// Counting semaphore with close(). Shared so that an abandoned handler
/// thread can still release its slot after the executor is gone.
class ConcurrencyLimiter : public std::enable_shared_from_this<ConcurrencyLimiter> {
public:
    /// Held for the lifetime of one handler run.
    class Slot {
    public:
        Slot() = default;
        Slot(Slot&& other) noexcept : owner_(std::move(other.owner_)) {}
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot() { reset(); }

        explicit operator bool() const noexcept { return owner_ != nullptr; }
        void reset();

    private:
        friend class ConcurrencyLimiter;
        explicit Slot(std::shared_ptr<ConcurrencyLimiter> owner) : owner_(std::move(owner)) {}
        std::shared_ptr<ConcurrencyLimiter> owner_;
    };

    static std::shared_ptr<ConcurrencyLimiter> create(size_t limit);

    /// Empty slot if none is free or the limiter is closed.
    Slot try_acquire();

    /// Wait up to `timeout`; empty slot on timeout or close().
    Slot acquire_for(std::chrono::milliseconds timeout);

    /// Wake all waiters and refuse further acquisitions.
    void close();

    /// Block until no slot is held or `timeout` elapses. True when idle.
    bool wait_idle(std::chrono::milliseconds timeout);

    size_t in_use() const;
    size_t limit() const noexcept { return limit_; }

private:
    explicit ConcurrencyLimiter(size_t limit) : limit_(limit) {}
    void release();

    const size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_use_ = 0;
    bool closed_ = false;
};

/// Runs handlers with bounded concurrency, per-call timeout and fault
/// containment. Nothing thrown by a handler escapes invoke().
class Executor {
public:
    struct Options {
        size_t max_concurrent_handlers = 8;
        AdmissionPolicy admission = AdmissionPolicy::Wait;
        std::chrono::milliseconds admission_timeout{1000};
        std::chrono::milliseconds call_timeout{30000};   // zero disables
        std::chrono::milliseconds cancel_grace{250};
    };

    Executor();
    explicit Executor(Options opts);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    /// Acquire a slot, run the handler on its own thread and wait for it,
    /// the context's cancellation, or the call timeout. If the handler does
    /// not finish within cancel_grace after cancellation it is abandoned and
    /// keeps its slot until it returns.
    [[nodiscard]] InvocationResult invoke(const DescriptorPtr& descriptor,
                                          const nlohmann::json& arguments,
                                          RequestContext& ctx);

    /// Stop admitting new invocations. Running handlers are unaffected.
    void close();
    [[nodiscard]] bool is_closed() const;

    /// Wait for all handler threads (including abandoned ones) to return.
    bool wait_idle(std::chrono::milliseconds timeout);

    /// Handler threads currently holding a slot.
    [[nodiscard]] size_t active() const;

    const Options& options() const noexcept { return opts_; }

private:
    Options opts_;
    std::shared_ptr<ConcurrencyLimiter> limiter_;
    mutable std::mutex mutex_;
    bool closed_ = false;
};

/// Run a handler inline and convert anything it throws into an envelope.
[[nodiscard]] InvocationResult run_contained(const CapabilityDescriptor& descriptor,
                                             const nlohmann::json& arguments,
                                             RequestContext& ctx);

} // namespace toolhost
