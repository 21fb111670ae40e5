#include "toolhost/cancellation.hpp"
#include "toolhost/error.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace toolhost {

struct CancellationToken::State {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
    std::atomic<CancelReason> reason{CancelReason::None};
};

std::string_view cancel_reason_name(CancelReason r) noexcept {
    switch (r) {
        case CancelReason::None:       return "none";
        case CancelReason::Client:     return "cancelled by client";
        case CancelReason::Disconnect: return "transport disconnected";
        case CancelReason::Timeout:    return "timed out";
    }
    return "unknown";
}

// ---------- CancellationToken ----------

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {
}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state)) {
}

bool CancellationToken::is_cancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
}

CancelReason CancellationToken::reason() const noexcept {
    return state_->reason.load(std::memory_order_acquire);
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] {
        return state_->cancelled.load(std::memory_order_acquire);
    });
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw CancelledError(std::string("Request ") + std::string(cancel_reason_name(reason())));
    }
}

// ---------- CancellationSource ----------

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

bool CancellationSource::cancel(CancelReason reason) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load(std::memory_order_acquire)) return false;
        state_->reason.store(reason, std::memory_order_release);
        state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
    return true;
}

bool CancellationSource::is_cancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
}

} // namespace toolhost
