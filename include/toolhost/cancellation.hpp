#pragma once
#include <chrono>
#include <memory>
#include <string_view>

namespace toolhost {

enum class CancelReason {
    None,
    Client,      // notifications/cancelled from the peer
    Disconnect,  // transport closed
    Timeout      // per-call timeout elapsed
};

std::string_view cancel_reason_name(CancelReason r) noexcept;

/// Read side of a cancellation signal. Cheap to copy; all copies observe the
/// same state. A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken();

    [[nodiscard]] bool is_cancelled() const noexcept;
    [[nodiscard]] CancelReason reason() const noexcept;

    /// Block up to `timeout` or until cancelled. Returns true if cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

    /// Throws CancelledError if the token has fired.
    void throw_if_cancelled() const;

private:
    struct State;
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

/// Write side. The first cancel() wins and fixes the reason.
class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] CancellationToken token() const;

    /// Returns false if already cancelled.
    bool cancel(CancelReason reason);

    [[nodiscard]] bool is_cancelled() const noexcept;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace toolhost
