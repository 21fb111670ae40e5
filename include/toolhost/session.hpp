#pragma once
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace toolhost {

enum class LifecyclePhase {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Closed
};

std::string_view lifecycle_phase_name(LifecyclePhase p) noexcept;

/// Process-wide identity and negotiated capabilities. Built once per
/// negotiation and never mutated; handlers see it through RequestContext.
class Session {
public:
    Session(Implementation server_info,
            ServerCapabilities capabilities,
            std::optional<std::string> instructions = std::nullopt,
            std::chrono::system_clock::time_point started_at = std::chrono::system_clock::now());

    const Implementation& server_info() const noexcept { return server_info_; }
    const ServerCapabilities& capabilities() const noexcept { return capabilities_; }
    const std::optional<std::string>& instructions() const noexcept { return instructions_; }
    std::chrono::system_clock::time_point started_at() const noexcept { return started_at_; }

    std::chrono::milliseconds uptime() const;

    /// Same identity and start time, new capabilities (explicit re-negotiation).
    Session with_capabilities(ServerCapabilities capabilities) const;

    InitializeResult initialize_result() const;

private:
    Implementation server_info_;
    ServerCapabilities capabilities_;
    std::optional<std::string> instructions_;
    std::chrono::system_clock::time_point started_at_;
    std::chrono::steady_clock::time_point started_mono_;
};

} // namespace toolhost
