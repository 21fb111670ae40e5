#include "toolhost/session.hpp"
#include "toolhost/version.hpp"

namespace toolhost {

std::string_view lifecycle_phase_name(LifecyclePhase p) noexcept {
    switch (p) {
        case LifecyclePhase::Uninitialized: return "uninitialized";
        case LifecyclePhase::Initializing:  return "initializing";
        case LifecyclePhase::Ready:         return "ready";
        case LifecyclePhase::ShuttingDown:  return "shutting-down";
        case LifecyclePhase::Closed:        return "closed";
    }
    return "unknown";
}

Session::Session(Implementation server_info,
                 ServerCapabilities capabilities,
                 std::optional<std::string> instructions,
                 std::chrono::system_clock::time_point started_at)
    : server_info_(std::move(server_info))
    , capabilities_(std::move(capabilities))
    , instructions_(std::move(instructions))
    , started_at_(started_at)
    , started_mono_(std::chrono::steady_clock::now()) {
}

std::chrono::milliseconds Session::uptime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_mono_);
}

Session Session::with_capabilities(ServerCapabilities capabilities) const {
    Session copy = *this;
    copy.capabilities_ = std::move(capabilities);
    return copy;
}

InitializeResult Session::initialize_result() const {
    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.capabilities = capabilities_;
    result.server_info = server_info_;
    result.instructions = instructions_;
    return result;
}

} // namespace toolhost
