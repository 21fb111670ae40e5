#pragma once
#include "registry.hpp"
#include "types.hpp"
#include <optional>

namespace toolhost {

/// Explicit capability overrides from the embedding application.
/// Unset means "advertise if something is registered".
struct CapabilityFlags {
    std::optional<bool> tools;
    std::optional<bool> resources;
    std::optional<bool> prompts;
    bool resources_subscribe = false;
    bool list_changed = true;
};

/// Compute the advertised capabilities. An explicit false always wins over a
/// populated registry; an explicit true advertises even an empty category.
[[nodiscard]] ServerCapabilities negotiate(const CapabilityRegistry& registry,
                                           const CapabilityFlags& flags);

} // namespace toolhost
