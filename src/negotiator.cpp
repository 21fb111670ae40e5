#include "toolhost/negotiator.hpp"

namespace toolhost {

namespace {

bool enabled(const std::optional<bool>& flag, const CapabilityRegistry& registry, Category c) {
    if (flag) return *flag;
    return !registry.empty(c);
}

} // anonymous namespace

ServerCapabilities negotiate(const CapabilityRegistry& registry, const CapabilityFlags& flags) {
    ServerCapabilities caps;
    if (enabled(flags.tools, registry, Category::Tool)) {
        caps.tools = nlohmann::json{{"listChanged", flags.list_changed}};
    }
    if (enabled(flags.resources, registry, Category::Resource)) {
        caps.resources = nlohmann::json{
            {"subscribe", flags.resources_subscribe},
            {"listChanged", flags.list_changed}
        };
    }
    if (enabled(flags.prompts, registry, Category::Prompt)) {
        caps.prompts = nlohmann::json{{"listChanged", flags.list_changed}};
    }
    caps.logging = nlohmann::json::object();
    return caps;
}

} // namespace toolhost
