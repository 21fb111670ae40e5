#include "toolhost/types.hpp"
#include <stdexcept>

namespace toolhost {

std::string_view category_name(Category c) noexcept {
    switch (c) {
        case Category::Tool:     return "tools";
        case Category::Resource: return "resources";
        case Category::Prompt:   return "prompts";
    }
    return "unknown";
}

bool ServerCapabilities::advertises(Category c) const noexcept {
    switch (c) {
        case Category::Tool:     return tools.has_value();
        case Category::Resource: return resources.has_value();
        case Category::Prompt:   return prompts.has_value();
    }
    return false;
}

// ---------- Annotations ----------

void to_json(nlohmann::json& j, const Annotations& a) {
    j = nlohmann::json::object();
    if (a.audience) j["audience"] = *a.audience;
    if (a.priority) j["priority"] = *a.priority;
    if (a.last_modified) j["lastModified"] = *a.last_modified;
}

void from_json(const nlohmann::json& j, Annotations& a) {
    if (j.contains("audience")) a.audience = j.at("audience").get<std::vector<std::string>>();
    if (j.contains("priority")) a.priority = j.at("priority").get<double>();
    if (j.contains("lastModified")) a.last_modified = j.at("lastModified").get<std::string>();
}

// ---------- Content blocks ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
    if (j.contains("annotations")) t.annotations = j.at("annotations").get<Annotations>();
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
    if (j.contains("annotations")) t.annotations = j.at("annotations").get<Annotations>();
}

void to_json(nlohmann::json& j, const ResourceLink& t) {
    j = {{"type", "resource_link"}, {"uri", t.uri}, {"name", t.name}};
    if (t.description) j["description"] = *t.description;
    if (t.mime_type) j["mimeType"] = *t.mime_type;
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, ResourceLink& t) {
    t.uri = j.at("uri").get<std::string>();
    t.name = j.at("name").get<std::string>();
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
    if (j.contains("mimeType")) t.mime_type = j.at("mimeType").get<std::string>();
    if (j.contains("annotations")) t.annotations = j.at("annotations").get<Annotations>();
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource;
    resource["uri"] = t.uri;
    if (t.mime_type) resource["mimeType"] = *t.mime_type;
    if (t.text) resource["text"] = *t.text;
    if (t.blob) resource["blob"] = *t.blob;
    j = {{"type", "resource"}, {"resource", resource}};
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& resource = j.at("resource");
    t.uri = resource.at("uri").get<std::string>();
    if (resource.contains("mimeType")) t.mime_type = resource.at("mimeType").get<std::string>();
    if (resource.contains("text")) t.text = resource.at("text").get<std::string>();
    if (resource.contains("blob")) t.blob = resource.at("blob").get<std::string>();
    if (j.contains("annotations")) t.annotations = j.at("annotations").get<Annotations>();
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "image") {
        c = j.get<ImageContent>();
    } else if (type == "resource_link") {
        c = j.get<ResourceLink>();
    } else if (type == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        throw std::invalid_argument("Unknown content type: " + type);
    }
}

// ---------- Handler results ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(std::move(cj));
    }
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            Content c;
            from_json(cj, c);
            t.content.push_back(std::move(c));
        }
    }
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = {{"uri", t.uri}};
    if (t.mime_type) j["mimeType"] = *t.mime_type;
    if (t.text) j["text"] = *t.text;
    if (t.blob) j["blob"] = *t.blob;
}

void from_json(const nlohmann::json& j, ResourceContent& t) {
    t.uri = j.at("uri").get<std::string>();
    if (j.contains("mimeType")) t.mime_type = j.at("mimeType").get<std::string>();
    if (j.contains("text")) t.text = j.at("text").get<std::string>();
    if (j.contains("blob")) t.blob = j.at("blob").get<std::string>();
}

void to_json(nlohmann::json& j, const ReadResourceResult& t) {
    j = nlohmann::json::object();
    j["contents"] = nlohmann::json::array();
    for (const auto& c : t.contents) {
        j["contents"].push_back(c);
    }
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    nlohmann::json content_j;
    to_json(content_j, t.content);
    j = {{"role", t.role}, {"content", content_j}};
}

void from_json(const nlohmann::json& j, PromptMessage& t) {
    t.role = j.at("role").get<std::string>();
    from_json(j.at("content"), t.content);
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = nlohmann::json::object();
    j["messages"] = nlohmann::json::array();
    for (const auto& m : t.messages) {
        j["messages"].push_back(m);
    }
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, GetPromptResult& t) {
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
    t.messages = j.at("messages").get<std::vector<PromptMessage>>();
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.resources) j["resources"] = *t.resources;
    if (t.prompts) j["prompts"] = *t.prompts;
    if (t.logging) j["logging"] = *t.logging;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("resources")) t.resources = j.at("resources");
    if (j.contains("prompts")) t.prompts = j.at("prompts");
    if (j.contains("logging")) t.logging = j.at("logging");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const ClientCapabilities& t) {
    j = nlohmann::json::object();
    if (t.roots) j["roots"] = *t.roots;
    if (t.sampling) j["sampling"] = *t.sampling;
    if (t.elicitation) j["elicitation"] = *t.elicitation;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    if (j.contains("roots")) t.roots = j.at("roots");
    if (j.contains("sampling")) t.sampling = j.at("sampling");
    if (j.contains("elicitation")) t.elicitation = j.at("elicitation");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    if (j.contains("title")) t.title = j.at("title").get<std::string>();
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

// ---------- LogLevel ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
    }
    return "info";
}

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug")     return LogLevel::Debug;
    if (s == "info")      return LogLevel::Info;
    if (s == "notice")    return LogLevel::Notice;
    if (s == "warning")   return LogLevel::Warning;
    if (s == "error")     return LogLevel::Error;
    if (s == "critical")  return LogLevel::Critical;
    if (s == "alert")     return LogLevel::Alert;
    if (s == "emergency") return LogLevel::Emergency;
    throw std::invalid_argument("Unknown log level: " + s);
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

} // namespace toolhost
