#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolhost {

// ---------- Categories ----------

enum class Category {
    Tool,
    Resource,
    Prompt
};

std::string_view category_name(Category c) noexcept;

// ---------- Annotations (defined first so content types can use it) ----------

struct Annotations {
    std::optional<std::vector<std::string>> audience; // "user", "assistant"
    std::optional<double> priority;                   // 0.0 .. 1.0
    std::optional<std::string> last_modified;         // ISO 8601

    bool operator==(const Annotations& o) const {
        return audience == o.audience && priority == o.priority
               && last_modified == o.last_modified;
    }
};

// ---------- Content blocks ----------

struct TextContent {
    std::string text;
    std::optional<Annotations> annotations;

    bool operator==(const TextContent& o) const {
        return text == o.text && annotations == o.annotations;
    }
};

struct ImageContent {
    std::string data;       // base64
    std::string mime_type;
    std::optional<Annotations> annotations;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type && annotations == o.annotations;
    }
};

/// Reference to a resource the client can read separately.
struct ResourceLink {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
    std::optional<Annotations> annotations;

    bool operator==(const ResourceLink& o) const {
        return uri == o.uri && name == o.name && description == o.description
               && mime_type == o.mime_type && annotations == o.annotations;
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64
    std::optional<Annotations> annotations;

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob && annotations == o.annotations;
    }
};

using Content = std::variant<TextContent, ImageContent, ResourceLink, EmbeddedResource>;

// ---------- Handler results ----------

struct CallToolResult {
    std::vector<Content> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && structured_content == o.structured_content
               && is_error == o.is_error;
    }
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const ResourceContent& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob;
    }
};

struct ReadResourceResult {
    std::vector<ResourceContent> contents;

    bool operator==(const ReadResourceResult& o) const { return contents == o.contents; }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    Content content;

    bool operator==(const PromptMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    bool operator==(const GetPromptResult& o) const {
        return description == o.description && messages == o.messages;
    }
};

// ---------- Invocation envelopes ----------

using SuccessContent = std::variant<CallToolResult, ReadResourceResult, GetPromptResult>;

struct ErrorEnvelope {
    int code;
    std::string message;
    std::optional<nlohmann::json> detail;

    bool operator==(const ErrorEnvelope& o) const {
        return code == o.code && message == o.message && detail == o.detail;
    }
};

using InvocationResult = std::variant<SuccessContent, ErrorEnvelope>;

struct InvocationRequest {
    Category category;
    std::string target;
    nlohmann::json arguments = nlohmann::json::object();
};

inline bool is_error(const InvocationResult& r) noexcept {
    return std::holds_alternative<ErrorEnvelope>(r);
}

// ---------- Capabilities ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> prompts;
    std::optional<nlohmann::json> logging;
    std::optional<nlohmann::json> experimental;

    bool advertises(Category c) const noexcept;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && resources == o.resources && prompts == o.prompts
               && logging == o.logging && experimental == o.experimental;
    }
};

struct ClientCapabilities {
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> elicitation;
    std::optional<nlohmann::json> experimental;

    bool operator==(const ClientCapabilities& o) const {
        return roots == o.roots && sampling == o.sampling && elicitation == o.elicitation
               && experimental == o.experimental;
    }
};

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && title == o.title && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info && instructions == o.instructions;
    }
};

// ---------- Client-visible logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s);

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Annotations& a);
void from_json(const nlohmann::json& j, Annotations& a);

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);

void to_json(nlohmann::json& j, const ResourceLink& t);
void from_json(const nlohmann::json& j, ResourceLink& t);

void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const ResourceContent& t);
void from_json(const nlohmann::json& j, ResourceContent& t);

void to_json(nlohmann::json& j, const ReadResourceResult& t);

void to_json(nlohmann::json& j, const PromptMessage& t);
void from_json(const nlohmann::json& j, PromptMessage& t);

void to_json(nlohmann::json& j, const GetPromptResult& t);
void from_json(const nlohmann::json& j, GetPromptResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const ClientCapabilities& t);
void from_json(const nlohmann::json& j, ClientCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

} // namespace toolhost
