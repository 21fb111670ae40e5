#include "toolhost/formatter.hpp"
#include "toolhost/schema.hpp"

namespace toolhost::formatter {

JsonRpcResponse format(const RequestId& id, const InvocationResult& result) {
    JsonRpcResponse resp;
    resp.id = id;
    if (const auto* ok = std::get_if<SuccessContent>(&result)) {
        resp.result = to_json(*ok);
    } else {
        resp.error = to_error(std::get<ErrorEnvelope>(result));
    }
    return resp;
}

nlohmann::json to_json(const SuccessContent& content) {
    return std::visit([](const auto& v) {
        nlohmann::json j;
        toolhost::to_json(j, v);
        return j;
    }, content);
}

JsonRpcError to_error(const ErrorEnvelope& envelope) {
    std::string message = envelope.message.empty() ? "Unknown error" : envelope.message;
    return JsonRpcError{envelope.code, std::move(message), envelope.detail};
}

nlohmann::json describe(Category category, const CapabilityDescriptor& d) {
    nlohmann::json j = nlohmann::json::object();
    switch (category) {
        case Category::Tool:
            j["name"] = d.name;
            if (d.title) j["title"] = *d.title;
            j["description"] = d.description;
            j["inputSchema"] = schema::to_input_schema(d.params);
            break;

        case Category::Resource:
            j[d.is_template() ? "uriTemplate" : "uri"] = d.name;
            j["name"] = d.title ? *d.title : d.name;
            if (d.title) j["title"] = *d.title;
            if (!d.description.empty()) j["description"] = d.description;
            if (d.mime_type) j["mimeType"] = *d.mime_type;
            break;

        case Category::Prompt: {
            j["name"] = d.name;
            if (d.title) j["title"] = *d.title;
            if (!d.description.empty()) j["description"] = d.description;
            nlohmann::json args = nlohmann::json::array();
            for (const auto& p : d.params) {
                nlohmann::json a = {{"name", p.name}, {"required", p.required}};
                if (!p.description.empty()) a["description"] = p.description;
                args.push_back(std::move(a));
            }
            j["arguments"] = std::move(args);
            break;
        }
    }
    if (d.annotations) j["annotations"] = *d.annotations;
    return j;
}

ErrorEnvelope from_validation(const ValidationError& e) {
    nlohmann::json errors = nlohmann::json::array();
    for (const auto& fe : e.errors()) {
        errors.push_back({{"field", fe.field}, {"message", fe.message}});
    }
    return ErrorEnvelope{error::InvalidParams, e.what(), nlohmann::json{{"errors", std::move(errors)}}};
}

} // namespace toolhost::formatter
