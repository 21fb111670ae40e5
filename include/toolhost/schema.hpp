#pragma once
#include "error.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolhost {

enum class ParamType {
    String,
    Integer,
    Number,
    Boolean,
    Object,
    Array,
    Any
};

std::string_view param_type_name(ParamType t) noexcept;
ParamType param_type_from_string(std::string_view s);

/// One declared argument of a tool, prompt or resource template.
struct ParamSpec {
    std::string name;
    std::string description;
    ParamType type = ParamType::String;
    bool required = false;
    std::optional<nlohmann::json> default_value;

    bool operator==(const ParamSpec& o) const {
        return name == o.name && description == o.description && type == o.type
               && required == o.required && default_value == o.default_value;
    }
};

enum class UnknownArguments {
    Reject,
    Ignore
};

namespace schema {

/// Validate `arguments` against `params` and return the normalized payload:
/// values coerced to their declared type, defaults filled in, and (under
/// UnknownArguments::Ignore) undeclared keys dropped.
/// Throws ValidationError listing every offending field.
[[nodiscard]] nlohmann::json validate(const std::vector<ParamSpec>& params,
                                      const nlohmann::json& arguments,
                                      UnknownArguments unknown = UnknownArguments::Reject);

/// Render a parameter list as a JSON Schema object for tools/list.
[[nodiscard]] nlohmann::json to_input_schema(const std::vector<ParamSpec>& params);

/// Build a parameter list from a JSON Schema object ("properties" +
/// "required"). Properties come out in key order.
[[nodiscard]] std::vector<ParamSpec> from_input_schema(const nlohmann::json& input_schema);

} // namespace schema

} // namespace toolhost
