#include "toolhost/schema.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <set>

namespace toolhost {

ValidationError::ValidationError(std::vector<FieldError> errors)
    : Error([&errors] {
          std::string msg = "Invalid arguments";
          for (size_t i = 0; i < errors.size(); ++i) {
              msg += (i == 0 ? ": " : "; ");
              msg += errors[i].field.empty() ? errors[i].message
                                             : errors[i].field + " " + errors[i].message;
          }
          return msg;
      }())
    , errors_(std::move(errors)) {
}

std::string_view param_type_name(ParamType t) noexcept {
    switch (t) {
        case ParamType::String:  return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number:  return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Object:  return "object";
        case ParamType::Array:   return "array";
        case ParamType::Any:     return "any";
    }
    return "any";
}

ParamType param_type_from_string(std::string_view s) {
    if (s == "string")  return ParamType::String;
    if (s == "integer") return ParamType::Integer;
    if (s == "number")  return ParamType::Number;
    if (s == "boolean") return ParamType::Boolean;
    if (s == "object")  return ParamType::Object;
    if (s == "array")   return ParamType::Array;
    if (s == "any")     return ParamType::Any;
    throw std::invalid_argument("Unknown parameter type: " + std::string(s));
}

namespace schema {

namespace {

std::optional<int64_t> parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
    return static_cast<int64_t>(v);
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

// Returns the coerced value, or nullopt when the value cannot represent `type`.
std::optional<nlohmann::json> coerce(const nlohmann::json& v, ParamType type) {
    switch (type) {
        case ParamType::Any:
            return v;
        case ParamType::String:
            if (v.is_string()) return v;
            if (v.is_number() || v.is_boolean()) return nlohmann::json(v.dump());
            return std::nullopt;
        case ParamType::Integer:
            if (v.is_number_integer()) return v;
            if (v.is_number_float()) {
                double d = v.get<double>();
                if (std::trunc(d) == d && std::abs(d) < 9.0e15) {
                    return nlohmann::json(static_cast<int64_t>(d));
                }
                return std::nullopt;
            }
            if (v.is_string()) {
                if (auto i = parse_int(v.get<std::string>())) return nlohmann::json(*i);
            }
            return std::nullopt;
        case ParamType::Number:
            if (v.is_number()) return v;
            if (v.is_string()) {
                if (auto d = parse_double(v.get<std::string>())) return nlohmann::json(*d);
            }
            return std::nullopt;
        case ParamType::Boolean:
            if (v.is_boolean()) return v;
            if (v.is_string()) {
                const auto& s = v.get_ref<const std::string&>();
                if (s == "true") return nlohmann::json(true);
                if (s == "false") return nlohmann::json(false);
            }
            return std::nullopt;
        case ParamType::Object:
            if (v.is_object()) return v;
            return std::nullopt;
        case ParamType::Array:
            if (v.is_array()) return v;
            return std::nullopt;
    }
    return std::nullopt;
}

} // anonymous namespace

nlohmann::json validate(const std::vector<ParamSpec>& params,
                        const nlohmann::json& arguments,
                        UnknownArguments unknown) {
    if (!arguments.is_null() && !arguments.is_object()) {
        throw ValidationError({FieldError{"", "arguments must be an object"}});
    }
    const nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;

    std::vector<FieldError> errors;
    nlohmann::json out = nlohmann::json::object();
    std::set<std::string> declared;

    for (const auto& p : params) {
        declared.insert(p.name);
        auto it = args.find(p.name);
        bool present = it != args.end() && !it->is_null();

        if (!present) {
            if (p.default_value) {
                out[p.name] = *p.default_value;
            } else if (p.required) {
                errors.push_back({p.name, "is required"});
            }
            continue;
        }

        auto coerced = coerce(*it, p.type);
        if (!coerced) {
            errors.push_back({p.name, "expected " + std::string(param_type_name(p.type))});
            continue;
        }
        out[p.name] = std::move(*coerced);
    }

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (declared.count(it.key())) continue;
        if (unknown == UnknownArguments::Reject) {
            errors.push_back({it.key(), "is not a declared argument"});
        }
    }

    if (!errors.empty()) throw ValidationError(std::move(errors));
    return out;
}

nlohmann::json to_input_schema(const std::vector<ParamSpec>& params) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& p : params) {
        nlohmann::json prop = nlohmann::json::object();
        if (p.type != ParamType::Any) prop["type"] = std::string(param_type_name(p.type));
        if (!p.description.empty()) prop["description"] = p.description;
        if (p.default_value) prop["default"] = *p.default_value;
        properties[p.name] = std::move(prop);
        if (p.required) required.push_back(p.name);
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (!required.empty()) schema["required"] = std::move(required);
    return schema;
}

std::vector<ParamSpec> from_input_schema(const nlohmann::json& input_schema) {
    std::vector<ParamSpec> params;
    if (!input_schema.is_object()) return params;

    std::set<std::string> required;
    if (input_schema.contains("required") && input_schema.at("required").is_array()) {
        for (const auto& r : input_schema.at("required")) {
            required.insert(r.get<std::string>());
        }
    }
    if (!input_schema.contains("properties") || !input_schema.at("properties").is_object()) {
        return params;
    }

    for (const auto& [name, prop] : input_schema.at("properties").items()) {
        ParamSpec p;
        p.name = name;
        p.required = required.count(name) > 0;
        p.type = ParamType::Any;
        if (prop.contains("type") && prop.at("type").is_string()) {
            p.type = param_type_from_string(prop.at("type").get<std::string>());
        }
        if (prop.contains("description")) p.description = prop.at("description").get<std::string>();
        if (prop.contains("default")) p.default_value = prop.at("default");
        params.push_back(std::move(p));
    }
    return params;
}

} // namespace schema

} // namespace toolhost
