#include <gtest/gtest.h>
#include "toolhost/schema.hpp"

using namespace toolhost;

namespace {

std::vector<ParamSpec> sample_params() {
    return {
        ParamSpec{"path", "file path", ParamType::String, true, std::nullopt},
        ParamSpec{"limit", "", ParamType::Integer, false, nlohmann::json(10)},
        ParamSpec{"verbose", "", ParamType::Boolean, false, std::nullopt},
    };
}

std::vector<FieldError> errors_of(const std::vector<ParamSpec>& params, const nlohmann::json& args,
                                  UnknownArguments unknown = UnknownArguments::Reject) {
    try {
        (void)schema::validate(params, args, unknown);
    } catch (const ValidationError& e) {
        return e.errors();
    }
    return {};
}

} // namespace

TEST(Schema, AcceptsValidArgumentsAndFillsDefaults) {
    auto out = schema::validate(sample_params(), {{"path", "/tmp"}});
    EXPECT_EQ(out["path"], "/tmp");
    EXPECT_EQ(out["limit"], 10);
    EXPECT_FALSE(out.contains("verbose"));
}

TEST(Schema, NullArgumentsTreatedAsEmpty) {
    std::vector<ParamSpec> none;
    EXPECT_EQ(schema::validate(none, nullptr), nlohmann::json::object());
}

TEST(Schema, CoercesScalars) {
    auto out = schema::validate(sample_params(),
                                {{"path", 42}, {"limit", "25"}, {"verbose", "true"}});
    EXPECT_EQ(out["path"], "42");
    EXPECT_EQ(out["limit"], 25);
    EXPECT_EQ(out["verbose"], true);

    auto whole = schema::validate(sample_params(), {{"path", "p"}, {"limit", 3.0}});
    EXPECT_TRUE(whole["limit"].is_number_integer());
}

TEST(Schema, ReportsEveryOffendingField) {
    auto errors = errors_of(sample_params(), {{"limit", 2.5}, {"verbose", "maybe"}, {"colour", "red"}});
    ASSERT_EQ(errors.size(), 4u);
    EXPECT_EQ(errors[0], (FieldError{"path", "is required"}));
    EXPECT_EQ(errors[1], (FieldError{"limit", "expected integer"}));
    EXPECT_EQ(errors[2], (FieldError{"verbose", "expected boolean"}));
    EXPECT_EQ(errors[3], (FieldError{"colour", "is not a declared argument"}));
}

TEST(Schema, IgnorePolicyDropsUnknownKeys) {
    auto out = schema::validate(sample_params(), {{"path", "a"}, {"extra", 1}}, UnknownArguments::Ignore);
    EXPECT_FALSE(out.contains("extra"));
    EXPECT_TRUE(errors_of(sample_params(), {{"path", "a"}, {"extra", 1}}, UnknownArguments::Ignore).empty());
}

TEST(Schema, NonObjectArgumentsRejected) {
    auto errors = errors_of(sample_params(), nlohmann::json::array({1, 2}));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].field, "");
}

TEST(Schema, ValidationErrorMessageListsFields) {
    try {
        (void)schema::validate(sample_params(), nlohmann::json::object());
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid arguments: path is required");
    }
}

TEST(Schema, InputSchemaRendering) {
    auto s = schema::to_input_schema(sample_params());
    EXPECT_EQ(s["type"], "object");
    EXPECT_EQ(s["properties"]["path"]["type"], "string");
    EXPECT_EQ(s["properties"]["path"]["description"], "file path");
    EXPECT_EQ(s["properties"]["limit"]["default"], 10);
    EXPECT_EQ(s["required"], nlohmann::json::array({"path"}));

    auto empty = schema::to_input_schema({});
    EXPECT_FALSE(empty.contains("required"));
    EXPECT_TRUE(empty["properties"].empty());
}

TEST(Schema, FromInputSchema) {
    nlohmann::json js = {
        {"type", "object"},
        {"properties", {{"b", {{"type", "number"}}}, {"a", {{"description", "anything"}}}}},
        {"required", {"b"}}
    };
    auto params = schema::from_input_schema(js);
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[0].name, "a");
    EXPECT_EQ(params[0].type, ParamType::Any);
    EXPECT_FALSE(params[0].required);
    EXPECT_EQ(params[1].name, "b");
    EXPECT_EQ(params[1].type, ParamType::Number);
    EXPECT_TRUE(params[1].required);

    EXPECT_THROW(schema::from_input_schema({{"properties", {{"x", {{"type", "date"}}}}}}),
                 std::invalid_argument);
}
