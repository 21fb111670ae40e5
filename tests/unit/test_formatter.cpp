#include <gtest/gtest.h>
#include "toolhost/formatter.hpp"

using namespace toolhost;

TEST(Formatter, SuccessCarriesContentInOrder) {
    CallToolResult r;
    r.content.push_back(TextContent{"a", std::nullopt});
    r.content.push_back(TextContent{"b", std::nullopt});
    auto resp = formatter::format(RequestId{int64_t{3}}, InvocationResult{SuccessContent{r}});
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_FALSE(resp.error.has_value());
    EXPECT_EQ(std::get<int64_t>(*resp.id), 3);
    EXPECT_EQ((*resp.result)["content"][0]["text"], "a");
    EXPECT_EQ((*resp.result)["content"][1]["text"], "b");
}

TEST(Formatter, ReadResourceShape) {
    ReadResourceResult r;
    r.contents.push_back({"config://app", std::string("application/json"), std::string("{}"), std::nullopt});
    auto j = formatter::to_json(SuccessContent{r});
    EXPECT_EQ(j["contents"][0]["uri"], "config://app");
    EXPECT_EQ(j["contents"][0]["mimeType"], "application/json");
}

TEST(Formatter, ErrorKeepsCodeMessageDetail) {
    ErrorEnvelope e{error::ResourceExhausted, "Too many concurrent requests",
                    nlohmann::json{{"retryable", true}}};
    auto resp = formatter::format(RequestId{std::string("x")}, InvocationResult{e});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_FALSE(resp.result.has_value());
    EXPECT_EQ(resp.error->code, error::ResourceExhausted);
    EXPECT_EQ(resp.error->message, "Too many concurrent requests");
    EXPECT_EQ((*resp.error->data)["retryable"], true);
}

TEST(Formatter, EmptyMessageGetsPlaceholder) {
    auto err = formatter::to_error(ErrorEnvelope{error::InternalError, "", std::nullopt});
    EXPECT_EQ(err.message, "Unknown error");
    EXPECT_FALSE(err.data.has_value());
}

TEST(Formatter, FromValidation) {
    ValidationError ve({FieldError{"a", "is required"}, FieldError{"b", "expected integer"}});
    auto env = formatter::from_validation(ve);
    EXPECT_EQ(env.code, error::InvalidParams);
    ASSERT_TRUE(env.detail.has_value());
    const auto& errors = (*env.detail)["errors"];
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[1]["field"], "b");
    EXPECT_EQ(errors[1]["message"], "expected integer");
}

TEST(Formatter, DescribeTool) {
    CapabilityDescriptor d;
    d.name = "echo";
    d.title = "Echo";
    d.description = "Echo input";
    d.params = {ParamSpec{"text", "", ParamType::String, true, std::nullopt}};
    d.annotations = nlohmann::json{{"readOnlyHint", true}};
    auto j = formatter::describe(Category::Tool, d);
    EXPECT_EQ(j["name"], "echo");
    EXPECT_EQ(j["title"], "Echo");
    EXPECT_EQ(j["inputSchema"]["properties"]["text"]["type"], "string");
    EXPECT_EQ(j["annotations"]["readOnlyHint"], true);
}

TEST(Formatter, DescribeResourceAndTemplate) {
    CapabilityDescriptor exact;
    exact.name = "config://app";
    exact.mime_type = "application/json";
    auto j = formatter::describe(Category::Resource, exact);
    EXPECT_EQ(j["uri"], "config://app");
    EXPECT_EQ(j["name"], "config://app");
    EXPECT_EQ(j["mimeType"], "application/json");
    EXPECT_FALSE(j.contains("description"));

    CapabilityDescriptor tmpl;
    tmpl.name = "file:///{path}";
    tmpl.title = "Files";
    auto t = formatter::describe(Category::Resource, tmpl);
    EXPECT_EQ(t["uriTemplate"], "file:///{path}");
    EXPECT_FALSE(t.contains("uri"));
    EXPECT_EQ(t["name"], "Files");
}

TEST(Formatter, DescribePrompt) {
    CapabilityDescriptor d;
    d.name = "review";
    d.params = {ParamSpec{"code", "source", ParamType::String, true, std::nullopt},
                ParamSpec{"style", "", ParamType::String, false, std::nullopt}};
    auto j = formatter::describe(Category::Prompt, d);
    ASSERT_EQ(j["arguments"].size(), 2u);
    EXPECT_EQ(j["arguments"][0]["name"], "code");
    EXPECT_EQ(j["arguments"][0]["required"], true);
    EXPECT_EQ(j["arguments"][0]["description"], "source");
    EXPECT_FALSE(j["arguments"][1].contains("description"));
}
