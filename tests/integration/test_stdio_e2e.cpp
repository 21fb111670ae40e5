#include <gtest/gtest.h>
#include "harness.hpp"
#include "toolhost/error.hpp"
#include <atomic>
#include <set>
#include <stdexcept>

using namespace toolhost;
using namespace toolhost::testing;

class StdioE2ETest : public ::testing::Test {
protected:
    std::unique_ptr<StdioHarness> h_;

    void SetUp() override {
        Server::Options opts = test_options();
        opts.capabilities.resources_subscribe = true;
        h_ = std::make_unique<StdioHarness>(opts);
        auto& s = h_->server();

        s.add_tool({"echo", std::nullopt, "Echo the input text",
                    {ParamSpec{"text", "text to echo", ParamType::String, true, std::nullopt}},
                    std::nullopt},
                   [](RequestContext&, const nlohmann::json& args) {
                       return text_result(args.at("text").get<std::string>());
                   });

        s.add_tool({"add", std::nullopt, "Add two integers",
                    {ParamSpec{"a", "", ParamType::Integer, true, std::nullopt},
                     ParamSpec{"b", "", ParamType::Integer, false, nlohmann::json(1)}},
                    std::nullopt},
                   [](RequestContext&, const nlohmann::json& args) {
                       auto sum = args.at("a").get<int64_t>() + args.at("b").get<int64_t>();
                       CallToolResult r = text_result(std::to_string(sum));
                       r.structured_content = nlohmann::json{{"sum", sum}};
                       return r;
                   });

        s.add_tool({"fail", std::nullopt, "Always throws", {}, std::nullopt},
                   [](RequestContext&, const nlohmann::json&) -> CallToolResult {
                       throw std::runtime_error("Tool intentionally failed");
                   });

        s.add_tool({"reject", std::nullopt, "Throws a protocol error", {}, std::nullopt},
                   [](RequestContext&, const nlohmann::json&) -> CallToolResult {
                       throw ProtocolError(error::InvalidParams, "nope", nlohmann::json{{"why", "test"}});
                   });

        s.add_tool({"steps", std::nullopt, "Reports progress and logs", {}, std::nullopt},
                   [](RequestContext& ctx, const nlohmann::json&) {
                       ctx.log(LogLevel::Info, "starting");
                       for (int i = 1; i <= 3; ++i) ctx.report_progress(i, 3.0);
                       return text_result("done");
                   });

        s.add_resource({"config://app", std::nullopt, "App config", std::string("application/json"),
                        {}, std::nullopt},
                       [](RequestContext&, const std::string& uri, const nlohmann::json&) {
                           ReadResourceResult r;
                           r.contents.push_back({uri, std::string("application/json"),
                                                 std::string("{\"debug\":false}"), std::nullopt});
                           return r;
                       });

        s.add_resource({"file:///{path}", std::nullopt, "A file", std::string("text/plain"),
                        {}, std::nullopt},
                       [](RequestContext&, const std::string& uri, const nlohmann::json& vars) {
                           ReadResourceResult r;
                           r.contents.push_back({uri, std::string("text/plain"),
                                                 "contents of " + vars.at("path").get<std::string>(),
                                                 std::nullopt});
                           return r;
                       });

        s.add_resource({"missing://thing", std::nullopt, "Always absent", std::nullopt, {}, std::nullopt},
                       [](RequestContext&, const std::string& uri, const nlohmann::json&)
                           -> ReadResourceResult {
                           throw NotFoundError("no such resource: " + uri);
                       });

        s.add_prompt({"review", std::nullopt, "Code review prompt",
                      {ParamSpec{"code", "code to review", ParamType::String, true, std::nullopt}}},
                     [](RequestContext&, const nlohmann::json& args) {
                         GetPromptResult r;
                         r.description = "Review";
                         r.messages.push_back({"user",
                             TextContent{"Please review: " + args.at("code").get<std::string>(),
                                         std::nullopt}});
                         return r;
                     });

        h_->start();
    }

    void TearDown() override { h_->stop(); }

    PipeClient& client() { return h_->client(); }
};

TEST_F(StdioE2ETest, RequestBeforeInitializeIsRejected) {
    auto resp = client().request(1, "tools/list");
    ASSERT_TRUE(resp.contains("error"));
    EXPECT_EQ(resp["error"]["code"], error::InvalidRequest);
    EXPECT_EQ(resp["error"]["message"], "server not initialized");
}

TEST_F(StdioE2ETest, PingBeforeInitialize) {
    auto resp = client().request(1, "ping");
    ASSERT_TRUE(resp.contains("result"));
    EXPECT_TRUE(resp["result"].is_object());
}

TEST_F(StdioE2ETest, InitializeAdvertisesRegisteredCategories) {
    auto result = h_->initialize();
    EXPECT_EQ(result["protocolVersion"], std::string(PROTOCOL_VERSION));
    EXPECT_EQ(result["serverInfo"]["name"], "test-server");
    const auto& caps = result["capabilities"];
    EXPECT_TRUE(caps.contains("tools"));
    EXPECT_TRUE(caps.contains("prompts"));
    EXPECT_TRUE(caps["resources"]["subscribe"].get<bool>());
    EXPECT_TRUE(caps.contains("logging"));
}

TEST_F(StdioE2ETest, InitializeRecordsClient) {
    EXPECT_FALSE(h_->server().client_info().has_value());
    client().request(1, "initialize", {
        {"protocolVersion", "2025-06-18"},
        {"capabilities", {{"roots", {{"listChanged", true}}}}},
        {"clientInfo", {{"name", "inspector"}, {"version", "0.4"}}}
    });
    auto info = h_->server().client_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "inspector");
    EXPECT_EQ(info->version, "0.4");
    auto caps = h_->server().client_capabilities();
    ASSERT_TRUE(caps.roots.has_value());
    EXPECT_TRUE((*caps.roots)["listChanged"].get<bool>());
}

TEST_F(StdioE2ETest, SecondInitializeFails) {
    h_->initialize(1);
    auto resp = client().request(2, "initialize", {{"protocolVersion", "2025-06-18"}});
    ASSERT_TRUE(resp.contains("error"));
    EXPECT_EQ(resp["error"]["code"], error::InvalidRequest);
}

TEST_F(StdioE2ETest, ListTools) {
    h_->initialize();
    auto resp = client().request(1, "tools/list");
    const auto& tools = resp["result"]["tools"];
    ASSERT_EQ(tools.size(), 5u);
    EXPECT_EQ(tools[0]["name"], "echo");
    EXPECT_EQ(tools[0]["inputSchema"]["required"], nlohmann::json::array({"text"}));
    EXPECT_FALSE(resp["result"].contains("nextCursor"));
}

TEST_F(StdioE2ETest, CallEchoTool) {
    h_->initialize();
    auto resp = client().request(1, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "Hello"}}}});
    ASSERT_TRUE(resp.contains("result"));
    EXPECT_EQ(resp["result"]["content"][0]["type"], "text");
    EXPECT_EQ(resp["result"]["content"][0]["text"], "Hello");
    EXPECT_FALSE(resp["result"].value("isError", false));
}

TEST_F(StdioE2ETest, DefaultArgumentApplied) {
    h_->initialize();
    auto resp = client().request(1, "tools/call", {{"name", "add"}, {"arguments", {{"a", 41}}}});
    EXPECT_EQ(resp["result"]["structuredContent"]["sum"], 42);
}

TEST_F(StdioE2ETest, UnknownToolIsInvalidParams) {
    h_->initialize();
    auto resp = client().request(1, "tools/call", {{"name", "nonexistent"}, {"arguments", nlohmann::json::object()}});
    ASSERT_TRUE(resp.contains("error"));
    EXPECT_EQ(resp["error"]["code"], error::InvalidParams);
    EXPECT_EQ(resp["error"]["data"]["target"], "nonexistent");
}

TEST_F(StdioE2ETest, ValidationErrorNamesFields) {
    h_->initialize();
    auto resp = client().request(1, "tools/call",
                                 {{"name", "add"}, {"arguments", {{"a", "x"}, {"extra", 1}}}});
    ASSERT_TRUE(resp.contains("error"));
    EXPECT_EQ(resp["error"]["code"], error::InvalidParams);
    const auto& errors = resp["error"]["data"]["errors"];
    ASSERT_EQ(errors.size(), 2u);
    std::set<std::string> fields;
    for (const auto& e : errors) fields.insert(e["field"].get<std::string>());
    EXPECT_EQ(fields.count("a"), 1u);
    EXPECT_EQ(fields.count("extra"), 1u);
}

TEST_F(StdioE2ETest, FaultingHandlerDoesNotAffectNextRequest) {
    h_->initialize();
    auto bad = client().request(1, "tools/call", {{"name", "fail"}});
    ASSERT_TRUE(bad.contains("error"));
    EXPECT_EQ(bad["error"]["code"], error::InternalError);
    EXPECT_EQ(bad["error"]["data"], "Tool intentionally failed");

    auto good = client().request(2, "tools/call", {{"name", "echo"}, {"arguments", {{"text", "still here"}}}});
    EXPECT_EQ(good["result"]["content"][0]["text"], "still here");
}

TEST_F(StdioE2ETest, HandlerProtocolErrorKeepsCode) {
    h_->initialize();
    auto resp = client().request(1, "tools/call", {{"name", "reject"}});
    EXPECT_EQ(resp["error"]["code"], error::InvalidParams);
    EXPECT_EQ(resp["error"]["message"], "nope");
    EXPECT_EQ(resp["error"]["data"]["why"], "test");
}

TEST_F(StdioE2ETest, UnknownMethod) {
    h_->initialize();
    auto resp = client().request(1, "does/not/exist");
    EXPECT_EQ(resp["error"]["code"], error::MethodNotFound);
}

TEST_F(StdioE2ETest, MalformedLineGetsParseError) {
    h_->initialize();
    client().send_line("{not json");
    auto resp = client().wait_response(nullptr);
    EXPECT_EQ(resp["error"]["code"], error::ParseError);

    // The stream stays usable afterwards.
    auto ping = client().request(7, "ping");
    EXPECT_TRUE(ping.contains("result"));
}

TEST_F(StdioE2ETest, ReadExactResource) {
    h_->initialize();
    auto list = client().request(1, "resources/list");
    ASSERT_EQ(list["result"]["resources"].size(), 2u);
    EXPECT_EQ(list["result"]["resources"][0]["uri"], "config://app");

    auto resp = client().request(2, "resources/read", {{"uri", "config://app"}});
    EXPECT_EQ(resp["result"]["contents"][0]["text"], "{\"debug\":false}");
    EXPECT_EQ(resp["result"]["contents"][0]["mimeType"], "application/json");
}

TEST_F(StdioE2ETest, ReadTemplatedResource) {
    h_->initialize();
    auto templates = client().request(1, "resources/templates/list");
    ASSERT_EQ(templates["result"]["resourceTemplates"].size(), 1u);
    EXPECT_EQ(templates["result"]["resourceTemplates"][0]["uriTemplate"], "file:///{path}");

    auto resp = client().request(2, "resources/read", {{"uri", "file:///notes.txt"}});
    EXPECT_EQ(resp["result"]["contents"][0]["uri"], "file:///notes.txt");
    EXPECT_EQ(resp["result"]["contents"][0]["text"], "contents of notes.txt");
}

TEST_F(StdioE2ETest, ResourceHandlerNotFound) {
    h_->initialize();
    auto resp = client().request(1, "resources/read", {{"uri", "missing://thing"}});
    EXPECT_EQ(resp["error"]["code"], error::ResourceNotFound);
}

TEST_F(StdioE2ETest, UnknownResourceIsInvalidParams) {
    h_->initialize();
    auto resp = client().request(1, "resources/read", {{"uri", "nowhere://x"}});
    EXPECT_EQ(resp["error"]["code"], error::InvalidParams);
}

TEST_F(StdioE2ETest, GetPrompt) {
    h_->initialize();
    auto resp = client().request(1, "prompts/get", {{"name", "review"}, {"arguments", {{"code", "x = 1"}}}});
    ASSERT_TRUE(resp.contains("result"));
    EXPECT_EQ(resp["result"]["messages"][0]["role"], "user");
    EXPECT_EQ(resp["result"]["messages"][0]["content"]["text"], "Please review: x = 1");

    auto missing = client().request(2, "prompts/get", {{"name", "review"}});
    EXPECT_EQ(missing["error"]["code"], error::InvalidParams);
}

TEST_F(StdioE2ETest, ProgressAndLogNotifications) {
    h_->initialize();
    auto set = client().request(1, "logging/setLevel", {{"level", "debug"}});
    ASSERT_TRUE(set.contains("result"));

    auto resp = client().request(2, "tools/call",
                                 {{"name", "steps"}, {"_meta", {{"progressToken", "tok"}}}});
    EXPECT_EQ(resp["result"]["content"][0]["text"], "done");

    auto log = client().wait_notification("notifications/message");
    EXPECT_EQ(log["params"]["level"], "info");
    EXPECT_EQ(log["params"]["data"], "starting");

    for (int i = 1; i <= 3; ++i) {
        auto p = client().wait_notification("notifications/progress");
        EXPECT_EQ(p["params"]["progressToken"], "tok");
        EXPECT_EQ(p["params"]["progress"].get<double>(), i);
    }
}

TEST_F(StdioE2ETest, LogLevelFiltersMessages) {
    h_->initialize();
    client().request(1, "logging/setLevel", {{"level", "error"}});
    client().request(2, "tools/call", {{"name", "steps"}});
    EXPECT_FALSE(client().saw_notification("notifications/message", std::chrono::milliseconds(100)));

    auto bad = client().request(3, "logging/setLevel", {{"level", "loud"}});
    EXPECT_EQ(bad["error"]["code"], error::InvalidParams);
}

TEST_F(StdioE2ETest, SubscribeAndUpdate) {
    h_->initialize();
    auto sub = client().request(1, "resources/subscribe", {{"uri", "config://app"}});
    ASSERT_TRUE(sub.contains("result"));
    h_->server().notify_resource_updated("config://app");
    auto n = client().wait_notification("notifications/resources/updated");
    EXPECT_EQ(n["params"]["uri"], "config://app");

    client().request(2, "resources/unsubscribe", {{"uri", "config://app"}});
    h_->server().notify_resource_updated("config://app");
    EXPECT_FALSE(client().saw_notification("notifications/resources/updated",
                                           std::chrono::milliseconds(100)));
}

TEST_F(StdioE2ETest, RuntimeRegistrationNotifiesListChanged) {
    h_->initialize();
    h_->server().add_tool({"late", std::nullopt, "Added after start", {}, std::nullopt},
                          [](RequestContext&, const nlohmann::json&) { return text_result("late"); });
    client().wait_notification("notifications/tools/list_changed");

    auto resp = client().request(1, "tools/call", {{"name", "late"}});
    EXPECT_EQ(resp["result"]["content"][0]["text"], "late");

    EXPECT_TRUE(h_->server().remove_tool("late"));
    client().wait_notification("notifications/tools/list_changed");
    auto gone = client().request(2, "tools/call", {{"name", "late"}});
    EXPECT_EQ(gone["error"]["code"], error::InvalidParams);
}

TEST_F(StdioE2ETest, StringRequestIdsEchoed) {
    h_->initialize();
    client().send({{"jsonrpc", "2.0"}, {"id", "abc"}, {"method", "ping"}});
    auto resp = client().wait_response("abc");
    EXPECT_EQ(resp["id"], "abc");
}

TEST(StdioPagination, CursorWalksAllTools) {
    Server::Options opts = test_options();
    opts.page_size = 10;
    StdioHarness h(opts);
    for (int i = 0; i < 25; ++i) {
        h.server().add_tool({"tool_" + std::to_string(i), std::nullopt, "", {}, std::nullopt},
                            [](RequestContext&, const nlohmann::json&) { return CallToolResult{}; });
    }
    h.start();
    h.initialize();

    std::vector<std::string> names;
    nlohmann::json params = nlohmann::json::object();
    for (int64_t id = 1; id < 10; ++id) {
        auto resp = h.client().request(id, "tools/list", params);
        for (const auto& t : resp["result"]["tools"]) names.push_back(t["name"].get<std::string>());
        if (!resp["result"].contains("nextCursor")) break;
        params["cursor"] = resp["result"]["nextCursor"];
    }
    ASSERT_EQ(names.size(), 25u);
    EXPECT_EQ(names.front(), "tool_0");
    EXPECT_EQ(names.back(), "tool_24");

    auto bad = h.client().request(99, "tools/list", {{"cursor", "not-a-number"}});
    EXPECT_EQ(bad["error"]["code"], error::InvalidParams);
}

TEST(StdioCapabilities, EmptyCategoryNotAdvertised) {
    StdioHarness h;
    h.server().add_tool({"only", std::nullopt, "", {}, std::nullopt},
                        [](RequestContext&, const nlohmann::json&) { return CallToolResult{}; });
    h.start();
    auto result = h.initialize();
    EXPECT_TRUE(result["capabilities"].contains("tools"));
    EXPECT_FALSE(result["capabilities"].contains("prompts"));
    EXPECT_FALSE(result["capabilities"].contains("resources"));

    auto resp = h.client().request(1, "prompts/get", {{"name", "x"}});
    EXPECT_EQ(resp["error"]["code"], error::MethodNotFound);
    auto list = h.client().request(2, "prompts/list");
    EXPECT_EQ(list["error"]["code"], error::MethodNotFound);
}

TEST(StdioOrdered, ResponsesFollowArrivalOrder) {
    StdioTransport::Options topts;
    topts.ordered_responses = true;
    StdioHarness h(test_options(), topts);
    h.server().add_tool({"wait", std::nullopt, "",
                         {ParamSpec{"ms", "", ParamType::Integer, true, std::nullopt}}, std::nullopt},
                        [](RequestContext&, const nlohmann::json& args) {
                            std::this_thread::sleep_for(
                                std::chrono::milliseconds(args.at("ms").get<int64_t>()));
                            return text_result(std::to_string(args.at("ms").get<int64_t>()));
                        });
    h.start();
    h.initialize();

    h.client().send_request(1, "tools/call", {{"name", "wait"}, {"arguments", {{"ms", 200}}}});
    h.client().send_request(2, "tools/call", {{"name", "wait"}, {"arguments", {{"ms", 10}}}});
    h.client().send_request(3, "ping");

    std::vector<int64_t> order;
    for (int i = 0; i < 3; ++i) {
        auto msg = h.client().next();
        ASSERT_TRUE(msg.has_value());
        if (msg->contains("id")) order.push_back((*msg)["id"].get<int64_t>());
    }
    EXPECT_EQ(order, (std::vector<int64_t>{1, 2, 3}));
}

TEST(StdioLifecycle, EofShutsDownServer) {
    StdioHarness h;
    h.start();
    h.initialize();
    EXPECT_TRUE(h.server().is_running());
    h.stop();
    EXPECT_FALSE(h.server().is_running());
    EXPECT_EQ(h.server().phase(), LifecyclePhase::Closed);
}

TEST(StdioLifecycle, ServeIsOneShot) {
    StdioHarness h;
    h.start();
    h.initialize();
    h.stop();
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    EXPECT_THROW(h.server().serve(std::make_unique<StdioTransport>(fds[0], fds[1])), Error);
}
