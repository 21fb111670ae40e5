#include <benchmark/benchmark.h>
#include "toolhost/negotiator.hpp"
#include "toolhost/router.hpp"
#include "toolhost/schema.hpp"
#include <memory>
#include <string>

using namespace toolhost;

namespace {

CapabilityDescriptor make_tool(const std::string& name) {
    CapabilityDescriptor d;
    d.name = name;
    d.params = {ParamSpec{"text", "", ParamType::String, true, std::nullopt},
                ParamSpec{"count", "", ParamType::Integer, false, nlohmann::json(1)}};
    d.handler = [](RequestContext&, const nlohmann::json& args) -> InvocationResult {
        CallToolResult r;
        r.content.push_back(TextContent{args.at("text").get<std::string>(), std::nullopt});
        return SuccessContent{r};
    };
    return d;
}

CapabilityDescriptor make_resource(const std::string& uri) {
    CapabilityDescriptor d;
    d.name = uri;
    for (const auto& v : uri_template_variables(uri)) {
        d.params.push_back(ParamSpec{v, "", ParamType::String, true, std::nullopt});
    }
    d.handler = [](RequestContext& ctx, const nlohmann::json&) -> InvocationResult {
        ReadResourceResult r;
        r.contents.push_back({ctx.target(), std::nullopt, "contents", std::nullopt});
        return SuccessContent{r};
    };
    return d;
}

// Registry with n tools and a couple of resources, wired to a router.
struct Fixture {
    explicit Fixture(int n_tools) {
        for (int i = 0; i < n_tools; ++i) registry.add(Category::Tool, make_tool("tool_" + std::to_string(i)));
        registry.add(Category::Resource, make_resource("config://app"));
        registry.add(Category::Resource, make_resource("file:///{path}"));
        router = std::make_unique<Router>(registry, executor);
        router->on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });
        session = std::make_shared<Session>(Implementation{"bench", std::nullopt, "1"},
                                            negotiate(registry, CapabilityFlags{}));
    }

    JsonRpcResponse call(const JsonRpcRequest& req) {
        RequestContext ctx(session, CancellationSource{}, req.id);
        return router->handle_request(req, ctx);
    }

    CapabilityRegistry registry;
    Executor executor;
    std::unique_ptr<Router> router;
    std::shared_ptr<Session> session;
};

} // namespace

static void BM_ControlPing(benchmark::State& state) {
    Fixture f(1);
    const JsonRpcRequest req{RequestId{int64_t{1}}, "ping", std::nullopt};
    for (auto _ : state) {
        auto resp = f.call(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ControlPing)->MinTime(1.0);

static void BM_ToolCall(benchmark::State& state) {
    Fixture f(static_cast<int>(state.range(0)));
    const JsonRpcRequest req{RequestId{int64_t{1}}, "tools/call",
                             nlohmann::json{{"name", "tool_0"}, {"arguments", {{"text", "hi"}}}}};
    for (auto _ : state) {
        auto resp = f.call(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ToolCall)->Arg(1)->Arg(100)->Arg(1000);

static void BM_ResourceTemplateRead(benchmark::State& state) {
    Fixture f(1);
    const JsonRpcRequest req{RequestId{int64_t{1}}, "resources/read",
                             nlohmann::json{{"uri", "file:///var/log/app.log"}}};
    for (auto _ : state) {
        auto resp = f.call(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ResourceTemplateRead)->MinTime(1.0);

static void BM_UnknownTarget(benchmark::State& state) {
    Fixture f(100);
    const JsonRpcRequest req{RequestId{int64_t{1}}, "tools/call",
                             nlohmann::json{{"name", "missing"}}};
    for (auto _ : state) {
        auto resp = f.call(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_UnknownTarget)->MinTime(1.0);

static void BM_InvalidArguments(benchmark::State& state) {
    Fixture f(1);
    const JsonRpcRequest req{RequestId{int64_t{1}}, "tools/call",
                             nlohmann::json{{"name", "tool_0"}, {"arguments", {{"count", "x"}}}}};
    for (auto _ : state) {
        auto resp = f.call(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_InvalidArguments)->MinTime(1.0);

static void BM_RegistryLookup(benchmark::State& state) {
    Fixture f(static_cast<int>(state.range(0)));
    const std::string name = "tool_" + std::to_string(state.range(0) / 2);
    for (auto _ : state) {
        auto d = f.registry.find(Category::Tool, name);
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_RegistryLookup)->Arg(10)->Arg(1000);

static void BM_SchemaValidate(benchmark::State& state) {
    const auto params = make_tool("t").params;
    const nlohmann::json args = {{"text", 42}, {"count", "7"}};
    for (auto _ : state) {
        auto normalized = schema::validate(params, args);
        benchmark::DoNotOptimize(normalized);
    }
}
BENCHMARK(BM_SchemaValidate)->MinTime(1.0);
