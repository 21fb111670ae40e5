#include <benchmark/benchmark.h>
#include "toolhost/codec.hpp"
#include "toolhost/error.hpp"
#include "toolhost/formatter.hpp"
#include "toolhost/json_rpc.hpp"
#include <string>

using namespace toolhost;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"get_time","arguments":{"format":"rfc3339"},"_meta":{"progressToken":"p-42"}}})";

static const std::string kResourceRead =
    R"({"jsonrpc":"2.0","id":"r-7","method":"resources/read","params":{"uri":"file:///var/log/app/current.log"}})";

// tools/list response as the formatter would emit it for n tools.
static std::string make_listing(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Tool number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"path", {{"type", "string"}, {"description", "Target path"}}},
                    {"limit", {{"type", "integer"}, {"default", 10}}}
                }},
                {"required", {"path"}}
            }}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1},
                          {"result", {{"tools", tools}, {"nextCursor", "50"}}}}.dump();
}

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseToolCall)->MinTime(1.0);

static void BM_ParseResourceRead(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kResourceRead);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kResourceRead.size());
}
BENCHMARK(BM_ParseResourceRead)->MinTime(1.0);

static void BM_ParseListing(benchmark::State& state) {
    const std::string raw = make_listing(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto msg = Codec::parse(raw);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseListing)->Arg(10)->Arg(50)->Arg(200);

static void BM_ParseBatch(benchmark::State& state) {
    nlohmann::json batch = nlohmann::json::array();
    for (int i = 0; i < 50; ++i) {
        batch.push_back({{"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"},
                         {"params", {{"name", "echo"}, {"arguments", {{"text", "x"}}}}}});
    }
    const std::string raw = batch.dump();

    for (auto _ : state) {
        auto msgs = Codec::parse_batch(raw);
        benchmark::DoNotOptimize(msgs);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseBatch)->MinTime(1.0);

static void BM_RejectMalformed(benchmark::State& state) {
    const std::string bad = R"({"jsonrpc":"2.0","id":1,"method":)";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_RejectMalformed)->MinTime(1.0);

static void BM_SerializeToolResult(benchmark::State& state) {
    CallToolResult result;
    result.content.push_back(TextContent{"2026-10-19T12:00:00Z", std::nullopt});
    result.structured_content = nlohmann::json{{"time", "2026-10-19T12:00:00Z"}};
    const InvocationResult outcome = SuccessContent{result};

    for (auto _ : state) {
        auto s = Codec::serialize(formatter::format(RequestId{int64_t{42}}, outcome));
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeToolResult)->MinTime(1.0);

static void BM_SerializeErrorEnvelope(benchmark::State& state) {
    ErrorEnvelope envelope{error::InvalidParams, "Invalid arguments: path is required",
                           nlohmann::json{{"errors", {{{"field", "path"}, {"message", "is required"}}}}}};
    const InvocationResult outcome = envelope;

    for (auto _ : state) {
        auto s = Codec::serialize(formatter::format(RequestId{std::string("r-7")}, outcome));
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeErrorEnvelope)->MinTime(1.0);

static void BM_SerializeListing(benchmark::State& state) {
    const auto msg = Codec::parse(make_listing(50));
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeListing)->MinTime(1.0);
