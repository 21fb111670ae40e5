#include "time_tools.hpp"
#include <toolhost/error.hpp>

#include <algorithm>
#include <ctime>

namespace time_server {

using namespace toolhost;

std::string format_time(std::chrono::system_clock::time_point tp, const std::string& format) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    if (format == "Unix") {
        return std::to_string(static_cast<long long>(t));
    }
    if (format == "RFC3339") {
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }
    throw ProtocolError(error::InvalidParams, "Unsupported time format: " + format,
                        nlohmann::json{{"allowed", {"RFC3339", "Unix"}}});
}

void register_all(Server& server) {
    server.add_tool(
        ToolSpec{"get_time", std::string("Current time"),
                 "Return the current UTC time",
                 {ParamSpec{"format", "Output format: RFC3339 or Unix", ParamType::String,
                            false, nlohmann::json("RFC3339")}},
                 nlohmann::json{{"readOnlyHint", true}}},
        [](RequestContext&, const nlohmann::json& args) {
            CallToolResult result;
            auto now = format_time(std::chrono::system_clock::now(),
                                   args.at("format").get<std::string>());
            result.content.push_back(TextContent{now, std::nullopt});
            return result;
        });

    // Cooperative long-running tool: reports progress and honors cancellation.
    server.add_tool(
        ToolSpec{"sleep", std::nullopt, "Sleep for the given number of milliseconds",
                 {ParamSpec{"ms", "Duration in milliseconds", ParamType::Integer, true, std::nullopt}},
                 std::nullopt},
        [](RequestContext& ctx, const nlohmann::json& args) {
            const auto total = args.at("ms").get<int64_t>();
            const int64_t step = 50;
            auto token = ctx.cancellation();
            for (int64_t done = 0; done < total; done += step) {
                if (token.wait_for(std::chrono::milliseconds(std::min(step, total - done)))) {
                    token.throw_if_cancelled();
                }
                ctx.report_progress(static_cast<double>(std::min(done + step, total)),
                                    static_cast<double>(total));
            }
            CallToolResult result;
            result.content.push_back(TextContent{"slept " + std::to_string(total) + " ms", std::nullopt});
            return result;
        });

    server.add_resource(
        ResourceSpec{"uptime://server", std::string("Server uptime"),
                     "Seconds since the server started", std::string("text/plain"), {}, std::nullopt},
        [](RequestContext& ctx, const std::string& uri, const nlohmann::json&) {
            auto secs = std::chrono::duration_cast<std::chrono::seconds>(ctx.session().uptime());
            ReadResourceResult result;
            result.contents.push_back(ResourceContent{uri, std::string("text/plain"),
                                                      std::to_string(secs.count()), std::nullopt});
            return result;
        });

    server.add_prompt(
        PromptSpec{"greeting", std::nullopt, "Greet someone by name",
                   {ParamSpec{"name", "Who to greet", ParamType::String, true, std::nullopt}}},
        [](RequestContext& ctx, const nlohmann::json& args) {
            GetPromptResult result;
            result.description = "Greeting from " + ctx.session().server_info().name;
            result.messages.push_back(PromptMessage{
                "user", TextContent{"Hello, " + args.at("name").get<std::string>() + "!", std::nullopt}});
            return result;
        });
}

} // namespace time_server
