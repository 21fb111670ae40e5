/// Time server: get_time / sleep tools, an uptime resource and a greeting prompt.
/// Usage: ./time_server [config.json]
/// Communicates over stdio (newline-delimited JSON-RPC); logs go to stderr.

#include <toolhost/toolhost.hpp>
#include "time_tools.hpp"

int main(int argc, char** argv) {
    try {
        auto settings = argc > 1 ? toolhost::Settings::from_file(argv[1]) : toolhost::Settings{};
        settings.apply_env();
        settings.apply_logging();
        if (argc <= 1) {
            settings.server.server_info = {"time-server", std::nullopt, "1.0.0"};
        }

        toolhost::Server server{settings.server};
        time_server::register_all(server);

        // Serve over stdio; blocks until the client disconnects
        server.serve_stdio();
    } catch (const toolhost::ConfigError& e) {
        toolhost::log::logger()->critical("configuration error: {}", e.what());
        return 2;
    } catch (const toolhost::Error& e) {
        toolhost::log::logger()->critical("fatal: {}", e.what());
        return 1;
    }
    return 0;
}
