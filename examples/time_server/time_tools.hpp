#pragma once
#include <toolhost/server.hpp>
#include <chrono>
#include <string>

namespace time_server {

/// Render `tp` in one of the supported formats ("RFC3339", "Unix").
/// Throws toolhost::ProtocolError (InvalidParams) for anything else.
std::string format_time(std::chrono::system_clock::time_point tp, const std::string& format);

/// get_time and sleep tools, the uptime://server resource and the greeting
/// prompt.
void register_all(toolhost::Server& server);

} // namespace time_server
