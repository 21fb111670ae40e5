#pragma once
#include <string_view>

namespace toolhost {

constexpr std::string_view LIBRARY_VERSION     = "0.3.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace toolhost
