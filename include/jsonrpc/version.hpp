#pragma once
#include <string_view>

namespace jsonrpc {

constexpr std::string_view LIBRARY_VERSION = "0.11.1";
constexpr std::string_view JSONRPC_VERSION = "2.0";

} // namespace jsonrpc
