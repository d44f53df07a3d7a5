#pragma once
#include <string>
#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace jsonrpc {

/// Library logger ("jsonrpc").
log4cplus::Logger& logger();

/// Load a log4cplus properties file, falling back to a console
/// configuration at WARN when the file is missing or unreadable.
void init_logging(const std::string& config_path);

} // namespace jsonrpc
