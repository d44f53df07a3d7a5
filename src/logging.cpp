#include "jsonrpc/logging.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace jsonrpc {

log4cplus::Logger& logger() {
    static log4cplus::Logger instance = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("jsonrpc"));
    return instance;
}

void init_logging(const std::string& config_path) {
    std::error_code ec;
    std::filesystem::path path = std::filesystem::absolute(config_path, ec);
    if (!ec && std::filesystem::exists(path, ec)) {
        try {
            log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(path.string()));
            return;
        } catch (const std::exception& e) {
            log4cplus::helpers::LogLog::getLogLog()->error(
                LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(e.what())));
        }
    }

    log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
    fallback.configure();
    log4cplus::Logger::getRoot().setLogLevel(log4cplus::WARN_LOG_LEVEL);
}

} // namespace jsonrpc
