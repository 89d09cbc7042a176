#include "stackport/Logging.hpp"
#include "stackport/Errors.hpp"
#include "stackport/Util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stackport {

void init_logger() {
    auto logger = spdlog::get("stackport");
    if (!logger) logger = spdlog::stderr_color_mt("stackport");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level: " + name);
}

} // namespace stackport
