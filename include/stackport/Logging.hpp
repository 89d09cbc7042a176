#ifndef STACKPORT_LOGGING_HPP
#define STACKPORT_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <string>

namespace stackport {

// Initialize logging with stderr output (stdout carries command results)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// "debug", "INFO", "warn", ... Throws ConfigError on an unknown name.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace stackport

#endif // STACKPORT_LOGGING_HPP
