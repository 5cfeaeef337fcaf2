#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace helm::util {

// Initialize logging with console output
void init_logger(const std::string& level = "info");

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
// Unknown names fall back to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace helm::util
