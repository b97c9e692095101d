#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tf_engine {

// Shared "diagram2tf" logger writing to stderr. Falls back to the spdlog
// default logger if the named logger cannot be created.
std::shared_ptr<spdlog::logger> engine_logger();

// Adds a truncating file sink to engine_logger(). Returns false if the file
// cannot be opened; console logging is unaffected.
bool add_log_file(const std::string& path);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Returns false and leaves the level unchanged otherwise.
bool set_log_level(const std::string& level_name);

} // namespace tf_engine
