#include <tf_engine/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <utility>

namespace tf_engine {

namespace {

const char* const kLoggerName = "diagram2tf";
const char* const kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

} // namespace

std::shared_ptr<spdlog::logger> engine_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        std::shared_ptr<spdlog::logger> l;
        try {
            l = spdlog::stderr_color_mt(kLoggerName);
            l->set_level(spdlog::level::warn);
            l->set_pattern(kPattern);
        } catch (const spdlog::spdlog_ex&) {
            l = spdlog::get(kLoggerName);
            if (!l) l = spdlog::default_logger();
        }
        return l;
    }();
    return logger;
}

bool add_log_file(const std::string& path) {
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true);
        sink->set_pattern(kPattern);
        engine_logger()->sinks().push_back(std::move(sink));
        engine_logger()->flush_on(spdlog::level::info);
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        engine_logger()->warn("cannot open log file {}: {}", path, e.what());
        return false;
    }
}

bool set_log_level(const std::string& level_name) {
    const auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off; only accept "off" when asked for it.
    if (level == spdlog::level::off && level_name != "off") return false;
    engine_logger()->set_level(level);
    return true;
}

} // namespace tf_engine
