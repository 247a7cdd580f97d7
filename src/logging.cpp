#include "common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mpmm {

namespace {

constexpr const char* kLoggerName = "mpmm";

spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off")   return spdlog::level::off;
    return spdlog::level::info;
}

} // anonymous namespace

void init_logging(const std::string& level) {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        existing->set_level(parse_level(level));
        return;
    }

    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(kLoggerName, sink);
    log->set_level(parse_level(level));
    log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

    spdlog::register_logger(log);
    spdlog::set_default_logger(log);
}

std::shared_ptr<spdlog::logger> logger() {
    auto log = spdlog::get(kLoggerName);
    return log ? log : spdlog::default_logger();
}

} // namespace mpmm
