#include <grid_engine/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace grid_engine {

namespace {

std::shared_ptr<spdlog::logger> create_engine_logger() {
    try {
        auto logger = spdlog::get("grid_engine");
        if (!logger) logger = spdlog::stderr_color_mt("grid_engine");
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        return spdlog::default_logger();
    }
}

} // namespace

std::shared_ptr<spdlog::logger> engine_logger() {
    static const std::shared_ptr<spdlog::logger> logger = create_engine_logger();
    return logger;
}

void set_engine_log_level(spdlog::level::level_enum level) {
    engine_logger()->set_level(level);
}

} // namespace grid_engine
