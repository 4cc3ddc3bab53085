#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace grid_engine {

// Logger shared by all engine algorithms ("grid_engine", stderr). Quiet by
// default: only safety-cap hits are reported at warn level.
std::shared_ptr<spdlog::logger> engine_logger();

void set_engine_log_level(spdlog::level::level_enum level);

} // namespace grid_engine
