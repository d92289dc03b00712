// log.h
// Engine-wide spdlog logger.

#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace hexsettle {
namespace log {

// Named "hexsettle", stdout color sink, created on first use at level warn.
std::shared_ptr<spdlog::logger> get();

void set_level(spdlog::level::level_enum level);

} // namespace log
} // namespace hexsettle
