// log.cpp

#include "hexsettle/log.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hexsettle {
namespace log {

std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto existing = spdlog::get("hexsettle");
        if (existing) return existing;
        auto created = spdlog::stdout_color_mt("hexsettle");
        created->set_pattern("[%H:%M:%S.%e][%n][%l] %v");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return logger;
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace log
} // namespace hexsettle
