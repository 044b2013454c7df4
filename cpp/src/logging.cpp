#include "boltjoint/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace boltjoint {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("boltjoint");
        if (existing) {
            return existing;
        }
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto log = std::make_shared<spdlog::logger>("boltjoint", console_sink);
        log->set_level(spdlog::level::warn);
        log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        spdlog::register_logger(log);
        return log;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace boltjoint
