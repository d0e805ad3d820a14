#include <pill_match/log.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pill_match {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;

    std::call_once(once, [] {
        instance = spdlog::get(kLoggerName);
        if (!instance) {
            instance = spdlog::stderr_color_mt(kLoggerName);
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace pill_match
