#pragma once

/// @file log.hpp
/// @brief Library logger

#include <memory>

#include <spdlog/spdlog.h>

namespace pill_match {

/// @brief Name under which the library logger is registered with spdlog
constexpr const char* kLoggerName = "pill_match";

/// @brief Returns the library logger, creating it on first use
///
/// If the application registered a logger named "pill_match" before the
/// first call, that logger is used instead. Defaults to level warn.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// @brief Sets the level of the library logger
void set_log_level(spdlog::level::level_enum level);

}  // namespace pill_match
