/**
 * @file logging.hpp
 * @brief Library-wide spdlog logger.
 */
#pragma once
#include "rwdagt/common/common.hpp"
#include <spdlog/spdlog.h>

namespace rwdagt
{

/**
 * @brief Name under which the library logger is registered with spdlog.
 */
inline constexpr const char* kLoggerName = "rwdagt";

/**
 * @brief Get the library logger.
 *
 * @details
 * The logger is created on first use with a colored stderr sink and registered
 * with spdlog under `kLoggerName`. If the application has already registered a
 * logger with that name, that logger is used instead.
 *
 * @par Thread Safety
 * - Safe to call from any thread.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the library logger.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace rwdagt
