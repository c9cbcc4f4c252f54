/**
 * @file log.hpp
 * @brief Internal logging macros
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>

#include "matterlink/log.hpp"

namespace matter
{
namespace link
{
namespace internal
{

bool log_enabled(LogLevel level);

void log_write(LogLevel level, LogRegion region, const std::string& message);

/**
 * @brief Render a buffer as lowercase hex without separators
 */
std::string hex_dump(const uint8_t* data, size_t len);

}  // namespace internal
}  // namespace link
}  // namespace matter

#define MATTERLINK_LOG(level, region, ...)                                                \
  do                                                                                      \
  {                                                                                       \
    if (::matter::link::internal::log_enabled(level))                                     \
    {                                                                                     \
      ::matter::link::internal::log_write(level, region, ::fmt::format(__VA_ARGS__));     \
    }                                                                                     \
  } while (0)

#define LOG_DEBUG(region, ...) MATTERLINK_LOG(::matter::link::LogLevel::DEBUG, region, __VA_ARGS__)
#define LOG_INFO(region, ...) MATTERLINK_LOG(::matter::link::LogLevel::INFO, region, __VA_ARGS__)
#define LOG_WARN(region, ...) MATTERLINK_LOG(::matter::link::LogLevel::WARN, region, __VA_ARGS__)
#define LOG_ERROR(region, ...) MATTERLINK_LOG(::matter::link::LogLevel::ERROR, region, __VA_ARGS__)
