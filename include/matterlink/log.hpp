/**
 * @file log.hpp
 * @brief matterlink logging configuration
 *
 * The library formats log lines with fmt and hands them to a single
 * process-wide handler. The default handler writes to stderr.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

namespace matter
{
namespace link
{

enum class LogLevel : uint8_t
{
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
  OFF = 4,
};

/**
 * @brief Subsystem that produced a log line
 */
enum class LogRegion : uint8_t
{
  CODEC,
  MRP,
  BTP,
  TRANSPORT,
  COMMISSIONER,
};

/**
 * @brief Log handler callback type
 *
 * @param user    User context pointer passed to set_log_handler()
 * @param level   Severity of the line
 * @param region  Subsystem name ("codec", "mrp", ...)
 * @param message Formatted message (NUL-terminated, valid for the call only)
 */
using LogHandlerFn = void (*)(void* user, LogLevel level, const char* region,
                              const char* message);

/**
 * @brief Set the minimum level that reaches the handler (default: WARN)
 */
void set_log_level(LogLevel level);

LogLevel get_log_level();

/**
 * @brief Install a log handler
 *
 * Passing nullptr restores the default stderr handler.
 */
void set_log_handler(LogHandlerFn handler, void* user = nullptr);

const char* log_level_name(LogLevel level);

const char* log_region_name(LogRegion region);

}  // namespace link
}  // namespace matter
