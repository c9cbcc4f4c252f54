/**
 * @file log.cpp
 * @brief Logging implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <iterator>
#include <mutex>

namespace matter
{
namespace link
{

namespace
{

void default_handler(void*, LogLevel level, const char* region, const char* message)
{
  fmt::print(stderr, "[{}] [{}] {}\n", log_level_name(level), region, message);
}

std::atomic<LogLevel> g_level{LogLevel::WARN};

std::mutex g_handler_mutex;
LogHandlerFn g_handler = &default_handler;
void* g_handler_user = nullptr;

}  // namespace

void set_log_level(LogLevel level)
{
  g_level.store(level);
}

LogLevel get_log_level()
{
  return g_level.load();
}

void set_log_handler(LogHandlerFn handler, void* user)
{
  std::lock_guard<std::mutex> lock(g_handler_mutex);
  g_handler = (handler != nullptr) ? handler : &default_handler;
  g_handler_user = (handler != nullptr) ? user : nullptr;
}

const char* log_level_name(LogLevel level)
{
  switch (level)
  {
    case LogLevel::DEBUG:
      return "debug";
    case LogLevel::INFO:
      return "info";
    case LogLevel::WARN:
      return "warn";
    case LogLevel::ERROR:
      return "error";
    default:
      return "off";
  }
}

const char* log_region_name(LogRegion region)
{
  switch (region)
  {
    case LogRegion::CODEC:
      return "codec";
    case LogRegion::MRP:
      return "mrp";
    case LogRegion::BTP:
      return "btp";
    case LogRegion::TRANSPORT:
      return "transport";
    case LogRegion::COMMISSIONER:
      return "commissioner";
    default:
      return "unknown";
  }
}

namespace internal
{

bool log_enabled(LogLevel level)
{
  const LogLevel current = g_level.load();
  return current != LogLevel::OFF && level >= current;
}

void log_write(LogLevel level, LogRegion region, const std::string& message)
{
  LogHandlerFn handler;
  void* user;
  {
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    handler = g_handler;
    user = g_handler_user;
  }

  // Called unlocked so a handler may log or replace itself
  handler(user, level, log_region_name(region), message.c_str());
}

std::string hex_dump(const uint8_t* data, size_t len)
{
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i)
  {
    fmt::format_to(std::back_inserter(out), "{:02x}", data[i]);
  }
  return out;
}

}  // namespace internal
}  // namespace link
}  // namespace matter
