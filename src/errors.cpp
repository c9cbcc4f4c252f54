/**
 * @file errors.cpp
 * @brief Error code descriptions
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "matterlink/protocol.hpp"

namespace matter
{
namespace link
{

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "matterlink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace link
}  // namespace matter
