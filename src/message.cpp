/**
 * @file message.cpp
 * @brief Message assembly implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <fmt/format.h>

#include <utility>

#include "log.hpp"
#include "matterlink/binary.hpp"
#include "matterlink/message.hpp"

namespace matter
{
namespace link
{

ErrorCode encode_message(const Message& msg, std::vector<uint8_t>& out)
{
  const bool has_extensions = msg.frame.has_message_extensions();
  if (has_extensions && msg.extensions.size() > 0xFFFF)
  {
    return ErrorCode::EXTENSIONS_TOO_LONG;
  }

  out.clear();
  out.reserve(msg.frame.size() + msg.exchange.size() + EXTENSION_LENGTH_SIZE +
              msg.extensions.size() + msg.payload.size());

  encode_frame_header(msg.frame, out);

  const ErrorCode err = encode_exchange_header(msg.exchange, out);
  if (err != ErrorCode::OK)
  {
    out.clear();
    return err;
  }

  if (has_extensions)
  {
    append_le<uint16_t>(out, static_cast<uint16_t>(msg.extensions.size()));
    out.insert(out.end(), msg.extensions.begin(), msg.extensions.end());
  }

  out.insert(out.end(), msg.payload.begin(), msg.payload.end());
  return ErrorCode::OK;
}

ErrorCode decode_message(const uint8_t* data, size_t len, Message& out)
{
  if (data == nullptr)
  {
    return ErrorCode::MESSAGE_TOO_SHORT;
  }

  Message msg;
  size_t pos = 0;
  size_t used = 0;

  ErrorCode err = decode_frame_header(data, len, msg.frame, used);
  if (err == ErrorCode::FRAME_TOO_SHORT)
  {
    return ErrorCode::MESSAGE_TOO_SHORT;
  }
  if (err != ErrorCode::OK)
  {
    return err;
  }
  pos += used;

  err = decode_exchange_header(data + pos, len - pos, msg.exchange, used);
  if (err == ErrorCode::HEADER_TOO_SHORT)
  {
    return ErrorCode::MESSAGE_TOO_SHORT;
  }
  if (err != ErrorCode::OK)
  {
    return err;
  }
  pos += used;

  if (msg.frame.has_message_extensions())
  {
    if (len - pos < EXTENSION_LENGTH_SIZE)
    {
      return ErrorCode::MESSAGE_TOO_SHORT;
    }
    const size_t ext_len = read_le<uint16_t>(&data[pos]);
    pos += EXTENSION_LENGTH_SIZE;

    if (len - pos < ext_len)
    {
      return ErrorCode::MESSAGE_TOO_SHORT;
    }
    msg.extensions.assign(data + pos, data + pos + ext_len);
    pos += ext_len;
  }

  msg.payload.assign(data + pos, data + len);
  out = std::move(msg);
  return ErrorCode::OK;
}

std::string to_string(const Message& msg)
{
  return fmt::format("Message{{\n  {}\n  {}\n  Extensions: {} bytes\n  Payload: {} bytes [{}]\n}}",
                     to_string(msg.frame), to_string(msg.exchange), msg.extensions.size(),
                     msg.payload.size(), internal::hex_dump(msg.payload.data(), msg.payload.size()));
}

bool operator==(const Message& a, const Message& b)
{
  if (!(a.frame == b.frame) || !(a.exchange == b.exchange) || a.payload != b.payload)
  {
    return false;
  }
  if (a.frame.has_message_extensions() && a.extensions != b.extensions)
  {
    return false;
  }
  return true;
}

}  // namespace link
}  // namespace matter
