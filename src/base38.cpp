/**
 * @file base38.cpp
 * @brief Base-38 encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "matterlink/onboarding.hpp"

namespace matter
{
namespace link
{

namespace
{

constexpr char ALPHABET[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ-.";
constexpr uint32_t RADIX = 38;

// Characters emitted for a chunk of 1, 2 or 3 bytes
constexpr size_t CHARS_PER_CHUNK[4] = {0, 2, 4, 5};

int char_value(char c)
{
  if (c >= '0' && c <= '9')
  {
    return c - '0';
  }
  if (c >= 'A' && c <= 'Z')
  {
    return 10 + (c - 'A');
  }
  if (c == '-')
  {
    return 36;
  }
  if (c == '.')
  {
    return 37;
  }
  return -1;
}

void encode_chunk(const uint8_t* data, size_t bytes, std::string& out)
{
  uint32_t value = 0;
  for (size_t i = 0; i < bytes; ++i)
  {
    value |= static_cast<uint32_t>(data[i]) << (i * 8);
  }

  for (size_t i = 0; i < CHARS_PER_CHUNK[bytes]; ++i)
  {
    out.push_back(ALPHABET[value % RADIX]);
    value /= RADIX;
  }
}

bool decode_chunk(const char* text, size_t chars, size_t bytes, std::vector<uint8_t>& out)
{
  uint32_t value = 0;
  uint32_t multiplier = 1;

  for (size_t i = 0; i < chars; ++i)
  {
    const int v = char_value(text[i]);
    if (v < 0)
    {
      return false;
    }
    value += static_cast<uint32_t>(v) * multiplier;
    multiplier *= RADIX;
  }

  // A group that does not fit its byte width was not produced by the encoder
  if (value >> (bytes * 8) != 0)
  {
    return false;
  }

  for (size_t i = 0; i < bytes; ++i)
  {
    out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
  }
  return true;
}

}  // namespace

std::string encode_base38(const uint8_t* data, size_t len)
{
  std::string out;
  if (len == 0 || data == nullptr)
  {
    return out;
  }

  out.reserve((len / 3) * 5 + CHARS_PER_CHUNK[len % 3]);

  size_t pos = 0;
  while (pos + 3 <= len)
  {
    encode_chunk(data + pos, 3, out);
    pos += 3;
  }

  if (pos < len)
  {
    encode_chunk(data + pos, len - pos, out);
  }

  return out;
}

ErrorCode decode_base38(const std::string& text, std::vector<uint8_t>& out)
{
  out.clear();
  out.reserve((text.size() / 5) * 3 + 2);

  size_t pos = 0;
  while (pos + 5 <= text.size())
  {
    if (!decode_chunk(text.data() + pos, 5, 3, out))
    {
      out.clear();
      return ErrorCode::INVALID_ENCODING;
    }
    pos += 5;
  }

  const size_t rest = text.size() - pos;
  size_t tail_bytes = 0;

  switch (rest)
  {
    case 0:
      return ErrorCode::OK;

    case 2:
      tail_bytes = 1;
      break;

    case 4:
      tail_bytes = 2;
      break;

    default:
      out.clear();
      return ErrorCode::INVALID_ENCODING;
  }

  if (!decode_chunk(text.data() + pos, rest, tail_bytes, out))
  {
    out.clear();
    return ErrorCode::INVALID_ENCODING;
  }

  return ErrorCode::OK;
}

}  // namespace link
}  // namespace matter
