/**
 * @file binary.hpp
 * @brief Fixed-width integer <-> byte conversion
 *
 * Matter packet and exchange headers are little-endian. Big-endian helpers
 * are kept for call sites that need network order.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace matter
{
namespace link
{

enum class Endian
{
  LITTLE,
  BIG,
};

/**
 * @brief Convert an unsigned integer to a fixed-size byte array
 *
 * @tparam T     uint8_t, uint16_t, uint32_t or uint64_t
 * @param value  Value to convert
 * @param order  Byte order of the result
 * @return Array of sizeof(T) bytes
 */
template <typename T>
std::array<uint8_t, sizeof(T)> to_bytes(T value, Endian order)
{
  static_assert(std::is_unsigned<T>::value, "to_bytes requires an unsigned type");

  std::array<uint8_t, sizeof(T)> out{};
  for (size_t i = 0; i < sizeof(T); ++i)
  {
    const uint8_t byte = static_cast<uint8_t>((static_cast<uint64_t>(value) >> (i * 8)) & 0xFF);
    if (order == Endian::LITTLE)
    {
      out[i] = byte;
    }
    else
    {
      out[sizeof(T) - 1 - i] = byte;
    }
  }
  return out;
}

/**
 * @brief Convert a fixed-size byte array back to an unsigned integer
 *
 * @tparam T     uint8_t, uint16_t, uint32_t or uint64_t
 * @param bytes  Array of sizeof(T) bytes
 * @param order  Byte order of the input
 * @return Decoded value
 */
template <typename T>
T from_bytes(const std::array<uint8_t, sizeof(T)>& bytes, Endian order)
{
  static_assert(std::is_unsigned<T>::value, "from_bytes requires an unsigned type");

  uint64_t value = 0;
  for (size_t i = 0; i < sizeof(T); ++i)
  {
    const uint8_t byte = (order == Endian::LITTLE) ? bytes[i] : bytes[sizeof(T) - 1 - i];
    value |= static_cast<uint64_t>(byte) << (i * 8);
  }
  return static_cast<T>(value);
}

/**
 * @brief Read a little-endian value from a raw buffer
 *
 * Caller guarantees at least sizeof(T) readable bytes at @p src.
 */
template <typename T>
T read_le(const uint8_t* src)
{
  uint64_t value = 0;
  for (size_t i = 0; i < sizeof(T); ++i)
  {
    value |= static_cast<uint64_t>(src[i]) << (i * 8);
  }
  return static_cast<T>(value);
}

/**
 * @brief Append a little-endian value to a byte vector
 */
template <typename T>
void append_le(std::vector<uint8_t>& out, T value)
{
  const auto bytes = to_bytes<T>(value, Endian::LITTLE);
  out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace link
}  // namespace matter
