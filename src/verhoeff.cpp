/**
 * @file verhoeff.cpp
 * @brief Verhoeff check digit implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "verhoeff.hpp"

#include <cstddef>
#include <cstdint>

namespace matter
{
namespace link
{
namespace internal
{

namespace
{

constexpr uint8_t D[10][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6}, {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8}, {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2}, {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4}, {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
};

constexpr uint8_t P[8][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2}, {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0}, {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5}, {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
};

constexpr uint8_t INV[10] = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

bool is_digit(char c)
{
  return c >= '0' && c <= '9';
}

// Runs the checksum over the digits right to left. `offset` shifts the
// permutation row so generation can account for the missing check digit.
bool accumulate(const std::string& digits, size_t offset, uint8_t& c)
{
  c = 0;
  size_t pos = offset;

  for (size_t i = digits.size(); i > 0; --i, ++pos)
  {
    const char ch = digits[i - 1];
    if (!is_digit(ch))
    {
      return false;
    }
    c = D[c][P[pos % 8][ch - '0']];
  }

  return true;
}

}  // namespace

char generate_verhoeff_check(const std::string& digits)
{
  uint8_t c = 0;
  if (!accumulate(digits, 1, c))
  {
    return '\0';
  }
  return static_cast<char>('0' + INV[c]);
}

bool validate_verhoeff_check(const std::string& digits)
{
  if (digits.empty())
  {
    return false;
  }

  uint8_t c = 0;
  if (!accumulate(digits, 0, c))
  {
    return false;
  }
  return c == 0;
}

}  // namespace internal
}  // namespace link
}  // namespace matter
