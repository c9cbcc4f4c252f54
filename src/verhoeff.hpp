/**
 * @file verhoeff.hpp
 * @brief Verhoeff check digit calculation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <string>

namespace matter
{
namespace link
{
namespace internal
{

/**
 * @brief Calculate the Verhoeff check digit for a decimal string
 *
 * Uses the dihedral group D5 multiplication table, the 8-row permutation
 * table and the inverse table. An empty string yields '0'.
 *
 * @param digits Decimal digits only ('0'-'9')
 * @return Check digit character ('0'-'9'), or '\0' if @p digits contains
 *         a non-digit character
 */
char generate_verhoeff_check(const std::string& digits);

/**
 * @brief Validate a decimal string whose last digit is a Verhoeff check digit
 *
 * @param digits Decimal digits including the trailing check digit
 * @return true if the checksum is valid, false otherwise (including empty
 *         input or non-digit characters)
 */
bool validate_verhoeff_check(const std::string& digits);

}  // namespace internal
}  // namespace link
}  // namespace matter
