/**
 * @file onboarding.hpp
 * @brief Onboarding payload codecs (QR code and manual pairing code)
 *
 * Both representations carry the same logical fields. The QR form carries
 * the full 12-bit discriminator; the manual pairing code carries only its
 * upper 4 bits.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "matterlink/protocol.hpp"

namespace matter
{
namespace link
{

/* ========================================================================= */
/* Base-38                                                                   */
/* ========================================================================= */

/**
 * @brief Encode raw bytes with the Matter Base-38 alphabet
 *
 * Every 3 input bytes (little-endian) yield 5 characters, a 2-byte tail
 * yields 4 characters and a 1-byte tail yields 2 characters. The least
 * significant digit is emitted first.
 *
 * @param data Input bytes (can be nullptr if len == 0)
 * @param len  Input length in bytes
 * @return Encoded string using "0-9A-Z-."
 */
std::string encode_base38(const uint8_t* data, size_t len);

/**
 * @brief Decode a Base-38 string
 *
 * @param text Encoded string
 * @param out  Output buffer (cleared first)
 * @return ErrorCode::OK, or ErrorCode::INVALID_ENCODING for a character
 *         outside the alphabet, a trailing group that is not 0, 2 or 4
 *         characters long, or a group whose value overflows its byte width
 */
ErrorCode decode_base38(const std::string& text, std::vector<uint8_t>& out);

/* ========================================================================= */
/* Onboarding payload                                                        */
/* ========================================================================= */

/**
 * @brief Commissioning flow advertised by the device
 */
enum class CommissioningFlow : uint8_t
{
  STANDARD = 0,
  USER_ACTION = 1,
  CUSTOM = 2,
};

/**
 * @brief Get the display name of a commissioning flow
 *
 * @return "standard", "user-action", "custom" or "unknown"
 */
const char* flow_name(CommissioningFlow flow);

/**
 * @brief Logical onboarding payload fields
 *
 * discovery_capabilities is only carried by the QR form.
 */
struct OnboardingPayload
{
  uint8_t version = 0;
  uint16_t vendor_id = 0;
  uint16_t product_id = 0;
  CommissioningFlow flow = CommissioningFlow::STANDARD;
  uint8_t discovery_capabilities = 0;
  uint16_t discriminator = 0;
  uint32_t passcode = 0;
};

/* ========================================================================= */
/* Discriminator and vendor matching                                         */
/* ========================================================================= */

/**
 * @brief Check whether only the upper 4 bits of a discriminator are set
 *
 * A discriminator recovered from a manual pairing code always satisfies
 * this; its lower 8 bits are unknown rather than zero.
 */
inline bool is_upper_4_bits_only(uint16_t discriminator)
{
  return (discriminator & SHORT_DISCRIMINATOR_MASK) == discriminator;
}

inline bool is_full_12_bits(uint16_t discriminator)
{
  return !is_upper_4_bits_only(discriminator);
}

/**
 * @brief Get the 4-bit short discriminator
 */
inline uint8_t short_discriminator(uint16_t discriminator)
{
  return static_cast<uint8_t>((discriminator >> 8) & 0x0F);
}

/**
 * @brief Compare two discriminators
 *
 * If either side is in short form only the upper 4 bits are compared,
 * otherwise all 12 bits must match.
 */
bool discriminator_matches(uint16_t a, uint16_t b);

/**
 * @brief Compare vendor or product ids, treating 0 as a wildcard
 */
inline bool id_matches(uint16_t a, uint16_t b)
{
  return a == 0 || b == 0 || a == b;
}

/**
 * @brief Format a passcode as its 4-byte little-endian PAKE input
 *
 * Example: 18924017 -> "f1:c1:20:01"
 */
std::string format_passcode(uint32_t passcode);

/* ========================================================================= */
/* QR payload                                                                */
/* ========================================================================= */

/**
 * @brief Pack payload fields into the 11-byte QR bit layout
 *
 * Bits are consumed LSB-first: version(3) vendor_id(16) product_id(16)
 * flow(2) discovery_capabilities(8) discriminator(12) passcode(27)
 * padding(4). Fields wider than their slot are masked.
 *
 * @param payload Payload fields
 * @param out     Output buffer (resized to QR_PAYLOAD_SIZE)
 */
void pack_qr_payload(const OnboardingPayload& payload, std::vector<uint8_t>& out);

/**
 * @brief Unpack the 11-byte QR bit layout
 *
 * @return ErrorCode::OK, ErrorCode::INVALID_LENGTH if @p len != 11, or
 *         ErrorCode::INVALID_PAYLOAD if the passcode is outside [1, 0x7FFFFFF]
 */
ErrorCode unpack_qr_payload(const uint8_t* data, size_t len, OnboardingPayload& out);

/**
 * @brief Encode a payload as "MT:" + Base-38
 *
 * @return ErrorCode::OK or ErrorCode::INVALID_PAYLOAD for out-of-range fields
 */
ErrorCode encode_qr_payload(const OnboardingPayload& payload, std::string& out);

/**
 * @brief Decode an "MT:" QR payload string
 *
 * @return ErrorCode::OK, ErrorCode::INVALID_PAYLOAD (missing prefix or
 *         passcode out of range), ErrorCode::INVALID_ENCODING or
 *         ErrorCode::INVALID_LENGTH
 */
ErrorCode decode_qr_payload(const std::string& text, OnboardingPayload& out);

/* ========================================================================= */
/* Manual pairing code                                                       */
/* ========================================================================= */

/**
 * @brief Encode a manual pairing code
 *
 * The 21-digit form is produced when vendor_id or product_id is non-zero,
 * the 11-digit form otherwise. The last digit is a Verhoeff check digit.
 * Neither form has room for the version or the flow, so the version must
 * be 0 and the flow must be CUSTOM for the 21-digit form and STANDARD for
 * the 11-digit form.
 *
 * @param payload   Payload fields
 * @param out       Output string
 * @param formatted Insert display hyphens (XXXX-XXX-XXXX or
 *                  XXXX-XXX-XXXX-XXXX-XXX-XX-X)
 * @return ErrorCode::OK or ErrorCode::INVALID_PAYLOAD if the version or
 *         flow cannot be carried, discriminator > 0x0FFF or
 *         passcode > 0x7FFFFFF
 */
ErrorCode encode_manual_pairing_code(const OnboardingPayload& payload, std::string& out,
                                     bool formatted = false);

/**
 * @brief Decode a manual pairing code
 *
 * Non-digit characters are ignored. The decoded discriminator only has its
 * upper 4 bits set.
 *
 * @return ErrorCode::OK, ErrorCode::INVALID_LENGTH (not 11 or 21 digits),
 *         ErrorCode::CHECKSUM_MISMATCH or ErrorCode::INVALID_PAYLOAD
 */
ErrorCode decode_manual_pairing_code(const std::string& text, OnboardingPayload& out);

/**
 * @brief Decode either a QR payload string or a manual pairing code
 */
ErrorCode parse_onboarding_payload(const std::string& text, OnboardingPayload& out);

}  // namespace link
}  // namespace matter
