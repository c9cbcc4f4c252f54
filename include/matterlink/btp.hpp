/**
 * @file btp.hpp
 * @brief BLE transport (BTP) handshake framing and advertisement decoding
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
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
/* Handshake                                                                 */
/* ========================================================================= */

/**
 * @brief BTP handshake request
 *
 * The request is a constant 9-byte frame; the accessors read fields back
 * out of it.
 */
class HandshakeRequest
{
 public:
  using Bytes = std::array<uint8_t, BTP_HANDSHAKE_REQUEST_SIZE>;

  HandshakeRequest();

  uint8_t control_flags() const
  {
    return bytes_[0];
  }

  uint8_t opcode() const
  {
    return bytes_[1];
  }

  uint8_t version() const
  {
    return bytes_[2];
  }

  const Bytes& bytes() const
  {
    return bytes_;
  }

  /**
   * @brief Append the request frame to @p out
   */
  void encode(std::vector<uint8_t>& out) const;

 private:
  Bytes bytes_;
};

/**
 * @brief BTP handshake response
 *
 * Only the first three bytes are interpreted; the full frame is kept in
 * @ref raw.
 */
struct HandshakeResponse
{
  uint8_t control_flags = 0;
  uint8_t opcode = 0;
  uint8_t vendor_nibble = 0;  ///< Bits 4-7 of byte 2
  std::vector<uint8_t> raw;
};

/**
 * @brief Decode a BTP handshake response
 *
 * @return ErrorCode::OK or ErrorCode::INVALID_HANDSHAKE if fewer than
 *         BTP_HANDSHAKE_RESPONSE_MIN_SIZE bytes are supplied
 */
ErrorCode decode_handshake_response(const uint8_t* data, size_t len, HandshakeResponse& out);

std::string to_string(const HandshakeRequest& request);
std::string to_string(const HandshakeResponse& response);

/* ========================================================================= */
/* Advertisement                                                             */
/* ========================================================================= */

constexpr size_t BLE_ADVERTISEMENT_SIZE = 8;

constexpr uint8_t BLE_OPCODE_COMMISSIONABLE = 0x00;
constexpr uint8_t BLE_FLAG_ADDITIONAL_DATA = 0x01;
constexpr uint8_t BLE_FLAG_EXTENDED_ANNOUNCEMENT = 0x02;

/**
 * Matter BLE service data (little-endian):
 *
 * [OPCODE][VER/DISC_L][VER/DISC_H][VID_L][VID_H][PID_L][PID_H][FLAGS]
 *
 * - VER/DISC: advertisement version in bits 12-15, discriminator in bits 0-11
 */
struct BleAdvertisement
{
  uint8_t opcode = 0;
  uint8_t version = 0;
  uint16_t discriminator = 0;
  uint16_t vendor_id = 0;
  uint16_t product_id = 0;
  uint8_t flags = 0;

  bool is_commissionable() const
  {
    return opcode == BLE_OPCODE_COMMISSIONABLE;
  }

  bool has_additional_data() const
  {
    return (flags & BLE_FLAG_ADDITIONAL_DATA) != 0;
  }

  bool is_extended_announcement() const
  {
    return (flags & BLE_FLAG_EXTENDED_ANNOUNCEMENT) != 0;
  }
};

/**
 * @brief Decode Matter BLE service data
 *
 * Bytes past the first 8 are ignored.
 *
 * @return ErrorCode::OK or ErrorCode::INVALID_LENGTH if fewer than 8 bytes
 */
ErrorCode decode_ble_advertisement(const uint8_t* data, size_t len, BleAdvertisement& out);

}  // namespace link
}  // namespace matter
