/**
 * @file btp.cpp
 * @brief BTP handshake and BLE advertisement implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "matterlink/btp.hpp"

#include <fmt/format.h>

#include <utility>

#include "log.hpp"
#include "matterlink/binary.hpp"

namespace matter
{
namespace link
{

HandshakeRequest::HandshakeRequest()
    : bytes_{BTP_CONTROL_FLAGS_HANDSHAKE,
             BTP_MANAGEMENT_OPCODE_HANDSHAKE,
             BTP_VERSION,
             0x00,
             0x00,
             0x00,
             0x00,
             0x00,
             BTP_HANDSHAKE_TRAILER}
{
}

void HandshakeRequest::encode(std::vector<uint8_t>& out) const
{
  out.insert(out.end(), bytes_.begin(), bytes_.end());
}

ErrorCode decode_handshake_response(const uint8_t* data, size_t len, HandshakeResponse& out)
{
  if (data == nullptr || len < BTP_HANDSHAKE_RESPONSE_MIN_SIZE)
  {
    LOG_WARN(LogRegion::BTP, "handshake response too short: {} bytes", len);
    return ErrorCode::INVALID_HANDSHAKE;
  }

  HandshakeResponse response;
  response.control_flags = data[0];
  response.opcode = data[1];
  response.vendor_nibble = static_cast<uint8_t>((data[2] & 0xF0) >> 4);
  response.raw.assign(data, data + len);

  out = std::move(response);
  return ErrorCode::OK;
}

std::string to_string(const HandshakeRequest& request)
{
  return fmt::format("HandshakeRequest{{Flags=0x{:02X}, Opcode=0x{:02X}, Version={}}} [{}]",
                     request.control_flags(), request.opcode(), request.version(),
                     internal::hex_dump(request.bytes().data(), request.bytes().size()));
}

std::string to_string(const HandshakeResponse& response)
{
  return fmt::format("HandshakeResponse{{Flags=0x{:02X}, Opcode=0x{:02X}, Vendor={}}} [{}]",
                     response.control_flags, response.opcode, response.vendor_nibble,
                     internal::hex_dump(response.raw.data(), response.raw.size()));
}

ErrorCode decode_ble_advertisement(const uint8_t* data, size_t len, BleAdvertisement& out)
{
  if (data == nullptr || len < BLE_ADVERTISEMENT_SIZE)
  {
    return ErrorCode::INVALID_LENGTH;
  }

  const uint16_t version_discriminator = read_le<uint16_t>(&data[1]);

  out.opcode = data[0];
  out.version = static_cast<uint8_t>(version_discriminator >> 12);
  out.discriminator = version_discriminator & DISCRIMINATOR_MAX;
  out.vendor_id = read_le<uint16_t>(&data[3]);
  out.product_id = read_le<uint16_t>(&data[5]);
  out.flags = data[7];
  return ErrorCode::OK;
}

}  // namespace link
}  // namespace matter
