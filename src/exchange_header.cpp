/**
 * @file exchange_header.cpp
 * @brief Exchange header encoding/decoding implementation
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

size_t ExchangeHeader::size() const
{
  size_t total = EXCHANGE_HEADER_MIN_SIZE;
  if (has_vendor_id())
  {
    total += sizeof(uint16_t);
  }
  if (is_ack())
  {
    total += sizeof(uint32_t);
  }
  if (has_secured_extensions())
  {
    total += EXTENSION_LENGTH_SIZE + secured_extensions.size();
  }
  return total;
}

ErrorCode encode_exchange_header(const ExchangeHeader& header, std::vector<uint8_t>& out)
{
  if (header.has_secured_extensions() && header.secured_extensions.size() > 0xFFFF)
  {
    return ErrorCode::EXTENSIONS_TOO_LONG;
  }

  out.reserve(out.size() + header.size());

  out.push_back(header.exchange_flags);
  out.push_back(header.opcode);
  append_le<uint16_t>(out, header.exchange_id);
  append_le<uint16_t>(out, header.protocol_id);

  if (header.has_vendor_id())
  {
    append_le<uint16_t>(out, header.vendor_id);
  }
  if (header.is_ack())
  {
    append_le<uint32_t>(out, header.ack_counter);
  }
  if (header.has_secured_extensions())
  {
    append_le<uint16_t>(out, static_cast<uint16_t>(header.secured_extensions.size()));
    out.insert(out.end(), header.secured_extensions.begin(), header.secured_extensions.end());
  }

  return ErrorCode::OK;
}

ErrorCode decode_exchange_header(const uint8_t* data, size_t len, ExchangeHeader& out,
                                 size_t& consumed)
{
  consumed = 0;
  if (data == nullptr || len < EXCHANGE_HEADER_MIN_SIZE)
  {
    return ErrorCode::HEADER_TOO_SHORT;
  }

  ExchangeHeader header;
  header.exchange_flags = data[0];
  header.opcode = data[1];
  header.exchange_id = read_le<uint16_t>(&data[2]);
  header.protocol_id = read_le<uint16_t>(&data[4]);

  size_t pos = EXCHANGE_HEADER_MIN_SIZE;

  if (header.has_vendor_id())
  {
    if (len - pos < sizeof(uint16_t))
    {
      return ErrorCode::HEADER_TRUNCATED_VENDOR_ID;
    }
    header.vendor_id = read_le<uint16_t>(&data[pos]);
    pos += sizeof(uint16_t);
  }

  if (header.is_ack())
  {
    if (len - pos < sizeof(uint32_t))
    {
      return ErrorCode::HEADER_TRUNCATED_ACK_COUNTER;
    }
    header.ack_counter = read_le<uint32_t>(&data[pos]);
    pos += sizeof(uint32_t);
  }

  if (header.has_secured_extensions())
  {
    if (len - pos < EXTENSION_LENGTH_SIZE)
    {
      return ErrorCode::HEADER_TRUNCATED_SECURED_EXTENSIONS;
    }
    const size_t ext_len = read_le<uint16_t>(&data[pos]);
    pos += EXTENSION_LENGTH_SIZE;

    if (len - pos < ext_len)
    {
      return ErrorCode::HEADER_TRUNCATED_SECURED_EXTENSIONS;
    }
    header.secured_extensions.assign(data + pos, data + pos + ext_len);
    pos += ext_len;
  }

  out = std::move(header);
  consumed = pos;
  return ErrorCode::OK;
}

std::string to_string(const ExchangeHeader& header)
{
  std::string flags;
  if (header.is_initiator())
  {
    flags += "I";
  }
  if (header.is_ack())
  {
    flags += "A";
  }
  if (header.is_reliability_requested())
  {
    flags += "R";
  }
  if (header.has_secured_extensions())
  {
    flags += "SX";
  }
  if (header.has_vendor_id())
  {
    flags += "V";
  }

  std::vector<uint8_t> encoded;
  if (encode_exchange_header(header, encoded) != ErrorCode::OK)
  {
    encoded.clear();
  }

  return fmt::format(
      "ExchangeHeader{{Flags=0x{:02X} [{}], Opcode=0x{:02X}, ExchID=0x{:04X}, "
      "ProtoID=0x{:04X}, VendorID=0x{:04X} (present={}), AckCtr={} (present={})}} "
      "[{} bytes: {}]",
      header.exchange_flags, flags, header.opcode, header.exchange_id, header.protocol_id,
      header.vendor_id, header.has_vendor_id(), header.ack_counter, header.is_ack(),
      encoded.size(), internal::hex_dump(encoded.data(), encoded.size()));
}

bool operator==(const ExchangeHeader& a, const ExchangeHeader& b)
{
  if (a.exchange_flags != b.exchange_flags || a.opcode != b.opcode ||
      a.exchange_id != b.exchange_id || a.protocol_id != b.protocol_id)
  {
    return false;
  }
  if (a.has_vendor_id() && a.vendor_id != b.vendor_id)
  {
    return false;
  }
  if (a.is_ack() && a.ack_counter != b.ack_counter)
  {
    return false;
  }
  if (a.has_secured_extensions() && a.secured_extensions != b.secured_extensions)
  {
    return false;
  }
  return true;
}

}  // namespace link
}  // namespace matter
