/**
 * @file frame_header.cpp
 * @brief Packet header encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <fmt/format.h>

#include "log.hpp"
#include "matterlink/binary.hpp"
#include "matterlink/message.hpp"

namespace matter
{
namespace link
{

size_t FrameHeader::size() const
{
  size_t total = FRAME_HEADER_MIN_SIZE;
  if (has_source_node_id())
  {
    total += NODE_ID_SIZE;
  }
  if (has_dest_node_id())
  {
    total += NODE_ID_SIZE;
  }
  return total;
}

void encode_frame_header(const FrameHeader& header, std::vector<uint8_t>& out)
{
  out.reserve(out.size() + header.size());

  // Fixed part: [FLAGS][SESSION_ID_L][SESSION_ID_H][SEC_FLAGS][COUNTER x4]
  out.push_back(header.flags);
  append_le<uint16_t>(out, header.session_id);
  out.push_back(header.security_flags);
  append_le<uint32_t>(out, header.message_counter);

  // Source precedes destination
  if (header.has_source_node_id())
  {
    append_le<uint64_t>(out, header.source_node_id);
  }
  if (header.has_dest_node_id())
  {
    append_le<uint64_t>(out, header.dest_node_id);
  }
}

ErrorCode decode_frame_header(const uint8_t* data, size_t len, FrameHeader& out,
                              size_t& consumed)
{
  consumed = 0;
  if (data == nullptr || len < FRAME_HEADER_MIN_SIZE)
  {
    return ErrorCode::FRAME_TOO_SHORT;
  }

  FrameHeader header;
  header.flags = data[0];
  header.session_id = read_le<uint16_t>(&data[1]);
  header.security_flags = data[3];
  header.message_counter = read_le<uint32_t>(&data[4]);

  size_t pos = FRAME_HEADER_MIN_SIZE;

  if (header.has_source_node_id())
  {
    if (len - pos < NODE_ID_SIZE)
    {
      return ErrorCode::FRAME_TRUNCATED_SOURCE_NODE_ID;
    }
    header.source_node_id = read_le<uint64_t>(&data[pos]);
    pos += NODE_ID_SIZE;
  }

  if (header.has_dest_node_id())
  {
    if (len - pos < NODE_ID_SIZE)
    {
      return ErrorCode::FRAME_TRUNCATED_DEST_NODE_ID;
    }
    header.dest_node_id = read_le<uint64_t>(&data[pos]);
    pos += NODE_ID_SIZE;
  }

  out = header;
  consumed = pos;
  return ErrorCode::OK;
}

std::string to_string(const FrameHeader& header)
{
  std::vector<uint8_t> encoded;
  encode_frame_header(header, encoded);

  return fmt::format(
      "FrameHeader{{Version={}, SessionID=0x{:04X}, SecurityFlags=0x{:02X}, MsgCtr={}, "
      "SrcNode=0x{:016X} (present={}), DstNode=0x{:016X} (present={})}} [{} bytes: {}]",
      header.version(), header.session_id, header.security_flags, header.message_counter,
      header.source_node_id, header.has_source_node_id(), header.dest_node_id,
      header.has_dest_node_id(), encoded.size(),
      internal::hex_dump(encoded.data(), encoded.size()));
}

bool operator==(const FrameHeader& a, const FrameHeader& b)
{
  if (a.flags != b.flags || a.session_id != b.session_id ||
      a.security_flags != b.security_flags || a.message_counter != b.message_counter)
  {
    return false;
  }
  if (a.has_source_node_id() && a.source_node_id != b.source_node_id)
  {
    return false;
  }
  if (a.has_dest_node_id() && a.dest_node_id != b.dest_node_id)
  {
    return false;
  }
  return true;
}

}  // namespace link
}  // namespace matter
