/**
 * @file message.hpp
 * @brief Matter message codec (packet header, exchange header, message)
 *
 * All types are plain values. Encoders append to a caller-supplied buffer;
 * decoders never read past the supplied length and report how many bytes
 * they consumed so the caller can locate the next structure.
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
/* Packet (frame) header                                                     */
/* ========================================================================= */

/**
 * @brief Packet-layer message header
 *
 * The presence bits in @ref flags decide whether @ref source_node_id and
 * @ref dest_node_id are serialized. Values of absent fields are ignored by
 * the encoder and left at zero by the decoder.
 */
struct FrameHeader
{
  uint8_t flags = 0;
  uint16_t session_id = 0;
  uint8_t security_flags = 0;
  uint32_t message_counter = 0;
  uint64_t source_node_id = 0;
  uint64_t dest_node_id = 0;

  uint8_t version() const
  {
    return flags & FRAME_VERSION_MASK;
  }

  bool has_source_node_id() const
  {
    return (flags & FLAG_SOURCE_NODE_ID_PRESENT) != 0;
  }

  bool has_dest_node_id() const
  {
    return (flags & FLAG_DEST_NODE_ID_PRESENT) != 0;
  }

  bool is_privacy() const
  {
    return (security_flags & SECURITY_FLAG_PRIVACY) != 0;
  }

  bool is_control() const
  {
    return (security_flags & SECURITY_FLAG_CONTROL) != 0;
  }

  bool has_message_extensions() const
  {
    return (security_flags & SECURITY_FLAG_MESSAGE_EXTENSIONS) != 0;
  }

  SessionType session_type() const
  {
    return static_cast<SessionType>(security_flags & SECURITY_SESSION_TYPE_MASK);
  }

  /**
   * @brief Encoded size: 8 bytes plus 8 per present node id
   */
  size_t size() const;
};

/**
 * @brief Encode a packet header
 *
 * Generates [FLAGS][SESSION_ID][SEC_FLAGS][COUNTER][SRC?][DST?] and appends
 * it to @p out.
 */
void encode_frame_header(const FrameHeader& header, std::vector<uint8_t>& out);

/**
 * @brief Decode a packet header
 *
 * @param data     Input buffer
 * @param len      Input length in bytes
 * @param out      Decoded header
 * @param consumed Number of bytes read
 * @return ErrorCode::OK, ErrorCode::FRAME_TOO_SHORT if fewer than 8 bytes,
 *         or ErrorCode::FRAME_TRUNCATED_SOURCE_NODE_ID /
 *         ErrorCode::FRAME_TRUNCATED_DEST_NODE_ID if a flagged node id is cut
 */
ErrorCode decode_frame_header(const uint8_t* data, size_t len, FrameHeader& out,
                              size_t& consumed);

std::string to_string(const FrameHeader& header);

/* ========================================================================= */
/* Exchange (protocol) header                                                */
/* ========================================================================= */

/**
 * @brief Exchange-layer (protocol) header
 *
 * vendor_id is serialized iff EXCHANGE_FLAG_VENDOR is set, ack_counter iff
 * EXCHANGE_FLAG_ACK is set, secured_extensions (with a 2-byte length
 * prefix) iff EXCHANGE_FLAG_SECURED_EXTENSIONS is set.
 */
struct ExchangeHeader
{
  uint8_t exchange_flags = 0;
  uint8_t opcode = 0;
  uint16_t exchange_id = 0;
  uint16_t protocol_id = 0;
  uint16_t vendor_id = 0;
  uint32_t ack_counter = 0;
  std::vector<uint8_t> secured_extensions;

  bool is_initiator() const
  {
    return (exchange_flags & EXCHANGE_FLAG_INITIATOR) != 0;
  }

  bool is_ack() const
  {
    return (exchange_flags & EXCHANGE_FLAG_ACK) != 0;
  }

  bool is_reliability_requested() const
  {
    return (exchange_flags & EXCHANGE_FLAG_RELIABILITY) != 0;
  }

  bool has_secured_extensions() const
  {
    return (exchange_flags & EXCHANGE_FLAG_SECURED_EXTENSIONS) != 0;
  }

  bool has_vendor_id() const
  {
    return (exchange_flags & EXCHANGE_FLAG_VENDOR) != 0;
  }

  size_t size() const;
};

/**
 * @brief Encode an exchange header
 *
 * @return ErrorCode::OK or ErrorCode::EXTENSIONS_TOO_LONG if the secured
 *         extensions do not fit a 16-bit length prefix (@p out is untouched)
 */
ErrorCode encode_exchange_header(const ExchangeHeader& header, std::vector<uint8_t>& out);

/**
 * @brief Decode an exchange header
 *
 * Fields are read in the fixed order: flags, opcode, exchange id, protocol
 * id, [vendor id], [ack counter], [secured extensions].
 *
 * @return ErrorCode::OK, ErrorCode::HEADER_TOO_SHORT if fewer than 6 bytes,
 *         or the HEADER_TRUNCATED_* code naming the missing optional field
 */
ErrorCode decode_exchange_header(const uint8_t* data, size_t len, ExchangeHeader& out,
                                 size_t& consumed);

std::string to_string(const ExchangeHeader& header);

/* ========================================================================= */
/* Message                                                                   */
/* ========================================================================= */

/**
 * @brief Complete Matter message
 *
 * Wire format: [FRAME HEADER][EXCHANGE HEADER][EXT_LEN][EXT...][PAYLOAD...]
 * The extensions block is present iff the frame header's security flags
 * carry SECURITY_FLAG_MESSAGE_EXTENSIONS.
 */
struct Message
{
  FrameHeader frame;
  ExchangeHeader exchange;
  std::vector<uint8_t> extensions;
  std::vector<uint8_t> payload;
};

/**
 * @brief Encode a message
 *
 * @param msg Message to encode
 * @param out Output buffer for the encoded message (cleared first)
 * @return ErrorCode::OK or ErrorCode::EXTENSIONS_TOO_LONG
 */
ErrorCode encode_message(const Message& msg, std::vector<uint8_t>& out);

/**
 * @brief Decode a message
 *
 * Everything after the headers and extensions is the opaque payload.
 *
 * @return ErrorCode::OK, ErrorCode::MESSAGE_TOO_SHORT if the buffer ends
 *         inside a header or the extensions block, or a more specific
 *         frame/exchange truncation code
 */
ErrorCode decode_message(const uint8_t* data, size_t len, Message& out);

std::string to_string(const Message& msg);

bool operator==(const FrameHeader& a, const FrameHeader& b);
bool operator==(const ExchangeHeader& a, const ExchangeHeader& b);
bool operator==(const Message& a, const Message& b);

}  // namespace link
}  // namespace matter
