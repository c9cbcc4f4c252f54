/**
 * @file protocol.hpp
 * @brief matterlink protocol definitions
 *
 * Wire constants for the Matter message layer (packet header, exchange
 * header, MRP) and the BLE transport handshake, plus the shared error codes.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace matter
{
namespace link
{

/* ========================================================================= */
/* Packet (frame) header                                                     */
/* ========================================================================= */

/**
 * Packet header format (all multi-byte fields little-endian):
 *
 * [FLAGS][SESSION_ID_L][SESSION_ID_H][SEC_FLAGS][CTR0][CTR1][CTR2][CTR3]
 * [SOURCE_NODE_ID (8 bytes), if FLAG_SOURCE_NODE_ID_PRESENT]
 * [DEST_NODE_ID (8 bytes), if FLAG_DEST_NODE_ID_PRESENT]
 *
 * - FLAGS:     version in bits 0-3, destination present bit 5, source present bit 6
 * - SEC_FLAGS: privacy bit 7, control bit 6, message extensions bit 5,
 *              session type bits 0-1
 *
 * Minimum header size: 8 bytes. Maximum header size: 24 bytes.
 */
constexpr size_t FRAME_HEADER_MIN_SIZE = 8;
constexpr size_t NODE_ID_SIZE = 8;

constexpr uint8_t FRAME_VERSION_MASK = 0x0F;
constexpr uint8_t FLAG_DEST_NODE_ID_PRESENT = 0x20;
constexpr uint8_t FLAG_SOURCE_NODE_ID_PRESENT = 0x40;

constexpr uint8_t SECURITY_FLAG_PRIVACY = 0x80;
constexpr uint8_t SECURITY_FLAG_CONTROL = 0x40;
constexpr uint8_t SECURITY_FLAG_MESSAGE_EXTENSIONS = 0x20;
constexpr uint8_t SECURITY_SESSION_TYPE_MASK = 0x03;

/**
 * @brief Session type carried in the low two bits of the security flags
 */
enum class SessionType : uint8_t
{
  UNICAST = 0x00,
  GROUP = 0x01,
};

/* ========================================================================= */
/* Exchange (protocol) header                                                */
/* ========================================================================= */

/**
 * Exchange header format (all multi-byte fields little-endian):
 *
 * [EX_FLAGS][OPCODE][EXCHANGE_ID_L][EXCHANGE_ID_H][PROTOCOL_ID_L][PROTOCOL_ID_H]
 * [VENDOR_ID (2 bytes), if EXCHANGE_FLAG_VENDOR]
 * [ACK_COUNTER (4 bytes), if EXCHANGE_FLAG_ACK]
 * [SX_LEN (2 bytes)][SX_DATA...], if EXCHANGE_FLAG_SECURED_EXTENSIONS
 *
 * Minimum header size: 6 bytes.
 */
constexpr size_t EXCHANGE_HEADER_MIN_SIZE = 6;

constexpr uint8_t EXCHANGE_FLAG_INITIATOR = 0x01;
constexpr uint8_t EXCHANGE_FLAG_ACK = 0x02;
constexpr uint8_t EXCHANGE_FLAG_RELIABILITY = 0x04;
constexpr uint8_t EXCHANGE_FLAG_SECURED_EXTENSIONS = 0x08;
constexpr uint8_t EXCHANGE_FLAG_VENDOR = 0x10;

/**
 * @brief Length prefix size used by message extensions and secured extensions
 */
constexpr size_t EXTENSION_LENGTH_SIZE = 2;

/**
 * @brief Protocol identifiers carried in the exchange header
 */
enum class ProtocolId : uint16_t
{
  SECURE_CHANNEL = 0x0000,
  INTERACTION_MODEL = 0x0001,
};

/**
 * @brief Secure channel protocol opcodes
 */
enum class SecureChannelOpcode : uint8_t
{
  MRP_STANDALONE_ACK = 0x10,
  PBKDF_PARAM_REQUEST = 0x20,
  PBKDF_PARAM_RESPONSE = 0x21,
  PASE_PAKE1 = 0x22,
  PASE_PAKE2 = 0x23,
  PASE_PAKE3 = 0x24,
  STATUS_REPORT = 0x40,
};

/**
 * @brief Interaction model protocol opcodes
 */
enum class InteractionOpcode : uint8_t
{
  STATUS_RESPONSE = 0x01,
  READ_REQUEST = 0x02,
  SUBSCRIBE_REQUEST = 0x03,
  SUBSCRIBE_RESPONSE = 0x04,
  REPORT_DATA = 0x05,
  WRITE_REQUEST = 0x06,
  WRITE_RESPONSE = 0x07,
  INVOKE_REQUEST = 0x08,
  INVOKE_RESPONSE = 0x09,
  TIMED_REQUEST = 0x0A,
};

/**
 * @brief Opcode used by standalone acknowledgements built by this library
 */
constexpr uint8_t STANDALONE_ACK_OPCODE = 0x00;

/* ========================================================================= */
/* BTP handshake                                                             */
/* ========================================================================= */

/**
 * BTP handshake request (9 bytes, fixed):
 *
 * [0x65][0x6C][0x04][0x00][0x00][0x00][0x00][0x00][0xF4]
 *
 * BTP handshake response: at least 6 bytes,
 * [CTRL_FLAGS][OPCODE][VER/VENDOR nibble in bits 4-7]...
 */
constexpr size_t BTP_HANDSHAKE_REQUEST_SIZE = 9;
constexpr size_t BTP_HANDSHAKE_RESPONSE_MIN_SIZE = 6;

constexpr uint8_t BTP_CONTROL_FLAGS_HANDSHAKE = 0x65;
constexpr uint8_t BTP_MANAGEMENT_OPCODE_HANDSHAKE = 0x6C;
constexpr uint8_t BTP_VERSION = 0x04;
constexpr uint8_t BTP_HANDSHAKE_TRAILER = 0xF4;

/* ========================================================================= */
/* Onboarding payload                                                        */
/* ========================================================================= */

constexpr char QR_PAYLOAD_PREFIX[] = "MT:";
constexpr size_t QR_PAYLOAD_SIZE = 11;

constexpr uint16_t DISCRIMINATOR_MAX = 0x0FFF;
constexpr uint16_t SHORT_DISCRIMINATOR_MASK = 0x0F00;
constexpr uint32_t PASSCODE_MIN = 0x0000001;
constexpr uint32_t PASSCODE_MAX = 0x7FFFFFF;

constexpr size_t MANUAL_CODE_SHORT_LENGTH = 11;
constexpr size_t MANUAL_CODE_LONG_LENGTH = 21;

/* ========================================================================= */
/* Response codes                                                            */
/* ========================================================================= */

/**
 * @brief Error codes returned by codec and transport operations
 *
 * Defined via errors.def so the C API shares the same values.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "matterlink/errors.def"
#undef ERR
};

/**
 * @brief Get a static description of an error code
 *
 * @param code Error code
 * @return Message string (never nullptr)
 */
const char* error_message(ErrorCode code);

}  // namespace link
}  // namespace matter
