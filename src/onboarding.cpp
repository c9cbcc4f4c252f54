/**
 * @file onboarding.cpp
 * @brief QR payload and manual pairing code implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "matterlink/onboarding.hpp"

#include <fmt/format.h>

#include <cstring>

#include "log.hpp"
#include "matterlink/binary.hpp"
#include "verhoeff.hpp"

namespace matter
{
namespace link
{

namespace
{

/* ========================================================================= */
/* Bit packing helpers                                                       */
/* ========================================================================= */

// LSB-first bit writer over a fixed byte buffer
class BitWriter
{
 public:
  explicit BitWriter(std::vector<uint8_t>& buf) : buf_(buf), pos_(0) {}

  void put(uint64_t value, size_t bits)
  {
    for (size_t i = 0; i < bits; ++i, ++pos_)
    {
      if ((value >> i) & 0x1)
      {
        buf_[pos_ / 8] |= static_cast<uint8_t>(1u << (pos_ % 8));
      }
    }
  }

 private:
  std::vector<uint8_t>& buf_;
  size_t pos_;
};

class BitReader
{
 public:
  explicit BitReader(const uint8_t* data) : data_(data), pos_(0) {}

  uint64_t get(size_t bits)
  {
    uint64_t value = 0;
    for (size_t i = 0; i < bits; ++i, ++pos_)
    {
      const uint64_t bit = (data_[pos_ / 8] >> (pos_ % 8)) & 0x1;
      value |= bit << i;
    }
    return value;
  }

 private:
  const uint8_t* data_;
  size_t pos_;
};

constexpr size_t QR_VERSION_BITS = 3;
constexpr size_t QR_VENDOR_ID_BITS = 16;
constexpr size_t QR_PRODUCT_ID_BITS = 16;
constexpr size_t QR_FLOW_BITS = 2;
constexpr size_t QR_CAPABILITIES_BITS = 8;
constexpr size_t QR_DISCRIMINATOR_BITS = 12;
constexpr size_t QR_PASSCODE_BITS = 27;
constexpr size_t QR_PADDING_BITS = 4;

constexpr uint8_t MANUAL_CODE_VERSION = 0;

/* ========================================================================= */
/* Manual pairing code digit groups                                          */
/* ========================================================================= */

/*
 * Digit layout (decimal, data digits only):
 *
 * [D1]       (VID_PID_PRESENT << 2) | (DISCRIMINATOR >> 10)
 * [D2..D6]   ((DISCRIMINATOR & 0x300) << 6) | (PASSCODE & 0x3FFF)
 * [D7..D10]  PASSCODE >> 14
 * [D11..D15] VENDOR_ID   (21-digit form only)
 * [D16..D20] PRODUCT_ID  (21-digit form only)
 *
 * Version and flow have no digits: the version is always 0, the 11-digit
 * form implies a standard flow and the 21-digit form a custom flow.
 */

uint32_t parse_digits(const std::string& digits, size_t pos, size_t count)
{
  uint32_t value = 0;
  for (size_t i = pos; i < pos + count; ++i)
  {
    value = value * 10 + static_cast<uint32_t>(digits[i] - '0');
  }
  return value;
}

std::string format_manual_code(const std::string& code)
{
  if (code.size() == MANUAL_CODE_SHORT_LENGTH)
  {
    return code.substr(0, 4) + "-" + code.substr(4, 3) + "-" + code.substr(7);
  }

  return code.substr(0, 4) + "-" + code.substr(4, 3) + "-" + code.substr(7, 4) + "-" +
         code.substr(11, 4) + "-" + code.substr(15, 3) + "-" + code.substr(18, 2) + "-" +
         code.substr(20);
}

}  // namespace

/* ========================================================================= */
/* Common helpers                                                            */
/* ========================================================================= */

const char* flow_name(CommissioningFlow flow)
{
  switch (flow)
  {
    case CommissioningFlow::STANDARD:
      return "standard";
    case CommissioningFlow::USER_ACTION:
      return "user-action";
    case CommissioningFlow::CUSTOM:
      return "custom";
    default:
      return "unknown";
  }
}

bool discriminator_matches(uint16_t a, uint16_t b)
{
  a &= DISCRIMINATOR_MAX;
  b &= DISCRIMINATOR_MAX;

  if (is_upper_4_bits_only(a) || is_upper_4_bits_only(b))
  {
    return short_discriminator(a) == short_discriminator(b);
  }
  return a == b;
}

std::string format_passcode(uint32_t passcode)
{
  const auto b = to_bytes<uint32_t>(passcode, Endian::LITTLE);
  return fmt::format("{:02x}:{:02x}:{:02x}:{:02x}", b[0], b[1], b[2], b[3]);
}

/* ========================================================================= */
/* QR payload                                                                */
/* ========================================================================= */

void pack_qr_payload(const OnboardingPayload& payload, std::vector<uint8_t>& out)
{
  out.assign(QR_PAYLOAD_SIZE, 0x00);

  BitWriter writer(out);
  writer.put(payload.version & 0x07, QR_VERSION_BITS);
  writer.put(payload.vendor_id, QR_VENDOR_ID_BITS);
  writer.put(payload.product_id, QR_PRODUCT_ID_BITS);
  writer.put(static_cast<uint8_t>(payload.flow) & 0x03, QR_FLOW_BITS);
  writer.put(payload.discovery_capabilities, QR_CAPABILITIES_BITS);
  writer.put(payload.discriminator & DISCRIMINATOR_MAX, QR_DISCRIMINATOR_BITS);
  writer.put(payload.passcode & PASSCODE_MAX, QR_PASSCODE_BITS);
  writer.put(0, QR_PADDING_BITS);
}

ErrorCode unpack_qr_payload(const uint8_t* data, size_t len, OnboardingPayload& out)
{
  if (data == nullptr || len != QR_PAYLOAD_SIZE)
  {
    return ErrorCode::INVALID_LENGTH;
  }

  BitReader reader(data);
  OnboardingPayload payload;
  payload.version = static_cast<uint8_t>(reader.get(QR_VERSION_BITS));
  payload.vendor_id = static_cast<uint16_t>(reader.get(QR_VENDOR_ID_BITS));
  payload.product_id = static_cast<uint16_t>(reader.get(QR_PRODUCT_ID_BITS));
  payload.flow = static_cast<CommissioningFlow>(reader.get(QR_FLOW_BITS));
  payload.discovery_capabilities = static_cast<uint8_t>(reader.get(QR_CAPABILITIES_BITS));
  payload.discriminator = static_cast<uint16_t>(reader.get(QR_DISCRIMINATOR_BITS));
  payload.passcode = static_cast<uint32_t>(reader.get(QR_PASSCODE_BITS));

  if (payload.passcode < PASSCODE_MIN || payload.passcode > PASSCODE_MAX)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  out = payload;
  return ErrorCode::OK;
}

ErrorCode encode_qr_payload(const OnboardingPayload& payload, std::string& out)
{
  if (payload.version > 0x07 || static_cast<uint8_t>(payload.flow) > 0x03 ||
      payload.discriminator > DISCRIMINATOR_MAX || payload.passcode < PASSCODE_MIN ||
      payload.passcode > PASSCODE_MAX)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  std::vector<uint8_t> packed;
  pack_qr_payload(payload, packed);

  out = QR_PAYLOAD_PREFIX;
  out += encode_base38(packed.data(), packed.size());
  return ErrorCode::OK;
}

ErrorCode decode_qr_payload(const std::string& text, OnboardingPayload& out)
{
  const size_t prefix_len = std::strlen(QR_PAYLOAD_PREFIX);
  if (text.compare(0, prefix_len, QR_PAYLOAD_PREFIX) != 0)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  std::vector<uint8_t> packed;
  const ErrorCode err = decode_base38(text.substr(prefix_len), packed);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return unpack_qr_payload(packed.data(), packed.size(), out);
}

/* ========================================================================= */
/* Manual pairing code                                                       */
/* ========================================================================= */

ErrorCode encode_manual_pairing_code(const OnboardingPayload& payload, std::string& out,
                                     bool formatted)
{
  if (payload.version != MANUAL_CODE_VERSION || payload.discriminator > DISCRIMINATOR_MAX ||
      payload.passcode > PASSCODE_MAX)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  const bool vid_pid_present = payload.vendor_id != 0 || payload.product_id != 0;
  const CommissioningFlow implied_flow =
      vid_pid_present ? CommissioningFlow::CUSTOM : CommissioningFlow::STANDARD;
  if (payload.flow != implied_flow)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  const uint32_t d1 =
      (static_cast<uint32_t>(vid_pid_present) << 2) | ((payload.discriminator >> 10) & 0x03);
  const uint32_t d2_6 = (static_cast<uint32_t>(payload.discriminator & 0x300) << 6) |
                        (payload.passcode & 0x3FFF);
  const uint32_t d7_10 = (payload.passcode >> 14) & 0x3FFF;

  std::string data;
  if (vid_pid_present)
  {
    data = fmt::format("{:01d}{:05d}{:04d}{:05d}{:05d}", d1, d2_6, d7_10, payload.vendor_id,
                       payload.product_id);
  }
  else
  {
    data = fmt::format("{:01d}{:05d}{:04d}", d1, d2_6, d7_10);
  }

  data.push_back(internal::generate_verhoeff_check(data));
  out = formatted ? format_manual_code(data) : data;
  return ErrorCode::OK;
}

ErrorCode decode_manual_pairing_code(const std::string& text, OnboardingPayload& out)
{
  std::string code;
  code.reserve(text.size());
  for (const char c : text)
  {
    if (c >= '0' && c <= '9')
    {
      code.push_back(c);
    }
  }

  if (code.size() != MANUAL_CODE_SHORT_LENGTH && code.size() != MANUAL_CODE_LONG_LENGTH)
  {
    return ErrorCode::INVALID_LENGTH;
  }

  if (!internal::validate_verhoeff_check(code))
  {
    return ErrorCode::CHECKSUM_MISMATCH;
  }

  const uint32_t d1 = parse_digits(code, 0, 1);
  const uint32_t d2_6 = parse_digits(code, 1, 5);
  const uint32_t d7_10 = parse_digits(code, 6, 4);

  // Leading digits 8 and 9 are reserved; D2..D6 must fit 16 bits
  if (d1 > 7 || d2_6 > 0xFFFF)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  const bool is_long = code.size() == MANUAL_CODE_LONG_LENGTH;
  const bool vid_pid_present = ((d1 >> 2) & 0x01) != 0;
  if (vid_pid_present != is_long)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  OnboardingPayload payload;
  payload.discriminator =
      static_cast<uint16_t>(((d1 & 0x03) << 10) | (((d2_6 >> 14) & 0x03) << 8));
  payload.passcode = (d2_6 & 0x3FFF) | (d7_10 << 14);

  if (payload.passcode < PASSCODE_MIN || payload.passcode > PASSCODE_MAX)
  {
    return ErrorCode::INVALID_PAYLOAD;
  }

  if (is_long)
  {
    const uint32_t vendor_id = parse_digits(code, 10, 5);
    const uint32_t product_id = parse_digits(code, 15, 5);

    if (vendor_id > 0xFFFF || product_id > 0xFFFF)
    {
      return ErrorCode::INVALID_PAYLOAD;
    }

    payload.vendor_id = static_cast<uint16_t>(vendor_id);
    payload.product_id = static_cast<uint16_t>(product_id);
    payload.flow = CommissioningFlow::CUSTOM;
  }

  out = payload;
  return ErrorCode::OK;
}

ErrorCode parse_onboarding_payload(const std::string& text, OnboardingPayload& out)
{
  const size_t prefix_len = std::strlen(QR_PAYLOAD_PREFIX);
  const ErrorCode err = (text.compare(0, prefix_len, QR_PAYLOAD_PREFIX) == 0)
                            ? decode_qr_payload(text, out)
                            : decode_manual_pairing_code(text, out);

  if (err != ErrorCode::OK)
  {
    LOG_DEBUG(LogRegion::CODEC, "onboarding payload rejected: {}", error_message(err));
  }
  return err;
}

}  // namespace link
}  // namespace matter
