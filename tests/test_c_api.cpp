/**
 * @file test_c_api.cpp
 * @brief C API tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <deque>
#include <string>
#include <vector>

#include "matterlink/matterlink.h"
#include "matterlink/message.hpp"

namespace
{

struct Wire
{
  std::deque<std::vector<uint8_t>> inbound;
  std::vector<std::vector<uint8_t>> sent;
};

matterlink_error_t wire_transmit(void* user, const uint8_t* data, size_t len)
{
  static_cast<Wire*>(user)->sent.emplace_back(data, data + len);
  return MATTERLINK_ERR_OK;
}

matterlink_error_t wire_receive(void* user, uint8_t* buf, size_t cap, size_t* len)
{
  Wire* wire = static_cast<Wire*>(user);
  if (wire->inbound.empty())
  {
    return MATTERLINK_ERR_TIMEOUT;
  }
  const std::vector<uint8_t> next = wire->inbound.front();
  wire->inbound.pop_front();
  if (next.size() > cap)
  {
    return MATTERLINK_ERR_INVALID_LENGTH;
  }
  std::memcpy(buf, next.data(), next.size());
  *len = next.size();
  return MATTERLINK_ERR_OK;
}

}  // namespace

/* ========================================================================= */
/* Error strings                                                             */
/* ========================================================================= */

TEST_CASE("C API error strings")
{
  CHECK(std::string(matterlink_strerror(MATTERLINK_ERR_OK)) == "ok");
  CHECK(std::string(matterlink_strerror(MATTERLINK_ERR_CHECKSUM_MISMATCH)) ==
        "verhoeff checksum mismatch");
  CHECK(std::string(matterlink_strerror(static_cast<matterlink_error_t>(0xEE))) ==
        "unknown error");

  CHECK(std::string(matter::link::error_message(matter::link::ErrorCode::MESSAGE_TOO_SHORT)) ==
        matterlink_strerror(MATTERLINK_ERR_MESSAGE_TOO_SHORT));
  CHECK(static_cast<int>(matter::link::ErrorCode::INVALID_HANDSHAKE) ==
        MATTERLINK_ERR_INVALID_HANDSHAKE);
}

/* ========================================================================= */
/* Onboarding payload                                                        */
/* ========================================================================= */

TEST_CASE("C API payload functions")
{
  SUBCASE("Parse QR string")
  {
    matterlink_payload_t payload;
    REQUIRE(matterlink_payload_parse("MT:Y.ET08O614CCY06A810", &payload) == MATTERLINK_ERR_OK);
    CHECK(payload.vendor_id == 5010);
    CHECK(payload.product_id == 259);
    CHECK(payload.passcode == 57630675);

    char buf[MATTERLINK_QR_STRING_SIZE];
    REQUIRE(matterlink_qr_encode(&payload, buf, sizeof(buf)) == MATTERLINK_ERR_OK);
    CHECK(std::string(buf) == "MT:Y.ET08O614CCY06A810");
  }

  SUBCASE("Parse manual code")
  {
    matterlink_payload_t payload;
    REQUIRE(matterlink_payload_parse("3035-750-7966", &payload) == MATTERLINK_ERR_OK);
    CHECK(payload.passcode == 13045239);
    CHECK(payload.discriminator == 0x0C00);

    char buf[MATTERLINK_MANUAL_CODE_STRING_SIZE];
    REQUIRE(matterlink_manual_code_encode(&payload, 1, buf, sizeof(buf)) == MATTERLINK_ERR_OK);
    CHECK(std::string(buf) == "3035-750-7966");
    REQUIRE(matterlink_manual_code_encode(&payload, 0, buf, sizeof(buf)) == MATTERLINK_ERR_OK);
    CHECK(std::string(buf) == "30357507966");
  }

  SUBCASE("Errors")
  {
    matterlink_payload_t payload;
    CHECK(matterlink_payload_parse("3035-750-7967", &payload) == MATTERLINK_ERR_CHECKSUM_MISMATCH);
    CHECK(matterlink_payload_parse(nullptr, &payload) == MATTERLINK_ERR_INVALID_PAYLOAD);

    REQUIRE(matterlink_payload_parse("3035-750-7966", &payload) == MATTERLINK_ERR_OK);
    char small[4];
    CHECK(matterlink_manual_code_encode(&payload, 0, small, sizeof(small)) ==
          MATTERLINK_ERR_INVALID_LENGTH);

    payload.passcode = 0;
    char buf[MATTERLINK_QR_STRING_SIZE];
    CHECK(matterlink_qr_encode(&payload, buf, sizeof(buf)) == MATTERLINK_ERR_INVALID_PAYLOAD);
  }
}

/* ========================================================================= */
/* Link handle                                                               */
/* ========================================================================= */

TEST_CASE("C API link")
{
  Wire wire;

  SUBCASE("Create rejects missing callbacks")
  {
    CHECK(matterlink_create(nullptr, wire_receive, &wire, 1) == nullptr);
    CHECK(matterlink_create(wire_transmit, nullptr, &wire, 1) == nullptr);
    matterlink_destroy(nullptr);
  }

  SUBCASE("Send and receive")
  {
    MatterLink* link = matterlink_create(wire_transmit, wire_receive, &wire, 1);
    REQUIRE(link != nullptr);

    matterlink_message_info_t info = {};
    info.exchange_flags = 0x05;
    info.opcode = 0x20;
    info.exchange_id = 0x1234;
    const uint8_t payload[] = {0x01, 0x02, 0x03};
    REQUIRE(matterlink_send(link, &info, payload, sizeof(payload)) == MATTERLINK_ERR_OK);
    CHECK(info.message_counter == 0);
    REQUIRE(wire.sent.size() == 1);
    CHECK(wire.sent[0].size() == 8 + 6 + 3);

    // Loop the reliable message back: it is acknowledged automatically
    wire.inbound.push_back(wire.sent[0]);
    matterlink_message_info_t rx = {};
    uint8_t buf[16];
    size_t len = 0;
    REQUIRE(matterlink_receive(link, &rx, buf, sizeof(buf), &len) == MATTERLINK_ERR_OK);
    CHECK(len == 3);
    CHECK(buf[2] == 0x03);
    CHECK(rx.exchange_id == 0x1234);
    CHECK(rx.opcode == 0x20);
    CHECK(wire.sent.size() == 2);

    CHECK(matterlink_next_message_counter(link) == 2);
    matterlink_destroy(link);
  }

  SUBCASE("Auto-ACK disabled and small buffer")
  {
    MatterLink* link = matterlink_create(wire_transmit, wire_receive, &wire, 0);
    REQUIRE(link != nullptr);

    matter::link::Message msg;
    msg.exchange.exchange_flags = 0x04;
    msg.payload = {1, 2, 3, 4};
    std::vector<uint8_t> bytes;
    REQUIRE(matter::link::encode_message(msg, bytes) == matter::link::ErrorCode::OK);
    wire.inbound.push_back(bytes);

    matterlink_message_info_t rx = {};
    uint8_t buf[2];
    size_t len = 0;
    CHECK(matterlink_receive(link, &rx, buf, sizeof(buf), &len) == MATTERLINK_ERR_INVALID_LENGTH);
    CHECK(len == 4);
    CHECK(wire.sent.empty());

    // The oversized message is gone
    CHECK(matterlink_receive(link, &rx, buf, sizeof(buf), &len) == MATTERLINK_ERR_TIMEOUT);

    matterlink_set_auto_ack(link, 1);
    wire.inbound.push_back(bytes);
    CHECK(matterlink_receive(link, &rx, buf, sizeof(buf), &len) == MATTERLINK_ERR_INVALID_LENGTH);
    CHECK(wire.sent.size() == 1);
    CHECK(matterlink_receive(link, &rx, buf, sizeof(buf), &len) == MATTERLINK_ERR_TIMEOUT);
    matterlink_destroy(link);
  }

  SUBCASE("Handshake")
  {
    MatterLink* link = matterlink_create(wire_transmit, wire_receive, &wire, 1);
    REQUIRE(link != nullptr);

    CHECK(matterlink_handshake(link) == MATTERLINK_ERR_TIMEOUT);

    wire.inbound.push_back({0x65, 0x6C, 0x04, 0x00, 0x00, 0x00});
    CHECK(matterlink_handshake(link) == MATTERLINK_ERR_OK);
    CHECK(wire.sent.back()[8] == 0xF4);

    matterlink_destroy(link);
  }
}
