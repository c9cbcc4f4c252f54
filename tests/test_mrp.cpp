/**
 * @file test_mrp.cpp
 * @brief MRP acknowledgement and message counter tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <random>
#include <set>
#include <thread>
#include <vector>

#include "matterlink/mrp.hpp"

using namespace matter::link;

namespace
{

Message make_reliable_request()
{
  Message msg;
  msg.frame.flags = FLAG_SOURCE_NODE_ID_PRESENT;
  msg.frame.session_id = 0x0102;
  msg.frame.security_flags = 0x00;
  msg.frame.message_counter = 1000;
  msg.frame.source_node_id = 0x1122334455667788ULL;

  msg.exchange.exchange_flags = EXCHANGE_FLAG_INITIATOR | EXCHANGE_FLAG_RELIABILITY;
  msg.exchange.opcode = static_cast<uint8_t>(SecureChannelOpcode::PBKDF_PARAM_RESPONSE);
  msg.exchange.exchange_id = 0x7777;
  msg.exchange.protocol_id = static_cast<uint16_t>(ProtocolId::SECURE_CHANNEL);
  msg.payload = {0x15, 0x18};
  return msg;
}

}  // namespace

/* ========================================================================= */
/* Message counter                                                           */
/* ========================================================================= */

TEST_CASE("Message counter")
{
  SUBCASE("Post-increment from zero")
  {
    MessageCounter counter;
    CHECK(counter.next() == 0);
    CHECK(counter.next() == 1);
    CHECK(counter.next() == 2);
    CHECK(counter.current() == 3);
    CHECK(counter.current() == 3);
  }

  SUBCASE("Wraps on overflow")
  {
    MessageCounter counter(0xFFFFFFFF);
    CHECK(counter.next() == 0xFFFFFFFF);
    CHECK(counter.next() == 0);
  }

  SUBCASE("Concurrent increments are not lost")
  {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 10000;

    MessageCounter counter;
    std::vector<std::vector<uint32_t>> seen(THREADS);
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t)
    {
      workers.emplace_back(
          [&counter, &seen, t]()
          {
            seen[t].reserve(PER_THREAD);
            for (int i = 0; i < PER_THREAD; ++i)
            {
              seen[t].push_back(counter.next());
            }
          });
    }
    for (auto& worker : workers)
    {
      worker.join();
    }

    CHECK(counter.current() == THREADS * PER_THREAD);

    std::set<uint32_t> unique;
    for (const auto& values : seen)
    {
      unique.insert(values.begin(), values.end());
    }
    CHECK(unique.size() == static_cast<size_t>(THREADS * PER_THREAD));
  }
}

/* ========================================================================= */
/* Standalone ACK                                                            */
/* ========================================================================= */

TEST_CASE("ACK requested")
{
  Message msg = make_reliable_request();
  CHECK(is_ack_requested(msg));

  msg.exchange.exchange_flags = EXCHANGE_FLAG_INITIATOR;
  CHECK_FALSE(is_ack_requested(msg));
}

TEST_CASE("Standalone ACK construction")
{
  const Message received = make_reliable_request();
  const Message ack = build_standalone_ack(received, 55);

  SUBCASE("Frame header")
  {
    CHECK(ack.frame.session_id == received.frame.session_id);
    CHECK(ack.frame.security_flags == received.frame.security_flags);
    CHECK(ack.frame.message_counter == 55);
    CHECK(ack.frame.has_dest_node_id());
    CHECK(ack.frame.dest_node_id == received.frame.source_node_id);
    CHECK_FALSE(ack.frame.has_source_node_id());
  }

  SUBCASE("Exchange header")
  {
    CHECK(ack.exchange.exchange_flags == EXCHANGE_FLAG_ACK);
    CHECK(ack.exchange.is_ack());
    CHECK_FALSE(ack.exchange.is_reliability_requested());
    CHECK(ack.exchange.opcode == 0);
    CHECK(ack.exchange.exchange_id == received.exchange.exchange_id);
    CHECK(ack.exchange.protocol_id == received.exchange.protocol_id);
    CHECK(ack.exchange.ack_counter == received.frame.message_counter);
    CHECK(ack.payload.empty());
  }

  SUBCASE("Without source node id")
  {
    Message anonymous = make_reliable_request();
    anonymous.frame.flags = 0;

    const Message reply = build_standalone_ack(anonymous, 1);
    CHECK_FALSE(reply.frame.has_dest_node_id());
    CHECK_FALSE(reply.frame.has_source_node_id());
  }

  SUBCASE("Encodes and decodes back")
  {
    std::vector<uint8_t> buf;
    REQUIRE(encode_message(ack, buf) == ErrorCode::OK);

    Message decoded;
    REQUIRE(decode_message(buf.data(), buf.size(), decoded) == ErrorCode::OK);
    CHECK(decoded == ack);
  }
}

TEST_CASE("Standalone ACK properties")
{
  std::mt19937 rng(99);
  for (int i = 0; i < 500; ++i)
  {
    Message msg;
    msg.frame.flags = static_cast<uint8_t>(rng() & 0x6F);
    msg.frame.session_id = static_cast<uint16_t>(rng());
    msg.frame.security_flags = static_cast<uint8_t>(rng());
    msg.frame.message_counter = static_cast<uint32_t>(rng());
    msg.frame.source_node_id = (static_cast<uint64_t>(rng()) << 32) | rng();
    msg.exchange.exchange_flags = static_cast<uint8_t>(rng() & 0x1F);
    msg.exchange.exchange_id = static_cast<uint16_t>(rng());
    msg.exchange.protocol_id = static_cast<uint16_t>(rng());

    const uint32_t counter = static_cast<uint32_t>(rng());
    const Message ack = build_standalone_ack(msg, counter);

    CHECK_FALSE(is_ack_requested(ack));
    CHECK(ack.exchange.ack_counter == msg.frame.message_counter);
    CHECK(ack.frame.message_counter == counter);
    if (msg.frame.has_source_node_id())
    {
      CHECK(ack.frame.dest_node_id == msg.frame.source_node_id);
    }
  }
}
