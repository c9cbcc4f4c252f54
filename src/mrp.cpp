/**
 * @file mrp.cpp
 * @brief MRP acknowledgement implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "matterlink/mrp.hpp"

namespace matter
{
namespace link
{

bool is_ack_requested(const Message& msg)
{
  return msg.exchange.is_reliability_requested();
}

Message build_standalone_ack(const Message& received, uint32_t outbound_counter)
{
  Message ack;

  // Keep version and security context, node ids are re-derived below
  ack.frame.flags = received.frame.flags &
                    static_cast<uint8_t>(~(FLAG_SOURCE_NODE_ID_PRESENT | FLAG_DEST_NODE_ID_PRESENT));
  ack.frame.session_id = received.frame.session_id;
  ack.frame.security_flags = received.frame.security_flags;
  ack.frame.message_counter = outbound_counter;

  // Route back to the sender
  if (received.frame.has_source_node_id())
  {
    ack.frame.flags |= FLAG_DEST_NODE_ID_PRESENT;
    ack.frame.dest_node_id = received.frame.source_node_id;
  }

  ack.exchange.exchange_flags = EXCHANGE_FLAG_ACK;
  ack.exchange.opcode = STANDALONE_ACK_OPCODE;
  ack.exchange.exchange_id = received.exchange.exchange_id;
  ack.exchange.protocol_id = received.exchange.protocol_id;
  ack.exchange.ack_counter = received.frame.message_counter;

  return ack;
}

}  // namespace link
}  // namespace matter
