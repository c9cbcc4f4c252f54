/**
 * @file mrp.hpp
 * @brief Message Reliability Protocol acknowledgement helpers
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "matterlink/message.hpp"

namespace matter
{
namespace link
{

/**
 * @brief Check whether the sender requested an acknowledgement
 *
 * @return true if the exchange header carries EXCHANGE_FLAG_RELIABILITY
 */
bool is_ack_requested(const Message& msg);

/**
 * @brief Build a standalone acknowledgement for a received message
 *
 * The ACK keeps the session id and security flags of @p received, uses
 * @p outbound_counter as its message counter and routes back to the
 * sender's source node id when one was present. Its exchange header has
 * only EXCHANGE_FLAG_ACK set, opcode 0, the received exchange/protocol ids
 * and ack_counter = received message counter. The payload is empty.
 *
 * @param received         Message being acknowledged
 * @param outbound_counter Message counter for the ACK itself
 * @return Standalone ACK message
 */
Message build_standalone_ack(const Message& received, uint32_t outbound_counter);

/**
 * @brief Monotonic outbound message counter
 *
 * Starts at 0 and wraps on overflow. Safe for concurrent use.
 */
class MessageCounter
{
 public:
  MessageCounter() : counter_(0) {}

  explicit MessageCounter(uint32_t initial) : counter_(initial) {}

  MessageCounter(const MessageCounter&) = delete;
  MessageCounter& operator=(const MessageCounter&) = delete;

  /**
   * @brief Return the current value, then increment
   */
  uint32_t next()
  {
    return counter_.fetch_add(1);
  }

  /**
   * @brief Peek at the value next() would return
   */
  uint32_t current() const
  {
    return counter_.load();
  }

 private:
  std::atomic<uint32_t> counter_;  ///< Next counter value
};

}  // namespace link
}  // namespace matter
