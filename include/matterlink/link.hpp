/**
 * @file link.hpp
 * @brief matterlink transport codec wrapper
 *
 * Binds the message codec and MRP acknowledgement logic to a byte-level
 * transport supplied by the platform (BLE GATT, UDP socket, ...).
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "matterlink/btp.hpp"
#include "matterlink/message.hpp"
#include "matterlink/mrp.hpp"
#include "matterlink/protocol.hpp"

namespace matter
{
namespace link
{

/**
 * @brief Byte-level transport
 *
 * Implementations deliver whole datagrams: one transmit() call sends one
 * encoded message and one receive() call yields one inbound message.
 */
class Transport
{
 public:
  virtual ~Transport() = default;

  /**
   * @brief Send one buffer
   *
   * @return ErrorCode::OK or a transport-level error
   *         (ErrorCode::TRANSPORT_ERROR, ErrorCode::TIMEOUT,
   *         ErrorCode::NOT_CONNECTED)
   */
  virtual ErrorCode transmit(const uint8_t* data, size_t len) = 0;

  /**
   * @brief Receive one buffer
   *
   * @param out Received bytes (replaced)
   * @return ErrorCode::OK or a transport-level error
   */
  virtual ErrorCode receive(std::vector<uint8_t>& out) = 0;
};

/**
 * @brief Link settings
 */
struct LinkConfig
{
  /// Answer reliable messages with a standalone ACK from receive()
  bool auto_ack = true;

  /// Frame header versions accepted by receive()
  std::vector<uint8_t> allowed_versions = {0};
};

/**
 * @brief Matter message link over an abstract transport
 *
 * Example usage:
 * @code
 * UdpTransport udp(peer);
 * Link link(udp);
 *
 * Message request;
 * request.frame.message_counter = link.next_message_counter();
 * request.exchange.exchange_flags = EXCHANGE_FLAG_INITIATOR | EXCHANGE_FLAG_RELIABILITY;
 * link.transmit(request);
 *
 * Message response;
 * if (link.receive(response) == ErrorCode::OK) {
 *   // an ACK has already been sent if the peer asked for one
 * }
 * @endcode
 */
class Link
{
 public:
  /**
   * @brief Construct a link over a borrowed transport
   *
   * @param transport Transport that outlives the link
   * @param config    Link settings
   */
  explicit Link(Transport& transport, LinkConfig config = LinkConfig());

  /**
   * @brief Construct a link that owns its transport
   */
  explicit Link(std::unique_ptr<Transport> transport, LinkConfig config = LinkConfig());

  Link(const Link&) = delete;
  Link& operator=(const Link&) = delete;

  /**
   * @brief Encode and send a message
   *
   * @return ErrorCode::OK, an encode error, or the transport's error
   */
  ErrorCode transmit(const Message& msg);

  /**
   * @brief Receive and decode one message
   *
   * If auto-ACK is enabled and the message requests reliability, a
   * standalone ACK is sent before returning. A failure to send that ACK is
   * logged and does not change the result.
   *
   * @param out Decoded message
   * @return ErrorCode::OK, the transport's error, a decode error, or
   *         ErrorCode::UNSUPPORTED_VERSION
   */
  ErrorCode receive(Message& out);

  /**
   * @brief Perform the BTP handshake
   *
   * Sends the handshake request and decodes the next inbound buffer as the
   * response.
   *
   * @return ErrorCode::OK, the transport's error or
   *         ErrorCode::INVALID_HANDSHAKE
   */
  ErrorCode handshake(HandshakeResponse& out);

  /**
   * @brief Reserve the next outbound message counter
   */
  uint32_t next_message_counter()
  {
    return counter_.next();
  }

  void set_auto_ack(bool enabled)
  {
    auto_ack_ = enabled;
  }

  bool auto_ack() const
  {
    return auto_ack_;
  }

  const LinkConfig& config() const
  {
    return config_;
  }

  /**
   * @brief Get the bound transport
   *
   * @return nullptr if the link was built from an empty owning pointer
   */
  Transport* transport()
  {
    return transport_;
  }

 private:
  bool is_version_allowed(uint8_t version) const;

  /**
   * @brief Send a standalone ACK for @p received
   */
  void send_ack(const Message& received);

  std::unique_ptr<Transport> owned_;  ///< Set when the link owns its transport
  Transport* transport_;              ///< Active transport
  LinkConfig config_;                 ///< Link settings
  std::atomic<bool> auto_ack_;        ///< Auto-ACK switch
  MessageCounter counter_;            ///< Outbound message counter
};

}  // namespace link
}  // namespace matter
