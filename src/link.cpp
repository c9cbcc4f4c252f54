/**
 * @file link.cpp
 * @brief matterlink transport codec wrapper implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "matterlink/link.hpp"

#include <algorithm>
#include <utility>

#include "log.hpp"

namespace matter
{
namespace link
{

Link::Link(Transport& transport, LinkConfig config)
    : owned_(), transport_(&transport), config_(std::move(config)), auto_ack_(config_.auto_ack)
{
}

Link::Link(std::unique_ptr<Transport> transport, LinkConfig config)
    : owned_(std::move(transport)),
      transport_(owned_.get()),
      config_(std::move(config)),
      auto_ack_(config_.auto_ack)
{
}

ErrorCode Link::transmit(const Message& msg)
{
  if (transport_ == nullptr)
  {
    return ErrorCode::NOT_CONNECTED;
  }

  std::vector<uint8_t> encoded;
  const ErrorCode err = encode_message(msg, encoded);
  if (err != ErrorCode::OK)
  {
    LOG_WARN(LogRegion::TRANSPORT, "encode failed: {}", error_message(err));
    return err;
  }

  LOG_DEBUG(LogRegion::TRANSPORT, "tx counter={} opcode=0x{:02X} [{}]", msg.frame.message_counter,
            msg.exchange.opcode, internal::hex_dump(encoded.data(), encoded.size()));

  return transport_->transmit(encoded.data(), encoded.size());
}

ErrorCode Link::receive(Message& out)
{
  if (transport_ == nullptr)
  {
    return ErrorCode::NOT_CONNECTED;
  }

  std::vector<uint8_t> raw;
  ErrorCode err = transport_->receive(raw);
  if (err != ErrorCode::OK)
  {
    LOG_WARN(LogRegion::TRANSPORT, "receive failed: {}", error_message(err));
    return err;
  }

  Message msg;
  err = decode_message(raw.data(), raw.size(), msg);
  if (err != ErrorCode::OK)
  {
    LOG_WARN(LogRegion::TRANSPORT, "decode failed: {} [{}]", error_message(err),
             internal::hex_dump(raw.data(), raw.size()));
    return err;
  }

  if (!is_version_allowed(msg.frame.version()))
  {
    LOG_WARN(LogRegion::TRANSPORT, "rejected message version {}", msg.frame.version());
    return ErrorCode::UNSUPPORTED_VERSION;
  }

  LOG_DEBUG(LogRegion::TRANSPORT, "rx counter={} opcode=0x{:02X} [{}]", msg.frame.message_counter,
            msg.exchange.opcode, internal::hex_dump(raw.data(), raw.size()));

  if (auto_ack_ && is_ack_requested(msg))
  {
    send_ack(msg);
  }

  out = std::move(msg);
  return ErrorCode::OK;
}

ErrorCode Link::handshake(HandshakeResponse& out)
{
  if (transport_ == nullptr)
  {
    return ErrorCode::NOT_CONNECTED;
  }

  const HandshakeRequest request;
  LOG_DEBUG(LogRegion::BTP, "tx {}", to_string(request));

  ErrorCode err = transport_->transmit(request.bytes().data(), request.bytes().size());
  if (err != ErrorCode::OK)
  {
    LOG_WARN(LogRegion::BTP, "handshake request failed: {}", error_message(err));
    return err;
  }

  std::vector<uint8_t> raw;
  err = transport_->receive(raw);
  if (err != ErrorCode::OK)
  {
    LOG_WARN(LogRegion::BTP, "handshake response not received: {}", error_message(err));
    return err;
  }

  err = decode_handshake_response(raw.data(), raw.size(), out);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  LOG_DEBUG(LogRegion::BTP, "rx {}", to_string(out));
  return ErrorCode::OK;
}

bool Link::is_version_allowed(uint8_t version) const
{
  return std::find(config_.allowed_versions.begin(), config_.allowed_versions.end(), version) !=
         config_.allowed_versions.end();
}

void Link::send_ack(const Message& received)
{
  const Message ack = build_standalone_ack(received, counter_.next());

  std::vector<uint8_t> encoded;
  ErrorCode err = encode_message(ack, encoded);
  if (err == ErrorCode::OK)
  {
    err = transport_->transmit(encoded.data(), encoded.size());
  }

  if (err != ErrorCode::OK)
  {
    LOG_WARN(LogRegion::MRP, "failed to send ack for counter {}: {}",
             received.frame.message_counter, error_message(err));
    return;
  }

  LOG_DEBUG(LogRegion::MRP, "sent ack counter={} ack_counter={} exchange=0x{:04X}",
            ack.frame.message_counter, ack.exchange.ack_counter, ack.exchange.exchange_id);
}

}  // namespace link
}  // namespace matter
