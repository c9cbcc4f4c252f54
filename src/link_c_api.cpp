/**
 * @file link_c_api.cpp
 * @brief matterlink C API implementation
 *
 * C wrapper for the C++ codecs and Link class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstring>
#include <new>
#include <string>

#include "matterlink/link.hpp"
#include "matterlink/matterlink.h"
#include "matterlink/onboarding.hpp"

using namespace matter::link;

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

namespace
{

/**
 * @brief Transport backed by the C callbacks
 */
class CallbackTransport : public Transport
{
 public:
  CallbackTransport(matterlink_transmit_fn transmit, matterlink_receive_fn receive, void* user)
      : transmit_(transmit), receive_(receive), user_(user)
  {
  }

  ErrorCode transmit(const uint8_t* data, size_t len) override
  {
    return static_cast<ErrorCode>(transmit_(user_, data, len));
  }

  ErrorCode receive(std::vector<uint8_t>& out) override
  {
    out.resize(MATTERLINK_MAX_MESSAGE_SIZE);
    size_t len = 0;
    const ErrorCode err = static_cast<ErrorCode>(receive_(user_, out.data(), out.size(), &len));
    if (err != ErrorCode::OK)
    {
      out.clear();
      return err;
    }
    if (len > out.size())
    {
      out.clear();
      return ErrorCode::INVALID_LENGTH;
    }
    out.resize(len);
    return ErrorCode::OK;
  }

 private:
  matterlink_transmit_fn transmit_;
  matterlink_receive_fn receive_;
  void* user_;
};

matterlink_error_t to_c(ErrorCode code)
{
  return static_cast<matterlink_error_t>(code);
}

OnboardingPayload from_c(const matterlink_payload_t& in)
{
  OnboardingPayload out;
  out.version = in.version;
  out.vendor_id = in.vendor_id;
  out.product_id = in.product_id;
  out.flow = static_cast<CommissioningFlow>(in.flow);
  out.discovery_capabilities = in.discovery_capabilities;
  out.discriminator = in.discriminator;
  out.passcode = in.passcode;
  return out;
}

matterlink_payload_t to_c(const OnboardingPayload& in)
{
  matterlink_payload_t out;
  out.version = in.version;
  out.vendor_id = in.vendor_id;
  out.product_id = in.product_id;
  out.flow = static_cast<uint8_t>(in.flow);
  out.discovery_capabilities = in.discovery_capabilities;
  out.discriminator = in.discriminator;
  out.passcode = in.passcode;
  return out;
}

matterlink_error_t copy_string(const std::string& text, char* buf, size_t buf_size)
{
  if (buf == nullptr || text.size() + 1 > buf_size)
  {
    return MATTERLINK_ERR_INVALID_LENGTH;
  }
  std::memcpy(buf, text.c_str(), text.size() + 1);
  return MATTERLINK_ERR_OK;
}

}  // namespace

struct MatterLink
{
  CallbackTransport transport;
  Link* cpp_link;

  MatterLink(matterlink_transmit_fn transmit, matterlink_receive_fn receive, void* user,
             bool auto_ack)
      : transport(transmit, receive, user), cpp_link(nullptr)
  {
    LinkConfig config;
    config.auto_ack = auto_ack;
    cpp_link = new (std::nothrow) Link(transport, config);
  }

  ~MatterLink()
  {
    delete cpp_link;
  }
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* matterlink_strerror(matterlink_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg)   \
  case MATTERLINK_ERR_##name: \
    return msg;
#include "matterlink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Onboarding payload                                                        */
/* ========================================================================= */

matterlink_error_t matterlink_payload_parse(const char* text, matterlink_payload_t* out)
{
  if (text == nullptr || out == nullptr)
  {
    return MATTERLINK_ERR_INVALID_PAYLOAD;
  }

  OnboardingPayload payload;
  const ErrorCode err = parse_onboarding_payload(text, payload);
  if (err != ErrorCode::OK)
  {
    return to_c(err);
  }

  *out = to_c(payload);
  return MATTERLINK_ERR_OK;
}

matterlink_error_t matterlink_qr_encode(const matterlink_payload_t* payload, char* buf,
                                        size_t buf_size)
{
  if (payload == nullptr)
  {
    return MATTERLINK_ERR_INVALID_PAYLOAD;
  }

  std::string text;
  const ErrorCode err = encode_qr_payload(from_c(*payload), text);
  if (err != ErrorCode::OK)
  {
    return to_c(err);
  }
  return copy_string(text, buf, buf_size);
}

matterlink_error_t matterlink_manual_code_encode(const matterlink_payload_t* payload,
                                                 int formatted, char* buf, size_t buf_size)
{
  if (payload == nullptr)
  {
    return MATTERLINK_ERR_INVALID_PAYLOAD;
  }

  std::string text;
  const ErrorCode err = encode_manual_pairing_code(from_c(*payload), text, formatted != 0);
  if (err != ErrorCode::OK)
  {
    return to_c(err);
  }
  return copy_string(text, buf, buf_size);
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

MatterLink* matterlink_create(matterlink_transmit_fn transmit, matterlink_receive_fn receive,
                              void* user, int auto_ack)
{
  if (transmit == nullptr || receive == nullptr)
  {
    return nullptr;
  }

  MatterLink* link = new (std::nothrow) MatterLink(transmit, receive, user, auto_ack != 0);
  if (link == nullptr || link->cpp_link == nullptr)
  {
    delete link;
    return nullptr;
  }

  return link;
}

void matterlink_destroy(MatterLink* link)
{
  delete link;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

matterlink_error_t matterlink_handshake(MatterLink* link)
{
  if (link == nullptr || link->cpp_link == nullptr)
  {
    return MATTERLINK_ERR_NOT_CONNECTED;
  }

  HandshakeResponse response;
  return to_c(link->cpp_link->handshake(response));
}

matterlink_error_t matterlink_send(MatterLink* link, matterlink_message_info_t* info,
                                   const uint8_t* payload, size_t payload_len)
{
  if (link == nullptr || link->cpp_link == nullptr)
  {
    return MATTERLINK_ERR_NOT_CONNECTED;
  }
  if (info == nullptr || (payload == nullptr && payload_len != 0))
  {
    return MATTERLINK_ERR_INVALID_LENGTH;
  }

  Message msg;
  msg.frame.session_id = info->session_id;
  msg.frame.message_counter = link->cpp_link->next_message_counter();
  msg.exchange.exchange_flags = info->exchange_flags;
  msg.exchange.opcode = info->opcode;
  msg.exchange.exchange_id = info->exchange_id;
  msg.exchange.protocol_id = info->protocol_id;
  if (payload_len != 0)
  {
    msg.payload.assign(payload, payload + payload_len);
  }

  info->message_counter = msg.frame.message_counter;
  return to_c(link->cpp_link->transmit(msg));
}

matterlink_error_t matterlink_receive(MatterLink* link, matterlink_message_info_t* info,
                                      uint8_t* payload, size_t cap, size_t* payload_len)
{
  if (link == nullptr || link->cpp_link == nullptr)
  {
    return MATTERLINK_ERR_NOT_CONNECTED;
  }
  if (info == nullptr || payload_len == nullptr)
  {
    return MATTERLINK_ERR_INVALID_LENGTH;
  }

  Message msg;
  const ErrorCode err = link->cpp_link->receive(msg);
  if (err != ErrorCode::OK)
  {
    return to_c(err);
  }

  info->message_counter = msg.frame.message_counter;
  info->session_id = msg.frame.session_id;
  info->exchange_id = msg.exchange.exchange_id;
  info->protocol_id = msg.exchange.protocol_id;
  info->opcode = msg.exchange.opcode;
  info->exchange_flags = msg.exchange.exchange_flags;

  *payload_len = msg.payload.size();
  if (msg.payload.size() > cap || (payload == nullptr && !msg.payload.empty()))
  {
    return MATTERLINK_ERR_INVALID_LENGTH;
  }
  if (!msg.payload.empty())
  {
    std::memcpy(payload, msg.payload.data(), msg.payload.size());
  }
  return MATTERLINK_ERR_OK;
}

void matterlink_set_auto_ack(MatterLink* link, int enabled)
{
  if (link && link->cpp_link)
  {
    link->cpp_link->set_auto_ack(enabled != 0);
  }
}

uint32_t matterlink_next_message_counter(MatterLink* link)
{
  if (link && link->cpp_link)
  {
    return link->cpp_link->next_message_counter();
  }
  return 0;
}
