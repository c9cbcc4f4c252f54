/**
 * @file matterlink.h
 * @brief matterlink C API
 *
 * C-compatible interface for onboarding payload parsing and the message
 * link.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Constants                                                                 */
  /* ========================================================================= */

  /** @brief Maximum buffer accepted from the receive callback */
#define MATTERLINK_MAX_MESSAGE_SIZE 1280

  /** @brief Buffer size that fits any encoded QR payload string */
#define MATTERLINK_QR_STRING_SIZE 32

  /** @brief Buffer size that fits any formatted manual pairing code */
#define MATTERLINK_MANUAL_CODE_STRING_SIZE 32

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) MATTERLINK_ERR_##name = val,
#include "matterlink/errors.def"
#undef ERR
  } matterlink_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* matterlink_strerror(matterlink_error_t err);

  /* ========================================================================= */
  /* Onboarding payload                                                        */
  /* ========================================================================= */

  typedef enum
  {
    MATTERLINK_FLOW_STANDARD = 0,
    MATTERLINK_FLOW_USER_ACTION = 1,
    MATTERLINK_FLOW_CUSTOM = 2,
  } matterlink_flow_t;

  /**
   * @brief Onboarding payload fields
   */
  typedef struct
  {
    uint8_t version;
    uint16_t vendor_id;
    uint16_t product_id;
    uint8_t flow; /**< matterlink_flow_t */
    uint8_t discovery_capabilities;
    uint16_t discriminator;
    uint32_t passcode;
  } matterlink_payload_t;

  /**
   * @brief Parse an "MT:" QR string or a manual pairing code
   *
   * @param text NUL-terminated input
   * @param out  Decoded fields
   * @return MATTERLINK_ERR_OK or the decode error
   */
  matterlink_error_t matterlink_payload_parse(const char* text, matterlink_payload_t* out);

  /**
   * @brief Encode a QR payload string
   *
   * @param payload  Payload fields
   * @param buf      Output buffer (NUL-terminated on success)
   * @param buf_size Output buffer size
   * @return MATTERLINK_ERR_OK, MATTERLINK_ERR_INVALID_PAYLOAD or
   *         MATTERLINK_ERR_INVALID_LENGTH if @p buf is too small
   */
  matterlink_error_t matterlink_qr_encode(const matterlink_payload_t* payload, char* buf,
                                          size_t buf_size);

  /**
   * @brief Encode a manual pairing code
   *
   * @param payload   Payload fields
   * @param formatted Non-zero to insert display hyphens
   * @param buf       Output buffer (NUL-terminated on success)
   * @param buf_size  Output buffer size
   * @return MATTERLINK_ERR_OK, MATTERLINK_ERR_INVALID_PAYLOAD or
   *         MATTERLINK_ERR_INVALID_LENGTH if @p buf is too small
   */
  matterlink_error_t matterlink_manual_code_encode(const matterlink_payload_t* payload,
                                                   int formatted, char* buf, size_t buf_size);

  /* ========================================================================= */
  /* Link handle                                                               */
  /* ========================================================================= */

  /** @brief Opaque handle to Link instance */
  typedef struct MatterLink MatterLink;

  /**
   * @brief Transport send callback
   *
   * @param user User-defined context pointer
   * @param data Data buffer to send
   * @param len  Number of bytes to send
   * @return MATTERLINK_ERR_OK or a transport error
   */
  typedef matterlink_error_t (*matterlink_transmit_fn)(void* user, const uint8_t* data,
                                                       size_t len);

  /**
   * @brief Transport receive callback
   *
   * @param user User-defined context pointer
   * @param buf  Buffer to fill
   * @param cap  Buffer capacity (MATTERLINK_MAX_MESSAGE_SIZE)
   * @param len  Number of bytes written
   * @return MATTERLINK_ERR_OK or a transport error
   */
  typedef matterlink_error_t (*matterlink_receive_fn)(void* user, uint8_t* buf, size_t cap,
                                                      size_t* len);

  /**
   * @brief Header fields exchanged with matterlink_send() / matterlink_receive()
   */
  typedef struct
  {
    uint32_t message_counter;
    uint16_t session_id;
    uint16_t exchange_id;
    uint16_t protocol_id;
    uint8_t opcode;
    uint8_t exchange_flags;
  } matterlink_message_info_t;

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a new Link instance
   *
   * @param transmit Transport send callback
   * @param receive  Transport receive callback
   * @param user     User context pointer (passed to both callbacks)
   * @param auto_ack Non-zero to acknowledge reliable messages automatically
   * @return Pointer to Link instance, or NULL on invalid arguments or
   *         allocation failure
   */
  MatterLink* matterlink_create(matterlink_transmit_fn transmit, matterlink_receive_fn receive,
                                void* user, int auto_ack);

  /**
   * @brief Destroy Link instance and free resources
   * @param link Link instance (NULL-safe)
   */
  void matterlink_destroy(MatterLink* link);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Perform the BTP handshake
   */
  matterlink_error_t matterlink_handshake(MatterLink* link);

  /**
   * @brief Send a message
   *
   * The message counter is taken from the link and written back to
   * @p info->message_counter.
   *
   * @param link        Link instance
   * @param info        Header fields
   * @param payload     Application payload (can be NULL if payload_len == 0)
   * @param payload_len Payload length in bytes
   */
  matterlink_error_t matterlink_send(MatterLink* link, matterlink_message_info_t* info,
                                     const uint8_t* payload, size_t payload_len);

  /**
   * @brief Receive a message
   *
   * The message is consumed from the transport (and acknowledged when
   * auto-ACK is enabled) before its payload is copied. If the payload does
   * not fit it is discarded, only its length is reported, and it cannot be
   * received again. Size @p payload to MATTERLINK_MAX_MESSAGE_SIZE.
   *
   * @param link        Link instance
   * @param info        Decoded header fields
   * @param payload     Output buffer for the application payload
   * @param cap         Output buffer capacity
   * @param payload_len Payload length in bytes
   * @return MATTERLINK_ERR_OK, a receive/decode error, or
   *         MATTERLINK_ERR_INVALID_LENGTH if the payload does not fit
   */
  matterlink_error_t matterlink_receive(MatterLink* link, matterlink_message_info_t* info,
                                        uint8_t* payload, size_t cap, size_t* payload_len);

  void matterlink_set_auto_ack(MatterLink* link, int enabled);

  /**
   * @brief Reserve the next outbound message counter
   */
  uint32_t matterlink_next_message_counter(MatterLink* link);

#ifdef __cplusplus
} /* extern "C" */
#endif
