/**
 * @file commissioner.hpp
 * @brief Device discovery and transport session setup
 *
 * The commissioner drives the steps that precede PASE: find a
 * commissionable device matching an onboarding payload, open its
 * transport and, for BLE, run the BTP handshake.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "matterlink/link.hpp"
#include "matterlink/onboarding.hpp"
#include "matterlink/protocol.hpp"

namespace matter
{
namespace link
{

/* ========================================================================= */
/* Device records                                                            */
/* ========================================================================= */

enum class DeviceSource : uint8_t
{
  BLE,
  MDNS,
};

const char* device_source_name(DeviceSource source);

/**
 * @brief Commissionable device reported by a discoverer
 */
struct DeviceRecord
{
  DeviceSource source = DeviceSource::MDNS;
  uint16_t vendor_id = 0;
  uint16_t product_id = 0;
  uint16_t discriminator = 0;
  bool commissionable = true;
  std::string address;

  /**
   * @brief Check the record against an onboarding payload
   *
   * Vendor and product ids treat 0 as a wildcard; discriminators use the
   * short-form rule of discriminator_matches().
   */
  bool matches(const OnboardingPayload& payload) const;
};

/**
 * @brief Build a record from decoded BLE service data
 */
DeviceRecord make_ble_device_record(const BleAdvertisement& advertisement,
                                    const std::string& address);

std::string to_string(const DeviceRecord& device);

/* ========================================================================= */
/* Collaborators                                                             */
/* ========================================================================= */

using Clock = std::chrono::steady_clock;

/**
 * @brief Source of device records (BLE scanner, mDNS browser)
 */
class Discoverer
{
 public:
  virtual ~Discoverer() = default;

  /**
   * @brief Collect device records until @p deadline
   *
   * @param payload  Payload being searched for (may be used as a query hint)
   * @param deadline Point after which the search must stop
   * @param out      Records found so far (appended)
   * @return ErrorCode::OK, ErrorCode::TIMEOUT when the deadline ended the
   *         search, or another error
   */
  virtual ErrorCode discover(const OnboardingPayload& payload, Clock::time_point deadline,
                             std::vector<DeviceRecord>& out) = 0;
};

/**
 * @brief Opens a byte transport to a discovered device
 */
class DeviceConnector
{
 public:
  virtual ~DeviceConnector() = default;

  virtual ErrorCode open(const DeviceRecord& device, Clock::time_point deadline,
                         std::unique_ptr<Transport>& out) = 0;
};

/* ========================================================================= */
/* Commissioner                                                              */
/* ========================================================================= */

constexpr std::chrono::milliseconds DEFAULT_DISCOVERY_TIMEOUT{5000};
constexpr std::chrono::milliseconds DEFAULT_COMMISSIONING_TIMEOUT{5000};

/**
 * @brief Commissioner settings
 *
 * A zero timeout selects the matching default.
 */
struct CommissionerConfig
{
  std::chrono::milliseconds discovery_timeout = DEFAULT_DISCOVERY_TIMEOUT;
  std::chrono::milliseconds commissioning_timeout = DEFAULT_COMMISSIONING_TIMEOUT;
  LinkConfig link;
};

/**
 * @brief Commissioning step that produced a result
 */
enum class CommissionPhase : uint8_t
{
  NONE,
  DISCOVERY,
  CONNECT,
  HANDSHAKE,
  PASE,
};

const char* phase_name(CommissionPhase phase);

/**
 * @brief Error code tagged with the phase that failed
 */
struct CommissionResult
{
  ErrorCode code = ErrorCode::OK;
  CommissionPhase phase = CommissionPhase::NONE;

  bool ok() const
  {
    return code == ErrorCode::OK;
  }
};

std::string to_string(const CommissionResult& result);

class Commissioner
{
 public:
  /**
   * @brief Construct a commissioner
   *
   * All collaborators are borrowed and must outlive the commissioner.
   */
  Commissioner(Discoverer& ble, Discoverer& mdns, DeviceConnector& connector,
               CommissionerConfig config = CommissionerConfig());

  Commissioner(const Commissioner&) = delete;
  Commissioner& operator=(const Commissioner&) = delete;

  /**
   * @brief Run BLE and mDNS discovery concurrently
   *
   * Both searches share one deadline. A search that ends with
   * ErrorCode::TIMEOUT still contributes the records it found. Records that
   * are not commissionable or do not match @p payload are dropped.
   *
   * @param payload Payload to match
   * @param out     Matching records (replaced)
   * @return OK, or the first non-timeout discovery error (phase DISCOVERY)
   */
  CommissionResult discover(const OnboardingPayload& payload, std::vector<DeviceRecord>& out);

  /**
   * @brief Open a session transport to @p device
   *
   * BLE devices additionally complete the BTP handshake.
   *
   * @param device Device to connect to
   * @param out    Link bound to the opened transport
   * @return OK, or the failure tagged CONNECT or HANDSHAKE
   */
  CommissionResult connect(const DeviceRecord& device, std::unique_ptr<Link>& out);

  /**
   * @brief Discover and connect to the first matching device
   *
   * Stops once the transport session is ready; PASE is left to the caller.
   *
   * @param payload Payload to match
   * @param out     Link to the selected device
   * @param device  Selected device (optional)
   * @return OK, ErrorCode::NOT_FOUND (phase DISCOVERY) if nothing matched,
   *         or the failure of the first matching device
   */
  CommissionResult commission(const OnboardingPayload& payload, std::unique_ptr<Link>& out,
                              DeviceRecord* device = nullptr);

  const CommissionerConfig& config() const
  {
    return config_;
  }

 private:
  Discoverer& ble_;             ///< BLE scanner
  Discoverer& mdns_;            ///< mDNS browser
  DeviceConnector& connector_;  ///< Transport factory
  CommissionerConfig config_;   ///< Effective settings
};

}  // namespace link
}  // namespace matter
