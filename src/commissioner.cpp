/**
 * @file commissioner.cpp
 * @brief Device discovery and transport session setup implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "matterlink/commissioner.hpp"

#include <fmt/format.h>

#include <future>
#include <memory>
#include <utility>

#include "log.hpp"

namespace matter
{
namespace link
{

namespace
{

/// Number of discovery workers joined by Commissioner::discover()
constexpr size_t DISCOVERY_WORKERS = 2;

struct DiscoveryResult
{
  ErrorCode code = ErrorCode::OK;
  std::vector<DeviceRecord> devices;
};

std::chrono::milliseconds effective_timeout(std::chrono::milliseconds value,
                                            std::chrono::milliseconds fallback)
{
  return value.count() > 0 ? value : fallback;
}

}  // namespace

/* ========================================================================= */
/* Device records                                                            */
/* ========================================================================= */

const char* device_source_name(DeviceSource source)
{
  switch (source)
  {
    case DeviceSource::BLE:
      return "ble";
    case DeviceSource::MDNS:
      return "mdns";
    default:
      return "unknown";
  }
}

bool DeviceRecord::matches(const OnboardingPayload& payload) const
{
  return id_matches(vendor_id, payload.vendor_id) && id_matches(product_id, payload.product_id) &&
         discriminator_matches(discriminator, payload.discriminator);
}

DeviceRecord make_ble_device_record(const BleAdvertisement& advertisement,
                                    const std::string& address)
{
  DeviceRecord device;
  device.source = DeviceSource::BLE;
  device.vendor_id = advertisement.vendor_id;
  device.product_id = advertisement.product_id;
  device.discriminator = advertisement.discriminator;
  device.commissionable = advertisement.is_commissionable();
  device.address = address;
  return device;
}

std::string to_string(const DeviceRecord& device)
{
  return fmt::format("{} VendorID: {}, ProductID: {}, Discriminator: {} ({})",
                     device_source_name(device.source), device.vendor_id, device.product_id,
                     device.discriminator, device.address);
}

/* ========================================================================= */
/* Commissioner                                                              */
/* ========================================================================= */

const char* phase_name(CommissionPhase phase)
{
  switch (phase)
  {
    case CommissionPhase::NONE:
      return "none";
    case CommissionPhase::DISCOVERY:
      return "discovery";
    case CommissionPhase::CONNECT:
      return "connect";
    case CommissionPhase::HANDSHAKE:
      return "handshake";
    case CommissionPhase::PASE:
      return "pase";
    default:
      return "unknown";
  }
}

std::string to_string(const CommissionResult& result)
{
  if (result.ok())
  {
    return "ok";
  }
  return fmt::format("{} failed: {}", phase_name(result.phase), error_message(result.code));
}

Commissioner::Commissioner(Discoverer& ble, Discoverer& mdns, DeviceConnector& connector,
                           CommissionerConfig config)
    : ble_(ble), mdns_(mdns), connector_(connector), config_(std::move(config))
{
  config_.discovery_timeout =
      effective_timeout(config_.discovery_timeout, DEFAULT_DISCOVERY_TIMEOUT);
  config_.commissioning_timeout =
      effective_timeout(config_.commissioning_timeout, DEFAULT_COMMISSIONING_TIMEOUT);
}

CommissionResult Commissioner::discover(const OnboardingPayload& payload,
                                        std::vector<DeviceRecord>& out)
{
  out.clear();

  const Clock::time_point deadline = Clock::now() + config_.discovery_timeout;

  auto run = [&payload, deadline](Discoverer* discoverer)
  {
    DiscoveryResult result;
    result.code = discoverer->discover(payload, deadline, result.devices);
    return result;
  };

  std::future<DiscoveryResult> workers[DISCOVERY_WORKERS] = {
      std::async(std::launch::async, run, &ble_),
      std::async(std::launch::async, run, &mdns_),
  };

  // Join both workers before looking at either result
  DiscoveryResult results[DISCOVERY_WORKERS];
  for (size_t i = 0; i < DISCOVERY_WORKERS; ++i)
  {
    results[i] = workers[i].get();
  }

  for (const DiscoveryResult& result : results)
  {
    if (result.code != ErrorCode::OK && result.code != ErrorCode::TIMEOUT)
    {
      LOG_ERROR(LogRegion::COMMISSIONER, "discovery failed: {}", error_message(result.code));
      out.clear();
      return {result.code, CommissionPhase::DISCOVERY};
    }

    for (const DeviceRecord& device : result.devices)
    {
      LOG_DEBUG(LogRegion::COMMISSIONER, "device responded: {}", to_string(device));

      if (!device.commissionable)
      {
        continue;
      }
      if (!device.matches(payload))
      {
        LOG_INFO(LogRegion::COMMISSIONER, "skipping device (does not match payload): {}",
                 to_string(device));
        continue;
      }
      out.push_back(device);
    }
  }

  LOG_INFO(LogRegion::COMMISSIONER, "discovered {} matching device(s)", out.size());
  return {};
}

CommissionResult Commissioner::connect(const DeviceRecord& device, std::unique_ptr<Link>& out)
{
  const Clock::time_point deadline = Clock::now() + config_.commissioning_timeout;

  std::unique_ptr<Transport> transport;
  ErrorCode err = connector_.open(device, deadline, transport);
  if (err == ErrorCode::OK && !transport)
  {
    err = ErrorCode::NOT_CONNECTED;
  }
  if (err != ErrorCode::OK)
  {
    LOG_ERROR(LogRegion::COMMISSIONER, "failed to open transport ({}): {}", to_string(device),
              error_message(err));
    return {err, CommissionPhase::CONNECT};
  }

  auto link = std::make_unique<Link>(std::move(transport), config_.link);

  if (device.source == DeviceSource::BLE)
  {
    HandshakeResponse response;
    err = link->handshake(response);
    if (err != ErrorCode::OK)
    {
      LOG_ERROR(LogRegion::COMMISSIONER, "failed to perform handshake ({}): {}",
                to_string(device), error_message(err));
      return {err, CommissionPhase::HANDSHAKE};
    }
    LOG_INFO(LogRegion::COMMISSIONER, "handshake response: {}", to_string(response));
  }

  LOG_INFO(LogRegion::COMMISSIONER, "connected to device: {}", to_string(device));
  out = std::move(link);
  return {};
}

CommissionResult Commissioner::commission(const OnboardingPayload& payload,
                                          std::unique_ptr<Link>& out, DeviceRecord* device)
{
  std::vector<DeviceRecord> devices;
  const CommissionResult found = discover(payload, devices);
  if (!found.ok())
  {
    return found;
  }

  if (devices.empty())
  {
    LOG_WARN(LogRegion::COMMISSIONER, "no matching commissionable device found (discriminator={})",
             payload.discriminator);
    return {ErrorCode::NOT_FOUND, CommissionPhase::DISCOVERY};
  }

  const DeviceRecord& selected = devices.front();
  LOG_INFO(LogRegion::COMMISSIONER, "trying to commission device: {}", to_string(selected));

  const CommissionResult connected = connect(selected, out);
  if (connected.ok() && device != nullptr)
  {
    *device = selected;
  }
  return connected;
}

}  // namespace link
}  // namespace matter
