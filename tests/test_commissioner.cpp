/**
 * @file test_commissioner.cpp
 * @brief Discovery and session setup tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "matterlink/commissioner.hpp"
#include "mock_transport.hpp"

using namespace matter::link;
using matter::link::test::MockTransport;

namespace
{

class FakeDiscoverer : public Discoverer
{
 public:
  ErrorCode discover(const OnboardingPayload& payload, Clock::time_point deadline,
                     std::vector<DeviceRecord>& out) override
  {
    (void)payload;
    calls++;
    last_deadline = deadline;
    worker = std::this_thread::get_id();
    out.insert(out.end(), devices.begin(), devices.end());
    return result;
  }

  std::vector<DeviceRecord> devices;
  ErrorCode result = ErrorCode::OK;
  int calls = 0;
  Clock::time_point last_deadline;
  std::thread::id worker;
};

class FakeConnector : public DeviceConnector
{
 public:
  ErrorCode open(const DeviceRecord& device, Clock::time_point deadline,
                 std::unique_ptr<Transport>& out) override
  {
    (void)deadline;
    opened.push_back(device);
    if (result != ErrorCode::OK)
    {
      return result;
    }

    std::unique_ptr<MockTransport> transport(new MockTransport());
    if (device.source == DeviceSource::BLE && answer_handshake)
    {
      transport->push(std::vector<uint8_t>{0x65, 0x6C, 0x04, 0x00, 0xF4, 0x00});
    }
    last_transport = transport.get();
    out = std::move(transport);
    return ErrorCode::OK;
  }

  ErrorCode result = ErrorCode::OK;
  bool answer_handshake = true;
  std::vector<DeviceRecord> opened;
  MockTransport* last_transport = nullptr;
};

DeviceRecord make_device(DeviceSource source, uint16_t discriminator)
{
  DeviceRecord device;
  device.source = source;
  device.vendor_id = 0xFFF1;
  device.product_id = 0x8000;
  device.discriminator = discriminator;
  device.address = source == DeviceSource::BLE ? "AA:BB:CC:DD:EE:FF" : "fe80::1";
  return device;
}

OnboardingPayload make_payload()
{
  // Decoded from a short manual code: only the upper discriminator bits are known
  OnboardingPayload payload;
  payload.discriminator = 0x0F00;
  payload.passcode = 20202021;
  return payload;
}

}  // namespace

/* ========================================================================= */
/* Device records                                                            */
/* ========================================================================= */

TEST_CASE("Device record matching")
{
  DeviceRecord device = make_device(DeviceSource::MDNS, 0x0F42);

  SUBCASE("Short discriminator and wildcard ids")
  {
    CHECK(device.matches(make_payload()));
  }

  SUBCASE("Full discriminator")
  {
    OnboardingPayload payload = make_payload();
    payload.discriminator = 0x0F42;
    CHECK(device.matches(payload));
    payload.discriminator = 0x0F43;
    CHECK_FALSE(device.matches(payload));
  }

  SUBCASE("Vendor mismatch")
  {
    OnboardingPayload payload = make_payload();
    payload.vendor_id = 0xFFF2;
    CHECK_FALSE(device.matches(payload));
  }

  SUBCASE("Record from BLE advertisement")
  {
    BleAdvertisement adv;
    adv.opcode = 0x00;
    adv.discriminator = 0x0F00;
    adv.vendor_id = 0xFFF1;
    adv.product_id = 0x8000;

    const DeviceRecord record = make_ble_device_record(adv, "AA:BB");
    CHECK(record.source == DeviceSource::BLE);
    CHECK(record.commissionable);
    CHECK(record.address == "AA:BB");
    CHECK(record.matches(make_payload()));
    CHECK(to_string(record).find("VendorID: 65521") != std::string::npos);
  }
}

/* ========================================================================= */
/* Discovery                                                                 */
/* ========================================================================= */

TEST_CASE("Commissioner discovery")
{
  FakeDiscoverer ble;
  FakeDiscoverer mdns;
  FakeConnector connector;
  Commissioner commissioner(ble, mdns, connector);

  SUBCASE("Merges both sources and filters")
  {
    ble.devices.push_back(make_device(DeviceSource::BLE, 0x0F01));
    mdns.devices.push_back(make_device(DeviceSource::MDNS, 0x0F02));
    mdns.devices.push_back(make_device(DeviceSource::MDNS, 0x0A00));

    DeviceRecord closed = make_device(DeviceSource::MDNS, 0x0F03);
    closed.commissionable = false;
    mdns.devices.push_back(closed);

    std::vector<DeviceRecord> found;
    const CommissionResult result = commissioner.discover(make_payload(), found);
    REQUIRE(result.ok());
    CHECK(found.size() == 2);
    CHECK(ble.calls == 1);
    CHECK(mdns.calls == 1);
    CHECK(ble.worker != std::this_thread::get_id());
    CHECK(mdns.worker != std::this_thread::get_id());
  }

  SUBCASE("Timeout is not an error")
  {
    ble.result = ErrorCode::TIMEOUT;
    mdns.devices.push_back(make_device(DeviceSource::MDNS, 0x0F02));

    std::vector<DeviceRecord> found;
    REQUIRE(commissioner.discover(make_payload(), found).ok());
    CHECK(found.size() == 1);
  }

  SUBCASE("Other errors fail discovery")
  {
    mdns.result = ErrorCode::TRANSPORT_ERROR;
    ble.devices.push_back(make_device(DeviceSource::BLE, 0x0F01));

    std::vector<DeviceRecord> found;
    const CommissionResult result = commissioner.discover(make_payload(), found);
    CHECK(result.code == ErrorCode::TRANSPORT_ERROR);
    CHECK(result.phase == CommissionPhase::DISCOVERY);
    CHECK(found.empty());
  }

  SUBCASE("Shared deadline")
  {
    const auto before = Clock::now();
    std::vector<DeviceRecord> found;
    REQUIRE(commissioner.discover(make_payload(), found).ok());
    CHECK(ble.last_deadline == mdns.last_deadline);
    CHECK(ble.last_deadline >= before + DEFAULT_DISCOVERY_TIMEOUT);
  }
}

TEST_CASE("Commissioner configuration")
{
  FakeDiscoverer ble;
  FakeDiscoverer mdns;
  FakeConnector connector;

  SUBCASE("Zero selects defaults")
  {
    CommissionerConfig config;
    config.discovery_timeout = std::chrono::milliseconds(0);
    config.commissioning_timeout = std::chrono::milliseconds(0);
    Commissioner commissioner(ble, mdns, connector, config);
    CHECK(commissioner.config().discovery_timeout == DEFAULT_DISCOVERY_TIMEOUT);
    CHECK(commissioner.config().commissioning_timeout == DEFAULT_COMMISSIONING_TIMEOUT);
  }

  SUBCASE("Custom timeout")
  {
    CommissionerConfig config;
    config.discovery_timeout = std::chrono::milliseconds(250);
    Commissioner commissioner(ble, mdns, connector, config);

    const auto before = Clock::now();
    std::vector<DeviceRecord> found;
    REQUIRE(commissioner.discover(make_payload(), found).ok());
    CHECK(ble.last_deadline >= before + std::chrono::milliseconds(250));
    CHECK(ble.last_deadline < before + DEFAULT_DISCOVERY_TIMEOUT);
  }
}

/* ========================================================================= */
/* Connect and commission                                                    */
/* ========================================================================= */

TEST_CASE("Commissioner connect")
{
  FakeDiscoverer ble;
  FakeDiscoverer mdns;
  FakeConnector connector;
  Commissioner commissioner(ble, mdns, connector);

  SUBCASE("BLE device performs the handshake")
  {
    std::unique_ptr<Link> link;
    REQUIRE(commissioner.connect(make_device(DeviceSource::BLE, 0x0F00), link).ok());
    REQUIRE(link != nullptr);
    REQUIRE(connector.last_transport != nullptr);
    REQUIRE(connector.last_transport->sent.size() == 1);
    CHECK(connector.last_transport->sent[0].size() == BTP_HANDSHAKE_REQUEST_SIZE);
  }

  SUBCASE("mDNS device skips the handshake")
  {
    std::unique_ptr<Link> link;
    REQUIRE(commissioner.connect(make_device(DeviceSource::MDNS, 0x0F00), link).ok());
    REQUIRE(link != nullptr);
    CHECK(connector.last_transport->sent.empty());
  }

  SUBCASE("Open failure")
  {
    connector.result = ErrorCode::NOT_CONNECTED;
    std::unique_ptr<Link> link;
    const CommissionResult result =
        commissioner.connect(make_device(DeviceSource::MDNS, 0x0F00), link);
    CHECK(result.code == ErrorCode::NOT_CONNECTED);
    CHECK(result.phase == CommissionPhase::CONNECT);
    CHECK(link == nullptr);
    CHECK(to_string(result) == "connect failed: transport not connected");
  }

  SUBCASE("Handshake failure")
  {
    connector.answer_handshake = false;
    std::unique_ptr<Link> link;
    const CommissionResult result =
        commissioner.connect(make_device(DeviceSource::BLE, 0x0F00), link);
    CHECK(result.code == ErrorCode::TIMEOUT);
    CHECK(result.phase == CommissionPhase::HANDSHAKE);
    CHECK(link == nullptr);
  }
}

TEST_CASE("Commissioner commission")
{
  FakeDiscoverer ble;
  FakeDiscoverer mdns;
  FakeConnector connector;
  Commissioner commissioner(ble, mdns, connector);

  SUBCASE("First matching device")
  {
    mdns.devices.push_back(make_device(DeviceSource::MDNS, 0x0A00));
    mdns.devices.push_back(make_device(DeviceSource::MDNS, 0x0F10));

    std::unique_ptr<Link> link;
    DeviceRecord selected;
    REQUIRE(commissioner.commission(make_payload(), link, &selected).ok());
    REQUIRE(link != nullptr);
    CHECK(selected.discriminator == 0x0F10);
    REQUIRE(connector.opened.size() == 1);
    CHECK(connector.opened[0].discriminator == 0x0F10);
  }

  SUBCASE("Nothing matches")
  {
    mdns.devices.push_back(make_device(DeviceSource::MDNS, 0x0A00));

    std::unique_ptr<Link> link;
    const CommissionResult result = commissioner.commission(make_payload(), link);
    CHECK(result.code == ErrorCode::NOT_FOUND);
    CHECK(result.phase == CommissionPhase::DISCOVERY);
    CHECK(connector.opened.empty());
  }

  SUBCASE("Connect failure keeps its phase")
  {
    ble.devices.push_back(make_device(DeviceSource::BLE, 0x0F00));
    connector.answer_handshake = false;

    std::unique_ptr<Link> link;
    const CommissionResult result = commissioner.commission(make_payload(), link);
    CHECK(result.phase == CommissionPhase::HANDSHAKE);
    CHECK(std::string(phase_name(result.phase)) == "handshake");
  }
}
