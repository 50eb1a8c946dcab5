#include "handshake.hpp"
#include "mock_chlorinator.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

static void check_poll_handshake() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    MockBleConnection conn(device);
    SessionKey key{};
    HandshakeResult res = perform_poll_handshake(conn, "1234", key);
    assert(res.ok);
    assert(key.valid);
    assert(device.authenticated());

    const std::vector<Characteristic> expected_reads = {
        Characteristic::EqSessionKey, Characteristic::EqState,      Characteristic::EqSetup,
        Characteristic::EqTimers,     Characteristic::EqSettings,   Characteristic::EqLightState,
        Characteristic::EqLightSetup, Characteristic::EqLightTimers,
    };
    assert(device.reads() == expected_reads);
    const std::vector<Characteristic> expected_writes = {Characteristic::EqAuthentication};
    assert(device.writes() == expected_writes);
}

static void check_wrong_code() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    MockBleConnection conn(device);
    SessionKey key{};
    HandshakeResult res = perform_poll_handshake(conn, "9999", key);
    assert(!res.ok);
    assert(res.error == ChlorError::HandshakeFailed);
    assert(res.cause == ChlorError::CharacteristicIOError);
    assert(std::string(res.step) == "write_token");
    assert(!key.valid);
    assert(!device.authenticated());
    assert(!conn.is_connected());
}

static void check_failed_keep_alive() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    device.fail_read(Characteristic::EqTimers);
    MockBleConnection conn(device);
    SessionKey key{};
    HandshakeResult res = perform_poll_handshake(conn, "1234", key);
    assert(!res.ok);
    assert(res.error == ChlorError::HandshakeFailed);
    assert(res.cause == ChlorError::CharacteristicIOError);
    assert(!key.valid);
    // Reads stop at the failing characteristic.
    assert(device.reads().back() == Characteristic::EqTimers);
}

static void check_bad_key_length() {
    MockChlorinator device(DeviceFamily::Halo, "1234");
    device.set_session_key_len(8);
    MockBleConnection conn(device);
    SessionKey key{};
    SubscriptionId sub = 0;
    HandshakeResult res = perform_notify_handshake(conn, "1234", key, [](const uint8_t*, std::size_t) {}, sub);
    assert(!res.ok);
    assert(res.cause == ChlorError::InvalidPayloadLength);
    assert(std::string(res.step) == "read_session_key");
    assert(device.writes().empty());
    assert(device.subscribe_count() == 0);
}

static void check_notify_handshake() {
    MockChlorinator device(DeviceFamily::Halo, "1234");
    MockBleConnection conn(device);
    SessionKey key{};
    SubscriptionId sub = 0;
    HandshakeResult res = perform_notify_handshake(conn, "1234", key, [](const uint8_t*, std::size_t) {}, sub);
    assert(res.ok);
    assert(key.valid);
    assert(sub != 0);
    assert(device.subscribe_count() == 1);

    const HaloRequest stats_request{static_cast<uint16_t>(HaloCommand::ProbeStatistics), false, 0};
    TransportResult tr = send_read_request(conn, key, stats_request);
    assert(tr.ok);
    const std::vector<uint16_t> expected = {600};
    assert(device.requests() == expected);
    conn.unsubscribe(sub);
}

static void check_request_layout() {
    const HaloRequest gpo{static_cast<uint16_t>(HaloCommand::GpoSetup), true, 2};
    const std::vector<uint8_t> packet = build_read_request(gpo);
    assert(packet.size() == kHaloPacketLen);
    assert(packet[0] == kHaloRequestType);
    assert(packet[1] == 0x14 && packet[2] == 0x05);
    assert(packet[3] == 2);
    for (std::size_t i = 4; i < packet.size(); ++i) {
        assert(packet[i] == 0);
    }

    const std::vector<uint8_t> flex = build_read_request(kHaloCatchAllRequests[0]);
    assert(flex[1] == 107 && flex[2] == 0 && flex[3] == 0);
}

int main() {
    check_poll_handshake();
    check_wrong_code();
    check_failed_keep_alive();
    check_bad_key_length();
    check_notify_handshake();
    check_request_layout();
    return 0;
}
