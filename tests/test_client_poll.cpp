#include "client.hpp"
#include "codec_registry.hpp"
#include "mock_chlorinator.hpp"
#include "record_fields.hpp"

#include <cassert>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

static ClientConfig test_config() {
    ClientConfig cfg = load_config();
    cfg.device_id = "eq-test";
    cfg.access_code = "1234";
    cfg.busy_backoff_initial_ms = 5;
    cfg.busy_backoff_max_ms = 20;
    return cfg;
}

static void seed(MockChlorinator& device) {
    device.set_record(Characteristic::EqState, {2, 1, 1, 0, 0, 0x33, 74, 4, 14, 5, 9});
    device.set_record(Characteristic::EqSetup, {1, 75, 0xBC, 0x02, 0x02});
    device.set_record(Characteristic::EqCapabilities,
                      {0, 10, 0, 8, 70, 78, 40, 80, 1, 1, 0x21, 25, 1, 15, 4, 0x10, 0x27, 0x00, 0xE8, 0x03});
    device.set_record(Characteristic::EqTimers, {0x68, 0, 17, 30, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0});
    device.set_record(Characteristic::EqStatistics,
                      {78, 70, 0xD0, 0x02, 0x58, 0x02, 12, 0, 0x10, 0x27, 0, 0, 5, 0, 0, 0, 80});
    device.set_record(Characteristic::EqSettings, {0x3C, 0x00, 2});
}

static void check_gather() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    seed(device);
    MockBleTransport transport(device);
    const ClientConfig cfg = test_config();

    GatherResult res = gather_chlorinator_state(transport, cfg);
    assert(res.ok);
    assert(res.error == ChlorError::None);
    assert(res.records_merged == kPolledCharacteristicCount);
    assert(total_faults(res.faults.counters) == 0);
    assert(transport.last_device_id() == "eq-test");

    std::string text;
    assert(res.snapshot.get_text(kFieldMode, text) && text == "Auto");
    assert(res.snapshot.get_text("acid_dosing_inhibit_status", text) && text == "InhibitedForAPeriod");
    double value = 0.0;
    assert(res.snapshot.get_real(kFieldPhControlSetpoint, value) && std::fabs(value - 7.5) < 1e-9);
    int64_t number = 0;
    assert(res.snapshot.get_int(kFieldChlorineControlSetpoint, number) && number == 700);
    assert(res.snapshot.get_int(kFieldCellRunningHours, number) && number == 10000);
    assert(res.snapshot.get_int("pump_timer_1_start_minutes", number) && number == 480);
    bool flag = false;
    assert(res.snapshot.get_flag("pump_timer_1_invalid", flag) && !flag);

    // Handshake reads come first, then each record once in poll order.
    const std::vector<Characteristic> reads = device.reads();
    assert(reads.size() == 1 + 7 + kPolledCharacteristicCount);
    assert(reads.front() == Characteristic::EqSessionKey);
    for (std::size_t i = 0; i < kPolledCharacteristicCount; ++i) {
        assert(reads[8 + i] == polled_characteristics()[i]);
    }
    assert(device.active_sessions() == 0);
}

static void check_dispatch_on_family() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    seed(device);
    MockBleTransport transport(device);
    const ClientConfig cfg = test_config();
    assert(cfg.family == DeviceFamily::Equilibrium);

    GatherResult res = gather_state(transport, cfg);
    assert(res.ok);
    assert(res.records_merged == kPolledCharacteristicCount);
    assert(device.subscribe_count() == 0);
    assert(device.requests().empty());
    assert(device.reads().front() == Characteristic::EqSessionKey);
}

static void check_bad_record_is_skipped() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    seed(device);
    device.set_record(Characteristic::EqState, {3, 1, 1, 0, 0, 0x33, 74, 4, 14, 5, 9});
    MockBleTransport transport(device);

    GatherResult res = gather_chlorinator_state(transport, test_config());
    assert(res.ok);
    assert(res.records_merged == kPolledCharacteristicCount - 1);
    assert(res.faults.counters.unknown_enum_value == 1);
    assert(res.faults.last_error == ChlorError::UnknownEnumValue);
    assert(!res.snapshot.contains(kFieldMode));
    assert(res.snapshot.contains(kFieldCellReversalCount));
}

static void check_failures() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    seed(device);
    MockBleTransport transport(device);

    ClientConfig wrong = test_config();
    wrong.access_code = "4321";
    GatherResult res = gather_chlorinator_state(transport, wrong);
    assert(!res.ok);
    assert(res.error == ChlorError::HandshakeFailed);
    assert(res.cause == ChlorError::CharacteristicIOError);
    assert(res.snapshot.empty());

    device.fail_read(Characteristic::EqStatistics);
    res = gather_chlorinator_state(transport, test_config());
    assert(!res.ok);
    assert(res.error == ChlorError::CharacteristicIOError);

    device.set_refuse_connections(true);
    res = gather_chlorinator_state(transport, test_config());
    assert(!res.ok);
    assert(res.error == ChlorError::ConnectionError);

    ClientConfig empty_id = test_config();
    empty_id.device_id.clear();
    const uint32_t before = device.connections();
    res = gather_chlorinator_state(transport, empty_id);
    assert(!res.ok);
    assert(res.error == ChlorError::ConnectionError);
    assert(device.connections() == before);
}

static void check_action() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    seed(device);
    MockBleTransport transport(device);

    ActionResult res = write_chlorinator_action(transport, test_config(), EquilibriumAction::DisableAcidDosingForPeriod, 60);
    assert(res.ok);
    const std::vector<uint8_t> sent = device.last_action();
    assert(sent.size() == kActionFrameLen);
    assert(sent[0] == 11);
    assert(sent[1] == 60 && sent[2] == 0 && sent[3] == 0 && sent[4] == 0);
    const std::vector<Characteristic> writes = device.writes();
    assert(writes.size() == 2);
    assert(writes[0] == Characteristic::EqAuthentication);
    assert(writes[1] == Characteristic::EqAppAction);

    device.fail_write(Characteristic::EqAppAction);
    res = write_chlorinator_action(transport, test_config(), EquilibriumAction::Off);
    assert(!res.ok);
    assert(res.error == ChlorError::CharacteristicIOError);
}

static void check_one_session_per_device() {
    MockChlorinator device(DeviceFamily::Equilibrium, "1234");
    seed(device);
    device.set_connect_delay_ms(30);
    MockBleTransport transport(device);
    const ClientConfig cfg = test_config();

    GatherResult first{};
    GatherResult second{};
    std::thread a([&] { first = gather_chlorinator_state(transport, cfg); });
    std::thread b([&] { second = gather_chlorinator_state(transport, cfg); });
    a.join();
    b.join();
    assert(first.ok && second.ok);
    assert(device.connections() == 2);
    assert(device.max_concurrent() == 1);
}

int main() {
    check_gather();
    check_dispatch_on_family();
    check_bad_record_is_skipped();
    check_failures();
    check_action();
    check_one_session_per_device();
    return 0;
}
