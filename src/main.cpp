#include <cstdio>
#include "action.hpp"
#include "client.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "mock_chlorinator.hpp"
#include "protocol.hpp"

static void print_snapshot(const char* label, const GatherResult& res) {
    std::printf("\n[%s] ok=%d error=%s records=%u faults=%u\n", label, res.ok ? 1 : 0, error_name(res.error),
                static_cast<unsigned>(res.records_merged),
                static_cast<unsigned>(total_faults(res.faults.counters)));
    for (const auto& kv : res.snapshot.fields()) {
        std::printf("  %-40s %s\n", kv.first.c_str(), format_field(kv.second).c_str());
    }
}

static void seed_equilibrium(MockChlorinator& device) {
    // Auto, medium speed, pH 7.4, chlorine Ok, 14:05:09, pump and cell running.
    device.set_record(Characteristic::EqState, {2, 1, 1, 0, 0, 0x33, 74, 4, 14, 5, 9});
    device.set_record(Characteristic::EqSetup, {1, 75, 0xBC, 0x02, 0x02});
    device.set_record(Characteristic::EqCapabilities,
                      {0, 10, 0, 8, 70, 78, 40, 80, 1, 1, 0x21, 25, 1, 15, 4, 0x10, 0x27, 0x00, 0xE8, 0x03});
    device.set_record(Characteristic::EqTimers,
                      {0x68, 0, 17, 30, 0x00, 0, 0, 0, 0x00, 0, 0, 0, 0x00, 0, 0, 0});
    device.set_record(Characteristic::EqStatistics,
                      {78, 70, 0xD0, 0x02, 0x58, 0x02, 12, 0, 0x10, 0x27, 0, 0, 5, 0, 0, 0, 80});
    device.set_record(Characteristic::EqSettings, {0, 0, 0});
}

static void seed_halo(MockChlorinator& device) {
    device.queue_notification(static_cast<uint16_t>(HaloCommand::Temperature),
                              {0, 0x03, 0xFA, 0x00, 0xF0, 0x00, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0x02});
    device.queue_notification(static_cast<uint16_t>(HaloCommand::State),
                              {0x02, 5, 0xE8, 0x03, 0, 4, 0xBC, 0x02, 0, 73, 0, 0, 0, 0, 0, 0});
    device.queue_notification(static_cast<uint16_t>(HaloCommand::ProbeStatistics),
                              {78, 70, 0xD0, 0x02, 0x58, 0x02});
    device.queue_notification(static_cast<uint16_t>(HaloCommand::InfoLog), {1, 2, 3});
}

static bool resolve_family(const char* service, const char* local_name, ClientConfig& cfg) {
    DeviceFamily family = DeviceFamily::Equilibrium;
    if (!family_from_advertisement(service, local_name, family)) {
        std::printf("[SCAN] %s is not a chlorinator\n", cfg.device_id.c_str());
        return false;
    }
    cfg.family = family;
    std::printf("[SCAN] %s -> %s (service %s)\n", cfg.device_id.c_str(), family_name(family), service_uuid(family));
    return true;
}

int main() {
    init_logging();
    log_info("Chlorinator BLE client starting...");

    ClientConfig cfg = load_config();
    cfg.access_code = "1234";
    set_log_level(cfg.log_level);

    MockChlorinator equilibrium(DeviceFamily::Equilibrium, cfg.access_code);
    seed_equilibrium(equilibrium);
    MockBleTransport eq_transport(equilibrium);

    if (!resolve_family(kEquilibriumServiceUuid, nullptr, cfg)) {
        return 1;
    }
    const GatherResult eq = gather_state(eq_transport, cfg);
    print_snapshot("EQUILIBRIUM", eq);

    const ActionResult eq_action =
        write_chlorinator_action(eq_transport, cfg, EquilibriumAction::DisableAcidDosingForPeriod, 60);
    std::printf("\n[ACTION] %s ok=%d error=%s\n", to_string(EquilibriumAction::DisableAcidDosingForPeriod),
                eq_action.ok ? 1 : 0, error_name(eq_action.error));

    ClientConfig halo_cfg = cfg;
    halo_cfg.device_id = "11:22:33:44:55:66";
    halo_cfg.notify_window_ms = 2000;
    if (!resolve_family(nullptr, kHaloAdvertisedName, halo_cfg)) {
        return 1;
    }

    MockChlorinator halo(halo_cfg.family, halo_cfg.access_code);
    seed_halo(halo);
    MockBleTransport halo_transport(halo);

    const GatherResult hr = gather_state(halo_transport, halo_cfg);
    print_snapshot("HALO", hr);

    const ActionResult halo_action =
        write_halo_action(halo_transport, halo_cfg, encode_heater_action(HeaterAction::HeaterOn));
    std::printf("\n[ACTION] %s ok=%d error=%s\n", to_string(HeaterAction::HeaterOn), halo_action.ok ? 1 : 0,
                error_name(halo_action.error));

    return eq.ok && hr.ok && eq_action.ok && halo_action.ok ? 0 : 1;
}
