#include "config.hpp"

ClientConfig load_config() {
    ClientConfig cfg{};
    cfg.device_id = "AA:BB:CC:DD:EE:FF";
    cfg.access_code = "0000";
    cfg.family = DeviceFamily::Equilibrium;
    cfg.connect_timeout_ms = 10000;
    cfg.notify_window_ms = 15000;
    cfg.disconnect_poll_ms = 100;
    cfg.busy_backoff_initial_ms = 250;
    cfg.busy_backoff_max_ms = 5000;
    cfg.busy_wait_budget_ms = 0;
    cfg.channel_high_water = 64;
    cfg.log_level = LogLevel::Info;
    return cfg;
}

bool validate_config(const ClientConfig& cfg, const char** reason) {
    const char* why = nullptr;
    if (cfg.device_id.empty()) {
        why = "device id is empty";
    } else if (cfg.access_code.empty()) {
        why = "access code is empty";
    } else if (cfg.connect_timeout_ms == 0) {
        why = "connect timeout is zero";
    } else if (cfg.notify_window_ms == 0) {
        why = "notification window is zero";
    } else if (cfg.disconnect_poll_ms == 0) {
        why = "disconnect poll interval is zero";
    } else if (cfg.busy_backoff_initial_ms == 0 || cfg.busy_backoff_max_ms < cfg.busy_backoff_initial_ms) {
        why = "busy backoff range is invalid";
    } else if (cfg.channel_high_water == 0) {
        why = "channel high-water mark is zero";
    }
    if (reason) {
        *reason = why;
    }
    return why == nullptr;
}

const char* family_name(DeviceFamily family) {
    switch (family) {
        case DeviceFamily::Equilibrium: return "equilibrium";
        case DeviceFamily::Halo: return "halo";
    }
    return "unknown";
}
