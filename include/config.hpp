#pragma once

#include "logging.hpp"
#include "protocol.hpp"
#include <cstdint>
#include <string>

struct ClientConfig {
    std::string device_id;
    std::string access_code;
    DeviceFamily family;
    uint32_t connect_timeout_ms;
    uint32_t notify_window_ms;
    uint32_t disconnect_poll_ms;
    uint32_t busy_backoff_initial_ms;
    uint32_t busy_backoff_max_ms;
    uint32_t busy_wait_budget_ms;  // 0 waits indefinitely
    uint32_t channel_high_water;
    LogLevel log_level;
};

ClientConfig load_config();
bool validate_config(const ClientConfig& cfg, const char** reason);
const char* family_name(DeviceFamily family);
