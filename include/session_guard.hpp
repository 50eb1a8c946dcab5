#pragma once

#include "config.hpp"
#include "fault.hpp"
#include <string>

// One session per device. A second caller waits, polling with exponential backoff
// from cfg.busy_backoff_initial_ms up to cfg.busy_backoff_max_ms, and gives up with
// SessionBusy once cfg.busy_wait_budget_ms is spent (never when the budget is 0).
bool try_acquire_session(const std::string& device_id);
ChlorError acquire_session(const std::string& device_id, const ClientConfig& cfg);
void release_session(const std::string& device_id);
bool session_active(const std::string& device_id);

class DeviceSessionLock {
public:
    DeviceSessionLock(const std::string& device_id, const ClientConfig& cfg);
    ~DeviceSessionLock();

    DeviceSessionLock(const DeviceSessionLock&) = delete;
    DeviceSessionLock& operator=(const DeviceSessionLock&) = delete;

    bool held() const { return held_; }
    ChlorError error() const { return error_; }

private:
    std::string device_id_;
    bool held_ = false;
    ChlorError error_ = ChlorError::None;
};
