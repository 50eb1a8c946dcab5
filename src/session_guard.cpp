#include "session_guard.hpp"
#include "logging.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

namespace {
constexpr const char* TAG = "GUARD";

std::mutex g_guard_mu;
std::set<std::string> g_active_devices;
} // namespace

bool try_acquire_session(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(g_guard_mu);
    return g_active_devices.insert(device_id).second;
}

ChlorError acquire_session(const std::string& device_id, const ClientConfig& cfg) {
    uint32_t backoff_ms = std::max<uint32_t>(cfg.busy_backoff_initial_ms, 1);
    const uint32_t max_backoff_ms = std::max(backoff_ms, cfg.busy_backoff_max_ms);
    uint64_t waited_ms = 0;
    while (!try_acquire_session(device_id)) {
        if (cfg.busy_wait_budget_ms != 0 && waited_ms >= cfg.busy_wait_budget_ms) {
            log_message(LogLevel::Warn, TAG, "%s still busy after %llu ms", device_id.c_str(),
                        static_cast<unsigned long long>(waited_ms));
            return ChlorError::SessionBusy;
        }
        log_message(LogLevel::Debug, TAG, "%s already connected, waiting %u ms",
                    device_id.c_str(), static_cast<unsigned>(backoff_ms));
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
    }
    return ChlorError::None;
}

void release_session(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(g_guard_mu);
    g_active_devices.erase(device_id);
}

bool session_active(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(g_guard_mu);
    return g_active_devices.count(device_id) != 0;
}

DeviceSessionLock::DeviceSessionLock(const std::string& device_id, const ClientConfig& cfg)
    : device_id_(device_id) {
    error_ = acquire_session(device_id_, cfg);
    held_ = error_ == ChlorError::None;
}

DeviceSessionLock::~DeviceSessionLock() {
    if (held_) {
        release_session(device_id_);
    }
}
