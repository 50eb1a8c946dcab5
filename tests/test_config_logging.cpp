#include "config.hpp"
#include "logging.hpp"

#include <cassert>
#include <cstring>
#include <string>
#include <vector>

static std::vector<std::string> g_lines;
static std::vector<LogLevel> g_levels;

static void capture(LogLevel level, const char* tag, const char* line) {
    g_levels.push_back(level);
    g_lines.push_back(std::string(tag) + ":" + line);
}

static void check_defaults() {
    const ClientConfig cfg = load_config();
    const char* reason = "unset";
    assert(validate_config(cfg, &reason));
    assert(reason == nullptr);
    assert(cfg.family == DeviceFamily::Equilibrium);
    assert(cfg.busy_wait_budget_ms == 0);
    assert(cfg.busy_backoff_initial_ms <= cfg.busy_backoff_max_ms);
    assert(std::strcmp(family_name(DeviceFamily::Halo), "halo") == 0);
}

static void check_rejections() {
    ClientConfig cfg = load_config();
    const char* reason = nullptr;
    cfg.access_code.clear();
    assert(!validate_config(cfg, &reason));
    assert(reason && std::string(reason).find("access code") != std::string::npos);

    cfg = load_config();
    cfg.busy_backoff_max_ms = cfg.busy_backoff_initial_ms - 1;
    assert(!validate_config(cfg, &reason));

    cfg = load_config();
    cfg.notify_window_ms = 0;
    assert(!validate_config(cfg, nullptr));

    cfg = load_config();
    cfg.channel_high_water = 0;
    assert(!validate_config(cfg, &reason));
}

static void check_log_filtering() {
    init_logging();
    set_log_sink(capture);
    set_log_level(LogLevel::Warn);
    log_message(LogLevel::Debug, "TEST", "hidden %d", 1);
    log_message(LogLevel::Info, "TEST", "hidden %d", 2);
    log_message(LogLevel::Warn, "TEST", "shown %d", 3);
    log_message(LogLevel::Error, "TEST", "shown %s", "four");
    assert(g_lines.size() == 2);
    assert(g_lines[0] == "TEST:shown 3");
    assert(g_lines[1] == "TEST:shown four");
    assert(g_levels[1] == LogLevel::Error);

    set_log_level(LogLevel::None);
    log_message(LogLevel::Error, "TEST", "silenced");
    assert(g_lines.size() == 2);

    set_log_level(LogLevel::Debug);
    log_info("ready");
    assert(g_lines.back() == "MAIN:ready");
    assert(log_level() == LogLevel::Debug);
    set_log_sink(nullptr);
}

int main() {
    check_defaults();
    check_rejections();
    check_log_filtering();
    return 0;
}
