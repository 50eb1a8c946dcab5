#pragma once

#include "action.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "fault.hpp"
#include "snapshot.hpp"
#include "transport.hpp"
#include <cstdint>

struct GatherResult {
    bool ok;
    ChlorError error;
    ChlorError cause;  // transport or cipher error behind HandshakeFailed
    StateSnapshot snapshot;
    FaultStatus faults;
    uint32_t records_merged;
    SessionEndReason end_reason;  // notification variant only
};

struct ActionResult {
    bool ok;
    ChlorError error;
    ChlorError cause;
};

// Equilibrium: read every record characteristic once and merge what decodes.
GatherResult gather_chlorinator_state(BleTransport& transport, const ClientConfig& cfg);
ActionResult write_chlorinator_action(BleTransport& transport, const ClientConfig& cfg,
                                      EquilibriumAction action, int32_t minutes = 0);

// Halo: ask for everything and collect notifications until the device hangs up or
// cfg.notify_window_ms elapses.
GatherResult gather_halo_state(BleTransport& transport, const ClientConfig& cfg);
ActionResult write_halo_action(BleTransport& transport, const ClientConfig& cfg, const ActionFrame& frame);

// Runs the gather that matches cfg.family.
GatherResult gather_state(BleTransport& transport, const ClientConfig& cfg);
