#pragma once

#include <cstdint>

enum class ChlorError : uint8_t {
    None,
    ConnectionError,
    CharacteristicIOError,
    HandshakeFailed,
    InvalidPayloadLength,
    ShortBuffer,
    UnknownEnumValue,
    CipherFailure,
    SessionBusy,
};

const char* error_name(ChlorError err);

// Non-fatal error tallies for one session. Fatal errors end the session and are
// returned to the caller instead.
struct FaultCounters {
    uint32_t invalid_payload_length;
    uint32_t short_buffer;
    uint32_t unknown_enum_value;
    uint32_t cipher_failures;
    uint32_t transport_errors;
    uint32_t dropped_packets;
};

struct FaultStatus {
    bool fault_active;
    ChlorError last_error;
    const char* fault_msg;
    FaultCounters counters;
};

void record_fault(FaultStatus& status, ChlorError err, const char* msg);
void note_dropped_packet(FaultStatus& status);
uint32_t total_faults(const FaultCounters& counters);
