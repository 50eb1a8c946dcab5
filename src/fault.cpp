#include "fault.hpp"

const char* error_name(ChlorError err) {
    switch (err) {
        case ChlorError::None: return "None";
        case ChlorError::ConnectionError: return "ConnectionError";
        case ChlorError::CharacteristicIOError: return "CharacteristicIOError";
        case ChlorError::HandshakeFailed: return "HandshakeFailed";
        case ChlorError::InvalidPayloadLength: return "InvalidPayloadLength";
        case ChlorError::ShortBuffer: return "ShortBuffer";
        case ChlorError::UnknownEnumValue: return "UnknownEnumValue";
        case ChlorError::CipherFailure: return "CipherFailure";
        case ChlorError::SessionBusy: return "SessionBusy";
    }
    return "Unknown";
}

void record_fault(FaultStatus& status, ChlorError err, const char* msg) {
    switch (err) {
        case ChlorError::InvalidPayloadLength:
            status.counters.invalid_payload_length += 1;
            break;
        case ChlorError::ShortBuffer:
            status.counters.short_buffer += 1;
            break;
        case ChlorError::UnknownEnumValue:
            status.counters.unknown_enum_value += 1;
            break;
        case ChlorError::CipherFailure:
            status.counters.cipher_failures += 1;
            break;
        case ChlorError::ConnectionError:
        case ChlorError::CharacteristicIOError:
        case ChlorError::HandshakeFailed:
            status.counters.transport_errors += 1;
            break;
        case ChlorError::None:
        case ChlorError::SessionBusy:
            break;
    }
    status.fault_active = true;
    status.last_error = err;
    status.fault_msg = msg;
}

void note_dropped_packet(FaultStatus& status) {
    status.counters.dropped_packets += 1;
}

uint32_t total_faults(const FaultCounters& counters) {
    return counters.invalid_payload_length + counters.short_buffer + counters.unknown_enum_value +
           counters.cipher_failures + counters.transport_errors;
}
