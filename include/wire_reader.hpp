#pragma once

#include "fault.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>

struct CodecResult {
    bool ok;
    ChlorError error;
    // Record name for ShortBuffer, field name for UnknownEnumValue.
    const char* field;
};

inline CodecResult codec_ok() {
    return {true, ChlorError::None, nullptr};
}

inline CodecResult codec_error(ChlorError err, const char* field) {
    return {false, err, field};
}

// Bounds-checked little-endian cursor over a decrypted record.
struct WireReader {
    const uint8_t* data;
    std::size_t len;
    std::size_t idx = 0;

    std::size_t remaining() const { return idx <= len ? len - idx : 0; }

    bool u8(uint8_t& out) {
        if (remaining() < 1) return false;
        out = data[idx++];
        return true;
    }
    bool u16le(uint16_t& out) {
        if (remaining() < 2) return false;
        out = static_cast<uint16_t>(data[idx] | (data[idx + 1] << 8));
        idx += 2;
        return true;
    }
    bool u32le(uint32_t& out) {
        if (remaining() < 4) return false;
        out = static_cast<uint32_t>(data[idx]) |
              (static_cast<uint32_t>(data[idx + 1]) << 8) |
              (static_cast<uint32_t>(data[idx + 2]) << 16) |
              (static_cast<uint32_t>(data[idx + 3]) << 24);
        idx += 4;
        return true;
    }
    bool bytes(uint8_t* out, std::size_t n) {
        if (remaining() < n) return false;
        std::memcpy(out, data + idx, n);
        idx += n;
        return true;
    }
    bool skip(std::size_t n) {
        if (remaining() < n) return false;
        idx += n;
        return true;
    }
};

// Contiguous codes 0..max_code.
template <typename E>
bool enum_from_code(uint32_t code, uint32_t max_code, E& out) {
    if (code > max_code) {
        return false;
    }
    out = static_cast<E>(code);
    return true;
}

// As enum_from_code, but a one-byte 0xFF maps to the enum's -1 sentinel.
template <typename E>
bool enum_from_code_or_sentinel(uint8_t code, uint32_t max_code, E& out) {
    if (code == 0xFF) {
        out = static_cast<E>(-1);
        return true;
    }
    return enum_from_code(code, max_code, out);
}

inline double scale_tenths(uint32_t raw) {
    return static_cast<double>(raw) / 10.0;
}
