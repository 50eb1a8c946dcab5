#pragma once

#include "fault.hpp"
#include "protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct TransportResult {
    bool ok;
    ChlorError error;
};

inline TransportResult transport_ok() {
    return {true, ChlorError::None};
}

inline TransportResult transport_error(ChlorError err) {
    return {false, err};
}

// Receives raw (still encrypted) notification payloads on the transport's thread.
using PacketHandler = std::function<void(const uint8_t* data, std::size_t len)>;
using SubscriptionId = uint32_t;

// One live GATT connection. read/write fail with CharacteristicIOError.
class BleConnection {
public:
    virtual ~BleConnection() = default;

    virtual TransportResult read(Characteristic c, std::vector<uint8_t>& out) = 0;
    virtual TransportResult write(Characteristic c, const uint8_t* data, std::size_t len) = 0;
    virtual TransportResult subscribe(Characteristic c, PacketHandler handler, SubscriptionId& out) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
    virtual bool is_connected() const = 0;
    virtual void disconnect() = 0;

    TransportResult write(Characteristic c, const std::vector<uint8_t>& data) {
        return write(c, data.data(), data.size());
    }
};

// Discovery and connection policy live behind this interface. connect fails with ConnectionError.
class BleTransport {
public:
    virtual ~BleTransport() = default;

    virtual TransportResult connect(const std::string& device_id, uint32_t timeout_ms,
                                    std::unique_ptr<BleConnection>& out) = 0;
};
