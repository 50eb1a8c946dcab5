#pragma once

#include "protocol.hpp"
#include <array>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <variant>

// Decrypted notification split into command tag and record data.
struct TaggedPacket {
    uint16_t tag;
    std::array<uint8_t, kHaloDataLen> data;
};

enum class SessionEndReason : uint8_t {
    Disconnected,
    WindowElapsed,
    Terminated,
};

struct SessionEnd {
    SessionEndReason reason;
};

using ChannelItem = std::variant<TaggedPacket, SessionEnd>;

// FIFO between the notification callback and the decode task. Pushes block while
// `high_water` packets are pending; close() never blocks and makes every later pop
// return SessionEnd once the pending packets are drained.
class PacketChannel {
public:
    explicit PacketChannel(std::size_t high_water);

    // Returns false if the channel was closed before the packet could be queued.
    bool push(const TaggedPacket& packet);
    void close(SessionEndReason reason);

    // Returns false if nothing arrived within `timeout_ms`.
    bool pop(ChannelItem& out, uint32_t timeout_ms);

    bool closed() const;
    std::size_t pending() const;
    uint32_t backpressure_waits() const;

private:
    const std::size_t high_water_;
    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<TaggedPacket> packets_;
    bool closed_ = false;
    SessionEndReason end_reason_ = SessionEndReason::Terminated;
    uint32_t backpressure_waits_ = 0;
};
