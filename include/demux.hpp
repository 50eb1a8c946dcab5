#pragma once

#include "channel.hpp"
#include "crypto.hpp"
#include "fault.hpp"
#include "snapshot.hpp"
#include "transport.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

struct DemuxStats {
    uint32_t packets_received;
    uint32_t records_merged;
    uint32_t unknown_tags;
    FaultStatus faults;
};

enum class PacketOutcome : uint8_t {
    Merged,
    UnknownTag,
    DecodeFailed,
};

// Split a decrypted notification into tag and data. Fails on anything shorter than one packet.
bool extract_tagged_packet(const uint8_t* plaintext, std::size_t len, TaggedPacket& out);

// Decode one packet through the command registry and merge it into `snap`.
PacketOutcome apply_packet(const TaggedPacket& packet, StateSnapshot& snap, DemuxStats& stats);

// Routes Halo notifications into a snapshot. on_notification() runs on the transport's
// callback thread; a consumer thread started by start() decodes in arrival order.
// `key` is owned by the session and must be filled in before the first notification.
class NotificationDemux {
public:
    NotificationDemux(const SessionKey& key, std::size_t high_water);
    ~NotificationDemux();

    NotificationDemux(const NotificationDemux&) = delete;
    NotificationDemux& operator=(const NotificationDemux&) = delete;

    void start();
    void on_notification(const uint8_t* data, std::size_t len);
    PacketHandler handler();

    // Non-blocking; the consumer drains what is queued and stops.
    void terminate(SessionEndReason reason);

    // Terminates if still open, joins the consumer and hands over the snapshot.
    StateSnapshot finish();

    DemuxStats stats() const;
    SessionEndReason end_reason() const;

private:
    void consume();

    const SessionKey& key_;
    PacketChannel channel_;
    std::thread consumer_;
    mutable std::mutex mu_;
    StateSnapshot snapshot_;
    DemuxStats stats_{};
    SessionEndReason end_reason_ = SessionEndReason::Terminated;
};
