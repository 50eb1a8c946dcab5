#include "demux.hpp"
#include "codec_registry.hpp"
#include "logging.hpp"
#include <cstring>
#include <utility>

namespace {
constexpr const char* TAG = "DEMUX";
constexpr uint32_t kConsumerPollMs = 100;
} // namespace

bool extract_tagged_packet(const uint8_t* plaintext, std::size_t len, TaggedPacket& out) {
    if (!plaintext || len < kHaloPacketLen) {
        return false;
    }
    out.tag = static_cast<uint16_t>(plaintext[kHaloTagOffset] | (plaintext[kHaloTagOffset + 1] << 8));
    std::memcpy(out.data.data(), plaintext + kHaloDataOffset, kHaloDataLen);
    return true;
}

PacketOutcome apply_packet(const TaggedPacket& packet, StateSnapshot& snap, DemuxStats& stats) {
    const CommandCodec* codec = find_command_codec(packet.tag);
    if (!codec) {
        stats.unknown_tags++;
        note_dropped_packet(stats.faults);
        log_message(LogLevel::Debug, TAG, "dropping packet with unhandled tag %u",
                    static_cast<unsigned>(packet.tag));
        return PacketOutcome::UnknownTag;
    }
    CodecResult res = decode_and_merge(*codec, packet.data.data(), packet.data.size(), snap);
    if (!res.ok) {
        record_fault(stats.faults, res.error, codec->name);
        log_message(LogLevel::Warn, TAG, "%s: %s (%s)",
                    codec->name, error_name(res.error), res.field ? res.field : "-");
        return PacketOutcome::DecodeFailed;
    }
    stats.records_merged++;
    return PacketOutcome::Merged;
}

NotificationDemux::NotificationDemux(const SessionKey& key, std::size_t high_water)
    : key_(key), channel_(high_water) {}

NotificationDemux::~NotificationDemux() {
    channel_.close(SessionEndReason::Terminated);
    if (consumer_.joinable()) {
        consumer_.join();
    }
}

void NotificationDemux::start() {
    if (consumer_.joinable()) {
        return;
    }
    consumer_ = std::thread(&NotificationDemux::consume, this);
}

void NotificationDemux::on_notification(const uint8_t* data, std::size_t len) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stats_.packets_received++;
    }
    CipherResult plain = decrypt_payload(data, len, key_);
    if (!plain.ok) {
        std::lock_guard<std::mutex> lock(mu_);
        record_fault(stats_.faults, plain.error, "notification");
        log_message(LogLevel::Warn, TAG, "notification of %zu bytes rejected: %s", len, error_name(plain.error));
        return;
    }
    TaggedPacket packet{};
    const bool extracted = extract_tagged_packet(plain.bytes.data(), plain.bytes.size(), packet);
    wipe_bytes(plain.bytes);
    if (!extracted) {
        std::lock_guard<std::mutex> lock(mu_);
        record_fault(stats_.faults, ChlorError::ShortBuffer, "notification");
        return;
    }
    if (!channel_.push(packet)) {
        std::lock_guard<std::mutex> lock(mu_);
        note_dropped_packet(stats_.faults);
        log_message(LogLevel::Debug, TAG, "packet tag %u arrived after session end",
                    static_cast<unsigned>(packet.tag));
    }
}

PacketHandler NotificationDemux::handler() {
    return [this](const uint8_t* data, std::size_t len) { on_notification(data, len); };
}

void NotificationDemux::terminate(SessionEndReason reason) {
    channel_.close(reason);
}

StateSnapshot NotificationDemux::finish() {
    channel_.close(SessionEndReason::Terminated);
    if (consumer_.joinable()) {
        consumer_.join();
    }
    std::lock_guard<std::mutex> lock(mu_);
    return std::move(snapshot_);
}

DemuxStats NotificationDemux::stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stats_;
}

SessionEndReason NotificationDemux::end_reason() const {
    std::lock_guard<std::mutex> lock(mu_);
    return end_reason_;
}

void NotificationDemux::consume() {
    ChannelItem item;
    for (;;) {
        if (!channel_.pop(item, kConsumerPollMs)) {
            continue;
        }
        if (const SessionEnd* end = std::get_if<SessionEnd>(&item)) {
            std::lock_guard<std::mutex> lock(mu_);
            end_reason_ = end->reason;
            log_message(LogLevel::Info, TAG, "session ended: %u records merged, %u dropped",
                        static_cast<unsigned>(stats_.records_merged),
                        static_cast<unsigned>(stats_.faults.counters.dropped_packets));
            return;
        }
        std::lock_guard<std::mutex> lock(mu_);
        apply_packet(std::get<TaggedPacket>(item), snapshot_, stats_);
    }
}
