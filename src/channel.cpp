#include "channel.hpp"
#include <chrono>

PacketChannel::PacketChannel(std::size_t high_water) : high_water_(high_water == 0 ? 1 : high_water) {}

bool PacketChannel::push(const TaggedPacket& packet) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!closed_ && packets_.size() >= high_water_) {
        backpressure_waits_++;
        not_full_.wait(lock, [this] { return closed_ || packets_.size() < high_water_; });
    }
    if (closed_) {
        return false;
    }
    packets_.push_back(packet);
    not_empty_.notify_one();
    return true;
}

void PacketChannel::close(SessionEndReason reason) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (closed_) {
            return;
        }
        closed_ = true;
        end_reason_ = reason;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool PacketChannel::pop(ChannelItem& out, uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mu_);
    const bool ready = not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                           [this] { return closed_ || !packets_.empty(); });
    if (!ready) {
        return false;
    }
    if (!packets_.empty()) {
        out = packets_.front();
        packets_.pop_front();
        not_full_.notify_one();
        return true;
    }
    out = SessionEnd{end_reason_};
    return true;
}

bool PacketChannel::closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
}

std::size_t PacketChannel::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return packets_.size();
}

uint32_t PacketChannel::backpressure_waits() const {
    std::lock_guard<std::mutex> lock(mu_);
    return backpressure_waits_;
}
