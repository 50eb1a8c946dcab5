#pragma once

#include "config.hpp"
#include "crypto.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// In-memory chlorinator for host tests. Issues a session key, checks the auth token,
// serves encrypted Equilibrium characteristics and answers Halo read requests with
// encrypted notifications on a separate thread.
class MockChlorinator {
public:
    MockChlorinator(DeviceFamily family, std::string access_code)
        : family_(family), access_code_(std::move(access_code)) {}

    DeviceFamily family() const { return family_; }

    // Equilibrium record plaintext; padded with zeros to a valid cipher length.
    void set_record(Characteristic c, std::vector<uint8_t> plaintext) {
        std::lock_guard<std::mutex> lock(mu_);
        records_[c] = std::move(plaintext);
    }

    // Halo record sent once all catch-all requests have arrived, in insertion order.
    void queue_notification(uint16_t tag, const std::vector<uint8_t>& data) {
        std::vector<uint8_t> plain(kHaloPacketLen, 0);
        plain[0] = 0x01;
        plain[kHaloTagOffset] = static_cast<uint8_t>(tag & 0xFF);
        plain[kHaloTagOffset + 1] = static_cast<uint8_t>(tag >> 8);
        std::copy_n(data.begin(), std::min(data.size(), kHaloDataLen), plain.begin() + kHaloDataOffset);
        std::lock_guard<std::mutex> lock(mu_);
        notifications_.push_back({true, std::move(plain)});
    }

    // Sent without encryption, to model a garbled packet.
    void queue_raw_notification(std::vector<uint8_t> bytes) {
        std::lock_guard<std::mutex> lock(mu_);
        notifications_.push_back({false, std::move(bytes)});
    }

    void set_hang_up_after_notifications(bool hang_up) { hang_up_ = hang_up; }
    void set_refuse_connections(bool refuse) { refuse_connections_ = refuse; }
    void set_connect_delay_ms(uint32_t ms) { connect_delay_ms_ = ms; }
    void set_session_key_len(std::size_t len) { session_key_len_ = len; }

    void fail_read(Characteristic c) {
        std::lock_guard<std::mutex> lock(mu_);
        failing_reads_.insert(c);
    }

    void fail_write(Characteristic c) {
        std::lock_guard<std::mutex> lock(mu_);
        failing_writes_.insert(c);
    }

    // Observations.
    std::vector<Characteristic> reads() const {
        std::lock_guard<std::mutex> lock(mu_);
        return reads_;
    }

    std::vector<Characteristic> writes() const {
        std::lock_guard<std::mutex> lock(mu_);
        return writes_;
    }

    std::vector<uint16_t> requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

    std::vector<uint8_t> last_action() const {
        std::lock_guard<std::mutex> lock(mu_);
        return last_action_;
    }

    bool authenticated() const { return authenticated_; }
    uint32_t connections() const { return connections_; }
    uint32_t max_concurrent() const { return max_concurrent_; }
    uint32_t active_sessions() const { return active_; }
    uint32_t subscribe_count() const { return subscribe_count_; }

private:
    friend class MockBleConnection;
    friend class MockBleTransport;

    struct Notification {
        bool encrypt;
        std::vector<uint8_t> bytes;
    };

    std::vector<uint8_t> next_session_key() {
        const uint32_t seed = ++key_seed_;
        std::vector<uint8_t> key(session_key_len_);
        for (std::size_t i = 0; i < key.size(); ++i) {
            key[i] = static_cast<uint8_t>(seed * 31 + i * 7);
        }
        return key;
    }

    void open() {
        const uint32_t now = ++active_;
        connections_++;
        uint32_t prev = max_concurrent_;
        while (now > prev && !max_concurrent_.compare_exchange_weak(prev, now)) {
        }
    }

    void close() { active_--; }

    const DeviceFamily family_;
    const std::string access_code_;
    mutable std::mutex mu_;
    std::map<Characteristic, std::vector<uint8_t>> records_;
    std::vector<Notification> notifications_;
    std::set<Characteristic> failing_reads_;
    std::set<Characteristic> failing_writes_;
    std::vector<Characteristic> reads_;
    std::vector<Characteristic> writes_;
    std::vector<uint16_t> requests_;
    std::vector<uint8_t> last_action_;
    std::atomic<bool> hang_up_{true};
    std::atomic<bool> refuse_connections_{false};
    std::atomic<uint32_t> connect_delay_ms_{0};
    std::size_t session_key_len_ = kSessionKeyLen;
    std::atomic<bool> authenticated_{false};
    std::atomic<uint32_t> key_seed_{0};
    std::atomic<uint32_t> active_{0};
    std::atomic<uint32_t> connections_{0};
    std::atomic<uint32_t> max_concurrent_{0};
    std::atomic<uint32_t> subscribe_count_{0};
};

class MockBleConnection : public BleConnection {
public:
    using BleConnection::write;

    explicit MockBleConnection(MockChlorinator& device) : device_(device) { device_.open(); }

    ~MockBleConnection() override {
        disconnect();
        if (delivery_.joinable()) {
            delivery_.join();
        }
    }

    TransportResult read(Characteristic c, std::vector<uint8_t>& out) override {
        out.clear();
        if (!connected_) {
            return transport_error(ChlorError::CharacteristicIOError);
        }
        std::vector<uint8_t> plain;
        {
            std::lock_guard<std::mutex> lock(device_.mu_);
            device_.reads_.push_back(c);
            if (device_.failing_reads_.count(c)) {
                return transport_error(ChlorError::CharacteristicIOError);
            }
            if (c == Characteristic::EqSessionKey || c == Characteristic::HaloSessionKey) {
                session_key_raw_ = device_.next_session_key();
                out = session_key_raw_;
                make_session_key(session_key_raw_.data(), session_key_raw_.size(), key_);
                return transport_ok();
            }
            auto it = device_.records_.find(c);
            if (it != device_.records_.end()) {
                plain = it->second;
            }
        }
        if (!authenticated_) {
            return transport_error(ChlorError::CharacteristicIOError);
        }
        std::size_t len = kMinCipherPayloadLen;
        while (len < plain.size()) {
            len += kCipherBlockLen;
        }
        plain.resize(len, 0);
        CipherResult enc = encrypt_payload(plain, key_);
        if (!enc.ok) {
            return transport_error(ChlorError::CharacteristicIOError);
        }
        out = std::move(enc.bytes);
        return transport_ok();
    }

    TransportResult write(Characteristic c, const uint8_t* data, std::size_t len) override {
        if (!connected_) {
            return transport_error(ChlorError::CharacteristicIOError);
        }
        {
            std::lock_guard<std::mutex> lock(device_.mu_);
            device_.writes_.push_back(c);
            if (device_.failing_writes_.count(c)) {
                return transport_error(ChlorError::CharacteristicIOError);
            }
        }
        if (c == Characteristic::EqAuthentication || c == Characteristic::HaloAuthentication) {
            return check_token(data, len);
        }
        if (!authenticated_) {
            return transport_error(ChlorError::CharacteristicIOError);
        }
        CipherResult plain = decrypt_payload(data, len, key_);
        if (!plain.ok) {
            return transport_error(ChlorError::CharacteristicIOError);
        }
        if (c == Characteristic::HaloRx && !plain.bytes.empty() && plain.bytes[0] == kHaloRequestType) {
            on_request(static_cast<uint16_t>(plain.bytes[1] | (plain.bytes[2] << 8)));
            return transport_ok();
        }
        std::lock_guard<std::mutex> lock(device_.mu_);
        device_.last_action_ = plain.bytes;
        return transport_ok();
    }

    TransportResult subscribe(Characteristic c, PacketHandler handler, SubscriptionId& out) override {
        if (!connected_ || c != Characteristic::HaloTx) {
            return transport_error(ChlorError::CharacteristicIOError);
        }
        std::lock_guard<std::mutex> lock(handler_mu_);
        handler_ = std::move(handler);
        out = ++next_subscription_;
        device_.subscribe_count_++;
        return transport_ok();
    }

    void unsubscribe(SubscriptionId id) override {
        std::lock_guard<std::mutex> lock(handler_mu_);
        if (id == next_subscription_) {
            handler_ = nullptr;
        }
    }

    bool is_connected() const override { return connected_; }

    void disconnect() override {
        if (connected_.exchange(false)) {
            device_.close();
        }
    }

private:
    TransportResult check_token(const uint8_t* data, std::size_t len) {
        CipherResult expected = derive_auth_token(key_, device_.access_code_);
        const bool match = expected.ok && len == expected.bytes.size() &&
                           std::equal(expected.bytes.begin(), expected.bytes.end(), data);
        authenticated_ = match;
        device_.authenticated_ = match;
        if (!match) {
            // The device drops unauthenticated links.
            disconnect();
            return transport_error(ChlorError::CharacteristicIOError);
        }
        return transport_ok();
    }

    void on_request(uint16_t command) {
        std::size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(device_.mu_);
            device_.requests_.push_back(command);
            count = ++requests_seen_;
        }
        if (count == kHaloCatchAllRequests.size() && !delivery_.joinable()) {
            delivery_ = std::thread(&MockBleConnection::deliver, this);
        }
    }

    void deliver() {
        std::vector<MockChlorinator::Notification> pending;
        {
            std::lock_guard<std::mutex> lock(device_.mu_);
            pending = device_.notifications_;
        }
        for (auto& n : pending) {
            std::vector<uint8_t> bytes = n.bytes;
            if (n.encrypt) {
                CipherResult enc = encrypt_payload(n.bytes, key_);
                if (!enc.ok) {
                    continue;
                }
                bytes = std::move(enc.bytes);
            }
            std::lock_guard<std::mutex> lock(handler_mu_);
            if (handler_) {
                handler_(bytes.data(), bytes.size());
            }
        }
        if (device_.hang_up_) {
            disconnect();
        }
    }

    MockChlorinator& device_;
    std::atomic<bool> connected_{true};
    std::atomic<bool> authenticated_{false};
    std::vector<uint8_t> session_key_raw_;
    SessionKey key_{};
    std::mutex handler_mu_;
    PacketHandler handler_;
    SubscriptionId next_subscription_ = 0;
    std::size_t requests_seen_ = 0;
    std::thread delivery_;
};

class MockBleTransport : public BleTransport {
public:
    explicit MockBleTransport(MockChlorinator& device) : device_(device) {}

    TransportResult connect(const std::string& device_id, uint32_t timeout_ms,
                            std::unique_ptr<BleConnection>& out) override {
        (void)timeout_ms;
        last_device_id_ = device_id;
        if (device_.refuse_connections_) {
            return transport_error(ChlorError::ConnectionError);
        }
        out.reset(new MockBleConnection(device_));
        const uint32_t delay = device_.connect_delay_ms_;
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        return transport_ok();
    }

    const std::string& last_device_id() const { return last_device_id_; }

private:
    MockChlorinator& device_;
    std::string last_device_id_;
};
