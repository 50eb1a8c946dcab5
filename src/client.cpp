#include "client.hpp"
#include "codec_registry.hpp"
#include "crypto.hpp"
#include "demux.hpp"
#include "handshake.hpp"
#include "logging.hpp"
#include "session_guard.hpp"
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace {
constexpr const char* TAG = "CLIENT";

GatherResult gather_failure(ChlorError err, ChlorError cause) {
    GatherResult res{};
    res.ok = false;
    res.error = err;
    res.cause = cause;
    res.end_reason = SessionEndReason::Terminated;
    return res;
}

ActionResult action_failure(ChlorError err, ChlorError cause) {
    return {false, err, cause};
}

bool config_usable(const ClientConfig& cfg) {
    const char* reason = nullptr;
    if (!validate_config(cfg, &reason)) {
        log_message(LogLevel::Error, TAG, "invalid config: %s", reason);
        return false;
    }
    return true;
}

ChlorError open_connection(BleTransport& transport, const ClientConfig& cfg, std::unique_ptr<BleConnection>& conn) {
    TransportResult tr = transport.connect(cfg.device_id, cfg.connect_timeout_ms, conn);
    if (!tr.ok || !conn) {
        log_message(LogLevel::Warn, TAG, "connect to %s failed: %s", cfg.device_id.c_str(), error_name(tr.error));
        return ChlorError::ConnectionError;
    }
    return ChlorError::None;
}

// Wipes the key and drops the link on every exit path.
struct SessionScope {
    SessionKey& key;
    std::unique_ptr<BleConnection>& conn;

    ~SessionScope() {
        wipe_session_key(key);
        if (conn && conn->is_connected()) {
            conn->disconnect();
        }
    }
};

void wait_for_disconnect(const BleConnection& conn, const ClientConfig& cfg, NotificationDemux& demux) {
    const auto start = std::chrono::steady_clock::now();
    const auto window = std::chrono::milliseconds(cfg.notify_window_ms);
    while (conn.is_connected()) {
        if (std::chrono::steady_clock::now() - start >= window) {
            log_message(LogLevel::Debug, TAG, "device did not disconnect within %u ms",
                        static_cast<unsigned>(cfg.notify_window_ms));
            demux.terminate(SessionEndReason::WindowElapsed);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.disconnect_poll_ms));
    }
    demux.terminate(SessionEndReason::Disconnected);
}

ActionResult write_encrypted(BleConnection& conn, Characteristic target, const SessionKey& key,
                             const uint8_t* data, std::size_t len) {
    CipherResult enc = encrypt_payload(data, len, key);
    if (!enc.ok) {
        return action_failure(enc.error, enc.error);
    }
    TransportResult tr = conn.write(target, enc.bytes);
    if (!tr.ok) {
        log_message(LogLevel::Warn, TAG, "write to %s failed: %s",
                    characteristic_name(target), error_name(tr.error));
        return action_failure(tr.error, tr.error);
    }
    return {true, ChlorError::None, ChlorError::None};
}
} // namespace

GatherResult gather_chlorinator_state(BleTransport& transport, const ClientConfig& cfg) {
    if (!config_usable(cfg)) {
        return gather_failure(ChlorError::ConnectionError, ChlorError::None);
    }
    DeviceSessionLock guard(cfg.device_id, cfg);
    if (!guard.held()) {
        return gather_failure(guard.error(), ChlorError::None);
    }

    std::unique_ptr<BleConnection> conn;
    const ChlorError conn_err = open_connection(transport, cfg, conn);
    if (conn_err != ChlorError::None) {
        return gather_failure(conn_err, ChlorError::None);
    }
    SessionKey key{};
    SessionScope scope{key, conn};

    HandshakeResult hs = perform_poll_handshake(*conn, cfg.access_code, key);
    if (!hs.ok) {
        return gather_failure(hs.error, hs.cause);
    }

    GatherResult res{};
    res.end_reason = SessionEndReason::Terminated;
    std::vector<uint8_t> raw;
    for (Characteristic c : polled_characteristics()) {
        TransportResult tr = conn->read(c, raw);
        if (!tr.ok) {
            log_message(LogLevel::Warn, TAG, "read %s failed: %s", characteristic_name(c), error_name(tr.error));
            return gather_failure(tr.error, tr.error);
        }
        CipherResult plain = decrypt_payload(raw, key);
        if (!plain.ok) {
            record_fault(res.faults, plain.error, characteristic_name(c));
            log_message(LogLevel::Warn, TAG, "%s: %s", characteristic_name(c), error_name(plain.error));
            continue;
        }
        const CharacteristicCodec* codec = find_characteristic_codec(c);
        if (!codec) {
            note_dropped_packet(res.faults);
            continue;
        }
        CodecResult decoded = decode_and_merge(*codec, plain.bytes.data(), plain.bytes.size(), res.snapshot);
        wipe_bytes(plain.bytes);
        if (!decoded.ok) {
            record_fault(res.faults, decoded.error, codec->name);
            log_message(LogLevel::Warn, TAG, "%s: %s (%s)", codec->name, error_name(decoded.error),
                        decoded.field ? decoded.field : "-");
            continue;
        }
        res.records_merged++;
    }

    res.ok = true;
    res.error = ChlorError::None;
    res.cause = ChlorError::None;
    log_message(LogLevel::Info, TAG, "%s: %u records, %zu fields", cfg.device_id.c_str(),
                static_cast<unsigned>(res.records_merged), res.snapshot.size());
    return res;
}

ActionResult write_chlorinator_action(BleTransport& transport, const ClientConfig& cfg,
                                      EquilibriumAction action, int32_t minutes) {
    if (!config_usable(cfg)) {
        return action_failure(ChlorError::ConnectionError, ChlorError::None);
    }
    DeviceSessionLock guard(cfg.device_id, cfg);
    if (!guard.held()) {
        return action_failure(guard.error(), ChlorError::None);
    }

    std::unique_ptr<BleConnection> conn;
    const ChlorError conn_err = open_connection(transport, cfg, conn);
    if (conn_err != ChlorError::None) {
        return action_failure(conn_err, ChlorError::None);
    }
    SessionKey key{};
    SessionScope scope{key, conn};

    HandshakeResult hs = perform_poll_handshake(*conn, cfg.access_code, key);
    if (!hs.ok) {
        return action_failure(hs.error, hs.cause);
    }

    const ActionFrame frame = encode_equilibrium_action(action, minutes);
    log_message(LogLevel::Info, TAG, "%s: action %s", cfg.device_id.c_str(), to_string(action));
    return write_encrypted(*conn, Characteristic::EqAppAction, key, frame.bytes.data(), frame.len);
}

GatherResult gather_halo_state(BleTransport& transport, const ClientConfig& cfg) {
    if (!config_usable(cfg)) {
        return gather_failure(ChlorError::ConnectionError, ChlorError::None);
    }
    DeviceSessionLock guard(cfg.device_id, cfg);
    if (!guard.held()) {
        return gather_failure(guard.error(), ChlorError::None);
    }

    std::unique_ptr<BleConnection> conn;
    const ChlorError conn_err = open_connection(transport, cfg, conn);
    if (conn_err != ChlorError::None) {
        return gather_failure(conn_err, ChlorError::None);
    }
    SessionKey key{};
    SessionScope scope{key, conn};

    NotificationDemux demux(key, cfg.channel_high_water);
    demux.start();

    SubscriptionId subscription = 0;
    HandshakeResult hs = perform_notify_handshake(*conn, cfg.access_code, key, demux.handler(), subscription);
    if (!hs.ok) {
        demux.finish();
        return gather_failure(hs.error, hs.cause);
    }

    for (const HaloRequest& request : kHaloCatchAllRequests) {
        TransportResult tr = send_read_request(*conn, key, request);
        if (!tr.ok) {
            log_message(LogLevel::Warn, TAG, "request %u failed: %s",
                        static_cast<unsigned>(request.command), error_name(tr.error));
            conn->unsubscribe(subscription);
            demux.finish();
            return gather_failure(tr.error, tr.error);
        }
    }

    wait_for_disconnect(*conn, cfg, demux);
    conn->unsubscribe(subscription);

    GatherResult res{};
    res.snapshot = demux.finish();
    const DemuxStats stats = demux.stats();
    res.ok = true;
    res.error = ChlorError::None;
    res.cause = ChlorError::None;
    res.faults = stats.faults;
    res.records_merged = stats.records_merged;
    res.end_reason = demux.end_reason();
    log_message(LogLevel::Info, TAG, "%s: %u packets, %u records, %zu fields", cfg.device_id.c_str(),
                static_cast<unsigned>(stats.packets_received), static_cast<unsigned>(stats.records_merged),
                res.snapshot.size());
    return res;
}

ActionResult write_halo_action(BleTransport& transport, const ClientConfig& cfg, const ActionFrame& frame) {
    if (frame.family == ActionFamily::Equilibrium || frame.len != kActionFrameLen) {
        log_message(LogLevel::Error, TAG, "%s frame cannot be sent to a Halo unit",
                    action_family_name(frame.family));
        return action_failure(ChlorError::InvalidPayloadLength, ChlorError::None);
    }
    if (!config_usable(cfg)) {
        return action_failure(ChlorError::ConnectionError, ChlorError::None);
    }
    DeviceSessionLock guard(cfg.device_id, cfg);
    if (!guard.held()) {
        return action_failure(guard.error(), ChlorError::None);
    }

    std::unique_ptr<BleConnection> conn;
    const ChlorError conn_err = open_connection(transport, cfg, conn);
    if (conn_err != ChlorError::None) {
        return action_failure(conn_err, ChlorError::None);
    }
    SessionKey key{};
    SessionScope scope{key, conn};

    HandshakeResult hs = authenticate(*conn, Characteristic::HaloSessionKey, Characteristic::HaloAuthentication,
                                      cfg.access_code, key);
    if (!hs.ok) {
        return action_failure(hs.error, hs.cause);
    }
    log_message(LogLevel::Info, TAG, "%s: %s action tag %u", cfg.device_id.c_str(), action_family_name(frame.family),
                static_cast<unsigned>(frame.bytes[kActionHeaderLen]));
    return write_encrypted(*conn, Characteristic::HaloRx, key, frame.bytes.data(), frame.len);
}

GatherResult gather_state(BleTransport& transport, const ClientConfig& cfg) {
    log_message(LogLevel::Debug, TAG, "%s: %s gather", cfg.device_id.c_str(), family_name(cfg.family));
    if (cfg.family == DeviceFamily::Halo) {
        return gather_halo_state(transport, cfg);
    }
    return gather_chlorinator_state(transport, cfg);
}
