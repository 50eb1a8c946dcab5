#include "handshake.hpp"
#include "logging.hpp"
#include <utility>

namespace {
constexpr const char* TAG = "HANDSHAKE";

const Characteristic kKeepAliveReads[] = {
    Characteristic::EqState,
    Characteristic::EqSetup,
    Characteristic::EqTimers,
    Characteristic::EqSettings,
    Characteristic::EqLightState,
    Characteristic::EqLightSetup,
    Characteristic::EqLightTimers,
};

HandshakeResult handshake_ok() {
    return {true, ChlorError::None, ChlorError::None, nullptr};
}

HandshakeResult handshake_failed(ChlorError cause, const char* step) {
    log_message(LogLevel::Warn, TAG, "handshake failed at %s: %s", step, error_name(cause));
    return {false, ChlorError::HandshakeFailed, cause, step};
}
} // namespace

HandshakeResult authenticate(BleConnection& conn, Characteristic key_char, Characteristic auth_char,
                             const std::string& access_code, SessionKey& key) {
    key.valid = false;
    std::vector<uint8_t> raw_key;
    TransportResult tr = conn.read(key_char, raw_key);
    if (!tr.ok) {
        return handshake_failed(tr.error, "read_session_key");
    }
    const bool key_ok = make_session_key(raw_key.data(), raw_key.size(), key);
    wipe_bytes(raw_key);
    if (!key_ok) {
        return handshake_failed(ChlorError::InvalidPayloadLength, "read_session_key");
    }

    CipherResult token = derive_auth_token(key, access_code);
    if (!token.ok) {
        wipe_session_key(key);
        return handshake_failed(token.error, "derive_token");
    }
    tr = conn.write(auth_char, token.bytes);
    wipe_bytes(token.bytes);
    if (!tr.ok) {
        wipe_session_key(key);
        return handshake_failed(tr.error, "write_token");
    }
    log_message(LogLevel::Debug, TAG, "authenticated via %s", characteristic_name(auth_char));
    return handshake_ok();
}

HandshakeResult perform_poll_handshake(BleConnection& conn, const std::string& access_code, SessionKey& key) {
    HandshakeResult res = authenticate(conn, Characteristic::EqSessionKey, Characteristic::EqAuthentication,
                                       access_code, key);
    if (!res.ok) {
        return res;
    }
    std::vector<uint8_t> discard;
    for (Characteristic c : kKeepAliveReads) {
        TransportResult tr = conn.read(c, discard);
        if (!tr.ok) {
            wipe_session_key(key);
            return handshake_failed(tr.error, characteristic_name(c));
        }
    }
    return handshake_ok();
}

HandshakeResult perform_notify_handshake(BleConnection& conn, const std::string& access_code, SessionKey& key,
                                         PacketHandler handler, SubscriptionId& subscription) {
    HandshakeResult res = authenticate(conn, Characteristic::HaloSessionKey, Characteristic::HaloAuthentication,
                                       access_code, key);
    if (!res.ok) {
        return res;
    }
    TransportResult tr = conn.subscribe(Characteristic::HaloTx, std::move(handler), subscription);
    if (!tr.ok) {
        wipe_session_key(key);
        return handshake_failed(tr.error, "subscribe_tx");
    }
    log_message(LogLevel::Debug, TAG, "notifications enabled on %s", characteristic_name(Characteristic::HaloTx));
    return handshake_ok();
}

std::vector<uint8_t> build_read_request(const HaloRequest& request) {
    std::vector<uint8_t> packet(kHaloPacketLen, 0);
    packet[0] = kHaloRequestType;
    packet[kHaloTagOffset] = static_cast<uint8_t>(request.command & 0xFF);
    packet[kHaloTagOffset + 1] = static_cast<uint8_t>((request.command >> 8) & 0xFF);
    if (request.has_sub_param) {
        packet[kHaloDataOffset] = request.sub_param;
    }
    return packet;
}

TransportResult send_read_request(BleConnection& conn, const SessionKey& key, const HaloRequest& request) {
    CipherResult enc = encrypt_payload(build_read_request(request), key);
    if (!enc.ok) {
        return transport_error(enc.error);
    }
    log_message(LogLevel::Debug, TAG, "request command=%u", static_cast<unsigned>(request.command));
    return conn.write(Characteristic::HaloRx, enc.bytes);
}
