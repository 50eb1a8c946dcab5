#pragma once

#include "crypto.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include <string>
#include <vector>

struct HandshakeResult {
    bool ok;
    ChlorError error;  // HandshakeFailed on any failure
    ChlorError cause;  // underlying transport or cipher error
    const char* step;
};

// Read the session key, derive the token and write it. `key` is valid only on success.
HandshakeResult authenticate(BleConnection& conn, Characteristic key_char, Characteristic auth_char,
                             const std::string& access_code, SessionKey& key);

// Equilibrium: authenticate, then the keep-alive reads the device expects before it
// accepts further traffic. Their contents are discarded.
HandshakeResult perform_poll_handshake(BleConnection& conn, const std::string& access_code, SessionKey& key);

// Halo: authenticate, then subscribe `handler` to TX before any request is sent.
HandshakeResult perform_notify_handshake(BleConnection& conn, const std::string& access_code, SessionKey& key,
                                         PacketHandler handler, SubscriptionId& subscription);

// Plaintext request: type, command LE, optional sub-parameter, zero padded to one packet.
std::vector<uint8_t> build_read_request(const HaloRequest& request);

// Encrypt a request and write it to RX.
TransportResult send_read_request(BleConnection& conn, const SessionKey& key, const HaloRequest& request);
