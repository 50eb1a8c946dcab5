#pragma once

#include "fault.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

constexpr std::size_t kSessionKeyLen = 16;
constexpr std::size_t kCipherBlockLen = 16;
// Bytes left untouched by the second AES pass.
constexpr std::size_t kCipherHeadLen = 4;
constexpr std::size_t kMinCipherPayloadLen = kCipherHeadLen + kCipherBlockLen;

// Fixed AES-128 key shared by every device of the product family.
extern const std::array<uint8_t, kCipherBlockLen> kSharedSecret;

struct SessionKey {
    std::array<uint8_t, kSessionKeyLen> bytes;
    bool valid;
};

struct CipherResult {
    bool ok;
    ChlorError error;
    std::vector<uint8_t> bytes;
};

bool make_session_key(const uint8_t* data, std::size_t len, SessionKey& out);
void wipe_session_key(SessionKey& key);
void wipe_bytes(std::vector<uint8_t>& bytes);

// Left-aligned XOR; the shorter operand is zero padded to the longer length.
std::vector<uint8_t> xor_align(const uint8_t* a, std::size_t a_len, const uint8_t* b, std::size_t b_len);
std::vector<uint8_t> xor_align(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

// Payloads must be 4 + 16k bytes long (k >= 1) for both AES passes to be block aligned.
bool payload_length_valid(std::size_t len);

// E(shared, xor_align(key, code)) with the XOR result fixed to one block.
CipherResult derive_auth_token(const SessionKey& key, const std::string& access_code);

// xor with key, encrypt [0,16), then encrypt [4,len).
CipherResult encrypt_payload(const uint8_t* plaintext, std::size_t len, const SessionKey& key);
CipherResult encrypt_payload(const std::vector<uint8_t>& plaintext, const SessionKey& key);

// Inverse of encrypt_payload: decrypt [4,len), decrypt [0,16), xor with key.
CipherResult decrypt_payload(const uint8_t* ciphertext, std::size_t len, const SessionKey& key);
CipherResult decrypt_payload(const std::vector<uint8_t>& ciphertext, const SessionKey& key);
