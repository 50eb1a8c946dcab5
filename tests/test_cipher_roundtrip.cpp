#include "crypto.hpp"

#include <cassert>
#include <cstdint>
#include <random>
#include <vector>

static SessionKey random_key(std::mt19937& rng) {
    std::uniform_int_distribution<int> byte(0, 255);
    uint8_t raw[kSessionKeyLen];
    for (auto& b : raw) {
        b = static_cast<uint8_t>(byte(rng));
    }
    SessionKey key{};
    bool ok = make_session_key(raw, sizeof(raw), key);
    (void)ok;
    assert(ok);
    return key;
}

static std::vector<uint8_t> random_bytes(std::mt19937& rng, std::size_t len) {
    std::uniform_int_distribution<int> byte(0, 255);
    std::vector<uint8_t> out(len);
    for (auto& b : out) {
        b = static_cast<uint8_t>(byte(rng));
    }
    return out;
}

int main() {
    std::mt19937 rng(42);

    for (int i = 0; i < 64; ++i) {
        const SessionKey key = random_key(rng);
        const std::size_t len = kMinCipherPayloadLen + kCipherBlockLen * static_cast<std::size_t>(i % 4);
        const std::vector<uint8_t> plain = random_bytes(rng, len);
        CipherResult enc = encrypt_payload(plain, key);
        assert(enc.ok);
        assert(enc.bytes.size() == plain.size());
        assert(enc.bytes != plain);
        CipherResult dec = decrypt_payload(enc.bytes, key);
        assert(dec.ok);
        assert(dec.bytes == plain);
    }

    // xor_align undoes itself when the second operand covers the first.
    for (int i = 0; i < 32; ++i) {
        const std::vector<uint8_t> a = random_bytes(rng, static_cast<std::size_t>(i % 17));
        const std::vector<uint8_t> b = random_bytes(rng, 16 + static_cast<std::size_t>(i % 5));
        std::vector<uint8_t> twice = xor_align(xor_align(a, b), b);
        assert(twice.size() == b.size());
        for (std::size_t j = 0; j < a.size(); ++j) {
            assert(twice[j] == a[j]);
        }
        for (std::size_t j = a.size(); j < twice.size(); ++j) {
            assert(twice[j] == 0);
        }
    }

    {
        const std::vector<uint8_t> shorter = {0x0F, 0xF0};
        const std::vector<uint8_t> longer = {0xFF, 0xFF, 0xAA};
        const std::vector<uint8_t> expected = {0xF0, 0x0F, 0xAA};
        assert(xor_align(shorter, longer) == expected);
        assert(xor_align(longer, shorter) == expected);
    }

    const SessionKey key = random_key(rng);
    for (std::size_t len : {0u, 4u, 16u, 19u, 21u, 32u, 35u, 37u}) {
        const std::vector<uint8_t> buf(len, 0x5A);
        assert(!payload_length_valid(len));
        CipherResult enc = encrypt_payload(buf, key);
        assert(!enc.ok);
        assert(enc.error == ChlorError::InvalidPayloadLength);
        CipherResult dec = decrypt_payload(buf, key);
        assert(!dec.ok);
        assert(dec.error == ChlorError::InvalidPayloadLength);
    }
    assert(payload_length_valid(20));
    assert(payload_length_valid(36));

    {
        SessionKey short_key{};
        const uint8_t raw[8] = {1, 2, 3, 4, 5, 6, 7, 8};
        assert(!make_session_key(raw, sizeof(raw), short_key));
        assert(!short_key.valid);
        const std::vector<uint8_t> buf(20, 1);
        CipherResult enc = encrypt_payload(buf, short_key);
        assert(!enc.ok);
        assert(enc.error == ChlorError::CipherFailure);
    }

    {
        SessionKey wiped = random_key(rng);
        wipe_session_key(wiped);
        assert(!wiped.valid);
        for (uint8_t b : wiped.bytes) {
            assert(b == 0);
        }
    }
    return 0;
}
