#include "crypto.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

static std::vector<uint8_t> from_hex(const std::string& hex) {
    std::vector<uint8_t> out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

static SessionKey key_from_hex(const std::string& hex) {
    const std::vector<uint8_t> raw = from_hex(hex);
    SessionKey key{};
    bool ok = make_session_key(raw.data(), raw.size(), key);
    (void)ok;
    assert(ok);
    return key;
}

int main() {
    // Shared secret is the FIPS-197 example key, so an empty access code reduces the
    // token to the SP 800-38A AES-128 ECB vector.
    {
        const SessionKey key = key_from_hex("6bc1bee22e409f96e93d7e117393172a");
        CipherResult token = derive_auth_token(key, "");
        assert(token.ok);
        assert(token.bytes == from_hex("3ad77bb40d7a3660a89ecaf32466ef97"));
    }

    const SessionKey key = key_from_hex("000102030405060708090a0b0c0d0e0f");

    {
        CipherResult token = derive_auth_token(key, "1234");
        assert(token.ok);
        assert(token.bytes.size() == kCipherBlockLen);
        assert(token.bytes == from_hex("b94f6c239b404d503de47b86b574546a"));
    }

    // Access codes longer than the key only contribute their first block.
    {
        CipherResult a = derive_auth_token(key, "12345678901234567890");
        CipherResult b = derive_auth_token(key, "1234567890123456");
        assert(a.ok && b.ok);
        assert(a.bytes == b.bytes);
    }

    {
        std::vector<uint8_t> plain(20, 0);
        plain[0] = 0x02;
        CipherResult enc = encrypt_payload(plain, key);
        assert(enc.ok);
        assert(enc.bytes == from_hex("83c8737e381cbd25159e2babaa26dc4b9bfb71f8"));
        // The first four bytes only pass through the first AES block.
        assert(enc.bytes[0] == 0x83 && enc.bytes[3] == 0x7e);

        CipherResult dec = decrypt_payload(enc.bytes, key);
        assert(dec.ok);
        assert(dec.bytes == plain);
    }

    {
        SessionKey invalid{};
        CipherResult token = derive_auth_token(invalid, "1234");
        assert(!token.ok);
        assert(token.error == ChlorError::HandshakeFailed);
    }
    return 0;
}
