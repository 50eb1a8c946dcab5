#include "crypto.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>

const std::array<uint8_t, kCipherBlockLen> kSharedSecret{{
    0x2b, 0x7e, 0x15, 0x16, 0x28, 0xae, 0xd2, 0xa6,
    0xab, 0xf7, 0x15, 0x88, 0x09, 0xcf, 0x4f, 0x3c,
}};

namespace {
constexpr const char* TAG = "CIPHER";

struct EvpCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCtxDeleter>;

// In-place AES-128-ECB over whole blocks, padding disabled.
bool aes_ecb_inplace(uint8_t* data, std::size_t len, bool encrypt) {
    if (len == 0 || len % kCipherBlockLen != 0) {
        return false;
    }
    EvpCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        log_message(LogLevel::Error, TAG, "EVP_CIPHER_CTX_new failed");
        return false;
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, kSharedSecret.data(), nullptr, encrypt ? 1 : 0) != 1) {
        log_message(LogLevel::Error, TAG, "EVP_CipherInit_ex failed");
        return false;
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::vector<uint8_t> out(len + kCipherBlockLen);
    int out_len = 0;
    if (EVP_CipherUpdate(ctx.get(), out.data(), &out_len, data, static_cast<int>(len)) != 1) {
        log_message(LogLevel::Error, TAG, "EVP_CipherUpdate failed");
        return false;
    }
    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.data() + out_len, &final_len) != 1) {
        log_message(LogLevel::Error, TAG, "EVP_CipherFinal_ex failed");
        return false;
    }
    if (static_cast<std::size_t>(out_len + final_len) != len) {
        return false;
    }
    std::memcpy(data, out.data(), len);
    OPENSSL_cleanse(out.data(), out.size());
    return true;
}

CipherResult fail(ChlorError err) {
    return {false, err, {}};
}
} // namespace

bool make_session_key(const uint8_t* data, std::size_t len, SessionKey& out) {
    out.bytes.fill(0);
    out.valid = false;
    if (!data || len != kSessionKeyLen) {
        return false;
    }
    std::memcpy(out.bytes.data(), data, kSessionKeyLen);
    out.valid = true;
    return true;
}

void wipe_session_key(SessionKey& key) {
    OPENSSL_cleanse(key.bytes.data(), key.bytes.size());
    key.valid = false;
}

void wipe_bytes(std::vector<uint8_t>& bytes) {
    if (!bytes.empty()) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
    }
    bytes.clear();
}

std::vector<uint8_t> xor_align(const uint8_t* a, std::size_t a_len, const uint8_t* b, std::size_t b_len) {
    std::vector<uint8_t> out(std::max(a_len, b_len), 0);
    for (std::size_t i = 0; i < out.size(); ++i) {
        const uint8_t x = i < a_len ? a[i] : 0;
        const uint8_t y = i < b_len ? b[i] : 0;
        out[i] = static_cast<uint8_t>(x ^ y);
    }
    return out;
}

std::vector<uint8_t> xor_align(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    return xor_align(a.data(), a.size(), b.data(), b.size());
}

bool payload_length_valid(std::size_t len) {
    return len >= kMinCipherPayloadLen && (len - kCipherHeadLen) % kCipherBlockLen == 0;
}

CipherResult derive_auth_token(const SessionKey& key, const std::string& access_code) {
    if (!key.valid) {
        return fail(ChlorError::HandshakeFailed);
    }
    std::vector<uint8_t> block = xor_align(key.bytes.data(), key.bytes.size(),
                                           reinterpret_cast<const uint8_t*>(access_code.data()),
                                           access_code.size());
    block.resize(kCipherBlockLen, 0);
    if (!aes_ecb_inplace(block.data(), block.size(), true)) {
        wipe_bytes(block);
        return fail(ChlorError::CipherFailure);
    }
    return {true, ChlorError::None, std::move(block)};
}

CipherResult encrypt_payload(const uint8_t* plaintext, std::size_t len, const SessionKey& key) {
    if (!plaintext || !payload_length_valid(len)) {
        return fail(ChlorError::InvalidPayloadLength);
    }
    if (!key.valid) {
        return fail(ChlorError::CipherFailure);
    }
    std::vector<uint8_t> buf = xor_align(plaintext, len, key.bytes.data(), key.bytes.size());
    if (!aes_ecb_inplace(buf.data(), kCipherBlockLen, true) ||
        !aes_ecb_inplace(buf.data() + kCipherHeadLen, buf.size() - kCipherHeadLen, true)) {
        wipe_bytes(buf);
        return fail(ChlorError::CipherFailure);
    }
    return {true, ChlorError::None, std::move(buf)};
}

CipherResult encrypt_payload(const std::vector<uint8_t>& plaintext, const SessionKey& key) {
    return encrypt_payload(plaintext.data(), plaintext.size(), key);
}

CipherResult decrypt_payload(const uint8_t* ciphertext, std::size_t len, const SessionKey& key) {
    if (!ciphertext || !payload_length_valid(len)) {
        return fail(ChlorError::InvalidPayloadLength);
    }
    if (!key.valid) {
        return fail(ChlorError::CipherFailure);
    }
    std::vector<uint8_t> buf(ciphertext, ciphertext + len);
    if (!aes_ecb_inplace(buf.data() + kCipherHeadLen, buf.size() - kCipherHeadLen, false) ||
        !aes_ecb_inplace(buf.data(), kCipherBlockLen, false)) {
        wipe_bytes(buf);
        return fail(ChlorError::CipherFailure);
    }
    std::vector<uint8_t> plain = xor_align(buf.data(), buf.size(), key.bytes.data(), key.bytes.size());
    wipe_bytes(buf);
    return {true, ChlorError::None, std::move(plain)};
}

CipherResult decrypt_payload(const std::vector<uint8_t>& ciphertext, const SessionKey& key) {
    return decrypt_payload(ciphertext.data(), ciphertext.size(), key);
}
