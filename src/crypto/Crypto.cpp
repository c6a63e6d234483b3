#include "Crypto.h"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <utility>

#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

namespace clouddrop {
namespace crypto {
namespace {

inline void EnsureOpenSslInitialized() {
    static const int kInitOnce = []() -> int {
        OPENSSL_init_crypto(0, nullptr);
        return 1;
    }();
    (void)kInitOnce;
}

std::string GetOpenSslErrorString() {
    std::string out;
    for (;;) {
        unsigned long err = ERR_get_error();
        if (err == 0) break;
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) out += " | ";
        out += buf;
    }
    return out.empty() ? std::string("unknown OpenSSL error") : out;
}

[[noreturn]] void ThrowOpenSslError(const char* where) {
    throw std::runtime_error(std::string(where) + ": " + GetOpenSslErrorString());
}

inline void CheckSizeFitsInt(std::size_t n, const char* what) {
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large for OpenSSL int length");
    }
}

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtxPtr new_gcm_ctx(const Key& key, const Nonce& nonce, int enc) {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) ThrowOpenSslError("EVP_CIPHER_CTX_new");
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1) {
        ThrowOpenSslError("EVP_CipherInit_ex(aes_256_gcm)");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kGcmNonceSize), nullptr) != 1) {
        ThrowOpenSslError("EVP_CTRL_GCM_SET_IVLEN");
    }
    if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1) {
        ThrowOpenSslError("EVP_CipherInit_ex(key, nonce)");
    }
    return ctx;
}

EVP_PKEY* p256_keypair_new() {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!pctx) ThrowOpenSslError("EVP_PKEY_CTX_new_id");
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> guard(pctx, EVP_PKEY_CTX_free);

    if (EVP_PKEY_keygen_init(pctx) != 1) ThrowOpenSslError("EVP_PKEY_keygen_init");
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) != 1) {
        ThrowOpenSslError("EVP_PKEY_CTX_set_ec_paramgen_curve_nid(P-256)");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(pctx, &pkey) != 1 || !pkey) {
        ThrowOpenSslError("EVP_PKEY_keygen");
    }
    return pkey;
}

EVP_PKEY* p256_from_spki(const std::vector<Byte>& der) {
    if (der.empty()) throw std::invalid_argument("empty public key");
    CheckSizeFitsInt(der.size(), "public key");

    const unsigned char* p = der.data();
    EVP_PKEY* pkey = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
    if (!pkey) {
        ERR_clear_error();
        throw std::invalid_argument("not a DER SubjectPublicKeyInfo");
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> guard(pkey, EVP_PKEY_free);
    if (p != der.data() + der.size()) {
        throw std::invalid_argument("trailing bytes after public key");
    }
    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_EC) {
        throw std::invalid_argument("public key is not an EC key");
    }
    const EC_KEY* ec = EVP_PKEY_get0_EC_KEY(pkey);
    const EC_GROUP* group = ec ? EC_KEY_get0_group(ec) : nullptr;
    if (!group || EC_GROUP_get_curve_name(group) != NID_X9_62_prime256v1) {
        throw std::invalid_argument("public key is not on P-256");
    }
    return guard.release();
}

} // namespace

// ---------------- AesGcm ----------------

std::vector<Byte> AesGcm::Seal(const Byte* plaintext, std::size_t len, const Key& key, const Nonce& nonce) {
    EnsureOpenSslInitialized();
    CheckSizeFitsInt(len, "AES-GCM input size");
    auto ctx = new_gcm_ctx(key, nonce, 1);

    std::vector<Byte> out(len + kGcmTagSize);
    int out_len1 = 0;
    if (len > 0 && EVP_EncryptUpdate(ctx.get(), out.data(), &out_len1, plaintext, static_cast<int>(len)) != 1) {
        ThrowOpenSslError("EVP_EncryptUpdate(gcm)");
    }
    int out_len2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + out_len1, &out_len2) != 1) {
        ThrowOpenSslError("EVP_EncryptFinal_ex(gcm)");
    }
    const std::size_t body = static_cast<std::size_t>(out_len1 + out_len2);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize),
                            out.data() + body) != 1) {
        ThrowOpenSslError("EVP_CTRL_GCM_GET_TAG");
    }
    out.resize(body + kGcmTagSize);
    return out;
}

bool AesGcm::Open(const Byte* sealed, std::size_t len, const Key& key, const Nonce& nonce,
                  std::vector<Byte>& out) {
    if (len < kGcmTagSize) return false;
    EnsureOpenSslInitialized();
    CheckSizeFitsInt(len, "AES-GCM input size");
    auto ctx = new_gcm_ctx(key, nonce, 0);

    const std::size_t body = len - kGcmTagSize;
    std::vector<Byte> plain(body);
    int out_len1 = 0;
    if (body > 0 && EVP_DecryptUpdate(ctx.get(), plain.data(), &out_len1, sealed, static_cast<int>(body)) != 1) {
        ThrowOpenSslError("EVP_DecryptUpdate(gcm)");
    }
    Byte tag[kGcmTagSize];
    std::copy(sealed + body, sealed + len, tag);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagSize), tag) != 1) {
        ThrowOpenSslError("EVP_CTRL_GCM_SET_TAG");
    }
    int out_len2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + out_len1, &out_len2) != 1) {
        ERR_clear_error();
        return false;
    }
    plain.resize(static_cast<std::size_t>(out_len1 + out_len2));
    out = std::move(plain);
    return true;
}

// ---------------- EcdhKeyPair ----------------

void EcdhKeyPair::PkeyDeleter::operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); }

EcdhKeyPair::EcdhKeyPair() : key_pair_(nullptr) {
    EnsureOpenSslInitialized();
    key_pair_.reset(p256_keypair_new());
}

EcdhKeyPair::~EcdhKeyPair() = default;

EcdhKeyPair::EcdhKeyPair(EcdhKeyPair&& other) noexcept : key_pair_(std::move(other.key_pair_)) {}

EcdhKeyPair& EcdhKeyPair::operator=(EcdhKeyPair&& other) noexcept {
    if (this != &other) key_pair_ = std::move(other.key_pair_);
    return *this;
}

std::vector<Byte> EcdhKeyPair::public_key_spki() const {
    if (!key_pair_) throw std::runtime_error("ECDH keypair not initialized");
    int len = i2d_PUBKEY(key_pair_.get(), nullptr);
    if (len <= 0) ThrowOpenSslError("i2d_PUBKEY(size)");
    std::vector<Byte> out(static_cast<std::size_t>(len));
    unsigned char* p = out.data();
    if (i2d_PUBKEY(key_pair_.get(), &p) != len) ThrowOpenSslError("i2d_PUBKEY");
    return out;
}

std::vector<Byte> EcdhKeyPair::DeriveSharedSecret(const std::vector<Byte>& peer_spki) const {
    if (!key_pair_) throw std::runtime_error("ECDH keypair not initialized");

    EVP_PKEY* peer = p256_from_spki(peer_spki);
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> peer_guard(peer, EVP_PKEY_free);

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key_pair_.get(), nullptr);
    if (!ctx) ThrowOpenSslError("EVP_PKEY_CTX_new");
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx_guard(ctx, EVP_PKEY_CTX_free);

    if (EVP_PKEY_derive_init(ctx) != 1) ThrowOpenSslError("EVP_PKEY_derive_init");
    if (EVP_PKEY_derive_set_peer(ctx, peer) != 1) {
        ERR_clear_error();
        throw std::invalid_argument("peer key rejected for ECDH");
    }

    std::size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx, nullptr, &secret_len) != 1 || secret_len == 0) {
        ThrowOpenSslError("EVP_PKEY_derive(size)");
    }

    std::vector<Byte> secret(secret_len);
    if (EVP_PKEY_derive(ctx, secret.data(), &secret_len) != 1) {
        ThrowOpenSslError("EVP_PKEY_derive(data)");
    }
    secret.resize(secret_len);
    return secret;
}

// ---------------- helpers ----------------

Digest Sha256(const Byte* data, std::size_t len) {
    EnsureOpenSslInitialized();
    Digest out{};
    unsigned int out_len = 0;
    static const Byte kEmpty = 0;
    if (EVP_Digest(len > 0 ? data : &kEmpty, len, out.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
        out_len != kSha256Size) {
        ThrowOpenSslError("EVP_Digest(sha256)");
    }
    return out;
}

void RandomBytes(Byte* out, std::size_t len) {
    if (len == 0) return;
    EnsureOpenSslInitialized();
    CheckSizeFitsInt(len, "RAND_bytes length");
    if (RAND_bytes(out, static_cast<int>(len)) != 1) ThrowOpenSslError("RAND_bytes");
}

std::string RandomUuid() {
    std::array<Byte, 16> b{};
    RandomBytes(b.data(), b.size());
    b[6] = static_cast<Byte>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<Byte>((b[8] & 0x3F) | 0x80);

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                  b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf, 36);
}

} // namespace crypto
} // namespace clouddrop
