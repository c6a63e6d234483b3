#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace clouddrop {
namespace crypto {

using Byte = unsigned char;
static constexpr std::size_t kAesKeySize = 32;   // AES-256
static constexpr std::size_t kGcmNonceSize = 12;
static constexpr std::size_t kGcmTagSize = 16;
static constexpr std::size_t kSha256Size = 32;

using Key = std::array<Byte, kAesKeySize>;
using Nonce = std::array<Byte, kGcmNonceSize>;
using Digest = std::array<Byte, kSha256Size>;

class AesGcm final {
public:
    // Returns ciphertext || tag.
    static std::vector<Byte> Seal(const Byte* plaintext, std::size_t len, const Key& key, const Nonce& nonce);
    // Input is ciphertext || tag. Returns false when the tag does not verify.
    static bool Open(const Byte* sealed, std::size_t len, const Key& key, const Nonce& nonce,
                     std::vector<Byte>& out);
};

// ECDH key pair on NIST P-256 (prime256v1).
class EcdhKeyPair final {
public:
    EcdhKeyPair();
    ~EcdhKeyPair();

    EcdhKeyPair(const EcdhKeyPair&) = delete;
    EcdhKeyPair& operator=(const EcdhKeyPair&) = delete;

    EcdhKeyPair(EcdhKeyPair&&) noexcept;
    EcdhKeyPair& operator=(EcdhKeyPair&&) noexcept;

    // DER SubjectPublicKeyInfo, the format browsers export as "spki".
    std::vector<Byte> public_key_spki() const;

    // Raw ECDH output (the x coordinate, 32 bytes). Throws std::invalid_argument
    // when the peer key is not a well-formed P-256 SubjectPublicKeyInfo.
    std::vector<Byte> DeriveSharedSecret(const std::vector<Byte>& peer_spki) const;

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* p) const noexcept;
    };
    using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

    PkeyPtr key_pair_;
};

Digest Sha256(const Byte* data, std::size_t len);

void RandomBytes(Byte* out, std::size_t len);

// RFC 4122 version 4 identifier, lower-case hex with dashes.
std::string RandomUuid();

} // namespace crypto
} // namespace clouddrop
