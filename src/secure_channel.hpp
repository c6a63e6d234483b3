#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto/Crypto.h"
#include "errors.hpp"
#include "logger.hpp"
#include "util.hpp"

namespace clouddrop {

struct Sealed {
    std::vector<uint8_t> ciphertext;  // includes the 16-byte tag
    crypto::Nonce nonce{};
};

// Per-peer ECDH (P-256) key agreement and AES-256-GCM sealing.
//
// One local identity per process lifetime; each imported peer key yields a
// shared key held only in memory and dropped with remove_peer().
class SecureChannel {
public:
    explicit SecureChannel(Logger& logger);

    // Idempotent.
    void generate_identity();

    // DER SubjectPublicKeyInfo; generates the identity on first use.
    std::vector<uint8_t> export_public_key();
    std::string export_public_key_b64();

    // Replaces any previous key for peer. Throws KeyImportError.
    void import_peer_key(const PeerId& peer, const std::vector<uint8_t>& spki);
    void import_peer_key_b64(const PeerId& peer, const std::string& b64_spki);

    // Throws NoSharedKey.
    Sealed encrypt(const PeerId& peer, const std::vector<uint8_t>& plaintext) const;
    Sealed encrypt(const PeerId& peer, const uint8_t* data, size_t len) const;

    // Throws NoSharedKey or AuthenticationFailed.
    std::vector<uint8_t> decrypt(const PeerId& peer,
                                 const std::vector<uint8_t>& ciphertext,
                                 const crypto::Nonce& nonce) const;

    // nonce || ciphertext
    std::vector<uint8_t> encrypt_framed(const PeerId& peer, const uint8_t* data, size_t len) const;
    std::vector<uint8_t> encrypt_framed(const PeerId& peer, const std::vector<uint8_t>& plaintext) const;
    std::vector<uint8_t> decrypt_framed(const PeerId& peer, const std::vector<uint8_t>& framed) const;

    void remove_peer(const PeerId& peer);
    bool has_key(const PeerId& peer) const;

    // Lower-case hex SHA-256.
    static std::string digest(const std::vector<uint8_t>& data);
    static std::string digest(const uint8_t* data, size_t len);

private:
    const crypto::Key& key_for(const PeerId& peer) const;

    Logger& logger_;
    std::optional<crypto::EcdhKeyPair> identity_;
    std::unordered_map<PeerId, crypto::Key> keys_;
};

} // namespace clouddrop
