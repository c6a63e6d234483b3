#include "secure_channel.hpp"

#include "base64.hpp"

#include <algorithm>
#include <stdexcept>

namespace clouddrop {

SecureChannel::SecureChannel(Logger& logger) : logger_(logger) {}

void SecureChannel::generate_identity() {
    if (identity_) return;
    identity_.emplace();
    logger_.info("crypto identity generated (P-256)");
}

std::vector<uint8_t> SecureChannel::export_public_key() {
    generate_identity();
    return identity_->public_key_spki();
}

std::string SecureChannel::export_public_key_b64() {
    return b64::encode(export_public_key());
}

void SecureChannel::import_peer_key(const PeerId& peer, const std::vector<uint8_t>& spki) {
    generate_identity();
    std::vector<uint8_t> secret;
    try {
        secret = identity_->DeriveSharedSecret(spki);
    } catch (const std::invalid_argument& e) {
        logger_.warn("crypto key import failed peer=" + peer + ": " + e.what());
        throw KeyImportError(peer, e.what());
    }
    if (secret.size() != crypto::kAesKeySize) {
        throw KeyImportError(peer, "unexpected shared secret size " + std::to_string(secret.size()));
    }
    crypto::Key key{};
    std::copy(secret.begin(), secret.end(), key.begin());
    std::fill(secret.begin(), secret.end(), 0);

    bool replaced = keys_.count(peer) > 0;
    keys_[peer] = key;
    logger_.info("crypto shared key " + std::string(replaced ? "replaced" : "derived") + " peer=" + peer);
}

void SecureChannel::import_peer_key_b64(const PeerId& peer, const std::string& b64_spki) {
    std::vector<uint8_t> der;
    try {
        der = b64::decode(b64_spki);
    } catch (const std::invalid_argument& e) {
        throw KeyImportError(peer, std::string("bad base64: ") + e.what());
    }
    import_peer_key(peer, der);
}

const crypto::Key& SecureChannel::key_for(const PeerId& peer) const {
    auto it = keys_.find(peer);
    if (it == keys_.end()) throw NoSharedKey(peer);
    return it->second;
}

Sealed SecureChannel::encrypt(const PeerId& peer, const uint8_t* data, size_t len) const {
    const auto& key = key_for(peer);
    Sealed out;
    crypto::RandomBytes(out.nonce.data(), out.nonce.size());
    out.ciphertext = crypto::AesGcm::Seal(data, len, key, out.nonce);
    return out;
}

Sealed SecureChannel::encrypt(const PeerId& peer, const std::vector<uint8_t>& plaintext) const {
    return encrypt(peer, plaintext.data(), plaintext.size());
}

std::vector<uint8_t> SecureChannel::decrypt(const PeerId& peer,
                                            const std::vector<uint8_t>& ciphertext,
                                            const crypto::Nonce& nonce) const {
    const auto& key = key_for(peer);
    std::vector<uint8_t> plain;
    if (!crypto::AesGcm::Open(ciphertext.data(), ciphertext.size(), key, nonce, plain)) {
        throw AuthenticationFailed(peer);
    }
    return plain;
}

std::vector<uint8_t> SecureChannel::encrypt_framed(const PeerId& peer, const uint8_t* data, size_t len) const {
    Sealed s = encrypt(peer, data, len);
    std::vector<uint8_t> out;
    out.reserve(s.nonce.size() + s.ciphertext.size());
    out.insert(out.end(), s.nonce.begin(), s.nonce.end());
    out.insert(out.end(), s.ciphertext.begin(), s.ciphertext.end());
    return out;
}

std::vector<uint8_t> SecureChannel::encrypt_framed(const PeerId& peer, const std::vector<uint8_t>& plaintext) const {
    return encrypt_framed(peer, plaintext.data(), plaintext.size());
}

std::vector<uint8_t> SecureChannel::decrypt_framed(const PeerId& peer, const std::vector<uint8_t>& framed) const {
    const auto& key = key_for(peer);
    if (framed.size() < crypto::kGcmNonceSize + crypto::kGcmTagSize) throw AuthenticationFailed(peer);

    crypto::Nonce nonce{};
    std::copy(framed.begin(), framed.begin() + crypto::kGcmNonceSize, nonce.begin());
    std::vector<uint8_t> plain;
    if (!crypto::AesGcm::Open(framed.data() + crypto::kGcmNonceSize, framed.size() - crypto::kGcmNonceSize,
                              key, nonce, plain)) {
        throw AuthenticationFailed(peer);
    }
    return plain;
}

void SecureChannel::remove_peer(const PeerId& peer) {
    auto it = keys_.find(peer);
    if (it == keys_.end()) return;
    std::fill(it->second.begin(), it->second.end(), 0);
    keys_.erase(it);
    logger_.info("crypto shared key removed peer=" + peer);
}

bool SecureChannel::has_key(const PeerId& peer) const {
    return keys_.count(peer) > 0;
}

std::string SecureChannel::digest(const uint8_t* data, size_t len) {
    auto d = crypto::Sha256(data, len);
    return to_hex(d.data(), d.size());
}

std::string SecureChannel::digest(const std::vector<uint8_t>& data) {
    return digest(data.data(), data.size());
}

} // namespace clouddrop
