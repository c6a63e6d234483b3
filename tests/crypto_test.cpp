#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "base64.hpp"
#include "crypto/Crypto.h"
#include "errors.hpp"
#include "logger.hpp"
#include "secure_channel.hpp"

using namespace clouddrop;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

class SecureChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_.generate_identity();
        bob_.generate_identity();
    }

    void pair() {
        alice_.import_peer_key("bob", bob_.export_public_key());
        bob_.import_peer_key("alice", alice_.export_public_key());
    }

    Logger logger_;
    SecureChannel alice_{logger_};
    SecureChannel bob_{logger_};
};

TEST(CryptoTest, Sha256KnownAnswer) {
    EXPECT_EQ(SecureChannel::digest(bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(SecureChannel::digest(std::vector<uint8_t>{}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(CryptoTest, AesGcmSealOpen) {
    crypto::Key key{};
    crypto::RandomBytes(key.data(), key.size());
    crypto::Nonce nonce{};
    crypto::RandomBytes(nonce.data(), nonce.size());

    auto plain = bytes("attack at dawn");
    auto sealed = crypto::AesGcm::Seal(plain.data(), plain.size(), key, nonce);
    EXPECT_EQ(sealed.size(), plain.size() + crypto::kGcmTagSize);

    std::vector<crypto::Byte> out;
    ASSERT_TRUE(crypto::AesGcm::Open(sealed.data(), sealed.size(), key, nonce, out));
    EXPECT_EQ(out, plain);

    sealed[0] ^= 0x80;
    EXPECT_FALSE(crypto::AesGcm::Open(sealed.data(), sealed.size(), key, nonce, out));
}

TEST(CryptoTest, EcdhBothSidesAgree) {
    crypto::EcdhKeyPair a;
    crypto::EcdhKeyPair b;
    auto ab = a.DeriveSharedSecret(b.public_key_spki());
    auto ba = b.DeriveSharedSecret(a.public_key_spki());
    EXPECT_EQ(ab.size(), 32u);
    EXPECT_EQ(ab, ba);
}

TEST(CryptoTest, EcdhRejectsGarbage) {
    crypto::EcdhKeyPair a;
    EXPECT_THROW(a.DeriveSharedSecret(bytes("definitely not a key")), std::invalid_argument);
    EXPECT_THROW(a.DeriveSharedSecret({}), std::invalid_argument);
}

TEST(CryptoTest, UuidShape) {
    auto id = crypto::RandomUuid();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_NE(id, crypto::RandomUuid());
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(b64::encode(bytes("")), "");
    EXPECT_EQ(b64::encode(bytes("f")), "Zg==");
    EXPECT_EQ(b64::encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(b64::encode(bytes("foo")), "Zm9v");
    EXPECT_EQ(b64::encode(bytes("foobar")), "Zm9vYmFy");

    EXPECT_EQ(b64::decode("Zg=="), bytes("f"));
    EXPECT_EQ(b64::decode("Zm8="), bytes("fo"));
    EXPECT_EQ(b64::decode("Zm9vYmFy"), bytes("foobar"));
    EXPECT_TRUE(b64::decode("").empty());
}

TEST(Base64Test, RejectsMalformed) {
    EXPECT_THROW(b64::decode("Zm9"), std::invalid_argument);
    EXPECT_THROW(b64::decode("Zm9*"), std::invalid_argument);
}

TEST_F(SecureChannelTest, RoundTripAfterKeyExchange) {
    pair();
    EXPECT_TRUE(alice_.has_key("bob"));
    EXPECT_TRUE(bob_.has_key("alice"));

    auto plain = bytes("chunk payload");
    auto sealed = alice_.encrypt("bob", plain);
    EXPECT_EQ(sealed.ciphertext.size(), plain.size() + crypto::kGcmTagSize);
    EXPECT_EQ(bob_.decrypt("alice", sealed.ciphertext, sealed.nonce), plain);

    auto framed = bob_.encrypt_framed("alice", plain);
    EXPECT_EQ(framed.size(), crypto::kGcmNonceSize + plain.size() + crypto::kGcmTagSize);
    EXPECT_EQ(alice_.decrypt_framed("bob", framed), plain);
}

TEST_F(SecureChannelTest, FreshNoncePerMessage) {
    pair();
    auto plain = bytes("same");
    auto a = alice_.encrypt("bob", plain);
    auto b = alice_.encrypt("bob", plain);
    EXPECT_NE(a.nonce, b.nonce);
    EXPECT_NE(a.ciphertext, b.ciphertext);
}

TEST_F(SecureChannelTest, NoncesDoNotRepeatUnderOneKey) {
    pair();
    constexpr size_t kSamples = 10000;
    auto plain = bytes("x");

    std::set<crypto::Nonce> sealed_nonces;
    for (size_t i = 0; i < kSamples; ++i) sealed_nonces.insert(alice_.encrypt("bob", plain).nonce);
    EXPECT_EQ(sealed_nonces.size(), kSamples);

    std::set<crypto::Nonce> framed_nonces;
    for (size_t i = 0; i < kSamples; ++i) {
        auto framed = alice_.encrypt_framed("bob", plain);
        ASSERT_GE(framed.size(), crypto::kGcmNonceSize);
        crypto::Nonce n{};
        std::copy(framed.begin(), framed.begin() + crypto::kGcmNonceSize, n.begin());
        framed_nonces.insert(n);
    }
    EXPECT_EQ(framed_nonces.size(), kSamples);
}

TEST_F(SecureChannelTest, TamperingIsDetected) {
    pair();
    auto framed = alice_.encrypt_framed("bob", bytes("payload"));

    auto bad_body = framed;
    bad_body[crypto::kGcmNonceSize] ^= 0x01;
    EXPECT_THROW(bob_.decrypt_framed("alice", bad_body), AuthenticationFailed);

    auto bad_nonce = framed;
    bad_nonce[0] ^= 0x01;
    EXPECT_THROW(bob_.decrypt_framed("alice", bad_nonce), AuthenticationFailed);

    std::vector<uint8_t> truncated(framed.begin(), framed.begin() + 10);
    EXPECT_THROW(bob_.decrypt_framed("alice", truncated), AuthenticationFailed);
}

TEST_F(SecureChannelTest, WrongPeerKeyFails) {
    pair();
    Logger logger;
    SecureChannel carol(logger);
    carol.import_peer_key("alice", alice_.export_public_key());
    auto framed = alice_.encrypt_framed("bob", bytes("for bob only"));
    EXPECT_THROW(carol.decrypt_framed("alice", framed), AuthenticationFailed);
}

TEST_F(SecureChannelTest, MissingKeyThrowsNoSharedKey) {
    EXPECT_FALSE(alice_.has_key("bob"));
    try {
        alice_.encrypt("bob", bytes("x"));
        FAIL() << "expected NoSharedKey";
    } catch (const NoSharedKey& e) {
        EXPECT_EQ(e.code(), make_error_code(Errc::no_shared_key));
    }
    EXPECT_THROW(alice_.decrypt_framed("bob", std::vector<uint8_t>(40, 0)), NoSharedKey);
}

TEST_F(SecureChannelTest, BadPeerKeyIsRejected) {
    EXPECT_THROW(alice_.import_peer_key("bob", bytes("junk")), KeyImportError);
    EXPECT_THROW(alice_.import_peer_key_b64("bob", "%%%%"), KeyImportError);
    EXPECT_FALSE(alice_.has_key("bob"));
}

TEST_F(SecureChannelTest, Base64KeyExchange) {
    alice_.import_peer_key_b64("bob", bob_.export_public_key_b64());
    bob_.import_peer_key_b64("alice", alice_.export_public_key_b64());
    auto framed = alice_.encrypt_framed("bob", bytes("hi"));
    EXPECT_EQ(bob_.decrypt_framed("alice", framed), bytes("hi"));
}

TEST_F(SecureChannelTest, IdentityIsStable) {
    auto first = alice_.export_public_key();
    alice_.generate_identity();
    EXPECT_EQ(alice_.export_public_key(), first);
}

TEST_F(SecureChannelTest, RemovePeerForgetsKey) {
    pair();
    alice_.remove_peer("bob");
    EXPECT_FALSE(alice_.has_key("bob"));
    EXPECT_THROW(alice_.encrypt("bob", bytes("x")), NoSharedKey);
}

TEST_F(SecureChannelTest, ReimportReplacesKey) {
    pair();
    Logger logger;
    SecureChannel bob2(logger);
    alice_.import_peer_key("bob", bob2.export_public_key());
    bob2.import_peer_key("alice", alice_.export_public_key());

    auto framed = alice_.encrypt_framed("bob", bytes("new"));
    EXPECT_EQ(bob2.decrypt_framed("alice", framed), bytes("new"));
    EXPECT_THROW(bob_.decrypt_framed("alice", framed), AuthenticationFailed);
}

TEST(ErrorsTest, CategoryMessages) {
    auto ec = make_error_code(Errc::relay_unavailable);
    EXPECT_EQ(ec.category().name(), std::string("clouddrop"));
    EXPECT_FALSE(ec.message().empty());
    EXPECT_NE(make_error_code(Errc::channel_timeout).message(),
              make_error_code(Errc::encryption_key_timeout).message());

    boost::system::error_code converted = Errc::connect_failed;
    EXPECT_EQ(converted, make_error_code(Errc::connect_failed));
}
