#include <catch2/catch.hpp>
#include "vaultbridge/utilities/envelope_builder.hpp"
#include "vaultbridge/crypto/aes_gcm.hpp"
#include "vaultbridge/crypto/sodium_interop.hpp"
#include "vaultbridge/protocol/constants.hpp"

#include <string>
#include <vector>

using namespace vaultbridge::protocol;
using namespace vaultbridge::protocol::crypto;
using namespace vaultbridge::protocol::utilities;

namespace {
std::vector<uint8_t> Bytes(const std::string& text) {
    return {text.begin(), text.end()};
}
}

TEST_CASE("EnvelopeBuilder - Seal and open", "[envelope]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto vault = EcKeyPair::Generate().Unwrap();
    const auto plaintext = Bytes(R"({"url":"https://example.com","requestId":"abc"})");

    auto sealed = EnvelopeBuilder::Seal(plaintext, vault.PublicKey());
    REQUIRE(sealed.IsOk());
    const auto& envelope = sealed.Unwrap();
    REQUIRE(envelope.iv.size() == kAesGcmNonceBytes);
    REQUIRE(envelope.ciphertext_with_tag.size() == plaintext.size() + kAesGcmTagBytes);
    REQUIRE(envelope.ephemeral_public_key != vault.PublicKeySpki());

    const auto sender = EcPublicKey::FromSpki(envelope.ephemeral_public_key).Unwrap();
    auto opened = EnvelopeBuilder::Open(envelope.ciphertext_with_tag, envelope.iv, sender, vault);
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == plaintext);
}

TEST_CASE("EnvelopeBuilder - Every seal uses a fresh ephemeral key and IV", "[envelope][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto vault = EcKeyPair::Generate().Unwrap();
    const auto plaintext = Bytes("same payload");

    const auto first = EnvelopeBuilder::Seal(plaintext, vault.PublicKey()).Unwrap();
    const auto second = EnvelopeBuilder::Seal(plaintext, vault.PublicKey()).Unwrap();
    REQUIRE(first.ephemeral_public_key != second.ephemeral_public_key);
    REQUIRE(first.iv != second.iv);
    REQUIRE(first.ciphertext_with_tag != second.ciphertext_with_tag);
}

TEST_CASE("EnvelopeBuilder - Message key is the leading 32 bytes of the ECDH secret", "[envelope]") {
    const auto own = EcKeyPair::Generate().Unwrap();
    const auto peer = EcKeyPair::Generate().Unwrap();
    const auto key = EnvelopeBuilder::DeriveMessageKey(own, peer.PublicKey()).Unwrap();
    const auto secret = own.DeriveSharedSecret(peer.PublicKey()).Unwrap();
    REQUIRE(key.size() == kAesKeyBytes);
    REQUIRE(std::vector<uint8_t>(secret.begin(), secret.begin() + kAesKeyBytes) == key);
    REQUIRE(EnvelopeBuilder::DeriveMessageKey(peer, own.PublicKey()).Unwrap() == key);
}

TEST_CASE("EnvelopeBuilder - Interoperates with a manual ECDH + AES-GCM peer", "[envelope][interop]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto vault = EcKeyPair::Generate().Unwrap();
    const auto sender = EcKeyPair::Generate().Unwrap();
    const auto iv = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    const auto plaintext = Bytes(R"({"entries":[]})");

    const auto secret = sender.DeriveSharedSecret(vault.PublicKey()).Unwrap();
    const std::vector<uint8_t> key(secret.begin(), secret.begin() + kAesKeyBytes);
    const auto ciphertext = AesGcm::Encrypt(key, iv, plaintext).Unwrap();

    auto opened = EnvelopeBuilder::Open(ciphertext, iv, sender.PublicKey(), vault);
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == plaintext);
}

TEST_CASE("EnvelopeBuilder - Opening with the wrong key fails", "[envelope][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto vault = EcKeyPair::Generate().Unwrap();
    const auto intruder = EcKeyPair::Generate().Unwrap();
    const auto sealed = EnvelopeBuilder::Seal(Bytes("secret"), vault.PublicKey()).Unwrap();
    const auto sender = EcPublicKey::FromSpki(sealed.ephemeral_public_key).Unwrap();

    auto result = EnvelopeBuilder::Open(sealed.ciphertext_with_tag, sealed.iv, sender, intruder);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::DecryptionFailure);
}
