#include <catch2/catch.hpp>
#include "vaultbridge/crypto/ec_key_pair.hpp"
#include "vaultbridge/crypto/digest.hpp"
#include "vaultbridge/crypto/sodium_interop.hpp"
#include "vaultbridge/protocol/constants.hpp"

#include <vector>

using namespace vaultbridge::protocol;
using namespace vaultbridge::protocol::crypto;

TEST_CASE("EcKeyPair - Generation and SPKI export", "[crypto][p256]") {
    auto generated = EcKeyPair::Generate();
    REQUIRE(generated.IsOk());
    const auto key_pair = std::move(generated).Unwrap();

    // 0x30 SEQUENCE; an uncompressed P-256 SPKI is 91 bytes.
    const auto& spki = key_pair.PublicKeySpki();
    REQUIRE(spki.size() == 91);
    REQUIRE(spki[0] == 0x30);

    const auto reimported = EcPublicKey::FromSpki(spki);
    REQUIRE(reimported.IsOk());
    REQUIRE(reimported.Unwrap().Spki() == spki);
    REQUIRE(key_pair.PublicKey().Spki() == spki);
}

TEST_CASE("EcKeyPair - ECDH agreement is symmetric", "[crypto][p256][ecdh]") {
    const auto alice = EcKeyPair::Generate().Unwrap();
    const auto bob = EcKeyPair::Generate().Unwrap();
    const auto carol = EcKeyPair::Generate().Unwrap();

    auto alice_secret = alice.DeriveSharedSecret(bob.PublicKey());
    auto bob_secret = bob.DeriveSharedSecret(alice.PublicKey());
    REQUIRE(alice_secret.IsOk());
    REQUIRE(bob_secret.IsOk());
    REQUIRE(alice_secret.Unwrap().size() == kAesKeyBytes);
    REQUIRE(alice_secret.Unwrap() == bob_secret.Unwrap());
    REQUIRE(alice.DeriveSharedSecret(carol.PublicKey()).Unwrap() != alice_secret.Unwrap());
}

TEST_CASE("EcPublicKey - Import rejects unusable keys", "[crypto][p256][validation]") {
    const auto key_pair = EcKeyPair::Generate().Unwrap();
    const auto& spki = key_pair.PublicKeySpki();

    SECTION("Empty input") {
        REQUIRE(EcPublicKey::FromSpki({}).IsErr());
    }
    SECTION("Truncated DER") {
        std::vector<uint8_t> truncated(spki.begin(), spki.end() - 5);
        auto result = EcPublicKey::FromSpki(truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Trailing bytes") {
        std::vector<uint8_t> padded = spki;
        padded.push_back(0x00);
        REQUIRE(EcPublicKey::FromSpki(padded).IsErr());
    }
    SECTION("Point not on the curve") {
        std::vector<uint8_t> off_curve = spki;
        off_curve.back() ^= 0x01;
        REQUIRE(EcPublicKey::FromSpki(off_curve).IsErr());
    }
    SECTION("Base64 that is not base64") {
        REQUIRE(EcPublicKey::FromBase64("***").IsErr());
    }
    SECTION("Base64 round trip") {
        const auto encoded = key_pair.PublicKey().ToBase64();
        REQUIRE(encoded == SodiumInterop::ToBase64(spki));
        REQUIRE(EcPublicKey::FromBase64(encoded).Unwrap().Spki() == spki);
    }
}

TEST_CASE("Digest - SHA-256", "[crypto][digest]") {
    const std::vector<uint8_t> abc = {'a', 'b', 'c'};
    auto digest = Digest::Sha256(abc);
    REQUIRE(digest.IsOk());
    REQUIRE(SodiumInterop::ToHex(digest.Unwrap()) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
