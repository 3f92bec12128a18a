#pragma once
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/crypto/ec_key_pair.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace vaultbridge::protocol::utilities {
using protocol::Result;
using protocol::ProtocolFailure;
using crypto::EcKeyPair;
using crypto::EcPublicKey;

struct SealedEnvelope {
    std::vector<uint8_t> ciphertext_with_tag;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ephemeral_public_key;
};

/**
 * One-shot ECDH + AES-256-GCM sealing.
 *
 * Seal draws a fresh P-256 key pair for every call, agrees a secret with the
 * recipient's long-term key and keeps the first 32 bytes as the AES key. The
 * ephemeral private key is dropped before Seal returns. Open is the inverse,
 * performed by whoever owns the recipient key pair.
 */
class EnvelopeBuilder {
public:
    [[nodiscard]] static Result<SealedEnvelope, ProtocolFailure>
    Seal(
        std::span<const uint8_t> plaintext,
        const EcPublicKey& recipient);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Open(
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> iv,
        const EcPublicKey& sender_ephemeral,
        const EcKeyPair& recipient);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    DeriveMessageKey(
        const EcKeyPair& own,
        const EcPublicKey& peer);
private:
    EnvelopeBuilder() = delete;
};
}
