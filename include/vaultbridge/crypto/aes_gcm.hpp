#pragma once
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace vaultbridge::protocol::crypto {

/**
 * AES-256-GCM as the vault speaks it: 32-byte key, 12-byte IV, no
 * associated data, and output laid out as ciphertext || 16-byte tag (the
 * WebCrypto layout carried in the `message` field of an envelope).
 *
 * Stateless primitive: the caller owns nonce uniqueness. Every envelope uses a
 * freshly derived key, and EnvelopeBuilder draws a random 12-byte IV per
 * message, so a (key, nonce) pair is never reused.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> plaintext);

    // Tag mismatch is reported as DecryptionFailure; bad sizes as InvalidInput.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> ciphertext_with_tag);
private:
    AesGcm() = delete;
};
}
