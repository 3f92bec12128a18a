#include "vaultbridge/utilities/envelope_builder.hpp"
#include "vaultbridge/crypto/aes_gcm.hpp"
#include "vaultbridge/crypto/sodium_interop.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/debug/key_logger.hpp"
#include "vaultbridge/protocol/constants.hpp"

namespace vaultbridge::protocol::utilities {
    using crypto::AesGcm;
    using crypto::SodiumInterop;

    Result<std::vector<uint8_t>, ProtocolFailure>
    EnvelopeBuilder::DeriveMessageKey(
        const EcKeyPair &own,
        const EcPublicKey &peer) {
        auto secret_result = own.DeriveSharedSecret(peer);
        if (secret_result.IsErr()) {
            return secret_result;
        }
        auto secret = std::move(secret_result).Unwrap();
        if (secret.size() < kAesKeyBytes) {
            { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret)); (void)__wipe; }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey(compat::format(
                    "Shared secret too short: {} bytes", secret.size())));
        }
        std::vector<uint8_t> key(secret.begin(), secret.begin() + kAesKeyBytes);
        { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret)); (void)__wipe; }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(key));
    }

    Result<SealedEnvelope, ProtocolFailure>
    EnvelopeBuilder::Seal(
        std::span<const uint8_t> plaintext,
        const EcPublicKey &recipient) {
        auto ephemeral_result = EcKeyPair::Generate();
        if (ephemeral_result.IsErr()) {
            return Result<SealedEnvelope, ProtocolFailure>::Err(std::move(ephemeral_result).UnwrapErr());
        }
        const auto ephemeral = std::move(ephemeral_result).Unwrap();

        auto key_result = DeriveMessageKey(ephemeral, recipient);
        if (key_result.IsErr()) {
            return Result<SealedEnvelope, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        auto iv = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
        debug::LogEnvelopeKeys(debug::Direction::Outbound, ephemeral.PublicKeySpki(), key, iv);

        auto encrypt_result = AesGcm::Encrypt(key, iv, plaintext);
        { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key)); (void)__wipe; }
        if (encrypt_result.IsErr()) {
            return Result<SealedEnvelope, ProtocolFailure>::Err(std::move(encrypt_result).UnwrapErr());
        }
        return Result<SealedEnvelope, ProtocolFailure>::Ok(SealedEnvelope{
            std::move(encrypt_result).Unwrap(),
            std::move(iv),
            ephemeral.PublicKeySpki()
        });
    }

    Result<std::vector<uint8_t>, ProtocolFailure>
    EnvelopeBuilder::Open(
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> iv,
        const EcPublicKey &sender_ephemeral,
        const EcKeyPair &recipient) {
        auto key_result = DeriveMessageKey(recipient, sender_ephemeral);
        if (key_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::DecryptionFailure(key_result.UnwrapErr().message));
        }
        auto key = std::move(key_result).Unwrap();
        debug::LogEnvelopeKeys(debug::Direction::Inbound, sender_ephemeral.Spki(), key, iv);
        auto decrypt_result = AesGcm::Decrypt(key, iv, ciphertext_with_tag);
        { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key)); (void)__wipe; }
        if (decrypt_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::DecryptionFailure(decrypt_result.UnwrapErr().message));
        }
        return decrypt_result;
    }
}
