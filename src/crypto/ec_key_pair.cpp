#include "vaultbridge/crypto/ec_key_pair.hpp"
#include "vaultbridge/crypto/sodium_interop.hpp"
#include "vaultbridge/core/format.hpp"
#include "openssl_support.hpp"

#include <openssl/core_names.h>
#include <openssl/x509.h>

namespace vaultbridge::protocol::crypto {
using OpenSSL = OpenSSLConstants;
using detail::GetOpenSSLError;

namespace {
    Result<std::vector<uint8_t>, ProtocolFailure> EncodeSpki(EVP_PKEY* pkey) {
        using SpkiResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        const int length = i2d_PUBKEY(pkey, nullptr);
        if (length <= 0) {
            return SpkiResult::Err(ProtocolFailure::Encode(
                compat::format("Failed to encode public key: {}", GetOpenSSLError())));
        }
        std::vector<uint8_t> der(static_cast<size_t>(length));
        unsigned char* cursor = der.data();
        if (i2d_PUBKEY(pkey, &cursor) != length) {
            return SpkiResult::Err(ProtocolFailure::Encode(
                compat::format("Failed to encode public key: {}", GetOpenSSLError())));
        }
        return SpkiResult::Ok(std::move(der));
    }

    bool IsP256(EVP_PKEY* pkey) {
        if (EVP_PKEY_is_a(pkey, OpenSSL::KEY_TYPE_EC.data()) != OpenSSL::SUCCESS) {
            return false;
        }
        char group_name[Constants::GROUP_NAME_BUFFER_SIZE] = {};
        size_t group_name_len = 0;
        if (EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME,
                                           group_name, sizeof(group_name),
                                           &group_name_len) != OpenSSL::SUCCESS) {
            return false;
        }
        return std::string_view(group_name, group_name_len) == OpenSSL::CURVE_P256_GROUP_NAME;
    }
}

EcPublicKey::EcPublicKey(std::shared_ptr<EVP_PKEY> pkey, std::vector<uint8_t> spki)
    : pkey_(std::move(pkey))
    , spki_(std::move(spki)) {}

Result<EcPublicKey, ProtocolFailure> EcPublicKey::FromSpki(std::span<const uint8_t> spki_der) {
    using KeyResult = Result<EcPublicKey, ProtocolFailure>;
    if (spki_der.empty()) {
        return KeyResult::Err(ProtocolFailure::InvalidInput("Public key is empty"));
    }
    const unsigned char* cursor = spki_der.data();
    EVP_PKEY* raw = d2i_PUBKEY(nullptr, &cursor, static_cast<long>(spki_der.size()));
    if (raw == nullptr) {
        return KeyResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Public key is not valid SubjectPublicKeyInfo: {}", GetOpenSSLError())));
    }
    std::shared_ptr<EVP_PKEY> pkey(raw, EVP_PKEY_Deleter{});
    if (cursor != spki_der.data() + spki_der.size()) {
        return KeyResult::Err(ProtocolFailure::InvalidInput("Trailing bytes after public key"));
    }
    if (!IsP256(pkey.get())) {
        return KeyResult::Err(ProtocolFailure::InvalidInput("Public key is not a P-256 key"));
    }
    detail::EVP_PKEY_CTX_ptr check_ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr));
    if (!check_ctx || EVP_PKEY_public_check(check_ctx.get()) != OpenSSL::SUCCESS) {
        return KeyResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Public key is not a valid curve point: {}", GetOpenSSLError())));
    }
    return KeyResult::Ok(EcPublicKey(std::move(pkey),
                                     std::vector<uint8_t>(spki_der.begin(), spki_der.end())));
}

Result<EcPublicKey, ProtocolFailure> EcPublicKey::FromBase64(std::string_view spki_base64) {
    auto decoded = SodiumInterop::FromBase64(spki_base64);
    if (decoded.IsErr()) {
        return Result<EcPublicKey, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Public key: " + decoded.UnwrapErr().message));
    }
    return FromSpki(decoded.Unwrap());
}

std::string EcPublicKey::ToBase64() const {
    return SodiumInterop::ToBase64(spki_);
}

EcKeyPair::EcKeyPair(std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter> pkey, std::vector<uint8_t> public_spki)
    : pkey_(std::move(pkey))
    , public_spki_(std::move(public_spki)) {}

Result<EcKeyPair, ProtocolFailure> EcKeyPair::Generate() {
    using PairResult = Result<EcKeyPair, ProtocolFailure>;
    detail::EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, OpenSSL::KEY_TYPE_EC.data(), nullptr));
    if (!ctx) {
        return PairResult::Err(ProtocolFailure::KeyGeneration(
            compat::format("Failed to create key context: {}", GetOpenSSLError())));
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return PairResult::Err(ProtocolFailure::KeyGeneration(
            compat::format("Failed to initialise key generation: {}", GetOpenSSLError())));
    }
    if (EVP_PKEY_CTX_set_group_name(ctx.get(), OpenSSL::CURVE_P256.data()) <= 0) {
        return PairResult::Err(ProtocolFailure::KeyGeneration(
            compat::format("Failed to select P-256: {}", GetOpenSSLError())));
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0 || raw == nullptr) {
        return PairResult::Err(ProtocolFailure::KeyGeneration(
            compat::format("P-256 key generation failed: {}", GetOpenSSLError())));
    }
    std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter> pkey(raw);
    auto spki = EncodeSpki(pkey.get());
    if (spki.IsErr()) {
        return PairResult::Err(ProtocolFailure::KeyGeneration(spki.UnwrapErr().message));
    }
    return PairResult::Ok(EcKeyPair(std::move(pkey), std::move(spki).Unwrap()));
}

EcPublicKey EcKeyPair::PublicKey() const {
    EVP_PKEY_up_ref(pkey_.get());
    return EcPublicKey(std::shared_ptr<EVP_PKEY>(pkey_.get(), EVP_PKEY_Deleter{}), public_spki_);
}

Result<std::vector<uint8_t>, ProtocolFailure>
EcKeyPair::DeriveSharedSecret(const EcPublicKey& peer) const {
    using SecretResult = Result<std::vector<uint8_t>, ProtocolFailure>;
    detail::EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey_.get(), nullptr));
    if (!ctx) {
        return SecretResult::Err(ProtocolFailure::DeriveKey(
            compat::format("Failed to create derive context: {}", GetOpenSSLError())));
    }
    if (EVP_PKEY_derive_init(ctx.get()) <= 0) {
        return SecretResult::Err(ProtocolFailure::DeriveKey(
            compat::format("Failed to initialise ECDH: {}", GetOpenSSLError())));
    }
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer.Native()) <= 0) {
        return SecretResult::Err(ProtocolFailure::DeriveKey(
            compat::format("Peer key rejected for ECDH: {}", GetOpenSSLError())));
    }
    size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) <= 0) {
        return SecretResult::Err(ProtocolFailure::DeriveKey(
            compat::format("Failed to size shared secret: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> secret(secret_len);
    if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) <= 0) {
        { auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret)); (void)__wipe; }
        return SecretResult::Err(ProtocolFailure::DeriveKey(
            compat::format("ECDH derivation failed: {}", GetOpenSSLError())));
    }
    secret.resize(secret_len);
    return SecretResult::Ok(std::move(secret));
}

}
