#pragma once
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/core/failures.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vaultbridge::protocol::crypto {

struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* pkey) const {
        if (pkey) {
            EVP_PKEY_free(pkey);
        }
    }
};

/**
 * @brief Validated P-256 public key together with its SubjectPublicKeyInfo DER.
 *
 * Cheap to copy; the underlying EVP_PKEY is shared and immutable.
 */
class EcPublicKey {
public:
    [[nodiscard]] static Result<EcPublicKey, ProtocolFailure> FromSpki(std::span<const uint8_t> spki_der);
    [[nodiscard]] static Result<EcPublicKey, ProtocolFailure> FromBase64(std::string_view spki_base64);

    [[nodiscard]] const std::vector<uint8_t>& Spki() const noexcept { return spki_; }
    [[nodiscard]] std::string ToBase64() const;
    [[nodiscard]] EVP_PKEY* Native() const noexcept { return pkey_.get(); }

private:
    friend class EcKeyPair;
    EcPublicKey(std::shared_ptr<EVP_PKEY> pkey, std::vector<uint8_t> spki);

    std::shared_ptr<EVP_PKEY> pkey_;
    std::vector<uint8_t> spki_;
};

/**
 * @brief Move-only P-256 key pair.
 *
 * The private scalar stays inside the EVP_PKEY and is freed by OpenSSL.
 */
class EcKeyPair {
public:
    [[nodiscard]] static Result<EcKeyPair, ProtocolFailure> Generate();

    EcKeyPair(EcKeyPair&&) noexcept = default;
    EcKeyPair& operator=(EcKeyPair&&) noexcept = default;
    EcKeyPair(const EcKeyPair&) = delete;
    EcKeyPair& operator=(const EcKeyPair&) = delete;
    ~EcKeyPair() = default;

    [[nodiscard]] const std::vector<uint8_t>& PublicKeySpki() const noexcept { return public_spki_; }
    [[nodiscard]] EcPublicKey PublicKey() const;

    /**
     * @brief ECDH with the peer key; yields the 32-byte x-coordinate of the shared point.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure>
    DeriveSharedSecret(const EcPublicKey& peer) const;

private:
    EcKeyPair(std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter> pkey, std::vector<uint8_t> public_spki);

    std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter> pkey_;
    std::vector<uint8_t> public_spki_;
};

}
