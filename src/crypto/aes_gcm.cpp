#include "vaultbridge/crypto/aes_gcm.hpp"
#include "vaultbridge/crypto/sodium_interop.hpp"
#include "vaultbridge/core/constants.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/protocol/constants.hpp"
#include "crypto/openssl_support.hpp"
#include <string>
namespace vaultbridge::protocol::crypto {
using OpenSSL = OpenSSLConstants;
using detail::EVP_CIPHER_CTX_ptr;
using detail::GetOpenSSLError;
namespace {
    using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

    void WipeQuietly(std::vector<uint8_t>& buffer) {
        auto __wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        (void)__wipe;
    }

    Result<Unit, ProtocolFailure> ValidateKeyAndIv(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        kAesKeyBytes, key.size())));
        }
        if (iv.size() != kAesGcmNonceBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("AES-GCM IV must be {} bytes, got {}",
                        kAesGcmNonceBytes, iv.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    // A context keyed for one direction; the 12-byte IV is GCM's default length.
    Result<EVP_CIPHER_CTX_ptr, ProtocolFailure> CreateCipher(
        const bool encrypt,
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) {
        using CtxResult = Result<EVP_CIPHER_CTX_ptr, ProtocolFailure>;
        EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return CtxResult::Err(ProtocolFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data(),
                              encrypt ? 1 : 0) != OpenSSL::SUCCESS) {
            return CtxResult::Err(ProtocolFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        return CtxResult::Ok(std::move(ctx));
    }
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> plaintext) {
    if (auto valid = ValidateKeyAndIv(key, iv); valid.IsErr()) {
        return BytesResult::Err(std::move(valid).UnwrapErr());
    }
    auto ctx_result = CreateCipher(true, key, iv);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(ProtocolFailure::Encode(
            compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(ProtocolFailure::Encode(
            compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    // Tag goes last, after the ciphertext.
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(ProtocolFailure::Encode(
            compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return BytesResult::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> ciphertext_with_tag) {
    if (auto valid = ValidateKeyAndIv(key, iv); valid.IsErr()) {
        return BytesResult::Err(std::move(valid).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return BytesResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    const auto ciphertext = ciphertext_with_tag.first(ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    auto ctx_result = CreateCipher(false, key, iv);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(ProtocolFailure::DecryptionFailure(
            compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            tag.data()) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return BytesResult::Err(ProtocolFailure::DecryptionFailure(
            compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        ERR_clear_error();
        return BytesResult::Err(ProtocolFailure::DecryptionFailure(
            std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return BytesResult::Ok(std::move(output));
}
}
