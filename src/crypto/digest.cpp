#include "vaultbridge/crypto/digest.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/protocol/constants.hpp"
#include "openssl_support.hpp"
namespace vaultbridge::protocol::crypto {
Result<std::vector<uint8_t>, ProtocolFailure> Digest::Sha256(std::span<const uint8_t> data) {
    using DigestResult = Result<std::vector<uint8_t>, ProtocolFailure>;
    detail::EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return DigestResult::Err(ProtocolFailure::Generic(
            compat::format("Failed to create digest context: {}", detail::GetOpenSSLError())));
    }
    std::vector<uint8_t> digest(kSha256Bytes);
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != OpenSSLConstants::SUCCESS ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != OpenSSLConstants::SUCCESS ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != OpenSSLConstants::SUCCESS) {
        return DigestResult::Err(ProtocolFailure::Generic(
            compat::format("SHA-256 failed: {}", detail::GetOpenSSLError())));
    }
    digest.resize(digest_len);
    return DigestResult::Ok(std::move(digest));
}
}
