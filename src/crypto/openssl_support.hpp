#pragma once

#include "vaultbridge/core/constants.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>
#include <string>

namespace vaultbridge::protocol::crypto::detail {

struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* ctx) const {
        if (ctx) {
            EVP_PKEY_CTX_free(ctx);
        }
    }
};
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;

struct EVP_CIPHER_CTX_Deleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;

struct EVP_MD_CTX_Deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;

inline std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    ERR_clear_error();
    return std::string(buffer);
}

}
