#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace vaultbridge::protocol {
struct Constants {
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t GROUP_NAME_BUFFER_SIZE = 64;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view KEY_TYPE_EC = "EC";
    static constexpr std::string_view CURVE_P256 = "P-256";
    static constexpr std::string_view CURVE_P256_GROUP_NAME = "prime256v1";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view INVALID_BASE64 = "Input is not valid base64";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED =
        "Authentication tag verification failed - data may have been tampered with";
    static constexpr std::string_view NOT_CONNECTED = "Not connected";
    static constexpr std::string_view HANDSHAKE_NOT_COMPLETE = "Handshake not complete";
    static constexpr std::string_view NOT_AUTHORIZED = "Not authorized";
    static constexpr std::string_view REQUEST_TIMEOUT = "Request timeout";
    static constexpr std::string_view CONNECTION_FAILED = "Connection failed - is the vault running?";
    static constexpr std::string_view CONNECTION_CLOSED = "Connection closed";
};
}
