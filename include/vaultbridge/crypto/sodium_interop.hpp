#pragma once

#include "vaultbridge/core/result.hpp"
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vaultbridge::protocol::crypto {

/**
 * @brief Interop layer for libsodium operations
 *
 * Provides safe interfaces to libsodium functionality: initialisation,
 * CSPRNG output, secure wiping, constant-time comparison and the hex and
 * base64 codecs used on the wire.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    /**
     * @brief Check if libsodium is initialized
     */
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses sodium_memzero for large buffers and a volatile loop for small ones.
     *
     * @param buffer Buffer to wipe
     * @return Ok on success, Err on failure
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Securely wipe a string holding secret text (decrypted bodies)
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     */
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief Lowercase hex encoding
     */
    static std::string ToHex(std::span<const uint8_t> data);

    /**
     * @brief Standard (padded, RFC 4648 alphabet) base64 encoding
     */
    static std::string ToBase64(std::span<const uint8_t> data);

    /**
     * @brief Decode standard base64; surrounding whitespace is ignored
     *
     * @return Err(DecodingFailed) when the text is not valid base64
     */
    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view text);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace vaultbridge::protocol::crypto
