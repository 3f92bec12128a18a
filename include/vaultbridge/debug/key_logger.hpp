#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug tracing of identity, ephemeral and derived keys.
 *
 * SECURITY WARNING: This module prints key material to stdout.
 * Only enable VAULTBRIDGE_DEBUG_KEYS to compare derivations against the
 * vault side while debugging interop. NEVER enable in production builds.
 *
 * Enable via CMake: -DVAULTBRIDGE_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace vaultbridge::debug {

enum class Direction {
    Outbound,
    Inbound
};

#ifdef VAULTBRIDGE_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 96) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

inline const char* DirectionToString(Direction direction) {
    return direction == Direction::Outbound ? "OUT" : "IN";
}

#define VB_LOG_KEY(direction, operation, key_name, data) \
    do { \
        fprintf(stdout, "[VB-DEBUG] %s %s %s: %s\n", \
            ::vaultbridge::debug::DirectionToString(direction), \
            operation, \
            key_name, \
            ::vaultbridge::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define VB_LOG_MSG(direction, operation, message) \
    do { \
        fprintf(stdout, "[VB-DEBUG] %s %s %s\n", \
            ::vaultbridge::debug::DirectionToString(direction), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

inline void LogIdentityCreated(
    std::string_view client_id,
    std::span<const uint8_t> public_key_spki) {

    VB_LOG_MSG(Direction::Outbound, "IDENTITY", std::string(client_id).c_str());
    VB_LOG_KEY(Direction::Outbound, "IDENTITY", "public_key_spki", public_key_spki);
}

inline void LogEnvelopeKeys(
    Direction direction,
    std::span<const uint8_t> ephemeral_public_spki,
    std::span<const uint8_t> message_key,
    std::span<const uint8_t> iv) {

    VB_LOG_KEY(direction, "ENVELOPE", "ephemeral_public_spki", ephemeral_public_spki);
    VB_LOG_KEY(direction, "ENVELOPE", "message_key", message_key);
    VB_LOG_KEY(direction, "ENVELOPE", "iv", iv);
}

#else // !VAULTBRIDGE_DEBUG_KEYS

#define VB_LOG_KEY(direction, operation, key_name, data) ((void)0)
#define VB_LOG_MSG(direction, operation, message) ((void)0)

inline void LogIdentityCreated(std::string_view, std::span<const uint8_t>) {}
inline void LogEnvelopeKeys(Direction, std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>) {}

#endif // VAULTBRIDGE_DEBUG_KEYS

} // namespace vaultbridge::debug
