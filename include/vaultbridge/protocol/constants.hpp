#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vaultbridge::protocol {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kClientIdBytes = 16;
inline constexpr size_t kRequestIdBytes = 16;
inline constexpr size_t kSha256Bytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kMaxPayloadBytes = 1024 * 1024;

inline constexpr std::string_view kDefaultBridgeUrl = "ws://localhost:19455";
inline constexpr std::string_view kDefaultClientName = "VaultBridge Client";
inline constexpr std::string_view kDefaultTargetName = "haex-pass";

inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{10000};
inline constexpr std::chrono::milliseconds kDefaultAuthorizationTimeout{30000};
inline constexpr std::chrono::milliseconds kDefaultConnectWindow{30000};
inline constexpr std::chrono::milliseconds kDefaultConnectInterval{1000};

inline constexpr uint32_t kDefaultRetryAttempts = 3;
inline constexpr std::chrono::milliseconds kDefaultRetryInitialDelay{2000};
inline constexpr double kDefaultRetryBackoffMultiplier = 1.5;
inline constexpr std::chrono::milliseconds kDefaultRetryRequestTimeout{30000};

namespace wire {
inline constexpr std::string_view kHandshake = "handshake";
inline constexpr std::string_view kHandshakeResponse = "handshakeResponse";
inline constexpr std::string_view kRequest = "request";
inline constexpr std::string_view kResponse = "response";
inline constexpr std::string_view kAuthorizationUpdate = "authorizationUpdate";
inline constexpr std::string_view kError = "error";
inline constexpr std::string_view kPing = "ping";
inline constexpr std::string_view kPong = "pong";
inline constexpr std::string_view kRequestIdField = "requestId";
}

}
