#pragma once

#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/protocol/constants.hpp"
#include "vaultbridge/rpc/retry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace vaultbridge::protocol::configuration {

/// Connection, routing and timing settings for a bridge client.
///
/// Every field has a usable default; a JSON file or the environment only
/// needs to carry what differs. Keys in the JSON form are camelCase and
/// durations are integer milliseconds:
///
///   {
///     "url": "ws://localhost:19455",
///     "clientName": "CLI",
///     "target": { "name": "haex-pass", "publicKeyFile": "/tmp/key.txt" },
///     "timeouts": { "requestMs": 10000, "authorizationMs": 30000 },
///     "retry": { "maxAttempts": 3, "initialDelayMs": 2000, "backoffMultiplier": 1.5 },
///     "logLevel": "debug"
///   }
struct BridgeConfig {
    std::string url{kDefaultBridgeUrl};
    uint32_t protocol_version = kProtocolVersion;
    std::string client_name{kDefaultClientName};

    std::chrono::milliseconds request_timeout = kDefaultRequestTimeout;
    std::chrono::milliseconds authorization_timeout = kDefaultAuthorizationTimeout;
    std::chrono::milliseconds connect_window = kDefaultConnectWindow;
    std::chrono::milliseconds connect_interval = kDefaultConnectInterval;
    /// Zero disables the ping loop.
    std::chrono::milliseconds keepalive_interval{0};

    /// Routing metadata copied into every request envelope.
    std::string target_public_key;
    std::string target_name{kDefaultTargetName};
    std::optional<std::filesystem::path> target_public_key_file;

    rpc::RetryPolicy retry;
    std::string log_level = "info";

    [[nodiscard]] static BridgeConfig Default();

    [[nodiscard]] static Result<BridgeConfig, ProtocolFailure> FromJson(const nlohmann::json& document);

    [[nodiscard]] static Result<BridgeConfig, ProtocolFailure> LoadFromFile(const std::filesystem::path& path);

    /// VAULTBRIDGE_URL, VAULTBRIDGE_CLIENT_NAME, VAULTBRIDGE_TARGET_KEY_FILE, VAULTBRIDGE_LOG_LEVEL.
    void ApplyEnvironment();

    /// Reads target_public_key from target_public_key_file when it is still empty.
    [[nodiscard]] Result<Unit, ProtocolFailure> ResolveTargetKey();

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;
};

}
