#include "vaultbridge/configuration/bridge_config.hpp"
#include "vaultbridge/core/format.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vaultbridge::protocol::configuration {
using nlohmann::json;

namespace {
    using ConfigResult = Result<BridgeConfig, ProtocolFailure>;

    std::chrono::milliseconds ReadMillis(const json& section, const char* key,
                                         const std::chrono::milliseconds fallback) {
        const auto it = section.find(key);
        if (it == section.end()) {
            return fallback;
        }
        return std::chrono::milliseconds(it->get<int64_t>());
    }

    std::string Trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return {};
        }
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    bool IsUtf8(const std::string& text) {
        try {
            (void)json(text).dump(-1, ' ', false, json::error_handler_t::strict);
            return true;
        } catch (const json::type_error&) {
            return false;
        }
    }

    std::optional<std::string> Environment(const char* name) {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }
}

BridgeConfig BridgeConfig::Default() {
    return BridgeConfig{};
}

Result<BridgeConfig, ProtocolFailure> BridgeConfig::FromJson(const json& document) {
    if (!document.is_object()) {
        return ConfigResult::Err(ProtocolFailure::InvalidInput("Configuration must be a JSON object"));
    }
    BridgeConfig config;
    try {
        config.url = document.value("url", config.url);
        config.protocol_version = document.value("protocolVersion", config.protocol_version);
        config.client_name = document.value("clientName", config.client_name);
        config.log_level = document.value("logLevel", config.log_level);

        if (const auto target = document.find("target"); target != document.end()) {
            config.target_name = target->value("name", config.target_name);
            config.target_public_key = target->value("publicKey", config.target_public_key);
            if (const auto file = target->find("publicKeyFile"); file != target->end()) {
                config.target_public_key_file = std::filesystem::path(file->get<std::string>());
            }
        }
        if (const auto timeouts = document.find("timeouts"); timeouts != document.end()) {
            config.request_timeout = ReadMillis(*timeouts, "requestMs", config.request_timeout);
            config.authorization_timeout = ReadMillis(*timeouts, "authorizationMs", config.authorization_timeout);
            config.connect_window = ReadMillis(*timeouts, "connectWindowMs", config.connect_window);
            config.connect_interval = ReadMillis(*timeouts, "connectIntervalMs", config.connect_interval);
            config.keepalive_interval = ReadMillis(*timeouts, "keepaliveMs", config.keepalive_interval);
        }
        if (const auto retry = document.find("retry"); retry != document.end()) {
            config.retry.max_attempts = retry->value("maxAttempts", config.retry.max_attempts);
            config.retry.initial_delay = ReadMillis(*retry, "initialDelayMs", config.retry.initial_delay);
            config.retry.backoff_multiplier = retry->value("backoffMultiplier", config.retry.backoff_multiplier);
            config.retry.request_timeout = ReadMillis(*retry, "requestTimeoutMs", config.retry.request_timeout);
            config.retry.initial_wait = ReadMillis(*retry, "initialWaitMs", config.retry.initial_wait);
        }
    } catch (const json::exception& ex) {
        return ConfigResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Invalid configuration value: {}", ex.what())));
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return ConfigResult::Err(std::move(valid).UnwrapErr());
    }
    return ConfigResult::Ok(std::move(config));
}

Result<BridgeConfig, ProtocolFailure> BridgeConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Cannot open config file: {}", path.string())));
    }
    json document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        return ConfigResult::Err(ProtocolFailure::InvalidInput(
            compat::format("Config file is not valid JSON: {}", path.string())));
    }
    return FromJson(document);
}

void BridgeConfig::ApplyEnvironment() {
    if (auto value = Environment("VAULTBRIDGE_URL")) {
        url = std::move(*value);
    }
    if (auto value = Environment("VAULTBRIDGE_CLIENT_NAME")) {
        client_name = std::move(*value);
    }
    if (auto value = Environment("VAULTBRIDGE_TARGET_KEY_FILE")) {
        target_public_key_file = std::filesystem::path(*value);
    }
    if (auto value = Environment("VAULTBRIDGE_LOG_LEVEL")) {
        log_level = std::move(*value);
    }
}

Result<Unit, ProtocolFailure> BridgeConfig::ResolveTargetKey() {
    if (!target_public_key.empty() || !target_public_key_file.has_value()) {
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    std::ifstream file(*target_public_key_file);
    if (!file.is_open()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            compat::format("Target public key file not found: {}", target_public_key_file->string())));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    target_public_key = Trim(contents.str());
    if (target_public_key.empty()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            compat::format("Target public key file is empty: {}", target_public_key_file->string())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> BridgeConfig::Validate() const {
    if (url.rfind("ws://", 0) != 0) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            compat::format("Bridge URL must start with ws://, got '{}'", url)));
    }
    if (client_name.empty()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Client name must not be empty"));
    }
    if (!IsUtf8(client_name) || !IsUtf8(target_name) || !IsUtf8(target_public_key)) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            "Client name and target routing fields must be valid UTF-8"));
    }
    if (request_timeout.count() <= 0 || authorization_timeout.count() <= 0 ||
        connect_window.count() <= 0 || connect_interval.count() <= 0) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Timeouts must be positive"));
    }
    if (keepalive_interval.count() < 0) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Keepalive interval must not be negative"));
    }
    return retry.Validate();
}

}
