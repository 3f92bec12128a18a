#pragma once
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/core/failures.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace vaultbridge::protocol {

struct ClientInfo {
    std::string client_id;
    std::string client_name;
    std::string public_key;
};

struct HandshakeMessage {
    uint32_t version = 0;
    ClientInfo client;
};

struct HandshakeResponse {
    std::optional<std::string> server_public_key;
    bool authorized = false;
    bool pending_approval = false;
};

// Client to vault. message and iv are base64; public_key is the ephemeral SPKI.
struct RequestEnvelope {
    std::string action;
    std::string message;
    std::string iv;
    std::string client_id;
    std::string public_key;
    std::string extension_public_key;
    std::string extension_name;
};

struct ResponseEnvelope {
    std::string action;
    std::string message;
    std::string iv;
    std::string client_id;
    std::string public_key;
};

struct AuthorizationUpdate {
    bool authorized = false;
};

struct ErrorMessage {
    std::string code;
    std::string message;
};

struct Pong {};

struct UnknownMessage {
    std::string type;
};

using InboundMessage = std::variant<
    HandshakeResponse,
    ResponseEnvelope,
    AuthorizationUpdate,
    ErrorMessage,
    Pong,
    UnknownMessage>;

void to_json(nlohmann::json& j, const ClientInfo& value);
void from_json(const nlohmann::json& j, ClientInfo& value);
void to_json(nlohmann::json& j, const HandshakeMessage& value);
void from_json(const nlohmann::json& j, HandshakeMessage& value);
void to_json(nlohmann::json& j, const HandshakeResponse& value);
void from_json(const nlohmann::json& j, HandshakeResponse& value);
void to_json(nlohmann::json& j, const RequestEnvelope& value);
void from_json(const nlohmann::json& j, RequestEnvelope& value);
void to_json(nlohmann::json& j, const ResponseEnvelope& value);
void from_json(const nlohmann::json& j, ResponseEnvelope& value);
void to_json(nlohmann::json& j, const AuthorizationUpdate& value);
void from_json(const nlohmann::json& j, AuthorizationUpdate& value);
void to_json(nlohmann::json& j, const ErrorMessage& value);
void from_json(const nlohmann::json& j, ErrorMessage& value);

/**
 * Frame-level codec for the bridge channel.
 *
 * Every frame is a JSON object whose string `type` selects the shape. Encode
 * stamps the type and fails with Encode when a string field is not valid
 * UTF-8; DecodeInbound accepts the five vault-to-client types and reports
 * anything else as UnknownMessage so the caller can log and move on.
 */
class MessageCodec {
public:
    using EncodeResult = Result<std::string, ProtocolFailure>;

    [[nodiscard]] static EncodeResult Encode(const HandshakeMessage& message);
    [[nodiscard]] static EncodeResult Encode(const RequestEnvelope& message);
    [[nodiscard]] static EncodeResult Encode(const HandshakeResponse& message);
    [[nodiscard]] static EncodeResult Encode(const ResponseEnvelope& message);
    [[nodiscard]] static EncodeResult Encode(const AuthorizationUpdate& message);
    [[nodiscard]] static EncodeResult Encode(const ErrorMessage& message);
    [[nodiscard]] static std::string EncodePing();

    // Compact serialization that rejects invalid UTF-8 instead of throwing.
    [[nodiscard]] static EncodeResult Serialize(const nlohmann::json& body);

    [[nodiscard]] static Result<InboundMessage, ProtocolFailure> DecodeInbound(std::string_view frame);

    // Parses a frame and returns its object and type; used by both directions.
    [[nodiscard]] static Result<std::pair<std::string, nlohmann::json>, ProtocolFailure>
    ParseFrame(std::string_view frame);
private:
    MessageCodec() = delete;
};

}
