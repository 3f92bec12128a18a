#include "vaultbridge/protocol/messages.hpp"
#include "vaultbridge/protocol/constants.hpp"
#include "vaultbridge/core/format.hpp"

namespace vaultbridge::protocol {
using nlohmann::json;

namespace {
    MessageCodec::EncodeResult Stamp(json body, const std::string_view type) {
        body["type"] = type;
        return MessageCodec::Serialize(body);
    }

    bool OptionalBool(const json& j, const char* key) {
        const auto it = j.find(key);
        return it != j.end() && it->is_boolean() && it->get<bool>();
    }
}

void to_json(json& j, const ClientInfo& value) {
    j = json{
        {"clientId", value.client_id},
        {"clientName", value.client_name},
        {"publicKey", value.public_key}
    };
}

void from_json(const json& j, ClientInfo& value) {
    j.at("clientId").get_to(value.client_id);
    j.at("clientName").get_to(value.client_name);
    j.at("publicKey").get_to(value.public_key);
}

void to_json(json& j, const HandshakeMessage& value) {
    j = json{
        {"version", value.version},
        {"client", value.client}
    };
}

void from_json(const json& j, HandshakeMessage& value) {
    j.at("version").get_to(value.version);
    j.at("client").get_to(value.client);
}

void to_json(json& j, const HandshakeResponse& value) {
    j = json{
        {"authorized", value.authorized},
        {"pendingApproval", value.pending_approval}
    };
    if (value.server_public_key.has_value()) {
        j["serverPublicKey"] = *value.server_public_key;
    }
}

// Absent flags mean false; a missing or non-string key leaves the key unset.
void from_json(const json& j, HandshakeResponse& value) {
    value.authorized = OptionalBool(j, "authorized");
    value.pending_approval = OptionalBool(j, "pendingApproval");
    value.server_public_key.reset();
    if (const auto it = j.find("serverPublicKey"); it != j.end() && it->is_string()) {
        value.server_public_key = it->get<std::string>();
    }
}

void to_json(json& j, const RequestEnvelope& value) {
    j = json{
        {"action", value.action},
        {"message", value.message},
        {"iv", value.iv},
        {"clientId", value.client_id},
        {"publicKey", value.public_key},
        {"extensionPublicKey", value.extension_public_key},
        {"extensionName", value.extension_name}
    };
}

void from_json(const json& j, RequestEnvelope& value) {
    j.at("action").get_to(value.action);
    j.at("message").get_to(value.message);
    j.at("iv").get_to(value.iv);
    j.at("clientId").get_to(value.client_id);
    j.at("publicKey").get_to(value.public_key);
    j.at("extensionPublicKey").get_to(value.extension_public_key);
    j.at("extensionName").get_to(value.extension_name);
}

void to_json(json& j, const ResponseEnvelope& value) {
    j = json{
        {"action", value.action},
        {"message", value.message},
        {"iv", value.iv},
        {"clientId", value.client_id},
        {"publicKey", value.public_key}
    };
}

void from_json(const json& j, ResponseEnvelope& value) {
    j.at("message").get_to(value.message);
    j.at("iv").get_to(value.iv);
    j.at("publicKey").get_to(value.public_key);
    value.action = j.value("action", std::string());
    value.client_id = j.value("clientId", std::string());
}

void to_json(json& j, const AuthorizationUpdate& value) {
    j = json{{"authorized", value.authorized}};
}

void from_json(const json& j, AuthorizationUpdate& value) {
    value.authorized = OptionalBool(j, "authorized");
}

void to_json(json& j, const ErrorMessage& value) {
    j = json{
        {"code", value.code},
        {"message", value.message}
    };
}

void from_json(const json& j, ErrorMessage& value) {
    value.code.clear();
    if (const auto it = j.find("code"); it != j.end() && !it->is_null()) {
        value.code = it->is_string() ? it->get<std::string>() : it->dump();
    }
    value.message = j.value("message", std::string());
}

MessageCodec::EncodeResult MessageCodec::Encode(const HandshakeMessage& message) {
    return Stamp(message, wire::kHandshake);
}

MessageCodec::EncodeResult MessageCodec::Encode(const RequestEnvelope& message) {
    return Stamp(message, wire::kRequest);
}

MessageCodec::EncodeResult MessageCodec::Encode(const HandshakeResponse& message) {
    return Stamp(message, wire::kHandshakeResponse);
}

MessageCodec::EncodeResult MessageCodec::Encode(const ResponseEnvelope& message) {
    return Stamp(message, wire::kResponse);
}

MessageCodec::EncodeResult MessageCodec::Encode(const AuthorizationUpdate& message) {
    return Stamp(message, wire::kAuthorizationUpdate);
}

MessageCodec::EncodeResult MessageCodec::Encode(const ErrorMessage& message) {
    return Stamp(message, wire::kError);
}

std::string MessageCodec::EncodePing() {
    return json{{"type", std::string(wire::kPing)}}.dump();
}

MessageCodec::EncodeResult MessageCodec::Serialize(const json& body) {
    try {
        return EncodeResult::Ok(body.dump(-1, ' ', false, json::error_handler_t::strict));
    } catch (const json::exception& ex) {
        return EncodeResult::Err(ProtocolFailure::Encode(
            compat::format("Cannot serialize frame: {}", ex.what())));
    }
}

Result<std::pair<std::string, json>, ProtocolFailure> MessageCodec::ParseFrame(std::string_view frame) {
    using FrameResult = Result<std::pair<std::string, json>, ProtocolFailure>;
    json body = json::parse(frame.begin(), frame.end(), nullptr, false);
    if (body.is_discarded()) {
        return FrameResult::Err(ProtocolFailure::Decode("Frame is not valid JSON"));
    }
    if (!body.is_object()) {
        return FrameResult::Err(ProtocolFailure::Decode("Frame is not a JSON object"));
    }
    const auto type = body.find("type");
    if (type == body.end() || !type->is_string()) {
        return FrameResult::Err(ProtocolFailure::Decode("Frame has no string 'type'"));
    }
    std::string type_name = type->get<std::string>();
    return FrameResult::Ok(std::make_pair(std::move(type_name), std::move(body)));
}

Result<InboundMessage, ProtocolFailure> MessageCodec::DecodeInbound(std::string_view frame) {
    using InboundResult = Result<InboundMessage, ProtocolFailure>;
    auto parsed = ParseFrame(frame);
    if (parsed.IsErr()) {
        return InboundResult::Err(std::move(parsed).UnwrapErr());
    }
    auto [type, body] = std::move(parsed).Unwrap();
    try {
        if (type == wire::kHandshakeResponse) {
            return InboundResult::Ok(body.get<HandshakeResponse>());
        }
        if (type == wire::kResponse) {
            return InboundResult::Ok(body.get<ResponseEnvelope>());
        }
        if (type == wire::kAuthorizationUpdate) {
            return InboundResult::Ok(body.get<AuthorizationUpdate>());
        }
        if (type == wire::kError) {
            return InboundResult::Ok(body.get<ErrorMessage>());
        }
        if (type == wire::kPong) {
            return InboundResult::Ok(Pong{});
        }
    } catch (const json::exception& ex) {
        return InboundResult::Err(ProtocolFailure::Decode(
            compat::format("Malformed '{}' frame: {}", type, ex.what())));
    }
    return InboundResult::Ok(UnknownMessage{std::move(type)});
}

}
