#include <catch2/catch.hpp>
#include "vaultbridge/protocol/messages.hpp"
#include "vaultbridge/protocol/constants.hpp"

#include <nlohmann/json.hpp>

using namespace vaultbridge::protocol;
using nlohmann::json;

TEST_CASE("MessageCodec - Outbound frames use the wire field names", "[messages][wire]") {
    SECTION("Handshake") {
        HandshakeMessage handshake;
        handshake.version = kProtocolVersion;
        handshake.client = ClientInfo{"0123456789abcdef0123456789abcdef", "CLI", "MFkw"};
        const auto frame = json::parse(MessageCodec::Encode(handshake).Unwrap());
        REQUIRE(frame["type"] == "handshake");
        REQUIRE(frame["version"] == 1);
        REQUIRE(frame["client"]["clientId"] == "0123456789abcdef0123456789abcdef");
        REQUIRE(frame["client"]["clientName"] == "CLI");
        REQUIRE(frame["client"]["publicKey"] == "MFkw");
    }
    SECTION("Request") {
        RequestEnvelope request{"get-items", "Y3Q=", "aXY=", "id", "ZXBo", "dmF1bHQ=", "haex-pass"};
        const auto frame = json::parse(MessageCodec::Encode(request).Unwrap());
        REQUIRE(frame["type"] == "request");
        REQUIRE(frame["action"] == "get-items");
        REQUIRE(frame["message"] == "Y3Q=");
        REQUIRE(frame["iv"] == "aXY=");
        REQUIRE(frame["clientId"] == "id");
        REQUIRE(frame["publicKey"] == "ZXBo");
        REQUIRE(frame["extensionPublicKey"] == "dmF1bHQ=");
        REQUIRE(frame["extensionName"] == "haex-pass");
    }
    SECTION("Ping") {
        REQUIRE(json::parse(MessageCodec::EncodePing()) == json{{"type", "ping"}});
    }
}

TEST_CASE("MessageCodec - Inbound frames decode by type", "[messages][wire]") {
    SECTION("Handshake response with defaults for absent flags") {
        auto decoded = MessageCodec::DecodeInbound(R"({"type":"handshakeResponse","serverPublicKey":"AAAA"})");
        REQUIRE(decoded.IsOk());
        const auto& response = std::get<HandshakeResponse>(decoded.Unwrap());
        REQUIRE(response.server_public_key == "AAAA");
        REQUIRE_FALSE(response.authorized);
        REQUIRE_FALSE(response.pending_approval);
    }
    SECTION("Handshake response without a key") {
        auto decoded = MessageCodec::DecodeInbound(R"({"type":"handshakeResponse","pendingApproval":true})");
        const auto& response = std::get<HandshakeResponse>(decoded.Unwrap());
        REQUIRE_FALSE(response.server_public_key.has_value());
        REQUIRE(response.pending_approval);
    }
    SECTION("Response") {
        auto decoded = MessageCodec::DecodeInbound(
            R"({"type":"response","action":"get-items","message":"bQ==","iv":"aQ==","clientId":"c","publicKey":"cA=="})");
        const auto& response = std::get<ResponseEnvelope>(decoded.Unwrap());
        REQUIRE(response.action == "get-items");
        REQUIRE(response.message == "bQ==");
        REQUIRE(response.iv == "aQ==");
        REQUIRE(response.public_key == "cA==");
    }
    SECTION("Authorization update") {
        auto decoded = MessageCodec::DecodeInbound(R"({"type":"authorizationUpdate","authorized":true})");
        REQUIRE(std::get<AuthorizationUpdate>(decoded.Unwrap()).authorized);
    }
    SECTION("Error with a numeric code") {
        auto decoded = MessageCodec::DecodeInbound(R"({"type":"error","code":403,"message":"Denied"})");
        const auto& error = std::get<ErrorMessage>(decoded.Unwrap());
        REQUIRE(error.code == "403");
        REQUIRE(error.message == "Denied");
    }
    SECTION("Pong") {
        auto decoded = MessageCodec::DecodeInbound(R"({"type":"pong"})");
        REQUIRE(std::holds_alternative<Pong>(decoded.Unwrap()));
    }
    SECTION("Unknown types are surfaced, not rejected") {
        auto decoded = MessageCodec::DecodeInbound(R"({"type":"telemetry","x":1})");
        REQUIRE(decoded.IsOk());
        REQUIRE(std::get<UnknownMessage>(decoded.Unwrap()).type == "telemetry");
    }
}

TEST_CASE("MessageCodec - Malformed frames are decode failures", "[messages][wire]") {
    for (const char* frame : {
             "not json",
             "[1,2,3]",
             R"({"no":"type"})",
             R"({"type":7})",
             R"({"type":"response","message":"bQ=="})",
             R"({"type":"response","message":1,"iv":"aQ==","publicKey":"cA=="})"}) {
        auto decoded = MessageCodec::DecodeInbound(frame);
        INFO(frame);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
