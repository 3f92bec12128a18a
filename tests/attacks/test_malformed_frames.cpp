#include <catch2/catch.hpp>
#include "helpers/client_harness.hpp"

#include <string>
#include <vector>

using namespace vaultbridge::protocol;
using namespace vaultbridge::protocol::test_helpers;
using namespace std::chrono_literals;
using nlohmann::json;
using Approval = FakeVaultPeer::Approval;

TEST_CASE("Malformed frames - Garbage never disturbs the channel", "[attacks][frames]") {
    ClientHarness harness(Approval::Paired);
    REQUIRE(harness.Connect());

    const std::vector<std::string> frames = {
        "",
        "null",
        "\xff\xfe\x00garbage",
        "{\"type\":",
        "[\"handshakeResponse\"]",
        R"({"type":null})",
        R"({"type":"response"})",
        R"({"type":"response","message":[],"iv":"","publicKey":""})",
        R"({"type":"response","message":"","iv":"","publicKey":""})",
        R"({"type":"error"})",
        R"({"type":"totallyNewFeature","data":{}})",
        std::string(64 * 1024, '{'),
    };
    for (const auto& frame : frames) {
        harness.transport->Deliver(frame);
    }
    harness.RunFor(30ms);

    REQUIRE(harness.transport->IsOpen());
    REQUIRE(harness.Request(ActionKind::GetPasswordConfig, json::object()).IsOk());
}

TEST_CASE("Malformed frames - Out-of-order control messages", "[attacks][frames]") {
    SECTION("Authorization update before the handshake verdict is ignored") {
        ClientHarness harness(Approval::Pending);
        std::optional<Result<Unit, ProtocolFailure>> connected;
        harness.transport->SetOutboundHook({});
        harness.client->Connect([&](Result<Unit, ProtocolFailure> result) { connected.emplace(std::move(result)); });
        REQUIRE(harness.RunUntil([&] { return connected.has_value(); }));
        REQUIRE(harness.client->State().status == ConnectionStatus::Connecting);

        harness.peer.Approve();
        harness.RunFor(20ms);
        REQUIRE(harness.client->State().status == ConnectionStatus::Connecting);
    }
    SECTION("A handshake key that is not P-256 leaves the channel keyless") {
        ClientHarness harness(Approval::Paired);
        harness.transport->SetOutboundHook([&harness](const std::string&) {
            harness.transport->Deliver(R"({"type":"handshakeResponse","serverPublicKey":"AAAA","authorized":true})");
        });
        REQUIRE(harness.Connect());
        REQUIRE(harness.client->State().status == ConnectionStatus::Paired);
        REQUIRE_FALSE(harness.client->State().peer_public_key.has_value());
        auto result = harness.Request(ActionKind::GetPasswordConfig, json::object());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::HandshakeIncomplete);
    }
    SECTION("A second handshake verdict replaces the first") {
        ClientHarness harness(Approval::Paired);
        REQUIRE(harness.Connect());
        harness.transport->Deliver(MessageCodec::Encode(HandshakeResponse{harness.peer.PublicKeyBase64(), false, true}).Unwrap());
        REQUIRE(harness.RunUntil([&] {
            return harness.client->State().status == ConnectionStatus::PendingApproval;
        }));
        auto result = harness.Request(ActionKind::GetPasswordConfig, json::object());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::NotAuthorized);
    }
}
