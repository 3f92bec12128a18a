#include <catch2/catch.hpp>
#include "vaultbridge/protocol/authorization_state_machine.hpp"

#include <vector>

using namespace vaultbridge::protocol;
using namespace vaultbridge::protocol::crypto;

namespace {
HandshakeVerdict Verdict(const ConnectionStatus status, std::optional<EcPublicKey> key = std::nullopt) {
    HandshakeVerdict verdict;
    verdict.status = status;
    verdict.peer_public_key = std::move(key);
    return verdict;
}
}

TEST_CASE("AuthorizationStateMachine - Subscribers see the current state first", "[state]") {
    AuthorizationStateMachine machine("client-1");
    std::vector<ConnectionStatus> seen;
    const auto id = machine.Subscribe([&](const ConnectionState& state) {
        REQUIRE(state.client_id == "client-1");
        seen.push_back(state.status);
    });
    REQUIRE(seen == std::vector{ConnectionStatus::Disconnected});

    REQUIRE(machine.BeginConnecting().IsOk());
    REQUIRE(machine.ApplyHandshake(Verdict(ConnectionStatus::PendingApproval)).IsOk());
    REQUIRE(machine.ApplyAuthorizationUpdate(true).IsOk());
    REQUIRE(seen == std::vector{
        ConnectionStatus::Disconnected,
        ConnectionStatus::Connecting,
        ConnectionStatus::PendingApproval,
        ConnectionStatus::Paired});

    REQUIRE(machine.Unsubscribe(id));
    REQUIRE_FALSE(machine.Unsubscribe(id));
    machine.MarkDisconnected();
    REQUIRE(seen.size() == 4);
}

TEST_CASE("AuthorizationStateMachine - Pairing lifecycle", "[state]") {
    AuthorizationStateMachine machine("client-2");
    const auto vault = EcKeyPair::Generate().Unwrap();

    REQUIRE(machine.BeginConnecting().IsOk());
    SECTION("Connecting twice is refused") {
        auto again = machine.BeginConnecting();
        REQUIRE(again.IsErr());
        REQUIRE(again.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
    SECTION("Handshake stores the peer key and disconnect clears it") {
        REQUIRE(machine.ApplyHandshake(Verdict(ConnectionStatus::Paired, vault.PublicKey())).IsOk());
        REQUIRE(machine.Status() == ConnectionStatus::Paired);
        REQUIRE(machine.PeerPublicKey().has_value());
        REQUIRE(machine.Snapshot().peer_public_key == vault.PublicKey().ToBase64());

        machine.MarkDisconnected("Connection lost");
        const auto state = machine.Snapshot();
        REQUIRE(state.status == ConnectionStatus::Disconnected);
        REQUIRE_FALSE(state.peer_public_key.has_value());
        REQUIRE(state.error == "Connection lost");
    }
    SECTION("Revocation falls back to connected") {
        REQUIRE(machine.ApplyHandshake(Verdict(ConnectionStatus::Paired, vault.PublicKey())).IsOk());
        REQUIRE(machine.ApplyAuthorizationUpdate(false).IsOk());
        REQUIRE(machine.Status() == ConnectionStatus::Connected);
    }
    SECTION("Authorization updates before the handshake are ignored") {
        REQUIRE(machine.ApplyAuthorizationUpdate(true).IsErr());
        REQUIRE(machine.Status() == ConnectionStatus::Connecting);
    }
}

TEST_CASE("AuthorizationStateMachine - Errors", "[state]") {
    AuthorizationStateMachine machine("client-3");
    int notifications = 0;
    (void)machine.Subscribe([&](const ConnectionState&) { ++notifications; });

    SECTION("Server errors are recorded without a status change") {
        REQUIRE(machine.BeginConnecting().IsOk());
        REQUIRE(machine.ApplyHandshake(Verdict(ConnectionStatus::Connected)).IsOk());
        machine.RecordError(ProtocolFailure::ServerError("Vault locked"));
        REQUIRE(machine.Snapshot().error == "Vault locked");
        REQUIRE(machine.Status() == ConnectionStatus::Connected);
        REQUIRE(notifications == 4);
    }
    SECTION("A new connection attempt clears the last error") {
        machine.MarkDisconnected("Connection failed - is the vault running?");
        REQUIRE(machine.Snapshot().error.has_value());
        REQUIRE(machine.BeginConnecting().IsOk());
        REQUIRE_FALSE(machine.Snapshot().error.has_value());
    }
    SECTION("Handshake while disconnected is refused") {
        REQUIRE(machine.ApplyHandshake(Verdict(ConnectionStatus::Paired)).IsErr());
    }
}

TEST_CASE("AuthorizationStateMachine - Handlers may unsubscribe themselves", "[state]") {
    AuthorizationStateMachine machine("client-4");
    SubscriptionId self_id = 0;
    int calls = 0;
    self_id = machine.Subscribe([&](const ConnectionState& state) {
        ++calls;
        if (state.status == ConnectionStatus::Connecting) {
            machine.Unsubscribe(self_id);
        }
    });
    REQUIRE(machine.BeginConnecting().IsOk());
    machine.MarkDisconnected();
    REQUIRE(calls == 2);
    REQUIRE(machine.SubscriberCount() == 0);
}
