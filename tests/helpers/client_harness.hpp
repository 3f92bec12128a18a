#pragma once
#include "helpers/fake_transport.hpp"
#include "helpers/fake_vault_peer.hpp"

#include "vaultbridge/client/vault_bridge_client.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <optional>

namespace vaultbridge::protocol::test_helpers {
using client::VaultBridgeClient;
using configuration::BridgeConfig;

/**
 * A client wired to a FakeVaultPeer over a FakeTransport, all driven by one
 * io_context on the test thread.
 */
struct ClientHarness {
    explicit ClientHarness(
        FakeVaultPeer::Approval approval,
        const std::function<void(BridgeConfig&)>& tune = {})
        : transport(std::make_shared<FakeTransport>(io))
        , peer(*transport, approval) {
        auto config = BridgeConfig::Default();
        config.client_name = "Test Client";
        config.target_public_key = peer.PublicKeyBase64();
        if (tune) {
            tune(config);
        }
        client = VaultBridgeClient::Create(io, config, identity::ClientIdentity::Create().Unwrap(), transport).Unwrap();
    }

    template<typename Predicate>
    bool RunUntil(Predicate predicate, const std::chrono::milliseconds limit = std::chrono::seconds(3)) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!predicate() && std::chrono::steady_clock::now() < deadline) {
            io.restart();
            io.run_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    void RunFor(const std::chrono::milliseconds duration) {
        const auto deadline = std::chrono::steady_clock::now() + duration;
        while (std::chrono::steady_clock::now() < deadline) {
            io.restart();
            io.run_for(std::chrono::milliseconds(5));
        }
    }

    // Connects and waits for the handshake verdict.
    bool Connect() {
        std::optional<Result<Unit, ProtocolFailure>> connected;
        client->Connect([&](Result<Unit, ProtocolFailure> result) { connected.emplace(std::move(result)); });
        if (!RunUntil([&] { return connected.has_value(); }) || connected->IsErr()) {
            return false;
        }
        return RunUntil([&] {
            const auto status = client->State().status;
            return status != ConnectionStatus::Connecting && status != ConnectionStatus::Disconnected;
        });
    }

    Result<nlohmann::json, ProtocolFailure> Request(ActionKind action, nlohmann::json payload) {
        std::optional<Result<nlohmann::json, ProtocolFailure>> outcome;
        client->SendRequest(action, std::move(payload),
            [&](Result<nlohmann::json, ProtocolFailure> result) { outcome.emplace(std::move(result)); });
        RunUntil([&] { return outcome.has_value(); }, std::chrono::seconds(15));
        if (!outcome.has_value()) {
            return Result<nlohmann::json, ProtocolFailure>::Err(ProtocolFailure::Generic("test: no completion"));
        }
        return std::move(*outcome);
    }

    boost::asio::io_context io;
    std::shared_ptr<FakeTransport> transport;
    FakeVaultPeer peer;
    std::shared_ptr<VaultBridgeClient> client;
};

}
