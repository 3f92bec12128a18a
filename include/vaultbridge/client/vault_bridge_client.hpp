#pragma once
#include "vaultbridge/configuration/bridge_config.hpp"
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/identity/client_identity.hpp"
#include "vaultbridge/interfaces/i_transport.hpp"
#include "vaultbridge/protocol/actions.hpp"
#include "vaultbridge/protocol/authorization_state_machine.hpp"
#include "vaultbridge/protocol/messages.hpp"
#include "vaultbridge/rpc/pending_request_table.hpp"
#include "vaultbridge/rpc/retry.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vaultbridge::protocol::client {
using configuration::BridgeConfig;
using identity::ClientIdentity;

/**
 * @brief Untrusted-side endpoint of the vault bridge channel.
 *
 * Connect opens the transport and sends the plaintext handshake; the vault's
 * verdict and later authorization updates drive the state machine. Once
 * paired, every SendRequest seals its payload for the vault's long-term key
 * under a fresh ephemeral key and waits for the response that carries the
 * same requestId. Requests are multiplexed; responses may arrive in any order.
 *
 * Asynchronous results are delivered on the io_context. Disconnect, a remote
 * close and a transport error all reject every outstanding request with
 * Disconnected.
 */
class VaultBridgeClient : public std::enable_shared_from_this<VaultBridgeClient> {
public:
    using ConnectHandler = std::function<void(Result<Unit, ProtocolFailure>)>;
    using ResponseHandler = rpc::PendingRequestTable::CompletionHandler;
    using BoolHandler = std::function<void(bool)>;
    using CreateHandler = std::function<void(Result<std::shared_ptr<VaultBridgeClient>, ProtocolFailure>)>;

    [[nodiscard]] static Result<std::shared_ptr<VaultBridgeClient>, ProtocolFailure> Create(
        boost::asio::io_context& io,
        BridgeConfig config,
        std::shared_ptr<const ClientIdentity> identity,
        std::shared_ptr<ITransport> transport);

    // Generates the identity on the io_context, then builds a WebSocket-backed client.
    static void CreateAsync(
        boost::asio::io_context& io,
        BridgeConfig config,
        CreateHandler handler);

    void Connect(ConnectHandler handler);
    void Disconnect();

    // Repeats Connect every config interval until it succeeds or the window closes.
    void ConnectWithRetry(BoolHandler handler);
    void ConnectWithRetry(std::chrono::milliseconds window, std::chrono::milliseconds interval, BoolHandler handler);

    void SendRequest(ActionKind action, nlohmann::json payload, ResponseHandler handler);
    void SendRequest(ActionKind action, nlohmann::json payload,
                     std::chrono::milliseconds timeout, ResponseHandler handler);

    // Each attempt is a full SendRequest with its own requestId and ephemeral key.
    void SendRequestWithRetry(ActionKind action, nlohmann::json payload,
                              const rpc::RetryPolicy& policy, ResponseHandler handler);

    void GetItems(const GetItemsRequest& request, ResponseHandler handler);
    void GetTotp(const GetTotpRequest& request, ResponseHandler handler);
    void CreateItem(const ItemEntry& entry, ResponseHandler handler);
    void UpdateItem(const UpdateItemRequest& request, ResponseHandler handler);

    /**
     * true once paired; false on denial, disconnect or timeout. Completes
     * immediately when already paired, and also when the current state is
     * connected or disconnected.
     */
    void WaitForAuthorization(BoolHandler handler);
    void WaitForAuthorization(std::chrono::milliseconds timeout, BoolHandler handler);

    [[nodiscard]] SubscriptionId Subscribe(AuthorizationStateMachine::StateHandler handler);
    bool Unsubscribe(SubscriptionId id);

    [[nodiscard]] ConnectionState State() const;
    [[nodiscard]] const ClientIdentity& Identity() const noexcept { return *identity_; }
    [[nodiscard]] const BridgeConfig& Config() const noexcept { return config_; }
    [[nodiscard]] size_t PendingRequestCount() const;

    VaultBridgeClient(const VaultBridgeClient&) = delete;
    VaultBridgeClient& operator=(const VaultBridgeClient&) = delete;

private:
    VaultBridgeClient(
        boost::asio::io_context& io,
        BridgeConfig config,
        std::shared_ptr<const ClientIdentity> identity,
        std::shared_ptr<ITransport> transport);

    void AttachTransport();
    void OnTransportOpen(Result<Unit, ProtocolFailure> opened, const ConnectHandler& handler);
    void OnTransportClosed();
    void OnTransportError(const ProtocolFailure& failure);
    void HandleFrame(std::string_view frame);
    void HandleHandshakeResponse(const HandshakeResponse& response);
    void HandleResponse(const ResponseEnvelope& envelope);
    void HandleServerError(const ErrorMessage& error);

    [[nodiscard]] Result<std::string, ProtocolFailure> BuildRequestFrame(
        ActionKind action,
        const nlohmann::json& payload,
        const crypto::EcPublicKey& peer) const;
    [[nodiscard]] Result<nlohmann::json, ProtocolFailure> OpenResponse(const ResponseEnvelope& envelope) const;

    void StartKeepalive();
    void StopKeepalive();
    void ResetChannel(std::optional<std::string> error, const ProtocolFailure& reason);
    void Complete(const ResponseHandler& handler, ProtocolFailure failure);

    boost::asio::io_context& io_;
    BridgeConfig config_;
    std::shared_ptr<const ClientIdentity> identity_;
    std::shared_ptr<ITransport> transport_;
    AuthorizationStateMachine state_;
    std::shared_ptr<rpc::PendingRequestTable> pending_;
    boost::asio::steady_timer keepalive_timer_;
};

[[nodiscard]] std::string GenerateRequestId();

}
