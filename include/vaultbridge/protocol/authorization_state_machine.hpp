#pragma once
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/crypto/ec_key_pair.hpp"
#include "vaultbridge/protocol/connection_state.hpp"
#include "vaultbridge/protocol/handshake.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vaultbridge::protocol {

using SubscriptionId = uint64_t;

/**
 * @brief Pairing status of the channel plus the subscriber list.
 *
 * All mutators are safe to call from any thread. Subscribers are invoked
 * outside the lock over a copy of the subscriber list, so a handler may
 * subscribe or unsubscribe (itself included) while being notified.
 *
 * Transitions:
 *   disconnected -> connecting                 BeginConnecting
 *   connecting   -> connected|pending|paired   ApplyHandshake
 *   pending      -> paired|connected           ApplyAuthorizationUpdate
 *   any          -> disconnected               MarkDisconnected
 */
class AuthorizationStateMachine {
public:
    using StateHandler = std::function<void(const ConnectionState&)>;

    explicit AuthorizationStateMachine(std::string client_id);

    AuthorizationStateMachine(const AuthorizationStateMachine&) = delete;
    AuthorizationStateMachine& operator=(const AuthorizationStateMachine&) = delete;

    [[nodiscard]] ConnectionState Snapshot() const;
    [[nodiscard]] ConnectionStatus Status() const;
    [[nodiscard]] std::optional<crypto::EcPublicKey> PeerPublicKey() const;

    // Replays the current state to handler before returning.
    [[nodiscard]] SubscriptionId Subscribe(StateHandler handler);
    bool Unsubscribe(SubscriptionId id);
    [[nodiscard]] size_t SubscriberCount() const;

    // Clears the last error. Fails with InvalidState unless disconnected.
    Result<Unit, ProtocolFailure> BeginConnecting();

    // A repeated handshake replaces the retained peer key.
    Result<Unit, ProtocolFailure> ApplyHandshake(const HandshakeVerdict& verdict);

    Result<Unit, ProtocolFailure> ApplyAuthorizationUpdate(bool authorized);

    // Vault error frame: records the failure's message, status is unchanged.
    void RecordError(const ProtocolFailure& failure);

    // Clears the peer key; error is recorded only when given.
    void MarkDisconnected(std::optional<std::string> error = std::nullopt);

private:
    struct Subscriber {
        SubscriptionId id;
        std::shared_ptr<StateHandler> handler;
    };

    [[nodiscard]] ConnectionState SnapshotLocked() const;
    void Notify();

    mutable std::unique_ptr<std::mutex> lock_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    std::string client_id_;
    std::optional<std::string> error_;
    std::optional<crypto::EcPublicKey> peer_public_key_;
    std::vector<Subscriber> subscribers_;
    SubscriptionId next_subscription_id_ = 1;
};

}
