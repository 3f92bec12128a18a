#include "vaultbridge/protocol/authorization_state_machine.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/core/logging.hpp"

#include <algorithm>

namespace vaultbridge::protocol {

AuthorizationStateMachine::AuthorizationStateMachine(std::string client_id)
    : lock_(std::make_unique<std::mutex>())
    , client_id_(std::move(client_id)) {}

ConnectionState AuthorizationStateMachine::SnapshotLocked() const {
    ConnectionState state;
    state.status = status_;
    state.client_id = client_id_;
    state.error = error_;
    if (peer_public_key_.has_value()) {
        state.peer_public_key = peer_public_key_->ToBase64();
    }
    return state;
}

ConnectionState AuthorizationStateMachine::Snapshot() const {
    std::lock_guard guard(*lock_);
    return SnapshotLocked();
}

ConnectionStatus AuthorizationStateMachine::Status() const {
    std::lock_guard guard(*lock_);
    return status_;
}

std::optional<crypto::EcPublicKey> AuthorizationStateMachine::PeerPublicKey() const {
    std::lock_guard guard(*lock_);
    return peer_public_key_;
}

SubscriptionId AuthorizationStateMachine::Subscribe(StateHandler handler) {
    auto shared_handler = std::make_shared<StateHandler>(std::move(handler));
    SubscriptionId id = 0;
    ConnectionState current;
    {
        std::lock_guard guard(*lock_);
        id = next_subscription_id_++;
        subscribers_.push_back(Subscriber{id, shared_handler});
        current = SnapshotLocked();
    }
    (*shared_handler)(current);
    return id;
}

bool AuthorizationStateMachine::Unsubscribe(const SubscriptionId id) {
    std::lock_guard guard(*lock_);
    const auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
        [id](const Subscriber& subscriber) { return subscriber.id == id; });
    if (it == subscribers_.end()) {
        return false;
    }
    subscribers_.erase(it);
    return true;
}

size_t AuthorizationStateMachine::SubscriberCount() const {
    std::lock_guard guard(*lock_);
    return subscribers_.size();
}

Result<Unit, ProtocolFailure> AuthorizationStateMachine::BeginConnecting() {
    {
        std::lock_guard guard(*lock_);
        if (status_ != ConnectionStatus::Disconnected) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                compat::format("Cannot start connecting while {}", ToString(status_))));
        }
        status_ = ConnectionStatus::Connecting;
        error_.reset();
    }
    Notify();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> AuthorizationStateMachine::ApplyHandshake(const HandshakeVerdict& verdict) {
    {
        std::lock_guard guard(*lock_);
        if (status_ == ConnectionStatus::Disconnected) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                "Handshake response received while disconnected"));
        }
        status_ = verdict.status;
        peer_public_key_ = verdict.peer_public_key;
    }
    logging::Get()->info("Handshake verdict: {}", ToString(verdict.status));
    Notify();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> AuthorizationStateMachine::ApplyAuthorizationUpdate(const bool authorized) {
    ConnectionStatus next = ConnectionStatus::Connected;
    {
        std::lock_guard guard(*lock_);
        if (status_ == ConnectionStatus::Disconnected || status_ == ConnectionStatus::Connecting) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                compat::format("Authorization update ignored while {}", ToString(status_))));
        }
        next = authorized ? ConnectionStatus::Paired : ConnectionStatus::Connected;
        status_ = next;
    }
    logging::Get()->info("Authorization update: {}", ToString(next));
    Notify();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void AuthorizationStateMachine::RecordError(const ProtocolFailure& failure) {
    logging::Get()->debug("Recording {}: {}", ToString(failure.type), failure.message);
    {
        std::lock_guard guard(*lock_);
        error_ = failure.message;
    }
    Notify();
}

void AuthorizationStateMachine::MarkDisconnected(std::optional<std::string> error) {
    {
        std::lock_guard guard(*lock_);
        status_ = ConnectionStatus::Disconnected;
        peer_public_key_.reset();
        if (error.has_value()) {
            error_ = std::move(error);
        }
    }
    Notify();
}

void AuthorizationStateMachine::Notify() {
    std::vector<Subscriber> snapshot;
    ConnectionState current;
    {
        std::lock_guard guard(*lock_);
        snapshot = subscribers_;
        current = SnapshotLocked();
    }
    for (const auto& subscriber : snapshot) {
        (*subscriber.handler)(current);
    }
}

}
