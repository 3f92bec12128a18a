#include "vaultbridge/client/vault_bridge_client.hpp"
#include "vaultbridge/core/constants.hpp"
#include "vaultbridge/core/format.hpp"
#include "vaultbridge/core/logging.hpp"
#include "vaultbridge/crypto/sodium_interop.hpp"
#include "vaultbridge/protocol/constants.hpp"
#include "vaultbridge/protocol/handshake.hpp"
#include "vaultbridge/transport/websocket_transport.hpp"
#include "vaultbridge/utilities/envelope_builder.hpp"

#include <boost/asio/post.hpp>

#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

namespace vaultbridge::protocol::client {
using crypto::SodiumInterop;
using utilities::EnvelopeBuilder;

namespace {

using Clock = std::chrono::steady_clock;

template<typename T>
void WipeQuietly(T& buffer) {
    auto __wipe = SodiumInterop::SecureWipe(buffer);
    (void)__wipe;
}

// Settles a WaitForAuthorization call exactly once.
class AuthorizationWaiter : public std::enable_shared_from_this<AuthorizationWaiter> {
public:
    AuthorizationWaiter(boost::asio::io_context& io, VaultBridgeClient::BoolHandler handler)
        : io_(io)
        , timer_(io)
        , handler_(std::move(handler)) {}

    void Start(const std::shared_ptr<VaultBridgeClient>& client, const std::chrono::milliseconds timeout) {
        client_ = client;
        timer_.expires_after(timeout);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            self->Settle(false);
        });

        const auto id = client->Subscribe([weak = weak_from_this()](const ConnectionState& state) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            switch (state.status) {
                case ConnectionStatus::Paired:
                    self->Settle(true);
                    break;
                case ConnectionStatus::Connected:
                case ConnectionStatus::Disconnected:
                    self->Settle(false);
                    break;
                case ConnectionStatus::Connecting:
                case ConnectionStatus::PendingApproval:
                    break;
            }
        });

        bool settled_during_replay = false;
        {
            std::lock_guard guard(lock_);
            subscription_ = id;
            settled_during_replay = settled_;
        }
        if (settled_during_replay) {
            client->Unsubscribe(id);
        }
    }

private:
    void Settle(const bool authorized) {
        std::optional<SubscriptionId> subscription;
        {
            std::lock_guard guard(lock_);
            if (settled_) {
                return;
            }
            settled_ = true;
            subscription = subscription_;
        }
        timer_.cancel();
        if (subscription.has_value()) {
            if (auto client = client_.lock()) {
                client->Unsubscribe(*subscription);
            }
        }
        boost::asio::post(io_, [handler = std::move(handler_), authorized]() {
            handler(authorized);
        });
    }

    boost::asio::io_context& io_;
    boost::asio::steady_timer timer_;
    VaultBridgeClient::BoolHandler handler_;
    std::weak_ptr<VaultBridgeClient> client_;
    std::mutex lock_;
    bool settled_ = false;
    std::optional<SubscriptionId> subscription_;
};

class ConnectRetry : public std::enable_shared_from_this<ConnectRetry> {
public:
    ConnectRetry(
        boost::asio::io_context& io,
        const std::chrono::milliseconds window,
        const std::chrono::milliseconds interval,
        VaultBridgeClient::BoolHandler handler)
        : timer_(io)
        , deadline_(Clock::now() + window)
        , interval_(interval)
        , handler_(std::move(handler)) {}

    void Attempt(const std::shared_ptr<VaultBridgeClient>& client) {
        ++attempts_;
        client->Connect([self = shared_from_this(), weak = std::weak_ptr(client)](
                            Result<Unit, ProtocolFailure> connected) {
            if (connected.IsOk()) {
                self->handler_(true);
                return;
            }
            auto client_alive = weak.lock();
            if (!client_alive || Clock::now() + self->interval_ > self->deadline_) {
                logging::Get()->warn("Giving up on {} after {} connection attempt(s): {}",
                    client_alive ? client_alive->Config().url : std::string("bridge"),
                    self->attempts_, connected.UnwrapErr().message);
                self->handler_(false);
                return;
            }
            logging::Get()->debug("Connection attempt {} failed, retrying in {}ms",
                self->attempts_, self->interval_.count());
            self->timer_.expires_after(self->interval_);
            self->timer_.async_wait([self, weak](const boost::system::error_code& ec) {
                auto retry_client = weak.lock();
                if (ec || !retry_client) {
                    self->handler_(false);
                    return;
                }
                self->Attempt(retry_client);
            });
        });
    }

private:
    boost::asio::steady_timer timer_;
    Clock::time_point deadline_;
    std::chrono::milliseconds interval_;
    VaultBridgeClient::BoolHandler handler_;
    uint32_t attempts_ = 0;
};

}

std::string GenerateRequestId() {
    return SodiumInterop::ToHex(SodiumInterop::GetRandomBytes(kRequestIdBytes));
}

VaultBridgeClient::VaultBridgeClient(
    boost::asio::io_context& io,
    BridgeConfig config,
    std::shared_ptr<const ClientIdentity> identity,
    std::shared_ptr<ITransport> transport)
    : io_(io)
    , config_(std::move(config))
    , identity_(std::move(identity))
    , transport_(std::move(transport))
    , state_(identity_->ClientId())
    , pending_(rpc::PendingRequestTable::Create(io))
    , keepalive_timer_(io) {}

Result<std::shared_ptr<VaultBridgeClient>, ProtocolFailure> VaultBridgeClient::Create(
    boost::asio::io_context& io,
    BridgeConfig config,
    std::shared_ptr<const ClientIdentity> identity,
    std::shared_ptr<ITransport> transport) {
    using R = Result<std::shared_ptr<VaultBridgeClient>, ProtocolFailure>;
    if (!identity) {
        return R::Err(ProtocolFailure::InvalidInput("Client identity is required"));
    }
    if (!transport) {
        return R::Err(ProtocolFailure::InvalidInput("Transport is required"));
    }
    if (auto resolved = config.ResolveTargetKey(); resolved.IsErr()) {
        return R::Err(std::move(resolved).UnwrapErr());
    }
    if (auto valid = config.Validate(); valid.IsErr()) {
        return R::Err(std::move(valid).UnwrapErr());
    }
    if (config.target_public_key.empty()) {
        logging::Get()->warn("No target public key configured; requests will carry an empty routing key");
    }
    std::shared_ptr<VaultBridgeClient> client(
        new VaultBridgeClient(io, std::move(config), std::move(identity), std::move(transport)));
    client->AttachTransport();
    logging::Get()->debug("Client {} created for {}", client->identity_->ClientId(), client->config_.url);
    return R::Ok(std::move(client));
}

void VaultBridgeClient::CreateAsync(
    boost::asio::io_context& io,
    BridgeConfig config,
    CreateHandler handler) {
    ClientIdentity::CreateAsync(io.get_executor(),
        [&io, config = std::move(config), handler = std::move(handler)](
            Result<std::shared_ptr<ClientIdentity>, ProtocolFailure> identity) mutable {
            if (identity.IsErr()) {
                handler(Result<std::shared_ptr<VaultBridgeClient>, ProtocolFailure>::Err(
                    std::move(identity).UnwrapErr()));
                return;
            }
            handler(Create(io, std::move(config), std::move(identity).Unwrap(),
                transport::WebSocketTransport::Create(io)));
        });
}

void VaultBridgeClient::AttachTransport() {
    std::weak_ptr<VaultBridgeClient> weak = weak_from_this();
    transport_->OnMessage([weak](const std::string_view frame) {
        if (auto self = weak.lock()) {
            self->HandleFrame(frame);
        }
    });
    transport_->OnClose([weak]() {
        if (auto self = weak.lock()) {
            self->OnTransportClosed();
        }
    });
    transport_->OnError([weak](const ProtocolFailure& failure) {
        if (auto self = weak.lock()) {
            self->OnTransportError(failure);
        }
    });
}

void VaultBridgeClient::Connect(ConnectHandler handler) {
    if (transport_->IsOpen()) {
        boost::asio::post(io_, [handler = std::move(handler)]() {
            handler(Result<Unit, ProtocolFailure>::Ok(unit));
        });
        return;
    }
    if (auto begun = state_.BeginConnecting(); begun.IsErr()) {
        boost::asio::post(io_, [handler = std::move(handler), failure = std::move(begun).UnwrapErr()]() {
            handler(Result<Unit, ProtocolFailure>::Err(failure));
        });
        return;
    }
    logging::Get()->info("Connecting to {}", config_.url);
    transport_->Connect(config_.url,
        [weak = weak_from_this(), handler = std::move(handler)](Result<Unit, ProtocolFailure> opened) {
            auto self = weak.lock();
            if (!self) {
                handler(Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Disconnected(std::string(ErrorMessages::CONNECTION_CLOSED))));
                return;
            }
            self->OnTransportOpen(std::move(opened), handler);
        });
}

void VaultBridgeClient::OnTransportOpen(Result<Unit, ProtocolFailure> opened, const ConnectHandler& handler) {
    if (opened.IsErr()) {
        logging::Get()->warn("Connection to {} failed: {}", config_.url, opened.UnwrapErr().message);
        if (state_.Status() == ConnectionStatus::Connecting) {
            state_.MarkDisconnected(std::string(ErrorMessages::CONNECTION_FAILED));
        }
        handler(Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Transport(std::string(ErrorMessages::CONNECTION_FAILED))));
        return;
    }

    auto handshake = HandshakeInitiator::Start(*identity_, config_.client_name, config_.protocol_version);
    auto sent = handshake.IsOk()
        ? transport_->Send(handshake.Unwrap().EncodedMessage())
        : Result<Unit, ProtocolFailure>::Err(handshake.UnwrapErr());
    if (sent.IsErr()) {
        const auto failure = std::move(sent).UnwrapErr();
        logging::Get()->warn("Failed to send handshake: {}", failure.message);
        transport_->Close();
        state_.MarkDisconnected(failure.message);
        handler(Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Transport(failure.message)));
        return;
    }
    logging::Get()->info("Connected as {}, handshake sent", identity_->ClientId());
    StartKeepalive();
    handler(Result<Unit, ProtocolFailure>::Ok(unit));
}

void VaultBridgeClient::ConnectWithRetry(BoolHandler handler) {
    ConnectWithRetry(config_.connect_window, config_.connect_interval, std::move(handler));
}

void VaultBridgeClient::ConnectWithRetry(
    const std::chrono::milliseconds window,
    const std::chrono::milliseconds interval,
    BoolHandler handler) {
    std::make_shared<ConnectRetry>(io_, window, interval, std::move(handler))->Attempt(shared_from_this());
}

void VaultBridgeClient::Disconnect() {
    logging::Get()->info("Disconnecting from {}", config_.url);
    transport_->Close();
    ResetChannel(std::nullopt, ProtocolFailure::Disconnected("Disconnected by client"));
}

void VaultBridgeClient::OnTransportClosed() {
    logging::Get()->info("Connection to {} closed", config_.url);
    ResetChannel(std::nullopt, ProtocolFailure::Disconnected(std::string(ErrorMessages::CONNECTION_CLOSED)));
}

void VaultBridgeClient::OnTransportError(const ProtocolFailure& failure) {
    logging::Get()->error("Transport error: {}", failure.message);
    ResetChannel(failure.message, ProtocolFailure::Disconnected(failure.message));
}

void VaultBridgeClient::ResetChannel(std::optional<std::string> error, const ProtocolFailure& reason) {
    StopKeepalive();
    state_.MarkDisconnected(std::move(error));
    if (const size_t rejected = pending_->RejectAll(reason); rejected > 0) {
        logging::Get()->info("Rejected {} pending request(s): {}", rejected, reason.message);
    }
}

void VaultBridgeClient::StartKeepalive() {
    if (config_.keepalive_interval.count() <= 0) {
        return;
    }
    keepalive_timer_.expires_after(config_.keepalive_interval);
    keepalive_timer_.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
        auto self = weak.lock();
        if (ec || !self || !self->transport_->IsOpen()) {
            return;
        }
        if (auto sent = self->transport_->Send(MessageCodec::EncodePing()); sent.IsErr()) {
            logging::Get()->debug("Keepalive ping not sent: {}", sent.UnwrapErr().message);
            return;
        }
        self->StartKeepalive();
    });
}

void VaultBridgeClient::StopKeepalive() {
    keepalive_timer_.cancel();
}

void VaultBridgeClient::HandleFrame(const std::string_view frame) {
    auto decoded = MessageCodec::DecodeInbound(frame);
    if (decoded.IsErr()) {
        logging::Get()->warn("Dropping malformed frame: {}", decoded.UnwrapErr().message);
        return;
    }
    std::visit([this](const auto& message) {
        using M = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<M, HandshakeResponse>) {
            HandleHandshakeResponse(message);
        } else if constexpr (std::is_same_v<M, ResponseEnvelope>) {
            HandleResponse(message);
        } else if constexpr (std::is_same_v<M, AuthorizationUpdate>) {
            if (auto applied = state_.ApplyAuthorizationUpdate(message.authorized); applied.IsErr()) {
                logging::Get()->debug("Ignoring authorization update: {}", applied.UnwrapErr().message);
            }
        } else if constexpr (std::is_same_v<M, ErrorMessage>) {
            HandleServerError(message);
        } else if constexpr (std::is_same_v<M, Pong>) {
            logging::Get()->trace("pong");
        } else {
            logging::Get()->warn("Ignoring message of unknown type '{}'", message.type);
        }
    }, decoded.Unwrap());
}

void VaultBridgeClient::HandleHandshakeResponse(const HandshakeResponse& response) {
    auto verdict = HandshakeInitiator::Finish(response);
    if (verdict.peer_key_error.has_value()) {
        logging::Get()->error("Vault sent an unusable public key: {}", verdict.peer_key_error->message);
    }
    if (auto applied = state_.ApplyHandshake(verdict); applied.IsErr()) {
        logging::Get()->debug("Ignoring handshake response: {}", applied.UnwrapErr().message);
    }
}

void VaultBridgeClient::HandleServerError(const ErrorMessage& error) {
    logging::Get()->error("Vault reported error {}: {}", error.code, error.message);
    state_.RecordError(ProtocolFailure::ServerError(error.message));
}

Result<nlohmann::json, ProtocolFailure> VaultBridgeClient::OpenResponse(const ResponseEnvelope& envelope) const {
    using R = Result<nlohmann::json, ProtocolFailure>;
    auto ciphertext = SodiumInterop::FromBase64(envelope.message);
    auto iv = SodiumInterop::FromBase64(envelope.iv);
    if (ciphertext.IsErr() || iv.IsErr()) {
        return R::Err(ProtocolFailure::DecryptionFailure("Response message or iv is not valid base64"));
    }
    auto sender = crypto::EcPublicKey::FromBase64(envelope.public_key);
    if (sender.IsErr()) {
        return R::Err(ProtocolFailure::DecryptionFailure(
            compat::format("Response public key rejected: {}", sender.UnwrapErr().message)));
    }
    auto plaintext = EnvelopeBuilder::Open(ciphertext.Unwrap(), iv.Unwrap(), sender.Unwrap(), identity_->KeyPair());
    if (plaintext.IsErr()) {
        return R::Err(std::move(plaintext).UnwrapErr());
    }
    auto& bytes = plaintext.Unwrap();
    auto body = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
    WipeQuietly(bytes);
    if (body.is_discarded() || !body.is_object()) {
        return R::Err(ProtocolFailure::DecryptionFailure("Decrypted response is not a JSON object"));
    }
    return R::Ok(std::move(body));
}

void VaultBridgeClient::HandleResponse(const ResponseEnvelope& envelope) {
    auto opened = OpenResponse(envelope);
    if (opened.IsErr()) {
        logging::Get()->warn("Dropping response for {}: {}", envelope.action, opened.UnwrapErr().message);
        return;
    }
    auto body = std::move(opened).Unwrap();
    const auto id = body.find(std::string(wire::kRequestIdField));
    if (id == body.end() || !id->is_string()) {
        logging::Get()->debug("Dropping {} response without requestId", envelope.action);
        return;
    }
    const std::string request_id = id->get<std::string>();
    if (!pending_->Resolve(request_id, std::move(body))) {
        logging::Get()->debug("Dropping response for unknown request {}", request_id);
    }
}

void VaultBridgeClient::Complete(const ResponseHandler& handler, ProtocolFailure failure) {
    boost::asio::post(io_, [handler, failure = std::move(failure)]() {
        handler(Result<nlohmann::json, ProtocolFailure>::Err(failure));
    });
}

Result<std::string, ProtocolFailure> VaultBridgeClient::BuildRequestFrame(
    const ActionKind action,
    const nlohmann::json& payload,
    const crypto::EcPublicKey& peer) const {
    using R = Result<std::string, ProtocolFailure>;
    auto serialized = MessageCodec::Serialize(payload);
    if (serialized.IsErr()) {
        return R::Err(ProtocolFailure::InvalidInput(std::move(serialized).UnwrapErr().message));
    }
    std::string plaintext = std::move(serialized).Unwrap();
    if (plaintext.size() > kMaxPayloadBytes) {
        WipeQuietly(plaintext);
        return R::Err(ProtocolFailure::InvalidInput(compat::format(
            "Payload of {} bytes exceeds the {} byte limit", plaintext.size(), kMaxPayloadBytes)));
    }
    auto sealed = EnvelopeBuilder::Seal(
        std::span(reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()), peer);
    WipeQuietly(plaintext);
    if (sealed.IsErr()) {
        return R::Err(std::move(sealed).UnwrapErr());
    }
    const auto& envelope = sealed.Unwrap();

    RequestEnvelope request;
    request.action = std::string(ToWireName(action));
    request.message = SodiumInterop::ToBase64(envelope.ciphertext_with_tag);
    request.iv = SodiumInterop::ToBase64(envelope.iv);
    request.client_id = identity_->ClientId();
    request.public_key = SodiumInterop::ToBase64(envelope.ephemeral_public_key);
    request.extension_public_key = config_.target_public_key;
    request.extension_name = config_.target_name;
    return MessageCodec::Encode(request);
}

void VaultBridgeClient::SendRequest(ActionKind action, nlohmann::json payload, ResponseHandler handler) {
    SendRequest(action, std::move(payload), config_.request_timeout, std::move(handler));
}

void VaultBridgeClient::SendRequest(
    const ActionKind action,
    nlohmann::json payload,
    const std::chrono::milliseconds timeout,
    ResponseHandler handler) {
    if (!transport_->IsOpen()) {
        Complete(handler, ProtocolFailure::Transport(std::string(ErrorMessages::NOT_CONNECTED)));
        return;
    }
    const auto peer = state_.PeerPublicKey();
    if (!peer.has_value()) {
        Complete(handler, ProtocolFailure::HandshakeIncomplete(std::string(ErrorMessages::HANDSHAKE_NOT_COMPLETE)));
        return;
    }
    if (state_.Status() != ConnectionStatus::Paired) {
        Complete(handler, ProtocolFailure::NotAuthorized(std::string(ErrorMessages::NOT_AUTHORIZED)));
        return;
    }
    if (auto valid = ActionSchema::Validate(action, payload); valid.IsErr()) {
        Complete(handler, std::move(valid).UnwrapErr());
        return;
    }

    const std::string request_id = GenerateRequestId();
    payload[std::string(wire::kRequestIdField)] = request_id;
    auto frame = BuildRequestFrame(action, payload, *peer);
    if (frame.IsErr()) {
        Complete(handler, std::move(frame).UnwrapErr());
        return;
    }

    if (auto registered = pending_->Register(request_id, timeout, handler); registered.IsErr()) {
        Complete(handler, std::move(registered).UnwrapErr());
        return;
    }
    logging::Get()->debug("Sending {} request {} as {} (timeout {}ms, target {} key {})",
        ToWireName(action), request_id, identity_->ClientId(), timeout.count(),
        config_.target_name, config_.target_public_key.substr(0, 16));
    if (auto sent = transport_->Send(std::move(frame).Unwrap()); sent.IsErr()) {
        if (pending_->Discard(request_id)) {
            Complete(handler, ProtocolFailure::Transport(sent.UnwrapErr().message));
        }
    }
}

void VaultBridgeClient::SendRequestWithRetry(
    const ActionKind action,
    nlohmann::json payload,
    const rpc::RetryPolicy& policy,
    ResponseHandler handler) {
    rpc::RetryScheduler::Run(io_, policy,
        [weak = weak_from_this(), action, payload = std::move(payload), timeout = policy.request_timeout](
            uint32_t, rpc::RetryScheduler::Completion done) {
            auto self = weak.lock();
            if (!self) {
                done(Result<nlohmann::json, ProtocolFailure>::Err(
                    ProtocolFailure::Disconnected(std::string(ErrorMessages::CONNECTION_CLOSED))));
                return;
            }
            self->SendRequest(action, payload, timeout, std::move(done));
        },
        std::move(handler));
}

void VaultBridgeClient::GetItems(const GetItemsRequest& request, ResponseHandler handler) {
    SendRequest(ActionKind::GetItems, request.ToPayload(), std::move(handler));
}

void VaultBridgeClient::GetTotp(const GetTotpRequest& request, ResponseHandler handler) {
    SendRequest(ActionKind::GetTotp, request.ToPayload(), std::move(handler));
}

void VaultBridgeClient::CreateItem(const ItemEntry& entry, ResponseHandler handler) {
    SendRequest(ActionKind::CreateItem, entry.ToPayload(), std::move(handler));
}

void VaultBridgeClient::UpdateItem(const UpdateItemRequest& request, ResponseHandler handler) {
    SendRequest(ActionKind::UpdateItem, request.ToPayload(), std::move(handler));
}

void VaultBridgeClient::WaitForAuthorization(BoolHandler handler) {
    WaitForAuthorization(config_.authorization_timeout, std::move(handler));
}

void VaultBridgeClient::WaitForAuthorization(const std::chrono::milliseconds timeout, BoolHandler handler) {
    if (state_.Status() == ConnectionStatus::Paired) {
        boost::asio::post(io_, [handler = std::move(handler)]() { handler(true); });
        return;
    }
    std::make_shared<AuthorizationWaiter>(io_, std::move(handler))->Start(shared_from_this(), timeout);
}

SubscriptionId VaultBridgeClient::Subscribe(AuthorizationStateMachine::StateHandler handler) {
    return state_.Subscribe(std::move(handler));
}

bool VaultBridgeClient::Unsubscribe(const SubscriptionId id) {
    return state_.Unsubscribe(id);
}

ConnectionState VaultBridgeClient::State() const {
    return state_.Snapshot();
}

size_t VaultBridgeClient::PendingRequestCount() const {
    return pending_->Size();
}

}
