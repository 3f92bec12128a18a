#include "vaultbridge/protocol/handshake.hpp"

namespace vaultbridge::protocol {

HandshakeInitiator::HandshakeInitiator(HandshakeMessage message, std::string encoded)
    : message_(std::move(message))
    , encoded_(std::move(encoded)) {}

Result<HandshakeInitiator, ProtocolFailure> HandshakeInitiator::Start(
    const identity::ClientIdentity& identity,
    const std::string_view client_name,
    const uint32_t protocol_version) {
    HandshakeMessage message;
    message.version = protocol_version;
    message.client.client_id = identity.ClientId();
    message.client.client_name = std::string(client_name);
    message.client.public_key = identity.PublicKeyBase64();
    auto encoded = MessageCodec::Encode(message);
    if (encoded.IsErr()) {
        return Result<HandshakeInitiator, ProtocolFailure>::Err(std::move(encoded).UnwrapErr());
    }
    return Result<HandshakeInitiator, ProtocolFailure>::Ok(
        HandshakeInitiator(std::move(message), std::move(encoded).Unwrap()));
}

ConnectionStatus HandshakeInitiator::Decide(const bool authorized, const bool pending_approval) noexcept {
    if (authorized) {
        return ConnectionStatus::Paired;
    }
    if (pending_approval) {
        return ConnectionStatus::PendingApproval;
    }
    return ConnectionStatus::Connected;
}

HandshakeVerdict HandshakeInitiator::Finish(const HandshakeResponse& response) {
    HandshakeVerdict verdict;
    verdict.status = Decide(response.authorized, response.pending_approval);
    if (!response.server_public_key.has_value()) {
        return verdict;
    }
    auto key = crypto::EcPublicKey::FromBase64(*response.server_public_key);
    if (key.IsErr()) {
        verdict.peer_key_error = std::move(key).UnwrapErr();
    } else {
        verdict.peer_public_key = std::move(key).Unwrap();
    }
    return verdict;
}

}
