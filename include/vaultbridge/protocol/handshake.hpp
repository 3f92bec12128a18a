#pragma once
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/crypto/ec_key_pair.hpp"
#include "vaultbridge/identity/client_identity.hpp"
#include "vaultbridge/protocol/connection_state.hpp"
#include "vaultbridge/protocol/messages.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vaultbridge::protocol {

struct HandshakeVerdict {
    ConnectionStatus status = ConnectionStatus::Connected;
    std::optional<crypto::EcPublicKey> peer_public_key;
    // Set when the vault sent a key that is not a usable P-256 SPKI.
    std::optional<ProtocolFailure> peer_key_error;
};

class HandshakeInitiator {
public:
    // Fails with Encode when the client name cannot be serialized.
    [[nodiscard]] static Result<HandshakeInitiator, ProtocolFailure> Start(
        const identity::ClientIdentity& identity,
        std::string_view client_name,
        uint32_t protocol_version);

    [[nodiscard]] const HandshakeMessage& Message() const noexcept { return message_; }
    [[nodiscard]] const std::string& EncodedMessage() const noexcept { return encoded_; }

    /**
     * Decision rule, in order: authorized -> paired, pendingApproval ->
     * pending_approval, otherwise connected.
     */
    [[nodiscard]] static ConnectionStatus Decide(bool authorized, bool pending_approval) noexcept;

    [[nodiscard]] static HandshakeVerdict Finish(const HandshakeResponse& response);

private:
    HandshakeInitiator(HandshakeMessage message, std::string encoded);

    HandshakeMessage message_;
    std::string encoded_;
};

}
