#include "vaultbridge/identity/client_identity.hpp"
#include "vaultbridge/crypto/digest.hpp"
#include "vaultbridge/crypto/sodium_interop.hpp"
#include "vaultbridge/core/logging.hpp"
#include "vaultbridge/debug/key_logger.hpp"
#include "vaultbridge/protocol/constants.hpp"

#include <boost/asio/post.hpp>

namespace vaultbridge::protocol::identity {
using crypto::Digest;
using crypto::SodiumInterop;

ClientIdentity::ClientIdentity(EcKeyPair key_pair, std::string client_id)
    : key_pair_(std::move(key_pair))
    , client_id_(std::move(client_id)) {}

Result<std::shared_ptr<ClientIdentity>, ProtocolFailure> ClientIdentity::Create() {
    using IdentityResult = Result<std::shared_ptr<ClientIdentity>, ProtocolFailure>;
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return IdentityResult::Err(ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto key_pair = EcKeyPair::Generate();
    if (key_pair.IsErr()) {
        logging::Get()->critical("Identity key generation failed: {}", key_pair.UnwrapErr().message);
        return IdentityResult::Err(std::move(key_pair).UnwrapErr());
    }
    auto pair = std::move(key_pair).Unwrap();
    auto client_id = DeriveClientId(pair.PublicKeySpki());
    if (client_id.IsErr()) {
        return IdentityResult::Err(std::move(client_id).UnwrapErr());
    }
    std::shared_ptr<ClientIdentity> identity(
        new ClientIdentity(std::move(pair), std::move(client_id).Unwrap()));
    debug::LogIdentityCreated(identity->ClientId(), identity->PublicKeySpki());
    logging::Get()->debug("Client identity created: {}", identity->ClientId());
    return IdentityResult::Ok(std::move(identity));
}

void ClientIdentity::CreateAsync(const boost::asio::any_io_executor& executor, CreateHandler handler) {
    boost::asio::post(executor, [handler = std::move(handler)]() {
        handler(Create());
    });
}

Result<std::string, ProtocolFailure> ClientIdentity::DeriveClientId(std::span<const uint8_t> public_key_spki) {
    if (public_key_spki.empty()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Cannot derive client id from an empty public key"));
    }
    return Digest::Sha256(public_key_spki).Map([](std::vector<uint8_t> digest) {
        return SodiumInterop::ToHex(std::span<const uint8_t>(digest).first(kClientIdBytes));
    });
}

std::string ClientIdentity::PublicKeyBase64() const {
    return SodiumInterop::ToBase64(key_pair_.PublicKeySpki());
}

Result<std::vector<uint8_t>, ProtocolFailure> ClientIdentity::DeriveSharedSecret(const EcPublicKey& peer) const {
    return key_pair_.DeriveSharedSecret(peer);
}

}
