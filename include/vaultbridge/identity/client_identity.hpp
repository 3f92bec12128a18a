#pragma once
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/crypto/ec_key_pair.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace vaultbridge::protocol::identity {
using protocol::Result;
using protocol::ProtocolFailure;
using crypto::EcKeyPair;
using crypto::EcPublicKey;

/**
 * @brief Long-term P-256 identity of this client.
 *
 * Created once per process and never rotated. The client id is the lowercase
 * hex of the first 16 bytes of SHA-256 over the SPKI DER of the public key,
 * so it is stable for as long as the key pair lives.
 */
class ClientIdentity {
public:
    using CreateHandler = std::function<void(Result<std::shared_ptr<ClientIdentity>, ProtocolFailure>)>;

    [[nodiscard]] static Result<std::shared_ptr<ClientIdentity>, ProtocolFailure> Create();

    // Generates the key pair on the executor and hands the identity to handler there.
    static void CreateAsync(const boost::asio::any_io_executor& executor, CreateHandler handler);

    [[nodiscard]] static Result<std::string, ProtocolFailure>
    DeriveClientId(std::span<const uint8_t> public_key_spki);

    [[nodiscard]] const std::string& ClientId() const noexcept { return client_id_; }
    [[nodiscard]] const std::vector<uint8_t>& PublicKeySpki() const noexcept { return key_pair_.PublicKeySpki(); }
    [[nodiscard]] std::string PublicKeyBase64() const;
    [[nodiscard]] const EcKeyPair& KeyPair() const noexcept { return key_pair_; }

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure>
    DeriveSharedSecret(const EcPublicKey& peer) const;

    ClientIdentity(const ClientIdentity&) = delete;
    ClientIdentity& operator=(const ClientIdentity&) = delete;

private:
    ClientIdentity(EcKeyPair key_pair, std::string client_id);

    EcKeyPair key_pair_;
    std::string client_id_;
};

}
