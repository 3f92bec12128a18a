/**
 * @file bridge_client_example.cpp
 * @brief Pairs with a local vault and looks up the entries for one URL
 *
 * Usage: vaultbridge_client <url> [config.json]
 */

#include "vaultbridge/client/vault_bridge_client.hpp"
#include "vaultbridge/core/logging.hpp"

#include <boost/asio/io_context.hpp>

#include <iostream>

using namespace vaultbridge::protocol;
using namespace vaultbridge::protocol::client;
using vaultbridge::protocol::configuration::BridgeConfig;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <url> [config.json]" << std::endl;
        return 2;
    }
    const std::string lookup_url = argv[1];

    BridgeConfig config = BridgeConfig::Default();
    if (argc > 2) {
        auto loaded = BridgeConfig::LoadFromFile(argv[2]);
        if (loaded.IsErr()) {
            std::cerr << "Failed to load configuration: " << loaded.UnwrapErr().message << std::endl;
            return 1;
        }
        config = std::move(loaded).Unwrap();
    }
    config.ApplyEnvironment();
    if (!vaultbridge::logging::SetLevel(config.log_level)) {
        std::cerr << "Unknown log level '" << config.log_level << "'" << std::endl;
        return 1;
    }

    boost::asio::io_context io;
    int exit_code = 1;
    std::shared_ptr<VaultBridgeClient> client;

    VaultBridgeClient::CreateAsync(io, config,
        [&](Result<std::shared_ptr<VaultBridgeClient>, ProtocolFailure> created) {
            if (created.IsErr()) {
                std::cerr << "Failed to create client: " << created.UnwrapErr().message << std::endl;
                return;
            }
            client = std::move(created).Unwrap();
            std::cout << "Client id: " << client->Identity().ClientId() << std::endl;

            client->ConnectWithRetry([&](const bool connected) {
                if (!connected) {
                    std::cerr << client->State().error.value_or("Connection failed") << std::endl;
                    return;
                }
                if (client->State().status != ConnectionStatus::Paired) {
                    std::cout << "Waiting for approval in the vault..." << std::endl;
                }
                client->WaitForAuthorization([&](const bool authorized) {
                    if (!authorized) {
                        std::cerr << "Not authorized by the vault" << std::endl;
                        client->Disconnect();
                        return;
                    }
                    client->GetItems(GetItemsRequest{lookup_url, std::nullopt},
                        [&](Result<nlohmann::json, ProtocolFailure> response) {
                            if (response.IsErr()) {
                                const auto& failure = response.UnwrapErr();
                                std::cerr << ToString(failure.type) << ": " << failure.message << std::endl;
                            } else {
                                std::cout << response.Unwrap().dump(2) << std::endl;
                                exit_code = 0;
                            }
                            client->Disconnect();
                        });
                });
            });
        });

    io.run();
    return exit_code;
}
