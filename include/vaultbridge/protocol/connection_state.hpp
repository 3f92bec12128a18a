#pragma once
#include <optional>
#include <string>
#include <string_view>
namespace vaultbridge::protocol {

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    PendingApproval,
    Paired
};

[[nodiscard]] constexpr std::string_view ToString(const ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected: return "connected";
        case ConnectionStatus::PendingApproval: return "pending_approval";
        case ConnectionStatus::Paired: return "paired";
    }
    return "unknown";
}

// Snapshot handed to state subscribers. peer_public_key is base64 SPKI.
struct ConnectionState {
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::string client_id;
    std::optional<std::string> error;
    std::optional<std::string> peer_public_key;
};

}
