#pragma once
#include "vaultbridge/core/failures.hpp"
#include "vaultbridge/core/result.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vaultbridge::protocol {

enum class ActionKind {
    GetItems,
    GetTotp,
    CreateItem,
    UpdateItem,
    GetPasswordConfig,
    GetPasswordPresets,
    PasskeyCreate,
    PasskeyGet,
    PasskeyList
};

inline constexpr std::array<ActionKind, 9> kAllActionKinds = {
    ActionKind::GetItems,
    ActionKind::GetTotp,
    ActionKind::CreateItem,
    ActionKind::UpdateItem,
    ActionKind::GetPasswordConfig,
    ActionKind::GetPasswordPresets,
    ActionKind::PasskeyCreate,
    ActionKind::PasskeyGet,
    ActionKind::PasskeyList
};

[[nodiscard]] std::string_view ToWireName(ActionKind kind) noexcept;
[[nodiscard]] std::optional<ActionKind> ParseActionKind(std::string_view wire_name) noexcept;

struct GetItemsRequest {
    std::string url;
    std::optional<std::vector<std::string>> fields;

    [[nodiscard]] nlohmann::json ToPayload() const;
};

struct GetTotpRequest {
    std::string entry_id;

    [[nodiscard]] nlohmann::json ToPayload() const;
};

// At least one of url or title must be set.
struct ItemEntry {
    std::optional<std::string> url;
    std::optional<std::string> title;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> otp;

    [[nodiscard]] nlohmann::json ToPayload() const;
};

struct UpdateItemRequest {
    std::string entry_id;
    ItemEntry changes;

    [[nodiscard]] nlohmann::json ToPayload() const;
};

/**
 * Per-action payload rules checked before anything is encrypted.
 *
 *   get-items      url: string (required), fields: string[] (optional)
 *   get-totp       entryId: string (required)
 *   create-item    url or title: string (one required), username, password, otp: string
 *   update-item    entryId: string (required) plus the create-item optionals
 *   passkey-list   relyingPartyId: string (optional)
 *   others         any object
 */
class ActionSchema {
public:
    [[nodiscard]] static Result<Unit, ProtocolFailure>
    Validate(ActionKind kind, const nlohmann::json& payload);
private:
    ActionSchema() = delete;
};

}
