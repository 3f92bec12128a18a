#include "vaultbridge/protocol/actions.hpp"
#include "vaultbridge/core/format.hpp"

#include <initializer_list>

namespace vaultbridge::protocol {
using nlohmann::json;

namespace {
    struct ActionName {
        ActionKind kind;
        std::string_view name;
    };

    constexpr std::array<ActionName, 9> kActionNames = {{
        {ActionKind::GetItems, "get-items"},
        {ActionKind::GetTotp, "get-totp"},
        {ActionKind::CreateItem, "create-item"},
        {ActionKind::UpdateItem, "update-item"},
        {ActionKind::GetPasswordConfig, "get-password-config"},
        {ActionKind::GetPasswordPresets, "get-password-presets"},
        {ActionKind::PasskeyCreate, "passkey-create"},
        {ActionKind::PasskeyGet, "passkey-get"},
        {ActionKind::PasskeyList, "passkey-list"}
    }};

    using Check = Result<Unit, ProtocolFailure>;

    Check Invalid(const ActionKind kind, const std::string_view detail) {
        return Check::Err(ProtocolFailure::InvalidInput(
            compat::format("{}: {}", ToWireName(kind), detail)));
    }

    Check RequireString(const ActionKind kind, const json& payload, const char* key) {
        const auto it = payload.find(key);
        if (it == payload.end()) {
            return Invalid(kind, compat::format("'{}' is required", key));
        }
        if (!it->is_string()) {
            return Invalid(kind, compat::format("'{}' must be a string", key));
        }
        return Check::Ok(unit);
    }

    Check OptionalStrings(const ActionKind kind, const json& payload,
                          std::initializer_list<const char*> keys) {
        for (const char* key : keys) {
            const auto it = payload.find(key);
            if (it != payload.end() && !it->is_null() && !it->is_string()) {
                return Invalid(kind, compat::format("'{}' must be a string", key));
            }
        }
        return Check::Ok(unit);
    }

    bool HasString(const json& payload, const char* key) {
        const auto it = payload.find(key);
        return it != payload.end() && it->is_string();
    }

    void PutOptional(json& payload, const char* key, const std::optional<std::string>& value) {
        if (value.has_value()) {
            payload[key] = *value;
        }
    }
}

std::string_view ToWireName(const ActionKind kind) noexcept {
    for (const auto& entry : kActionNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return {};
}

std::optional<ActionKind> ParseActionKind(const std::string_view wire_name) noexcept {
    for (const auto& entry : kActionNames) {
        if (entry.name == wire_name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

json GetItemsRequest::ToPayload() const {
    json payload{{"url", url}};
    if (fields.has_value()) {
        payload["fields"] = *fields;
    }
    return payload;
}

json GetTotpRequest::ToPayload() const {
    return json{{"entryId", entry_id}};
}

json ItemEntry::ToPayload() const {
    json payload = json::object();
    PutOptional(payload, "url", url);
    PutOptional(payload, "title", title);
    PutOptional(payload, "username", username);
    PutOptional(payload, "password", password);
    PutOptional(payload, "otp", otp);
    return payload;
}

json UpdateItemRequest::ToPayload() const {
    json payload = changes.ToPayload();
    payload["entryId"] = entry_id;
    return payload;
}

Result<Unit, ProtocolFailure> ActionSchema::Validate(const ActionKind kind, const json& payload) {
    if (!payload.is_object()) {
        return Invalid(kind, "payload must be a JSON object");
    }
    switch (kind) {
        case ActionKind::GetItems: {
            if (auto check = RequireString(kind, payload, "url"); check.IsErr()) {
                return check;
            }
            const auto fields = payload.find("fields");
            if (fields != payload.end() && !fields->is_null()) {
                if (!fields->is_array()) {
                    return Invalid(kind, "'fields' must be an array of strings");
                }
                for (const auto& field : *fields) {
                    if (!field.is_string()) {
                        return Invalid(kind, "'fields' must be an array of strings");
                    }
                }
            }
            return Check::Ok(unit);
        }
        case ActionKind::GetTotp:
            return RequireString(kind, payload, "entryId");
        case ActionKind::CreateItem:
            if (!HasString(payload, "url") && !HasString(payload, "title")) {
                return Invalid(kind, "url or title is required");
            }
            return OptionalStrings(kind, payload, {"url", "title", "username", "password", "otp"});
        case ActionKind::UpdateItem:
            if (auto check = RequireString(kind, payload, "entryId"); check.IsErr()) {
                return check;
            }
            return OptionalStrings(kind, payload, {"url", "title", "username", "password", "otp"});
        case ActionKind::PasskeyList:
            return OptionalStrings(kind, payload, {"relyingPartyId"});
        case ActionKind::GetPasswordConfig:
        case ActionKind::GetPasswordPresets:
        case ActionKind::PasskeyCreate:
        case ActionKind::PasskeyGet:
            return Check::Ok(unit);
    }
    return Invalid(kind, "unknown action");
}

}
