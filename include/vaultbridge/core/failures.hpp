#pragma once
#include <string>
#include <string_view>
namespace vaultbridge::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    SecureWipeFailed,
    EncodingFailed,
    DecodingFailed
};
enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    Encode,
    Decode,
    Transport,
    HandshakeIncomplete,
    NotAuthorized,
    RequestTimeout,
    DecryptionFailure,
    ServerError,
    Disconnected,
    InvalidState
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
    static SodiumFailure DecodingFailed(std::string msg) {
        return {SodiumFailureType::DecodingFailed, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Transport(std::string msg) {
        return {ProtocolFailureType::Transport, std::move(msg)};
    }
    static ProtocolFailure HandshakeIncomplete(std::string msg) {
        return {ProtocolFailureType::HandshakeIncomplete, std::move(msg)};
    }
    static ProtocolFailure NotAuthorized(std::string msg) {
        return {ProtocolFailureType::NotAuthorized, std::move(msg)};
    }
    static ProtocolFailure RequestTimeout(std::string msg) {
        return {ProtocolFailureType::RequestTimeout, std::move(msg)};
    }
    static ProtocolFailure DecryptionFailure(std::string msg) {
        return {ProtocolFailureType::DecryptionFailure, std::move(msg)};
    }
    static ProtocolFailure ServerError(std::string msg) {
        return {ProtocolFailureType::ServerError, std::move(msg)};
    }
    static ProtocolFailure Disconnected(std::string msg) {
        return {ProtocolFailureType::Disconnected, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};
[[nodiscard]] constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::Transport: return "TransportError";
        case ProtocolFailureType::HandshakeIncomplete: return "HandshakeIncomplete";
        case ProtocolFailureType::NotAuthorized: return "NotAuthorized";
        case ProtocolFailureType::RequestTimeout: return "RequestTimeout";
        case ProtocolFailureType::DecryptionFailure: return "DecryptionFailure";
        case ProtocolFailureType::ServerError: return "ServerError";
        case ProtocolFailureType::Disconnected: return "Disconnected";
        case ProtocolFailureType::InvalidState: return "InvalidState";
    }
    return "Unknown";
}
}
