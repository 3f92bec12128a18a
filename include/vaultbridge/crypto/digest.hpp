#pragma once
#include "vaultbridge/core/result.hpp"
#include "vaultbridge/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace vaultbridge::protocol::crypto {
class Digest {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Sha256(std::span<const uint8_t> data);
private:
    Digest() = delete;
};
}
