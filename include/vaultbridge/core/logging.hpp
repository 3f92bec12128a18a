#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace vaultbridge::logging {

inline constexpr std::string_view kLoggerName = "vaultbridge";
inline constexpr std::string_view kLogLevelEnvironmentVariable = "VAULTBRIDGE_LOG_LEVEL";

/**
 * @brief Returns the shared library logger, creating a stderr sink on first use.
 *
 * The initial level comes from VAULTBRIDGE_LOG_LEVEL when set, otherwise info.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> Get();

void SetLevel(spdlog::level::level_enum level);

// Accepts the spdlog level names (trace, debug, info, warn, error, critical, off).
[[nodiscard]] bool SetLevel(std::string_view level_name);

}
