#include "vaultbridge/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <mutex>
#include <string>

namespace vaultbridge::logging {

namespace {
    std::once_flag init_flag;
    std::shared_ptr<spdlog::logger> shared_logger;

    std::shared_ptr<spdlog::logger> CreateLogger() {
        const std::string name(kLoggerName);
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto logger = spdlog::stderr_color_mt(name);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::info);
        if (const char* env_level = std::getenv(std::string(kLogLevelEnvironmentVariable).c_str())) {
            const auto level = spdlog::level::from_str(env_level);
            if (level != spdlog::level::off || std::string_view(env_level) == "off") {
                logger->set_level(level);
            }
        }
        return logger;
    }
}

std::shared_ptr<spdlog::logger> Get() {
    std::call_once(init_flag, []() {
        shared_logger = CreateLogger();
    });
    return shared_logger;
}

void SetLevel(const spdlog::level::level_enum level) {
    Get()->set_level(level);
}

bool SetLevel(const std::string_view level_name) {
    const std::string name(level_name);
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return false;
    }
    SetLevel(level);
    return true;
}

}
