#pragma once

#include <fmt/core.h>

namespace vaultbridge::compat {
    using fmt::format;
}
