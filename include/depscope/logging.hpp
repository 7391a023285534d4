#pragma once

#include "export.hpp"

#include <string_view>

namespace depscope {

enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

constexpr std::string_view to_string(log_level level) noexcept {
    constexpr std::string_view names[] = {"trace", "debug", "info",
                                          "warning", "error", "fatal"};
    return names[static_cast<int>(level)];
}

/// Install a minimum-severity filter on the Boost.Log core.
DEPSCOPE_EXPORT void set_log_level(log_level level);

/// Parse a level name ("trace" ... "fatal"); unknown names map to info.
DEPSCOPE_EXPORT log_level log_level_from_string(std::string_view name) noexcept;

} // namespace depscope
