#include "depscope/logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace logging = boost::log;

namespace depscope {

namespace {

logging::trivial::severity_level to_severity(log_level level) {
    switch (level) {
        case log_level::trace:   return logging::trivial::trace;
        case log_level::debug:   return logging::trivial::debug;
        case log_level::info:    return logging::trivial::info;
        case log_level::warning: return logging::trivial::warning;
        case log_level::error:   return logging::trivial::error;
        case log_level::fatal:   return logging::trivial::fatal;
    }
    return logging::trivial::info;
}

} // namespace

void set_log_level(log_level level) {
    logging::core::get()->set_filter(
        logging::trivial::severity >= to_severity(level));
}

log_level log_level_from_string(std::string_view name) noexcept {
    constexpr log_level levels[] = {log_level::trace, log_level::debug,
                                    log_level::info, log_level::warning,
                                    log_level::error, log_level::fatal};
    for (auto level : levels) {
        if (to_string(level) == name) return level;
    }
    if (name == "warn") return log_level::warning;
    return log_level::info;
}

} // namespace depscope
