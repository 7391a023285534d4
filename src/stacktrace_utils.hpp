#pragma once

// Internal helper for stacktrace formatting.
// This header is NOT installed; it is only used by the library's .cpp files.

#include "depscope/dependency.hpp"
#include "depscope/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef DEPSCOPE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace depscope::internal {

// capture_stacktrace() is declared in dependency.hpp (public header)
// and implemented in stacktrace_capture.cpp.

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef DEPSCOPE_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one dependency's declaration trace for diagnostic output.
/// Returns a block like:
///   "Declaration stacktrace for timeout:\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_declaration_trace(const dependency& dep) {
    std::string trace = format_stacktrace(dep.declaration_stacktrace());
    if (trace.empty()) return {};
    return "Declaration stacktrace for " + demangle(dep.runtime_type()) + ":\n" + trace;
}

} // namespace depscope::internal
