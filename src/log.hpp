#pragma once

// Internal logging macros.
// This header is NOT installed; it is only used by the library's .cpp files.

#include <boost/log/trivial.hpp>

#define DEPSCOPE_LOG_TRACE BOOST_LOG_TRIVIAL(trace) << "depscope: "
#define DEPSCOPE_LOG_DEBUG BOOST_LOG_TRIVIAL(debug) << "depscope: "
#define DEPSCOPE_LOG_INFO BOOST_LOG_TRIVIAL(info) << "depscope: "
#define DEPSCOPE_LOG_WARN BOOST_LOG_TRIVIAL(warning) << "depscope: "
#define DEPSCOPE_LOG_ERROR BOOST_LOG_TRIVIAL(error) << "depscope: "
