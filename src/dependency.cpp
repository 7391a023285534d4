#include "depscope/dependency.hpp"

#ifdef DEPSCOPE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace depscope {

namespace internal {

std::any capture_stacktrace() {
#ifdef DEPSCOPE_HAS_STACKTRACE
    // Skip this frame and the dependency constructor.
    return std::any(boost::stacktrace::stacktrace(2, static_cast<std::size_t>(-1)));
#else
    return {};
#endif
}

} // namespace internal

dependency::dependency()
    : declaration_stacktrace_(internal::capture_stacktrace())
{}

// Copies are fresh declarations (e.g. bound instances): capture anew.
dependency::dependency(const dependency&)
    : std::enable_shared_from_this<dependency>()
    , declaration_stacktrace_(internal::capture_stacktrace())
{}

dependency& dependency::operator=(const dependency&) {
    return *this;
}

dependency::~dependency() = default;

void dependency::exit(std::exception_ptr /*error*/) {}

std::shared_ptr<dependency> dependency::bind_to_parameter(std::string_view /*name*/,
                                                          const value& /*final_value*/) {
    return shared_from_this();
}

void dependency::collect_exclusive_types(std::vector<std::type_index>& /*out*/) const {}

std::vector<std::type_index> dependency::exclusive_types() const {
    std::vector<std::type_index> types;
    collect_exclusive_types(types);
    return types;
}

bool dependency::is_exclusive() const {
    return !exclusive_types().empty();
}

} // namespace depscope
