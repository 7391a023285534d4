#include "depscope/value.hpp"

#include <exception>
#include <string>

namespace depscope {

std::string failed_dependency::message() const {
    if (!error) {
        return {};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace depscope
