#include "depscope/resolution.hpp"
#include "depscope/dependency.hpp"
#include "depscope/function.hpp"
#include "log.hpp"

namespace depscope {

resolved_dependencies::resolved_dependencies(const function& fn, const arguments& overrides) {
    try {
        resolve(fn, overrides);
    } catch (...) {
        ctx_.stack().close(std::current_exception());
        throw;
    }
}

void resolved_dependencies::resolve(const function& fn, const arguments& overrides) {
    for (const auto& [name, dep] : get_dependency_parameters(fn)) {
        if (auto it = overrides.find(name); it != overrides.end()) {
            resolved_[name] = it->second;
            continue;
        }

        try {
            resolved_[name] = ctx_.stack().enter(dep, ctx_);
        } catch (const no_active_shared_scope&) {
            throw;
        } catch (const std::exception& e) {
            DEPSCOPE_LOG_WARN << "dependency '" << name << "' of " << fn.name()
                              << " failed: " << e.what();
            resolved_[name] = failed_dependency{name, std::current_exception()};
        } catch (...) {
            DEPSCOPE_LOG_WARN << "dependency '" << name << "' of " << fn.name()
                              << " failed: non-standard exception";
            resolved_[name] = failed_dependency{name, std::current_exception()};
        }
    }

    for (const auto& [name, deps] : get_annotation_dependencies(fn)) {
        value final_value;
        if (auto it = overrides.find(name); it != overrides.end()) {
            final_value = it->second;
        } else if (auto found = resolved_.find(name); found != resolved_.end()) {
            final_value = found->second;
        }

        for (const auto& dep : deps) {
            auto bound = dep->bind_to_parameter(name, final_value);
            if (!bound) {
                throw depscope_error("bind_to_parameter returned null for parameter '"
                                     + name + "' of " + fn.name());
            }
            ctx_.stack().enter(bound, ctx_);
        }
    }
}

std::vector<const failed_dependency*> resolved_dependencies::failures() const {
    std::vector<const failed_dependency*> result;
    for (const auto& [name, v] : resolved_) {
        if (const auto* failed = as_failed(v)) result.push_back(failed);
    }
    return result;
}

void resolved_dependencies::close(std::exception_ptr pending) {
    ctx_.stack().close(std::move(pending));
}

} // namespace depscope
