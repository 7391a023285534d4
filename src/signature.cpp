#include "depscope/signature.hpp"
#include "depscope/dependency.hpp"
#include "depscope/exceptions.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace depscope {

parameter::parameter(std::string name)
    : name(std::move(name))
{}

parameter::parameter(std::string name, std::shared_ptr<dependency> default_dependency)
    : name(std::move(name))
    , default_dependency(std::move(default_dependency))
{}

parameter& parameter::annotate(std::shared_ptr<dependency> dep) & {
    metadata.push_back(std::move(dep));
    return *this;
}

parameter&& parameter::annotate(std::shared_ptr<dependency> dep) && {
    metadata.push_back(std::move(dep));
    return std::move(*this);
}

signature::signature(std::initializer_list<parameter> params)
    : parameters_(params)
{
    index();
}

signature::signature(std::vector<parameter> params)
    : parameters_(std::move(params))
{
    index();
}

void signature::index() {
    std::set<std::string, std::less<>> seen;
    for (const auto& p : parameters_) {
        if (!seen.insert(p.name).second) {
            throw depscope_error("Duplicate parameter name: " + p.name);
        }
        if (p.default_dependency) {
            dependency_parameters_.emplace_back(p.name, p.default_dependency);
        }

        dependency_list metadata;
        std::copy_if(p.metadata.begin(), p.metadata.end(),
                     std::back_inserter(metadata),
                     [](const auto& dep) { return dep != nullptr; });
        if (!metadata.empty()) {
            annotation_dependencies_.emplace_back(p.name, std::move(metadata));
        }
    }
}

signature signature::visible() const {
    std::vector<parameter> kept;
    for (const auto& p : parameters_) {
        if (!p.default_dependency) kept.push_back(p);
    }
    return signature(std::move(kept));
}

const parameter* signature::find(std::string_view name) const noexcept {
    auto it = std::find_if(parameters_.begin(), parameters_.end(),
        [&](const parameter& p) { return p.name == name; });
    return it == parameters_.end() ? nullptr : &*it;
}

} // namespace depscope
