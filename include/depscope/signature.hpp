#pragma once

#include "export.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace depscope {

using dependency_list = std::vector<std::shared_ptr<dependency>>;

/// Declaration order: name -> default descriptor.
using dependency_parameter_map =
    std::vector<std::pair<std::string, std::shared_ptr<dependency>>>;

/// Declaration order: name -> metadata descriptors.
using annotation_dependency_map =
    std::vector<std::pair<std::string, dependency_list>>;

// ---------------------------------------------------------------
// parameter: one declared parameter of a callable or producer
// ---------------------------------------------------------------

/// A parameter may carry a default dependency (the value is injected) and
/// any number of metadata dependencies (bound to the parameter's final
/// value, never injecting one).
struct DEPSCOPE_EXPORT parameter {
    explicit parameter(std::string name);
    parameter(std::string name, std::shared_ptr<dependency> default_dependency);

    /// Attach a tag-bound dependency.
    parameter& annotate(std::shared_ptr<dependency> dep) &;
    parameter&& annotate(std::shared_ptr<dependency> dep) &&;

    std::string name;
    std::shared_ptr<dependency> default_dependency;
    dependency_list metadata;
};

// ---------------------------------------------------------------
// signature: ordered parameter list with cached dependency views
// ---------------------------------------------------------------

class DEPSCOPE_EXPORT signature {
public:
    signature() = default;
    signature(std::initializer_list<parameter> params);
    explicit signature(std::vector<parameter> params);

    const std::vector<parameter>& parameters() const noexcept { return parameters_; }

    /// Parameters whose default is a dependency, in declaration order.
    const dependency_parameter_map& dependency_parameters() const noexcept {
        return dependency_parameters_;
    }

    /// Parameters carrying metadata dependencies, in declaration order.
    const annotation_dependency_map& annotation_dependencies() const noexcept {
        return annotation_dependencies_;
    }

    /// The signature a caller sees once dependency defaults are elided.
    /// Metadata-only parameters stay visible.
    signature visible() const;

    const parameter* find(std::string_view name) const noexcept;

    bool has_dependencies() const noexcept {
        return !dependency_parameters_.empty() || !annotation_dependencies_.empty();
    }

    std::size_t size() const noexcept { return parameters_.size(); }

private:
    void index();

    std::vector<parameter> parameters_;
    dependency_parameter_map dependency_parameters_;
    annotation_dependency_map annotation_dependencies_;
};

} // namespace depscope
