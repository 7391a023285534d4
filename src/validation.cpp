#include "depscope/validation.hpp"
#include "depscope/dependency.hpp"
#include "depscope/exceptions.hpp"
#include "depscope/function.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace depscope {

namespace {

struct type_group {
    std::type_index type;
    std::vector<const dependency*> members;
};

// Group by exact runtime type, in order of first appearance.
std::vector<type_group> group_by_type(const std::vector<const dependency*>& deps) {
    std::vector<type_group> groups;
    for (const auto* dep : deps) {
        auto type = dep->runtime_type();
        auto it = std::find_if(groups.begin(), groups.end(),
            [&](const type_group& g) { return g.type == type; });
        if (it == groups.end()) {
            groups.push_back({type, {dep}});
        } else {
            it->members.push_back(dep);
        }
    }
    return groups;
}

std::vector<std::type_index> runtime_types(const std::vector<const dependency*>& deps) {
    std::vector<std::type_index> types;
    types.reserve(deps.size());
    for (const auto* dep : deps) types.push_back(dep->runtime_type());
    return types;
}

[[noreturn]] void fail(const std::string& message, std::type_index offending,
                       const std::vector<const dependency*>& members) {
    validation_error ex(message, offending, runtime_types(members));
    std::string detail;
    for (const auto* dep : members) {
        std::string trace = internal::format_declaration_trace(*dep);
        if (trace.empty()) continue;
        if (!detail.empty()) detail += "\n";
        detail += trace;
    }
    if (!detail.empty()) ex.set_diagnostic_detail(detail);
    throw ex;
}

// ------------------------------------------------------------------
// At most one exclusive metadata dependency per exact type and parameter
// ------------------------------------------------------------------
void check_per_parameter(const annotation_dependency_map& annotations) {
    for (const auto& [name, deps] : annotations) {
        std::vector<const dependency*> members;
        for (const auto& dep : deps) members.push_back(dep.get());

        for (const auto& group : group_by_type(members)) {
            if (group.members.size() < 2 || !group.members.front()->is_exclusive()) continue;
            fail("Only one " + internal::demangle(group.type)
                     + " annotation dependency is allowed per parameter, but found "
                     + std::to_string(group.members.size()) + " on '" + name + "'",
                 group.type, group.members);
        }
    }
}

// ------------------------------------------------------------------
// At most one exclusive dependency per exact type
// ------------------------------------------------------------------
void check_concrete_types(const std::vector<const dependency*>& all) {
    for (const auto& group : group_by_type(all)) {
        if (group.members.size() < 2 || !group.members.front()->is_exclusive()) continue;
        fail("Only one " + internal::demangle(group.type) + " dependency is allowed",
             group.type, group.members);
    }
}

// ------------------------------------------------------------------
// At most one dependency under each exclusive ancestor
// ------------------------------------------------------------------
void check_exclusive_ancestors(const std::vector<const dependency*>& all) {
    // Most-derived ancestors first, in order of first appearance.
    std::vector<std::type_index> ancestors;
    std::vector<std::vector<std::type_index>> lineages;
    for (const auto* dep : all) {
        lineages.push_back(dep->exclusive_types());
        for (const auto& type : lineages.back()) {
            if (std::find(ancestors.begin(), ancestors.end(), type) == ancestors.end()) {
                ancestors.push_back(type);
            }
        }
    }

    for (const auto& ancestor : ancestors) {
        std::vector<const dependency*> members;
        for (std::size_t i = 0; i < all.size(); ++i) {
            const auto& lineage = lineages[i];
            if (std::find(lineage.begin(), lineage.end(), ancestor) != lineage.end()) {
                members.push_back(all[i]);
            }
        }
        if (members.size() < 2) continue;

        std::string found;
        for (const auto* dep : members) {
            if (!found.empty()) found += ", ";
            found += internal::demangle(dep->runtime_type());
        }
        fail("Only one " + internal::demangle(ancestor)
                 + " dependency is allowed, but found: " + found,
             ancestor, members);
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry point
// ------------------------------------------------------------------
void validate_dependencies(const function& fn) {
    std::vector<const dependency*> all;
    for (const auto& [name, dep] : get_dependency_parameters(fn)) {
        all.push_back(dep.get());
    }
    const auto& annotations = get_annotation_dependencies(fn);
    for (const auto& [name, deps] : annotations) {
        for (const auto& dep : deps) all.push_back(dep.get());
    }

    check_per_parameter(annotations);
    check_concrete_types(all);
    check_exclusive_ancestors(all);
}

} // namespace depscope
