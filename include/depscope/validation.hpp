#pragma once

#include "export.hpp"
#include "fwd.hpp"

namespace depscope {

/// Check that @p fn declares at most one exclusive dependency per exclusive
/// type, across its default dependencies and metadata dependencies
/// together.  Throws validation_error otherwise:
///
///   * two exclusive metadata dependencies of one exact type on the same
///     parameter name that parameter;
///   * two exclusive dependencies of one exact type name that type;
///   * exclusive dependencies of different types sharing an exclusive
///     ancestor name the ancestor and list every conflicting type.
///
/// Exact-type conflicts are reported before ancestor conflicts.
DEPSCOPE_EXPORT void validate_dependencies(const function& fn);

} // namespace depscope
