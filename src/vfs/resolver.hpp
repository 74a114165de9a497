#pragma once

#include "core/result.hpp"
#include "vfs/path_pointer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace lexis::vfs {

/// Locate `resource_name` under `roots`, in order.
///
/// Each root may be a directory (an empty string means the current
/// directory) or a ZIP archive. Names ending in ".gz" resolve to gzip
/// pointers. A name with a ".zip" segment is also tried as archive + entry.
/// When nothing matches, each segment in turn is retried as "<segment>.zip/"
/// so "corpora/x/y.txt" can come from "corpora/x.zip".
///
/// Fails with ErrorKind::ResourceNotFound; the error carries the resource
/// name, the roots searched and a suggested package.
Result<PathPointerPtr> find(std::string_view resource_name,
                            const std::vector<std::string>& roots);

/// Package most likely to provide `resource_name`: its second path segment
/// with any extension removed.
std::string suggested_package(std::string_view resource_name);

/// Multi-line report for a ResourceNotFound error.
std::string format_not_found_message(const Error& error);

} // namespace lexis::vfs
