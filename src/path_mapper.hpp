#pragma once

/**
 * Mapping of dotted resource names onto the filesystem.
 *
 * A resource named "Site.Pages.Admin.Users.aspx" under namespace root
 * "Site.Pages" maps to "<destination>/Admin/Users.aspx": the namespace root is
 * stripped, the last period starts the extension, and every other period
 * becomes a directory separator.
 */

#include "error.hpp"
#include <string>

namespace embed {

// Checks a namespace root: non-empty, no leading/trailing period, no "..".
Status validate_namespace_root(const std::string& namespace_root);

// Maps a resource name to a path under destination_root (or the current
// working directory if destination_root is empty). The result is absolute
// and normalized. Fails with InvalidArgument for malformed names and
// PrefixMismatch if resource_name doesn't start with "<namespace_root>.".
// Names with path separators after the namespace root are InvalidArgument.
Result<std::string> map_resource_to_path(
    const std::string& namespace_root,
    const std::string& resource_name,
    const std::string& destination_root
);

} // namespace embed
