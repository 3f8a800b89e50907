#pragma once

/**
 * Extraction of bundled resources to the filesystem.
 */

#include "error.hpp"
#include <string>

namespace embed {

class Package;

/**
 * Copies a resource from package into a new file at destination_path.
 *
 * Missing parent directories are created. The destination must not exist yet.
 * On failure an ExtractionFailure naming the package, resource and destination
 * is returned; a partially written destination file is left in place.
 */
Status extract_resource(
    Package& package,
    const std::string& resource_name,
    const std::string& destination_path
);

} // namespace embed
