#pragma once

/**
 * Page resource selection.
 *
 * Decides which resources bundled in a package are servable pages, based on
 * the page extension.
 */

#include <string>
#include <string_view>
#include <vector>

namespace embed {

class Package;

// Returns true if the name has at least one character before a
// case-insensitive ".aspx" suffix.
bool is_page_resource(std::string_view resource_name);

// Null-safe overload; a null name is never a page.
bool is_page_resource(const char* resource_name);

// Page resource names from the package, in the package's order.
std::vector<std::string> list_page_resources(const Package& package);

} // namespace embed
