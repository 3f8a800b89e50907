#pragma once

/**
 * Application configuration constants.
 *
 * Defines file names, extraction parameters, and server defaults for the
 * embedpages host.
 */

#include <cstddef>

namespace embed {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".embedpages.json";  // Default settings file.
constexpr const char* CACHE_DIR_PREFIX = "embedpages-";    // Prefix for the cache root directory name.
constexpr const char* PACKAGE_EXTENSION = ".zip";          // Extension tried when locating packages.

// ========== Settings Keys ==========

constexpr const char* SETTING_ALLOW_FILESYSTEM_PAGES = "allow_filesystem_pages";
constexpr const char* SETTING_PAGE_PACKAGES = "page_packages";
constexpr const char* SETTING_PACKAGE_DIRS = "package_dirs";

// ========== Page Resources ==========

// Extension that marks a bundled resource as a servable page.
constexpr const char* PAGE_EXTENSION = ".aspx";
constexpr std::size_t PAGE_EXTENSION_LENGTH = 5;

// Chunk size used when copying a resource into the cache.
constexpr std::size_t EXTRACT_BUFFER_SIZE = 1024;

// ========== Server Defaults ==========

constexpr int DEFAULT_PORT = 8080;
constexpr const char* DEFAULT_PAGE = "Default.aspx";  // Served for directory requests.
constexpr const char* DEFAULT_ADDRESS = "0.0.0.0";

} // namespace embed
