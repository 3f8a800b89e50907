#pragma once

/**
 * Per-request choice between the real filesystem and the page cache.
 */

#include "error.hpp"
#include <string>

namespace embed {

class ConfigurationSource;
class HostLifecycle;
class InitializationCoordinator;

enum class TargetSource {
    Filesystem,  // Serve the file at the requested physical path.
    Cache        // Serve the extracted copy from the cache root.
};

struct ResolvedTarget {
    TargetSource source;
    std::string path;
};

/**
 * Resolves requested pages to a physical path.
 *
 * Holds no state beyond its collaborators and the application root, so one
 * router can be shared by all request threads.
 */
class RequestRouter {
public:
    // app_root is the directory request paths are translated under. Initializing
    // through this router registers cache teardown with lifecycle, if given.
    RequestRouter(InitializationCoordinator& coordinator,
                  const ConfigurationSource& config,
                  const std::string& app_root,
                  HostLifecycle* lifecycle = nullptr);

    // Initializes the cache if needed, then serves from the filesystem when
    // allow_filesystem_fallback is set and physical_path is an existing file,
    // or from the cache otherwise. Initialization errors are returned as-is.
    Result<ResolvedTarget> resolve(const std::string& virtual_path,
                                   const std::string& physical_path,
                                   bool allow_filesystem_fallback);

    // As above, with the fallback flag read from configuration.
    Result<ResolvedTarget> resolve(const std::string& virtual_path,
                                   const std::string& physical_path);

    // Moves a path under the application root to the same relative location
    // under the cache root. Paths outside the application root are returned
    // normalized but otherwise unchanged. Requires an initialized cache.
    Result<std::string> map_to_cache_path(const std::string& physical_path) const;

    const std::string& app_root() const { return app_root_; }

private:
    InitializationCoordinator& coordinator_;
    const ConfigurationSource& config_;
    HostLifecycle* lifecycle_;
    std::string app_root_;  // Absolute, normalized, no trailing separator.
};

} // namespace embed
