#include "request_router.hpp"
#include "cache_directory.hpp"
#include "initialization_coordinator.hpp"
#include "settings.hpp"
#include "verbose.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace embed {

// Absolute, lexically normalized, without a trailing separator (except "/").
static std::string normalize_path(const std::string& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec) {
        absolute = fs::path(path);
    }
    std::string normalized = absolute.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == fs::path::preferred_separator) {
        normalized.pop_back();
    }
    return normalized;
}

RequestRouter::RequestRouter(InitializationCoordinator& coordinator,
                             const ConfigurationSource& config,
                             const std::string& app_root,
                             HostLifecycle* lifecycle)
    : coordinator_(coordinator),
      config_(config),
      lifecycle_(lifecycle),
      app_root_(normalize_path(app_root.empty() ? "." : app_root)) {}

Result<ResolvedTarget> RequestRouter::resolve(const std::string& virtual_path,
                                              const std::string& physical_path) {
    return resolve(virtual_path, physical_path, config_.allow_filesystem_pages());
}

Result<ResolvedTarget> RequestRouter::resolve(const std::string& virtual_path,
                                              const std::string& physical_path,
                                              bool allow_filesystem_fallback) {
    if (physical_path.empty()) {
        return Error(ErrorKind::InvalidArgument, "Path to map may not be empty.");
    }

    // Ensure we're initialized when we get a request.
    if (auto status = coordinator_.ensure_initialized(lifecycle_); !status) {
        return status.error();
    }

    // If the file exists in the filesystem, pass the request through.
    if (allow_filesystem_fallback) {
        std::error_code ec;
        if (fs::is_regular_file(physical_path, ec)) {
            verbose_log("router", virtual_path + " -> filesystem " + physical_path);
            return ResolvedTarget{TargetSource::Filesystem, physical_path};
        }
    }

    auto mapped = map_to_cache_path(physical_path);
    if (!mapped) {
        return mapped.error();
    }
    verbose_log("router", virtual_path + " -> cache " + *mapped);
    return ResolvedTarget{TargetSource::Cache, std::move(mapped).value()};
}

Result<std::string> RequestRouter::map_to_cache_path(const std::string& physical_path) const {
    if (physical_path.empty()) {
        return Error(ErrorKind::InvalidArgument, "Path to map may not be empty.");
    }

    auto snapshot = coordinator_.snapshot();
    if (!snapshot) {
        return Error(ErrorKind::DirectoryLifecycleFailure, "Page cache is not initialized.");
    }

    std::string full_path = normalize_path(physical_path);
    bool under_root = full_path.compare(0, app_root_.size(), app_root_) == 0 &&
                      (full_path.size() == app_root_.size() ||
                       app_root_.back() == fs::path::preferred_separator ||
                       full_path[app_root_.size()] == fs::path::preferred_separator);
    if (!under_root) {
        return full_path;
    }

    std::string sub_path = full_path.substr(app_root_.size());
    return path_under(snapshot->root, sub_path);
}

} // namespace embed
