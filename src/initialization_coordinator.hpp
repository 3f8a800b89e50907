#pragma once

/**
 * One-time extraction of embedded pages into the cache.
 *
 * The first call to ensure_initialized() creates a fresh cache root and
 * extracts every page resource of every configured package into it. Later
 * calls return immediately. Concurrent first callers block until the winning
 * caller finishes and then share its result.
 */

#include "cache_directory.hpp"
#include "error.hpp"
#include "host_lifecycle.hpp"
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace embed {

class ConfigurationSource;
class PackageLoader;

enum class InitializationState {
    Uninitialized,
    Initializing,
    Ready
};

// Virtual path (cache-root-relative, e.g. "/Admin/Users.aspx") to absolute path.
using CacheIndex = std::map<std::string, std::string>;

/**
 * Result of one completed extraction pass. Immutable once published.
 */
struct CacheSnapshot {
    std::string root;
    CacheIndex index;
};

/**
 * Owns the cache root, the cache index and the initialization state.
 *
 * The configuration source and package loader must outlive the coordinator,
 * and so must any HostLifecycle passed to ensure_initialized().
 */
class InitializationCoordinator {
public:
    InitializationCoordinator(const ConfigurationSource& config, PackageLoader& loader);

    // Unregisters shutdown hooks and tears the cache down.
    ~InitializationCoordinator();

    // Non-copyable
    InitializationCoordinator(const InitializationCoordinator&) = delete;
    InitializationCoordinator& operator=(const InitializationCoordinator&) = delete;

    // Runs the extraction pass unless it already completed. If lifecycle is
    // given, teardown() is registered to run when it shuts down. On failure
    // the state returns to Uninitialized so a later call can retry; files
    // extracted so far are left in the cache root.
    Status ensure_initialized(HostLifecycle* lifecycle = nullptr);

    // Removes the cache root and forgets the index. Idempotent.
    Status teardown();

    InitializationState state() const { return state_.load(std::memory_order_acquire); }

    // The published cache, or null unless Ready.
    std::shared_ptr<const CacheSnapshot> snapshot() const;

    // Number of extraction passes started so far.
    std::size_t extraction_passes() const { return passes_.load(); }

private:
    Result<CacheIndex> run_extraction_pass(const std::string& root);
    void register_teardown(HostLifecycle* lifecycle);
    void on_host_shutdown(HostLifecycle* lifecycle);
    Status teardown_locked();

    const ConfigurationSource& config_;
    PackageLoader& loader_;

    std::mutex gate_;
    std::atomic<InitializationState> state_{InitializationState::Uninitialized};
    std::shared_ptr<const CacheSnapshot> snapshot_;  // Read and written with std::atomic_load/store.
    CacheDirectory cache_;
    std::vector<std::pair<HostLifecycle*, HostLifecycle::HookId>> hooks_;
    std::atomic<std::size_t> passes_{0};
};

} // namespace embed
