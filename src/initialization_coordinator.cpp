#include "initialization_coordinator.hpp"
#include "package.hpp"
#include "path_mapper.hpp"
#include "resource_catalog.hpp"
#include "resource_extractor.hpp"
#include "settings.hpp"
#include "verbose.hpp"
#include <algorithm>

namespace embed {

InitializationCoordinator::InitializationCoordinator(const ConfigurationSource& config, PackageLoader& loader)
    : config_(config), loader_(loader) {}

InitializationCoordinator::~InitializationCoordinator() {
    // Unhook without holding the gate: remove_hook waits for a running
    // shutdown callback, and that callback takes the gate.
    std::vector<std::pair<HostLifecycle*, HostLifecycle::HookId>> hooks;
    {
        std::lock_guard<std::mutex> lock(gate_);
        hooks.swap(hooks_);
    }
    for (const auto& [lifecycle, id] : hooks) {
        lifecycle->remove_hook(id);
    }

    std::lock_guard<std::mutex> lock(gate_);
    auto status = teardown_locked();
    if (!status) {
        verbose_err("cache", status.error().describe());
    }
}

Status InitializationCoordinator::ensure_initialized(HostLifecycle* lifecycle) {
    // Don't initialize twice.
    if (state_.load(std::memory_order_acquire) == InitializationState::Ready) {
        return Status::success();
    }

    std::lock_guard<std::mutex> lock(gate_);
    if (state_.load(std::memory_order_acquire) == InitializationState::Ready) {
        return Status::success();
    }

    state_.store(InitializationState::Initializing, std::memory_order_release);
    passes_.fetch_add(1);
    verbose_log("init", "Starting extraction pass");

    try {
        if (lifecycle) {
            register_teardown(lifecycle);
        }

        auto root = cache_.recreate();
        if (!root) {
            state_.store(InitializationState::Uninitialized, std::memory_order_release);
            verbose_err("init", root.error().describe());
            return root.error();
        }

        auto index = run_extraction_pass(*root);
        if (!index) {
            state_.store(InitializationState::Uninitialized, std::memory_order_release);
            verbose_err("init", index.error().describe());
            return index.error();
        }

        verbose_log("init", "Extracted " + std::to_string(index->size()) + " page(s) into " + *root);

        // Publish the finished index before flipping the state.
        auto snapshot = std::make_shared<const CacheSnapshot>(CacheSnapshot{*root, std::move(index).value()});
        std::atomic_store(&snapshot_, snapshot);
        state_.store(InitializationState::Ready, std::memory_order_release);
        return Status::success();
    } catch (...) {
        state_.store(InitializationState::Uninitialized, std::memory_order_release);
        throw;
    }
}

Result<CacheIndex> InitializationCoordinator::run_extraction_pass(const std::string& root) {
    CacheIndex index;

    // No configured packages just means an empty cache.
    for (const auto& binding : config_.package_bindings()) {
        if (auto status = validate_namespace_root(binding.namespace_root); !status) {
            return Error(ErrorKind::InvalidArgument,
                         "Invalid namespace root configured for package [" + binding.package_id + "].",
                         status.error());
        }

        auto package = loader_.load(binding.package_id);
        if (!package) {
            return package.error();
        }

        for (const auto& resource_name : list_page_resources(**package)) {
            auto actual_path = map_resource_to_path(binding.namespace_root, resource_name, root);
            if (!actual_path) {
                return actual_path.error();
            }

            std::string virtual_path = actual_path->substr(root.size());
            if (index.count(virtual_path) > 0) {
                verbose_log("init", "Skipping " + resource_name + " from [" + binding.package_id +
                            "]: " + virtual_path + " already extracted");
                continue;
            }

            if (auto status = extract_resource(**package, resource_name, *actual_path); !status) {
                return status.error();
            }
            index.emplace(std::move(virtual_path), std::move(actual_path).value());
        }
    }

    return index;
}

void InitializationCoordinator::register_teardown(HostLifecycle* lifecycle) {
    auto registered = std::find_if(hooks_.begin(), hooks_.end(),
        [lifecycle](const auto& hook) { return hook.first == lifecycle; });
    if (registered != hooks_.end()) {
        return;
    }

    // Attach to the host's shutdown so the cache goes away with it.
    HostLifecycle::HookId id = lifecycle->on_shutdown([this, lifecycle]() {
        on_host_shutdown(lifecycle);
    });
    hooks_.emplace_back(lifecycle, id);
}

void InitializationCoordinator::on_host_shutdown(HostLifecycle* lifecycle) {
    std::lock_guard<std::mutex> lock(gate_);
    hooks_.erase(std::remove_if(hooks_.begin(), hooks_.end(),
        [lifecycle](const auto& hook) { return hook.first == lifecycle; }), hooks_.end());

    auto status = teardown_locked();
    if (!status) {
        verbose_err("cache", status.error().describe());
    }
}

Status InitializationCoordinator::teardown() {
    std::lock_guard<std::mutex> lock(gate_);
    return teardown_locked();
}

Status InitializationCoordinator::teardown_locked() {
    Status status = cache_.destroy();
    std::atomic_store(&snapshot_, std::shared_ptr<const CacheSnapshot>());
    state_.store(InitializationState::Uninitialized, std::memory_order_release);
    return status;
}

std::shared_ptr<const CacheSnapshot> InitializationCoordinator::snapshot() const {
    return std::atomic_load(&snapshot_);
}

} // namespace embed
