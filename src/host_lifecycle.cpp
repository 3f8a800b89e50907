#include "host_lifecycle.hpp"
#include <utility>

namespace embed {

HostLifecycle::HookId ShutdownHooks::on_shutdown(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    HookId id = next_id_++;
    hooks_.emplace(id, std::move(callback));
    return id;
}

void ShutdownHooks::remove_hook(HookId id) {
    std::lock_guard<std::recursive_mutex> firing(firing_);
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_.erase(id);
}

void ShutdownHooks::fire() {
    std::lock_guard<std::recursive_mutex> firing(firing_);
    std::map<HookId, std::function<void()>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(hooks_);
    }
    for (auto& [id, callback] : pending) {
        if (callback) {
            callback();
        }
    }
}

std::size_t ShutdownHooks::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hooks_.size();
}

} // namespace embed
