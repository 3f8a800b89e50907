#pragma once

/**
 * Host lifecycle signals.
 *
 * Lets components register work to run when the hosting application shuts
 * down, such as removing the extraction cache.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace embed {

/**
 * Shutdown notification offered by the host.
 */
class HostLifecycle {
public:
    using HookId = std::size_t;

    virtual ~HostLifecycle() = default;

    // Registers a callback to run once when the host shuts down.
    virtual HookId on_shutdown(std::function<void()> callback) = 0;

    // Unregisters a callback. Unknown ids are ignored. After this returns the
    // callback is not running and will not run.
    virtual void remove_hook(HookId id) = 0;
};

/**
 * In-process HostLifecycle fired explicitly by the host.
 *
 * Thread-safe. Each callback runs at most once, in registration order.
 * Callbacks may register or remove hooks themselves. remove_hook() called
 * from another thread while fire() is running waits until fire() returns, so
 * once it returns the removed callback is not running and never will.
 */
class ShutdownHooks : public HostLifecycle {
public:
    HookId on_shutdown(std::function<void()> callback) override;
    void remove_hook(HookId id) override;

    // Runs and clears all registered callbacks.
    void fire();

    std::size_t size() const;

private:
    std::recursive_mutex firing_;  // Held while callbacks run.
    mutable std::mutex mutex_;
    std::map<HookId, std::function<void()>> hooks_;
    HookId next_id_ = 1;
};

} // namespace embed
