#include <catch2/catch.hpp>
#include "host_lifecycle.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace embed;

TEST_CASE("Hooks run once in registration order", "[lifecycle]") {
    ShutdownHooks hooks;
    std::vector<int> calls;
    hooks.on_shutdown([&calls]() { calls.push_back(1); });
    hooks.on_shutdown([&calls]() { calls.push_back(2); });
    REQUIRE(hooks.size() == 2);

    hooks.fire();
    hooks.fire();

    REQUIRE(calls == std::vector<int>{1, 2});
    REQUIRE(hooks.size() == 0);
}

TEST_CASE("Removed hooks don't run", "[lifecycle]") {
    ShutdownHooks hooks;
    int calls = 0;
    auto id = hooks.on_shutdown([&calls]() { ++calls; });
    hooks.remove_hook(id);
    hooks.remove_hook(id + 100);

    hooks.fire();
    REQUIRE(calls == 0);
}

TEST_CASE("Hooks may register new hooks while firing", "[lifecycle]") {
    ShutdownHooks hooks;
    int later = 0;
    hooks.on_shutdown([&]() { hooks.on_shutdown([&later]() { ++later; }); });

    hooks.fire();
    REQUIRE(later == 0);
    REQUIRE(hooks.size() == 1);

    hooks.fire();
    REQUIRE(later == 1);
}

TEST_CASE("Hooks may remove other hooks while firing", "[lifecycle]") {
    ShutdownHooks hooks;
    int calls = 0;
    HostLifecycle::HookId second = 0;
    hooks.on_shutdown([&]() { hooks.remove_hook(second); ++calls; });
    second = hooks.on_shutdown([&calls]() { ++calls; });

    hooks.fire();
    REQUIRE(calls == 2);
    REQUIRE(hooks.size() == 0);
}

TEST_CASE("remove_hook waits for a running callback", "[lifecycle][concurrency]") {
    ShutdownHooks hooks;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    auto id = hooks.on_shutdown([&]() {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
    });

    std::thread firing([&hooks]() { hooks.fire(); });
    while (!entered) {
        std::this_thread::yield();
    }
    hooks.remove_hook(id);
    REQUIRE(finished);

    firing.join();
}
