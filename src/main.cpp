#include "config.hpp"
#include "console.hpp"
#include "settings.hpp"
#include "zip_package.hpp"
#include "host_lifecycle.hpp"
#include "initialization_coordinator.hpp"
#include "request_router.hpp"
#include "rendering_pipeline.hpp"
#include "http_server.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <csignal>
#include <filesystem>
#include <string>
#include <vector>

using namespace embed;

// ========== Signal Handling ==========

static HttpServer* g_server = nullptr;  // Global server for signal handler.

// Handles SIGINT/SIGTERM by stopping the listener; main() then shuts down.
void signal_handler(int) {
    if (g_server) {
        g_server->stop();
    }
}

// ========== Index Listing ==========

// Extracts all configured pages, prints the cache index and removes the cache.
int list_pages(InitializationCoordinator& coordinator, ShutdownHooks& lifecycle, Console& console) {
    auto status = coordinator.ensure_initialized(&lifecycle);
    if (!status) {
        console.print_error(status.error());
        return 1;
    }

    auto snapshot = coordinator.snapshot();
    console.print_field("Cache root", snapshot->root);
    console.print_field("Pages", std::to_string(snapshot->index.size()));
    for (const auto& [virtual_path, actual_path] : snapshot->index) {
        console.println("  " + virtual_path + " -> " + actual_path);
    }

    lifecycle.fire();
    return 0;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Serves pages embedded in zip packages, extracted to a private cache"};
    app.footer("\nExamples:\n"
               "  embedpages --app-root site               Serve pages for the site directory\n"
               "  embedpages --package-dir packages --list Show which pages would be extracted\n");

    std::string config_path = SETTINGS_FILE;
    app.add_option("-c,--config", config_path, "Settings file (default: .embedpages.json)");

    std::string app_root = ".";
    app.add_option("--app-root", app_root, "Application root that request paths map into")
        ->check(CLI::ExistingDirectory);

    std::vector<std::string> package_dirs;
    app.add_option("--package-dir", package_dirs, "Directory to search for packages (repeatable)");

    int server_port = DEFAULT_PORT;
    app.add_option("-p,--port", server_port, "Port for web server (default: 8080)")
        ->check(CLI::Range(1, 65535));

    std::string server_address = DEFAULT_ADDRESS;
    app.add_option("--address", server_address, "Bind address for web server (default: 0.0.0.0)");

    bool list_only = false;
    app.add_flag("--list", list_only, "Extract the configured pages, list them and exit");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log initialization, extraction and requests to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    // Load settings; a missing file means no packages.
    Settings settings;
    if (auto loaded = load_settings(config_path)) {
        settings = std::move(*loaded);
    } else if (std::filesystem::exists(config_path)) {
        console.print_warning("Warning: Unable to parse " + config_path + ", using defaults");
    }
    settings.package_dirs.insert(settings.package_dirs.end(), package_dirs.begin(), package_dirs.end());

    SettingsConfiguration config(settings);
    ZipPackageLoader loader(settings.package_dirs);
    ShutdownHooks lifecycle;
    InitializationCoordinator coordinator(config, loader);

    if (list_only) {
        return list_pages(coordinator, lifecycle, console);
    }

    console.println();
    console.print_header("=== embedpages ===");
    console.print_field("Application root", std::filesystem::absolute(app_root).string());
    console.print_field("Packages", std::to_string(settings.page_packages.size()));
    console.print_field("Filesystem pages", settings.allow_filesystem_pages ? "allowed" : "disabled");

    StaticPagePipeline pipeline;
    auto entries = lookup_render_entries(pipeline);
    if (!entries) {
        console.print_error(entries.error());
        return 1;
    }

    RequestRouter router(coordinator, config, app_root, &lifecycle);
    HttpServer server(router, *entries);
    g_server = &server;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server.on_start([&console](const std::string& address, int port) {
        console.println();
        std::string display_addr = (address == "0.0.0.0") ? "localhost" : address;
        console.print_success("HTTP server running at http://" + display_addr + ":" + std::to_string(port));
        console.println("Press Ctrl+C to stop.");
        console.println();
    });

    // Start HTTP server (blocks until stopped).
    bool started = server.start(server_address, server_port);
    g_server = nullptr;

    // Host shutdown: removes the page cache.
    lifecycle.fire();

    if (!started) {
        console.print_error("Failed to start HTTP server on " + server_address + ":" + std::to_string(server_port));
        return 1;
    }

    console.print_warning("Stopped.");
    return 0;
}
