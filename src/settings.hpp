#pragma once

/**
 * Settings for the embedpages host.
 *
 * Handles loading of application settings from a local JSON file: which
 * packages carry embedded pages (and under which namespace root), where to
 * find them, and whether pages on the real filesystem take precedence.
 */

#include "config.hpp"
#include <string>
#include <vector>
#include <optional>
#include <utility>

namespace embed {

/**
 * A configured package and the namespace root stripped from its resource names.
 */
struct PackageBinding {
    std::string package_id;      // Package identifier passed to the loader.
    std::string namespace_root;  // e.g. "Site.Pages".
};

/**
 * Application settings stored in .embedpages.json.
 */
struct Settings {
    std::vector<PackageBinding> page_packages;  // In file order.
    std::vector<std::string> package_dirs;      // Directories searched for packages.
    bool allow_filesystem_pages = false;        // Serve real files when they exist.
};

// Parses settings from JSON text. Returns empty optional if the text is not
// a JSON object.
std::optional<Settings> parse_settings(const std::string& text);

// Loads settings from path. Returns empty optional if the file doesn't exist
// or can't be parsed.
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Parses a boolean setting value ("true"/"false", any case, surrounding
// whitespace ignored). Anything else is false.
bool parse_bool_setting(const std::string& text);

/**
 * Source of the package bindings and the filesystem fallback flag.
 */
class ConfigurationSource {
public:
    virtual ~ConfigurationSource() = default;

    // Configured bindings in order. Empty if nothing is configured.
    virtual std::vector<PackageBinding> package_bindings() const = 0;

    // False if not configured.
    virtual bool allow_filesystem_pages() const = 0;
};

/**
 * Configuration backed by a loaded Settings value.
 */
class SettingsConfiguration : public ConfigurationSource {
public:
    explicit SettingsConfiguration(Settings settings) : settings_(std::move(settings)) {}

    std::vector<PackageBinding> package_bindings() const override { return settings_.page_packages; }
    bool allow_filesystem_pages() const override { return settings_.allow_filesystem_pages; }

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace embed
