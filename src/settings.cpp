#include "settings.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <sstream>
#include <cctype>

namespace embed {

namespace fs = std::filesystem;
// Ordered so that package bindings keep the order they have in the file.
using json = nlohmann::ordered_json;

bool parse_bool_setting(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return false;
    }
    size_t end = text.find_last_not_of(" \t\n\r");
    std::string value = text.substr(start, end - start + 1);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true";
}

std::optional<Settings> parse_settings(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return std::nullopt;
        }

        Settings settings;

        if (j.contains(SETTING_ALLOW_FILESYSTEM_PAGES)) {
            const auto& flag = j[SETTING_ALLOW_FILESYSTEM_PAGES];
            if (flag.is_boolean()) {
                settings.allow_filesystem_pages = flag.get<bool>();
            } else if (flag.is_string()) {
                settings.allow_filesystem_pages = parse_bool_setting(flag.get<std::string>());
            }
        }

        if (j.contains(SETTING_PAGE_PACKAGES) && j[SETTING_PAGE_PACKAGES].is_object()) {
            for (const auto& [package_id, namespace_root] : j[SETTING_PAGE_PACKAGES].items()) {
                if (namespace_root.is_string()) {
                    settings.page_packages.push_back({package_id, namespace_root.get<std::string>()});
                } else {
                    verbose_err("config", "Ignoring package [" + package_id + "]: namespace root is not a string");
                }
            }
        }

        if (j.contains(SETTING_PACKAGE_DIRS) && j[SETTING_PACKAGE_DIRS].is_array()) {
            for (const auto& dir : j[SETTING_PACKAGE_DIRS]) {
                if (dir.is_string()) {
                    settings.package_dirs.push_back(dir.get<std::string>());
                }
            }
        }

        return settings;
    } catch (const json::exception& e) {
        verbose_err("config", std::string("Invalid settings: ") + e.what());
        return std::nullopt;
    }
}

std::optional<Settings> load_settings(const std::string& path) {
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_settings(buffer.str());
}

} // namespace embed
