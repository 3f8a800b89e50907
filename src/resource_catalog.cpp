#include "resource_catalog.hpp"
#include "config.hpp"
#include "package.hpp"
#include <algorithm>
#include <cctype>

namespace embed {

bool is_page_resource(std::string_view resource_name) {
    // At least one character of file name plus the extension.
    if (resource_name.size() <= PAGE_EXTENSION_LENGTH) {
        return false;
    }

    std::string_view suffix = resource_name.substr(resource_name.size() - PAGE_EXTENSION_LENGTH);
    std::string_view extension(PAGE_EXTENSION, PAGE_EXTENSION_LENGTH);
    return std::equal(suffix.begin(), suffix.end(), extension.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

bool is_page_resource(const char* resource_name) {
    if (resource_name == nullptr) {
        return false;
    }
    return is_page_resource(std::string_view(resource_name));
}

std::vector<std::string> list_page_resources(const Package& package) {
    std::vector<std::string> pages;
    for (auto& name : package.resource_names()) {
        if (is_page_resource(std::string_view(name))) {
            pages.push_back(std::move(name));
        }
    }
    return pages;
}

} // namespace embed
