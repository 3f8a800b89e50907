#include "console.hpp"
#include "error.hpp"
#include <cstdlib>
#include <unistd.h>

namespace embed {

Console::Console() : colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
    // Check if output is a terminal
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb" || !::isatty(STDOUT_FILENO)) {
        colors_enabled_ = false;
    }
}

void Console::println(const std::string& text) const {
    std::cout << text << std::endl;
}

void Console::print_error(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::RED << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_error(const Error& error) const {
    print_error(std::string("Error [") + to_string(error.kind) + "]: " + error.describe());
}

void Console::print_warning(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::YELLOW << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cout << "* " << text << std::endl;
    }
}

void Console::print_header(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_field(const std::string& label, const std::string& value, const char* color) const {
    if (colors_enabled_) {
        std::cout << color << label << ": " << ansi::RESET << value << std::endl;
    } else {
        std::cout << label << ": " << value << std::endl;
    }
}

} // namespace embed
