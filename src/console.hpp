#pragma once

#include <string>
#include <iostream>

namespace embed {

struct Error;

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output helper with color support.
 *
 * Falls back to plain text when colors are not supported (e.g., when
 * TERM=dumb).
 */
class Console {
public:
    // Creates a Console instance and detects color support.
    Console();

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints an Error with its kind and causes.
    void print_error(const Error& error) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints header text in bold cyan.
    void print_header(const std::string& text) const;

    // Prints a "label: value" line with the label in the given color.
    void print_field(const std::string& label, const std::string& value, const char* color = ansi::GREEN) const;

private:
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

} // namespace embed
