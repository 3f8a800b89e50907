#pragma once

/**
 * Lifecycle of the extraction cache root.
 *
 * The cache root is a private temporary directory that holds every extracted
 * page. Only one root is active at a time; recreating it removes the previous
 * one first.
 */

#include "error.hpp"
#include <set>
#include <string>

namespace embed {

// Joins a root-relative path ("Admin/Users.aspx" or "/Admin/Users.aspx") onto
// root, lexically normalized.
std::string path_under(const std::string& root, const std::string& relative);

/**
 * Owns a single temporary cache directory.
 *
 * Not synchronized; the owner serializes access.
 */
class CacheDirectory {
public:
    CacheDirectory() = default;
    ~CacheDirectory();

    // Non-copyable
    CacheDirectory(const CacheDirectory&) = delete;
    CacheDirectory& operator=(const CacheDirectory&) = delete;

    // Removes the active root (if any) and creates a new, empty one.
    // Returns its canonical absolute path.
    Result<std::string> recreate();

    // Recursively deletes the active root. A root that is already gone is
    // not an error. Safe to call when nothing is active.
    Status destroy();

    // Joins a root-relative path onto the active root.
    std::string path_under(const std::string& relative) const;

    // Active root, or empty if none.
    const std::string& root() const { return root_; }

private:
    std::string root_;
    std::set<std::string> retired_;  // Roots handed out before; never reused.
};

} // namespace embed
