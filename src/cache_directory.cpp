#include "cache_directory.hpp"
#include "config.hpp"
#include "verbose.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace embed {

CacheDirectory::~CacheDirectory() {
    auto status = destroy();
    if (!status) {
        verbose_err("cache", status.error().describe());
    }
}

Result<std::string> CacheDirectory::recreate() {
    // Clean up existing files.
    if (auto status = destroy(); !status) {
        return status.error();
    }

    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        return Error(ErrorKind::DirectoryLifecycleFailure,
                     "Unable to locate the temporary directory: " + ec.message());
    }
    if (::access(base.c_str(), W_OK | X_OK) != 0) {
        return Error(ErrorKind::DirectoryLifecycleFailure,
                     "No write access to temporary directory [" + base.string() + "]: " + std::strerror(errno));
    }

    // mkdtemp can in principle hand back a name we already used and removed.
    constexpr int MAX_ATTEMPTS = 16;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        std::string pattern = (base / (std::string(CACHE_DIR_PREFIX) + "XXXXXX")).string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');

        if (::mkdtemp(name.data()) == nullptr) {
            return Error(ErrorKind::DirectoryLifecycleFailure,
                         "Unable to create cache directory under [" + base.string() + "]: " + std::strerror(errno));
        }

        fs::path created = fs::canonical(fs::path(name.data()), ec);
        if (ec) {
            fs::remove(fs::path(name.data()), ec);
            return Error(ErrorKind::DirectoryLifecycleFailure,
                         "Unable to resolve cache directory [" + std::string(name.data()) + "]: " + ec.message());
        }

        if (retired_.count(created.string()) > 0) {
            fs::remove(created, ec);
            continue;
        }

        root_ = created.string();
        verbose_log("cache", "Created cache root " + root_);
        return root_;
    }

    return Error(ErrorKind::DirectoryLifecycleFailure,
                 "Unable to allocate a fresh cache directory under [" + base.string() + "].");
}

Status CacheDirectory::destroy() {
    if (root_.empty()) {
        return Status::success();
    }

    std::string root = root_;
    root_.clear();
    retired_.insert(root);

    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error(ErrorKind::DirectoryLifecycleFailure,
                     "Unable to remove cache root [" + root + "]: " + ec.message());
    }

    verbose_log("cache", "Removed cache root " + root);
    return Status::success();
}

std::string path_under(const std::string& root, const std::string& relative) {
    return (fs::path(root) / fs::path(relative).relative_path()).lexically_normal().string();
}

std::string CacheDirectory::path_under(const std::string& relative) const {
    return embed::path_under(root_, relative);
}

} // namespace embed
