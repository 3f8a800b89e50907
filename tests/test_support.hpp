#pragma once

// Shared fixtures for the embedpages tests: temporary directories, in-memory
// packages, zip archive builders and a fixed configuration source.

#include "error.hpp"
#include "package.hpp"
#include "settings.hpp"
#include <miniz.h>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace test_support {

namespace fs = std::filesystem;

// Creates a unique directory under the temp dir and removes it on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "embedpages-test-XXXXXX").string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        if (::mkdtemp(name.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = fs::canonical(name.data());
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    // Writes a file relative to the directory, creating parents.
    fs::path write(const std::string& relative, const std::string& content) const {
        fs::path file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    fs::path path_;
};

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic content of the given length.
inline std::string make_content(std::size_t length) {
    std::string content(length, '\0');
    for (std::size_t i = 0; i < length; ++i) {
        content[i] = static_cast<char>('a' + (i % 26));
    }
    return content;
}

// Package whose resources live in memory. A resource listed in failing_
// returns an I/O error after its first chunk.
class MemoryPackage : public embed::Package {
public:
    explicit MemoryPackage(std::string name,
                           std::vector<std::pair<std::string, std::string>> resources = {})
        : name_(std::move(name)), resources_(std::move(resources)) {}

    void add(const std::string& resource_name, const std::string& content) {
        resources_.emplace_back(resource_name, content);
    }

    void fail_reading(const std::string& resource_name) {
        failing_.push_back(resource_name);
    }

    const std::string& name() const override { return name_; }

    std::vector<std::string> resource_names() const override {
        std::vector<std::string> names;
        for (const auto& [resource_name, content] : resources_) {
            names.push_back(resource_name);
        }
        return names;
    }

    embed::Result<std::unique_ptr<embed::ResourceStream>> open_resource(const std::string& resource_name) override {
        for (const auto& [candidate, content] : resources_) {
            if (candidate == resource_name) {
                bool fails = std::find(failing_.begin(), failing_.end(), resource_name) != failing_.end();
                return std::make_unique<Stream>(content, fails);
            }
        }
        return embed::Error(embed::ErrorKind::ResourceNotFound, "No resource " + resource_name);
    }

private:
    class Stream : public embed::ResourceStream {
    public:
        Stream(std::string content, bool fails) : content_(std::move(content)), fails_(fails) {}

        embed::Result<std::size_t> read(std::uint8_t* buffer, std::size_t size) override {
            if (fails_ && offset_ > 0) {
                return embed::Error(embed::ErrorKind::IoError, "Simulated read failure");
            }
            std::size_t n = std::min(size, content_.size() - offset_);
            std::memcpy(buffer, content_.data() + offset_, n);
            offset_ += n;
            return n;
        }

    private:
        std::string content_;
        bool fails_;
        std::size_t offset_ = 0;
    };

    std::string name_;
    std::vector<std::pair<std::string, std::string>> resources_;
    std::vector<std::string> failing_;
};

// Loader over a fixed set of packages. Counts load calls.
class MapPackageLoader : public embed::PackageLoader {
public:
    void add(std::shared_ptr<embed::Package> package) {
        packages_[package->name()] = std::move(package);
    }

    embed::Result<std::shared_ptr<embed::Package>> load(const std::string& package_id) override {
        ++loads;
        auto it = packages_.find(package_id);
        if (it == packages_.end()) {
            return embed::Error(embed::ErrorKind::PackageLoadFailure, "Unknown package " + package_id);
        }
        return it->second;
    }

    std::atomic<int> loads{0};

private:
    std::map<std::string, std::shared_ptr<embed::Package>> packages_;
};

// Configuration with fixed values.
class StaticConfiguration : public embed::ConfigurationSource {
public:
    std::vector<embed::PackageBinding> bindings;
    bool allow_filesystem = false;

    std::vector<embed::PackageBinding> package_bindings() const override { return bindings; }
    bool allow_filesystem_pages() const override { return allow_filesystem; }
};

// Builds a zip archive in memory. Names ending in '/' become directory entries.
inline std::vector<std::uint8_t> make_zip(const std::vector<std::pair<std::string, std::string>>& entries) {
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    if (!mz_zip_writer_init_heap(&zip, 0, 0)) {
        throw std::runtime_error("mz_zip_writer_init_heap failed");
    }

    for (const auto& [name, content] : entries) {
        if (!mz_zip_writer_add_mem(&zip, name.c_str(), content.data(), content.size(),
                                   MZ_DEFAULT_COMPRESSION)) {
            mz_zip_writer_end(&zip);
            throw std::runtime_error("mz_zip_writer_add_mem failed for " + name);
        }
    }

    void* buffer = nullptr;
    std::size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&zip, &buffer, &size)) {
        mz_zip_writer_end(&zip);
        throw std::runtime_error("mz_zip_writer_finalize_heap_archive failed");
    }

    auto* bytes = static_cast<const std::uint8_t*>(buffer);
    std::vector<std::uint8_t> archive(bytes, bytes + size);
    mz_free(buffer);
    mz_zip_writer_end(&zip);
    return archive;
}

inline void write_zip(const fs::path& path,
                      const std::vector<std::pair<std::string, std::string>>& entries) {
    auto archive = make_zip(entries);
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(archive.data()), static_cast<std::streamsize>(archive.size()));
}

} // namespace test_support
