#pragma once

/**
 * Zip archive packages.
 *
 * Reads packages stored as zip archives, either from a file on disk or from
 * a buffer in memory. Entry names are the resource names.
 */

#include "package.hpp"
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace embed {

/**
 * A package backed by a zip archive.
 */
class ZipPackage : public Package, public std::enable_shared_from_this<ZipPackage> {
public:
    ~ZipPackage() override;

    // Non-copyable
    ZipPackage(const ZipPackage&) = delete;
    ZipPackage& operator=(const ZipPackage&) = delete;

    // Opens the archive at path.
    static Result<std::shared_ptr<ZipPackage>> open_file(const std::string& name, const std::string& path);

    // Opens an archive held in memory. The bytes are copied.
    static Result<std::shared_ptr<ZipPackage>> open_memory(const std::string& name, std::vector<std::uint8_t> data);

    const std::string& name() const override { return name_; }

    // Entry names in archive order, directories excluded.
    std::vector<std::string> resource_names() const override;

    Result<std::unique_ptr<ResourceStream>> open_resource(const std::string& resource_name) override;

private:
    explicit ZipPackage(std::string name);

    std::string name_;
    std::vector<std::uint8_t> data_;  // Backing bytes for in-memory archives.
    void* archive_ = nullptr;         // mz_zip_archive*
};

/**
 * Locates zip packages in a list of directories.
 *
 * A package identifier "Site.Pages" resolves to the first existing
 * "<dir>/Site.Pages.zip" or "<dir>/Site.Pages", searching directories in order.
 */
class ZipPackageLoader : public PackageLoader {
public:
    explicit ZipPackageLoader(std::vector<std::string> search_dirs);

    Result<std::shared_ptr<Package>> load(const std::string& package_id) override;

private:
    std::vector<std::string> search_dirs_;
};

} // namespace embed
