#include "zip_package.hpp"
#include "config.hpp"
#include "verbose.hpp"
#include <miniz.h>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace embed {

namespace {

// Streams one archive entry through miniz's iterative extractor.
class ZipResourceStream : public ResourceStream {
public:
    ZipResourceStream(std::shared_ptr<Package> owner,
                      mz_zip_reader_extract_iter_state* state,
                      mz_uint64 size)
        : owner_(std::move(owner)), state_(state), remaining_(size) {}

    ~ZipResourceStream() override {
        if (state_) {
            mz_zip_reader_extract_iter_free(state_);
        }
    }

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t size) override {
        if (!state_) {
            return std::size_t{0};
        }

        std::size_t n = mz_zip_reader_extract_iter_read(state_, buffer, size);
        if (n > remaining_) {
            return Error(ErrorKind::IoError, "Entry in [" + owner_->name() + "] is longer than its header states.");
        }
        remaining_ -= n;

        if (n == 0) {
            // Freeing the iterator also verifies the entry's CRC.
            bool intact = mz_zip_reader_extract_iter_free(state_);
            state_ = nullptr;
            if (remaining_ > 0) {
                return Error(ErrorKind::IoError, "Entry in [" + owner_->name() + "] ended early; " +
                             std::to_string(remaining_) + " bytes missing.");
            }
            if (!intact) {
                return Error(ErrorKind::IoError, "Entry in [" + owner_->name() + "] failed its integrity check.");
            }
        }
        return n;
    }

private:
    std::shared_ptr<Package> owner_;  // Keeps the archive open while streaming.
    mz_zip_reader_extract_iter_state* state_;
    mz_uint64 remaining_;
};

} // namespace

ZipPackage::ZipPackage(std::string name) : name_(std::move(name)) {}

ZipPackage::~ZipPackage() {
    if (archive_) {
        mz_zip_reader_end(static_cast<mz_zip_archive*>(archive_));
        delete static_cast<mz_zip_archive*>(archive_);
    }
}

Result<std::shared_ptr<ZipPackage>> ZipPackage::open_file(const std::string& name, const std::string& path) {
    std::shared_ptr<ZipPackage> package(new ZipPackage(name));

    auto* zip = new mz_zip_archive();
    std::memset(zip, 0, sizeof(mz_zip_archive));

    if (!mz_zip_reader_init_file(zip, path.c_str(), 0)) {
        std::string reason = mz_zip_get_error_string(mz_zip_get_last_error(zip));
        delete zip;
        return Error(ErrorKind::PackageLoadFailure,
                     "Unable to open package [" + name + "] at [" + path + "]: " + reason);
    }

    package->archive_ = zip;
    return package;
}

Result<std::shared_ptr<ZipPackage>> ZipPackage::open_memory(const std::string& name, std::vector<std::uint8_t> data) {
    std::shared_ptr<ZipPackage> package(new ZipPackage(name));
    package->data_ = std::move(data);

    auto* zip = new mz_zip_archive();
    std::memset(zip, 0, sizeof(mz_zip_archive));

    if (!mz_zip_reader_init_mem(zip, package->data_.data(), package->data_.size(), 0)) {
        std::string reason = mz_zip_get_error_string(mz_zip_get_last_error(zip));
        delete zip;
        return Error(ErrorKind::PackageLoadFailure,
                     "Unable to read package [" + name + "] from memory: " + reason);
    }

    package->archive_ = zip;
    return package;
}

std::vector<std::string> ZipPackage::resource_names() const {
    std::vector<std::string> names;
    auto* zip = static_cast<mz_zip_archive*>(archive_);

    mz_uint count = mz_zip_reader_get_num_files(zip);
    names.reserve(count);
    for (mz_uint i = 0; i < count; ++i) {
        if (mz_zip_reader_is_file_a_directory(zip, i)) {
            continue;
        }
        mz_uint length = mz_zip_reader_get_filename(zip, i, nullptr, 0);
        if (length == 0) {
            continue;
        }
        // The reported length includes the terminating null.
        std::string filename(length, '\0');
        mz_zip_reader_get_filename(zip, i, filename.data(), length);
        filename.resize(length - 1);
        names.push_back(std::move(filename));
    }
    return names;
}

Result<std::unique_ptr<ResourceStream>> ZipPackage::open_resource(const std::string& resource_name) {
    auto* zip = static_cast<mz_zip_archive*>(archive_);

    // Names differing only in case are distinct resources.
    int file_index = mz_zip_reader_locate_file(zip, resource_name.c_str(), nullptr, MZ_ZIP_FLAG_CASE_SENSITIVE);
    if (file_index < 0 || mz_zip_reader_is_file_a_directory(zip, static_cast<mz_uint>(file_index))) {
        return Error(ErrorKind::ResourceNotFound,
                     "Resource [" + resource_name + "] not found in package [" + name_ + "].");
    }

    mz_zip_archive_file_stat file_stat;
    if (!mz_zip_reader_file_stat(zip, static_cast<mz_uint>(file_index), &file_stat)) {
        return Error(ErrorKind::IoError,
                     "Unable to read header of [" + resource_name + "] in package [" + name_ + "].");
    }

    auto* state = mz_zip_reader_extract_iter_new(zip, static_cast<mz_uint>(file_index), 0);
    if (!state) {
        return Error(ErrorKind::IoError,
                     "Unable to open [" + resource_name + "] in package [" + name_ + "]: " +
                     mz_zip_get_error_string(mz_zip_get_last_error(zip)));
    }

    return std::make_unique<ZipResourceStream>(shared_from_this(), state, file_stat.m_uncomp_size);
}

ZipPackageLoader::ZipPackageLoader(std::vector<std::string> search_dirs)
    : search_dirs_(std::move(search_dirs)) {
    if (search_dirs_.empty()) {
        search_dirs_.push_back(".");
    }
}

Result<std::shared_ptr<Package>> ZipPackageLoader::load(const std::string& package_id) {
    if (package_id.empty()) {
        return Error(ErrorKind::PackageLoadFailure, "Package identifier may not be empty.");
    }

    std::string tried;
    for (const auto& dir : search_dirs_) {
        for (const auto& candidate : {fs::path(dir) / (package_id + PACKAGE_EXTENSION),
                                      fs::path(dir) / package_id}) {
            std::error_code ec;
            if (!fs::is_regular_file(candidate, ec)) {
                if (!tried.empty()) tried += ", ";
                tried += candidate.string();
                continue;
            }

            verbose_log("package", "Loading [" + package_id + "] from " + candidate.string());
            auto package = ZipPackage::open_file(package_id, candidate.string());
            if (!package) {
                return package.error();
            }
            return std::shared_ptr<Package>(std::move(package).value());
        }
    }

    return Error(ErrorKind::PackageLoadFailure,
                 "Package [" + package_id + "] not found (tried " + tried + ").");
}

} // namespace embed
