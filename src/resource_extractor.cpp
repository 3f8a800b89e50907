#include "resource_extractor.hpp"
#include "config.hpp"
#include "package.hpp"
#include "verbose.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace embed {

namespace {

struct FileCloser {
    void operator()(std::FILE* file) const { std::fclose(file); }
};

using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

Error io_error(const std::string& what) {
    return Error(ErrorKind::IoError, what + ": " + std::strerror(errno));
}

} // namespace

Status extract_resource(
    Package& package,
    const std::string& resource_name,
    const std::string& destination_path
) {
    if (resource_name.empty()) {
        return Error(ErrorKind::InvalidArgument, "Path to embedded resource may not be empty.");
    }
    if (destination_path.empty()) {
        return Error(ErrorKind::InvalidArgument, "Destination path of embedded resource may not be empty.");
    }

    // Create the directory if it doesn't exist.
    fs::path dir_path = fs::path(destination_path).parent_path();
    if (!dir_path.empty()) {
        std::error_code ec;
        fs::create_directories(dir_path, ec);
        if (ec) {
            return Error(ErrorKind::ExtractionFailure,
                         "Unable to create destination directory for path [" + destination_path + "].",
                         Error(ErrorKind::IoError, ec.message()));
        }
    }

    auto failure = [&](Error cause) {
        return Error(ErrorKind::ExtractionFailure,
                     "Unable to write resource [" + resource_name + "] from package [" +
                     package.name() + "] to destination [" + destination_path + "].",
                     std::move(cause));
    };

    auto stream = package.open_resource(resource_name);
    if (!stream) {
        return failure(stream.error());
    }

    // "x" gives create-new semantics: never overwrite an existing file.
    FileHandle file(std::fopen(destination_path.c_str(), "wbx"));
    if (!file) {
        return failure(io_error("Unable to create file"));
    }

    std::uint8_t buffer[EXTRACT_BUFFER_SIZE];
    std::size_t total = 0;
    while (true) {
        auto bytes_read = (*stream)->read(buffer, EXTRACT_BUFFER_SIZE);
        if (!bytes_read) {
            return failure(bytes_read.error());
        }
        if (*bytes_read == 0) {
            break;
        }
        if (std::fwrite(buffer, 1, *bytes_read, file.get()) != *bytes_read) {
            return failure(io_error("Write failed"));
        }
        total += *bytes_read;
    }

    if (std::fflush(file.get()) != 0) {
        return failure(io_error("Flush failed"));
    }
    if (std::fclose(file.release()) != 0) {
        return failure(io_error("Close failed"));
    }

    verbose_log("extract", resource_name + " -> " + destination_path +
                " (" + std::to_string(total) + " bytes)");
    return Status::success();
}

} // namespace embed
