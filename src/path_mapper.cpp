#include "path_mapper.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace embed {

// Applies the dotted-name rules shared by namespace roots and resource names.
static Status validate_dotted_name(const std::string& name, const char* what) {
    if (name.empty()) {
        return Error(ErrorKind::InvalidArgument, std::string(what) + " may not be empty.");
    }
    if (name.front() == '.' || name.back() == '.') {
        return Error(ErrorKind::InvalidArgument,
                     std::string(what) + " may not start or end with a period: " + name);
    }
    if (name.find("..") != std::string::npos) {
        return Error(ErrorKind::InvalidArgument,
                     std::string(what) + " may not contain two or more periods together: " + name);
    }
    return Status::success();
}

Status validate_namespace_root(const std::string& namespace_root) {
    return validate_dotted_name(namespace_root, "Base resource namespace");
}

Result<std::string> map_resource_to_path(
    const std::string& namespace_root,
    const std::string& resource_name,
    const std::string& destination_root
) {
    if (auto status = validate_namespace_root(namespace_root); !status) {
        return status.error();
    }
    if (auto status = validate_dotted_name(resource_name, "Embedded resource path"); !status) {
        return status.error();
    }

    const std::string prefix = namespace_root + ".";
    if (resource_name.compare(0, prefix.size(), prefix) != 0) {
        return Error(ErrorKind::PrefixMismatch,
                     "Base resource namespace [" + namespace_root +
                     "] must appear at the start of the embedded resource path [" +
                     resource_name + "].");
    }

    // Separators would let a name climb out of the destination folder.
    if (resource_name.find_first_of("/\\", prefix.size()) != std::string::npos) {
        return Error(ErrorKind::InvalidArgument,
                     "Embedded resource path may not contain path separators: " + resource_name);
    }

    std::error_code ec;
    fs::path target_folder = destination_root.empty()
        ? fs::current_path(ec)
        : fs::absolute(fs::path(destination_root), ec);
    if (ec) {
        return Error(ErrorKind::IoError,
                     "Unable to resolve destination folder [" + destination_root + "]: " + ec.message());
    }

    // Everything from the last period on is the extension; the rest is folders.
    std::string remainder = resource_name.substr(prefix.size());
    std::string extension;
    auto ext_pos = remainder.rfind('.');
    if (ext_pos != std::string::npos) {
        extension = remainder.substr(ext_pos);
        remainder.erase(ext_pos);
    }
    std::replace(remainder.begin(), remainder.end(), '.', fs::path::preferred_separator);

    fs::path mapped = target_folder / (remainder + extension);
    return mapped.lexically_normal().string();
}

} // namespace embed
