#include "error.hpp"

namespace embed {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::PrefixMismatch: return "PrefixMismatch";
        case ErrorKind::ExtractionFailure: return "ExtractionFailure";
        case ErrorKind::PackageLoadFailure: return "PackageLoadFailure";
        case ErrorKind::DirectoryLifecycleFailure: return "DirectoryLifecycleFailure";
        case ErrorKind::ResourceNotFound: return "ResourceNotFound";
        case ErrorKind::IoError: return "IoError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string text = message;
    for (const Error* e = cause.get(); e != nullptr; e = e->cause.get()) {
        text += " (caused by: " + e->message + ")";
    }
    return text;
}

} // namespace embed
