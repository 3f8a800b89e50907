#pragma once

/**
 * Error values for the resource virtualization layer.
 *
 * Operations report failure by returning an Error inside a Result or Status
 * instead of throwing. An Error may carry the lower-level error that caused it.
 */

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace embed {

enum class ErrorKind {
    InvalidArgument,            // Empty or malformed input.
    PrefixMismatch,             // Resource name doesn't start with its namespace root.
    ExtractionFailure,          // Resource could not be copied to the cache.
    PackageLoadFailure,         // Configured package could not be loaded.
    DirectoryLifecycleFailure,  // Cache root could not be created or removed.
    ResourceNotFound,           // Package has no resource with the requested name.
    IoError                     // Underlying read/write/filesystem failure.
};

// Returns a short name for the error kind (e.g. "PrefixMismatch").
const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
    std::shared_ptr<const Error> cause;  // Wrapped error, may be null.

    Error(ErrorKind kind, std::string message)
        : kind(kind), message(std::move(message)) {}

    Error(ErrorKind kind, std::string message, Error cause)
        : kind(kind), message(std::move(message)),
          cause(std::make_shared<const Error>(std::move(cause))) {}

    // Message followed by the chain of causes.
    std::string describe() const;
};

/**
 * Either a value or an Error.
 */
template <typename T>
class Result {
public:
    Result(Error error) : error_(std::move(error)) {}

    template <typename U,
              typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                          !std::is_same_v<std::decay_t<U>, Error> &&
                                          !std::is_same_v<std::decay_t<U>, Result>>>
    Result(U&& value) : value_(std::forward<U>(value)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

    const T& operator*() const& { return *value_; }
    T& operator*() & { return *value_; }
    const T* operator->() const { return &*value_; }
    T* operator->() { return &*value_; }

    const Error& error() const { return *error_; }

private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

/**
 * Success, or an Error.
 */
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status success() { return Status(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

} // namespace embed
