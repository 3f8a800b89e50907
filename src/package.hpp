#pragma once

/**
 * Packages of bundled resources.
 *
 * A package is a loadable unit that bundles named, byte-addressable resources.
 * Resource names are dotted identifiers such as "Site.Pages.Default.aspx".
 */

#include "error.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace embed {

/**
 * Sequential reader over one resource's bytes.
 */
class ResourceStream {
public:
    virtual ~ResourceStream() = default;

    // Reads up to size bytes into buffer. Returns the number of bytes read;
    // 0 means the end of the resource has been reached.
    virtual Result<std::size_t> read(std::uint8_t* buffer, std::size_t size) = 0;
};

/**
 * A loaded package.
 */
class Package {
public:
    virtual ~Package() = default;

    // Identifier used in diagnostics.
    virtual const std::string& name() const = 0;

    // All resource names in the package's own order.
    virtual std::vector<std::string> resource_names() const = 0;

    // Opens a resource for reading. Fails with ResourceNotFound if the
    // package has no resource with that name.
    virtual Result<std::unique_ptr<ResourceStream>> open_resource(const std::string& resource_name) = 0;
};

/**
 * Resolves package identifiers to loaded packages.
 */
class PackageLoader {
public:
    virtual ~PackageLoader() = default;

    // Fails with PackageLoadFailure if the package can't be found or opened.
    virtual Result<std::shared_ptr<Package>> load(const std::string& package_id) = 0;
};

} // namespace embed
