#pragma once

/**
 * Rendering of resolved pages.
 *
 * A rendering pipeline turns a resolved physical path into response bytes.
 * Pipelines expose up to two entry points: a public one, used for pages
 * served from the cache, and an optional internal one, used for pages passed
 * through from the real filesystem. The entries are looked up once at
 * startup; callers never ask the pipeline again per request.
 */

#include "error.hpp"
#include <optional>
#include <string>

namespace embed {

struct RenderRequest {
    std::string url;     // Requested virtual path.
    std::string method;  // HTTP method.
};

struct RenderedPage {
    std::string content;
    std::string mime_type;
};

/**
 * One way of rendering a page.
 */
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    // Returns nullopt if there is nothing to render at physical_path.
    virtual std::optional<RenderedPage> render(const RenderRequest& request,
                                               const std::string& physical_path) = 0;
};

enum class RenderEntryKind {
    Public,
    Internal
};

/**
 * Capability lookup for a pipeline's renderers.
 */
class RenderingPipeline {
public:
    virtual ~RenderingPipeline() = default;

    // Returns the renderer for kind, or null if the pipeline lacks it.
    virtual PageRenderer* find_entry(RenderEntryKind kind) = 0;
};

struct RenderEntryPoints {
    PageRenderer* public_entry = nullptr;
    PageRenderer* internal_entry = nullptr;
};

// Looks up both entries. A missing internal entry falls back to the public
// one; a missing public entry is an InvalidArgument error.
Result<RenderEntryPoints> lookup_render_entries(RenderingPipeline& pipeline);

// Gets the MIME type for a file based on its extension.
std::string get_mime_type(const std::string& path);

/**
 * Pipeline that serves page files verbatim.
 *
 * Offers only the public entry.
 */
class StaticPagePipeline : public RenderingPipeline {
public:
    PageRenderer* find_entry(RenderEntryKind kind) override;

private:
    class FileRenderer : public PageRenderer {
    public:
        std::optional<RenderedPage> render(const RenderRequest& request,
                                           const std::string& physical_path) override;
    };

    FileRenderer file_renderer_;
};

} // namespace embed
