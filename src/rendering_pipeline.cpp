#include "rendering_pipeline.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace embed {

Result<RenderEntryPoints> lookup_render_entries(RenderingPipeline& pipeline) {
    RenderEntryPoints entries;
    entries.public_entry = pipeline.find_entry(RenderEntryKind::Public);
    if (!entries.public_entry) {
        return Error(ErrorKind::InvalidArgument, "Rendering pipeline has no public entry point.");
    }

    entries.internal_entry = pipeline.find_entry(RenderEntryKind::Internal);
    if (!entries.internal_entry) {
        verbose_log("render", "No internal entry point; filesystem pages use the public entry");
        entries.internal_entry = entries.public_entry;
    }
    return entries;
}

std::string get_mime_type(const std::string& path) {
    // Find the extension
    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string::npos) {
        return "application/octet-stream";
    }

    std::string ext = path.substr(dot_pos);
    // Convert to lowercase
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Common MIME types
    if (ext == ".aspx" || ext == ".html" || ext == ".htm") return "text/html";
    if (ext == ".css") return "text/css";
    if (ext == ".js") return "application/javascript";
    if (ext == ".json") return "application/json";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".ico") return "image/x-icon";
    if (ext == ".txt") return "text/plain";
    if (ext == ".xml") return "application/xml";

    return "application/octet-stream";
}

PageRenderer* StaticPagePipeline::find_entry(RenderEntryKind kind) {
    if (kind == RenderEntryKind::Public) {
        return &file_renderer_;
    }
    return nullptr;
}

std::optional<RenderedPage> StaticPagePipeline::FileRenderer::render(const RenderRequest& request,
                                                                     const std::string& physical_path) {
    std::error_code ec;
    if (!fs::is_regular_file(physical_path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(physical_path, std::ios::binary);
    if (!file) {
        verbose_err("render", "Unable to open " + physical_path + " for " + request.url);
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return RenderedPage{content.str(), get_mime_type(physical_path)};
}

} // namespace embed
