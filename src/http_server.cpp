#include "http_server.hpp"
#include "config.hpp"
#include "request_router.hpp"
#include "verbose.hpp"
#include <httplib.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace embed {

HttpServer::HttpServer(RequestRouter& router, RenderEntryPoints entries)
    : router_(router), entries_(entries), server_(std::make_unique<httplib::Server>()) {}

HttpServer::~HttpServer() = default;

std::string HttpServer::translate_path(const std::string& request_path) const {
    std::string relative = request_path;

    // Handle directory requests
    if (relative.empty() || relative.back() == '/') {
        relative += DEFAULT_PAGE;
    }

    fs::path root(router_.app_root());
    fs::path translated = (root / fs::path(relative).relative_path()).lexically_normal();

    // Reject paths that climb out of the application root.
    auto rel = translated.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return "";
    }
    return translated.string();
}

bool HttpServer::start(const std::string& address, int port) {
    httplib::Server& svr = *server_;

    svr.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
        verbose_log("http", req.method + " " + req.path);

        std::string physical_path = translate_path(req.path);
        if (physical_path.empty()) {
            res.status = 404;
            res.set_content("Not Found", "text/plain");
            return;
        }

        auto target = router_.resolve(req.path, physical_path);
        if (!target) {
            // Serving can't continue without a valid cache.
            verbose_err("http", target.error().describe());
            res.status = 500;
            res.set_content("Internal Server Error", "text/plain");
            return;
        }

        PageRenderer* renderer = target->source == TargetSource::Filesystem
            ? entries_.internal_entry
            : entries_.public_entry;

        auto page = renderer->render(RenderRequest{req.path, req.method}, target->path);
        if (!page) {
            res.status = 404;
            res.set_content("Not Found", "text/plain");
            return;
        }

        res.set_content(page->content, page->mime_type);
    });

    // Call the on_start callback before blocking
    if (on_start_callback_) {
        on_start_callback_(address, port);
    }

    // This blocks until server is stopped
    return svr.listen(address, port);
}

void HttpServer::stop() {
    server_->stop();
}

void HttpServer::on_start(std::function<void(const std::string&, int)> callback) {
    on_start_callback_ = std::move(callback);
}

} // namespace embed
