#pragma once

/**
 * HTTP server for serving embedded pages.
 *
 * Translates each request path to a physical path under the application
 * root, lets the request router pick the filesystem or the page cache, and
 * renders the result through the rendering pipeline's entry points.
 */

#include "rendering_pipeline.hpp"
#include <string>
#include <functional>
#include <memory>

namespace httplib {
class Server;
}

namespace embed {

class RequestRouter;

/**
 * HTTP front end for the request router.
 */
class HttpServer {
public:
    HttpServer(RequestRouter& router, RenderEntryPoints entries);
    ~HttpServer();

    // Starts the server on the given address and port.
    // This call blocks until the server is stopped.
    // Returns true if server started successfully, false otherwise.
    bool start(const std::string& address, int port);

    // Stops a running server. Safe to call from another thread.
    void stop();

    // Sets a callback to be called when the server starts.
    void on_start(std::function<void(const std::string&, int)> callback);

    // Maps a request path to its physical location under the application
    // root. Returns empty if the path would leave the application root.
    std::string translate_path(const std::string& request_path) const;

private:
    RequestRouter& router_;
    RenderEntryPoints entries_;
    std::function<void(const std::string&, int)> on_start_callback_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace embed
