#include <catch2/catch.hpp>
#include "rendering_pipeline.hpp"
#include "http_server.hpp"
#include "initialization_coordinator.hpp"
#include "request_router.hpp"
#include "test_support.hpp"
#include <filesystem>

using namespace embed;
using test_support::MapPackageLoader;
using test_support::StaticConfiguration;
using test_support::TempDir;
namespace fs = std::filesystem;

namespace {

class TaggedRenderer : public PageRenderer {
public:
    explicit TaggedRenderer(std::string tag) : tag_(std::move(tag)) {}

    std::optional<RenderedPage> render(const RenderRequest& request, const std::string&) override {
        return RenderedPage{tag_ + " " + request.url, "text/plain"};
    }

private:
    std::string tag_;
};

// Pipeline offering whichever entries were given.
class FixedPipeline : public RenderingPipeline {
public:
    FixedPipeline(PageRenderer* public_entry, PageRenderer* internal_entry)
        : public_entry_(public_entry), internal_entry_(internal_entry) {}

    PageRenderer* find_entry(RenderEntryKind kind) override {
        return kind == RenderEntryKind::Public ? public_entry_ : internal_entry_;
    }

private:
    PageRenderer* public_entry_;
    PageRenderer* internal_entry_;
};

} // namespace

// ============================================================================
// Entry point lookup
// ============================================================================

TEST_CASE("Both entries are used when offered", "[render]") {
    TaggedRenderer pub("public");
    TaggedRenderer internal("internal");
    FixedPipeline pipeline(&pub, &internal);

    auto entries = lookup_render_entries(pipeline);
    REQUIRE(entries.ok());
    REQUIRE(entries->public_entry == &pub);
    REQUIRE(entries->internal_entry == &internal);
}

TEST_CASE("Missing internal entry falls back to public", "[render]") {
    TaggedRenderer pub("public");
    FixedPipeline pipeline(&pub, nullptr);

    auto entries = lookup_render_entries(pipeline);
    REQUIRE(entries.ok());
    REQUIRE(entries->internal_entry == &pub);
    REQUIRE(entries->internal_entry->render({"/Page.aspx", "GET"}, "")->content == "public /Page.aspx");
}

TEST_CASE("Missing public entry is an error", "[render][errors]") {
    TaggedRenderer internal("internal");
    FixedPipeline pipeline(nullptr, &internal);

    auto entries = lookup_render_entries(pipeline);
    REQUIRE_FALSE(entries.ok());
    REQUIRE(entries.error().kind == ErrorKind::InvalidArgument);
}

// ============================================================================
// Static pipeline
// ============================================================================

TEST_CASE("Static pipeline offers only the public entry", "[render]") {
    StaticPagePipeline pipeline;
    REQUIRE(pipeline.find_entry(RenderEntryKind::Public) != nullptr);
    REQUIRE(pipeline.find_entry(RenderEntryKind::Internal) == nullptr);

    auto entries = lookup_render_entries(pipeline);
    REQUIRE(entries.ok());
    REQUIRE(entries->internal_entry == entries->public_entry);
}

TEST_CASE("Static pipeline renders page files", "[render]") {
    TempDir dir;
    auto page = dir.write("Default.aspx", "<h1>Home</h1>");
    StaticPagePipeline pipeline;
    PageRenderer* renderer = pipeline.find_entry(RenderEntryKind::Public);

    auto rendered = renderer->render({"/Default.aspx", "GET"}, page.string());
    REQUIRE(rendered.has_value());
    REQUIRE(rendered->content == "<h1>Home</h1>");
    REQUIRE(rendered->mime_type == "text/html");

    REQUIRE_FALSE(renderer->render({"/Missing.aspx", "GET"}, (dir.path() / "Missing.aspx").string()).has_value());
    REQUIRE_FALSE(renderer->render({"/", "GET"}, dir.str()).has_value());
}

TEST_CASE("MIME types follow the extension", "[render]") {
    REQUIRE(get_mime_type("/site/Default.aspx") == "text/html");
    REQUIRE(get_mime_type("/site/PAGE.ASPX") == "text/html");
    REQUIRE(get_mime_type("styles.css") == "text/css");
    REQUIRE(get_mime_type("logo.png") == "image/png");
    REQUIRE(get_mime_type("README") == "application/octet-stream");
    REQUIRE(get_mime_type("archive.tar.gz") == "application/octet-stream");
    REQUIRE(get_mime_type("page.\xC3\x84spx") == "application/octet-stream");
    REQUIRE(get_mime_type("STYLES.CSS") == "text/css");
}

// ============================================================================
// Request path translation
// ============================================================================

TEST_CASE("Request paths translate under the application root", "[render][http]") {
    TempDir app;
    StaticConfiguration config;
    MapPackageLoader loader;
    InitializationCoordinator coordinator(config, loader);
    RequestRouter router(coordinator, config, app.str());
    StaticPagePipeline pipeline;
    auto entries = lookup_render_entries(pipeline);
    REQUIRE(entries.ok());
    HttpServer server(router, *entries);

    REQUIRE(server.translate_path("/Admin/Users.aspx") == (app.path() / "Admin" / "Users.aspx").string());
    REQUIRE(server.translate_path("/") == (app.path() / "Default.aspx").string());
    REQUIRE(server.translate_path("/Admin/") == (app.path() / "Admin" / "Default.aspx").string());
    REQUIRE(server.translate_path("/Admin/../Page.aspx") == (app.path() / "Page.aspx").string());

    REQUIRE(server.translate_path("/../etc/passwd").empty());
    REQUIRE(server.translate_path("/Admin/../../secret.aspx").empty());
}
