#include <catch2/catch.hpp>
#include "cache_directory.hpp"
#include "config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace embed;
namespace fs = std::filesystem;

TEST_CASE("Recreate makes an empty directory under the temp dir", "[cache]") {
    CacheDirectory cache;
    REQUIRE(cache.root().empty());

    auto root = cache.recreate();
    REQUIRE(root.ok());
    REQUIRE_FALSE(cache.root().empty());
    REQUIRE(cache.root() == *root);
    REQUIRE(fs::is_directory(*root));
    REQUIRE(fs::is_empty(*root));
    REQUIRE(fs::path(*root).is_absolute());
    REQUIRE(fs::path(*root).filename().string().rfind(CACHE_DIR_PREFIX, 0) == 0);
}

TEST_CASE("Recreate removes the previous root", "[cache]") {
    CacheDirectory cache;
    auto first = cache.recreate();
    REQUIRE(first.ok());
    std::ofstream(fs::path(*first) / "stale.aspx") << "stale";

    auto second = cache.recreate();
    REQUIRE(second.ok());
    REQUIRE(*second != *first);
    REQUIRE_FALSE(fs::exists(*first));
    REQUIRE(fs::is_directory(*second));
}

TEST_CASE("Destroy removes everything recursively", "[cache]") {
    CacheDirectory cache;
    auto root = cache.recreate();
    REQUIRE(root.ok());
    fs::create_directories(fs::path(*root) / "a" / "b");
    std::ofstream(fs::path(*root) / "a" / "b" / "Page.aspx") << "page";

    REQUIRE(cache.destroy().ok());
    REQUIRE_FALSE(fs::exists(*root));
    REQUIRE(cache.root().empty());
    REQUIRE(cache.root().empty());
}

TEST_CASE("Destroy is safe when nothing is active", "[cache]") {
    CacheDirectory cache;
    REQUIRE(cache.destroy().ok());
    REQUIRE(cache.destroy().ok());
}

TEST_CASE("Destroy tolerates a root that is already gone", "[cache]") {
    CacheDirectory cache;
    auto root = cache.recreate();
    REQUIRE(root.ok());
    fs::remove_all(*root);

    REQUIRE(cache.destroy().ok());
    REQUIRE(cache.root().empty());
}

TEST_CASE("Destructor removes the active root", "[cache]") {
    std::string root;
    {
        CacheDirectory cache;
        auto created = cache.recreate();
        REQUIRE(created.ok());
        root = *created;
    }
    REQUIRE_FALSE(fs::exists(root));
}

TEST_CASE("Roots are never handed out twice", "[cache]") {
    CacheDirectory cache;
    std::vector<std::string> roots;
    for (int i = 0; i < 5; ++i) {
        auto root = cache.recreate();
        REQUIRE(root.ok());
        REQUIRE(std::find(roots.begin(), roots.end(), *root) == roots.end());
        roots.push_back(*root);
    }
}

TEST_CASE("path_under joins relative and rooted paths", "[cache]") {
    CacheDirectory cache;
    auto root = cache.recreate();
    REQUIRE(root.ok());

    REQUIRE(cache.path_under("Admin/Users.aspx") == (fs::path(*root) / "Admin" / "Users.aspx").string());
    REQUIRE(cache.path_under("/Admin/Users.aspx") == (fs::path(*root) / "Admin" / "Users.aspx").string());
}

TEST_CASE("path_under collapses dot segments", "[cache]") {
    REQUIRE(path_under("/tmp/embedpages-abc", "Admin/./Users.aspx") == "/tmp/embedpages-abc/Admin/Users.aspx");
    REQUIRE(path_under("/tmp/embedpages-abc/", "/Default.aspx") == "/tmp/embedpages-abc/Default.aspx");
}
