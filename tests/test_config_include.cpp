#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include <filesystem>
#include <fstream>

using namespace autoheal;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "autoheal_test_include") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("ConfigInclude: service list from an included file", "[config][include]") {
    TmpDir tmp;

    tmp.file("services.toml", R"(
[[services]]
name = "api"
health_url = "http://api:8080/health"
)");

    auto main_path = tmp.file("main.toml", R"(
include = "services.toml"

[daemon]
tick_interval_seconds = 15
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.services.size() == 1);
    CHECK(result.config.daemon.tick_interval == std::chrono::seconds(15));
}

TEST_CASE("ConfigInclude: array includes concatenate services", "[config][include]") {
    TmpDir tmp;

    tmp.file("frontend.toml", R"(
[[services]]
name = "web"
health_url = "http://web/health"
)");

    tmp.file("backend.toml", R"(
[[services]]
name = "worker"
health_url = "http://worker/health"
)");

    auto main_path = tmp.file("main.toml", R"(
include = ["frontend.toml", "backend.toml"]

[[services]]
name = "api"
health_url = "http://api/health"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    REQUIRE(result.config.services.size() == 3);
    CHECK(result.config.find_service("web") != nullptr);
    CHECK(result.config.find_service("worker") != nullptr);
    CHECK(result.config.find_service("api") != nullptr);
}

TEST_CASE("ConfigInclude: including file overrides scalars", "[config][include]") {
    TmpDir tmp;

    tmp.file("base.toml", R"(
[circuit_breaker]
failure_threshold = 5
cooldown_seconds = 300

[[services]]
name = "api"
health_url = "http://api/health"
)");

    auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[circuit_breaker]
failure_threshold = 2
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.circuit_breaker.failure_threshold == 2);
    CHECK(result.config.circuit_breaker.cooldown == std::chrono::seconds(300));
}

TEST_CASE("ConfigInclude: circular include is detected", "[config][include]") {
    TmpDir tmp;

    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigInclude: missing include file fails the load", "[config][include]") {
    TmpDir tmp;

    auto main_path = tmp.file("main.toml", "include = \"nope.toml\"\n");
    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE_FALSE(result.success);
}
