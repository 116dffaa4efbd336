#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace portprobe::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "portprobe_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

} // namespace

TEST_CASE("ConfigManager default values", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path() / "config.json");

    const auto& config = manager.config();
    REQUIRE(config.scanner.concurrency == 50);
    REQUIRE(config.scanner.timeoutMs == 1000);
    REQUIRE(config.logging.level == "warn");
    REQUIRE(config.logging.file.empty());
    REQUIRE(config.jsonIndent == 2);
}

TEST_CASE("ConfigManager load", "[ConfigManager]") {
    TestConfigDir testDir;
    auto path = testDir.path() / "config.json";

    SECTION("Missing file is created with defaults") {
        ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(manager.config().scanner.concurrency == 50);
    }

    SECTION("Missing parent directory is created on save") {
        ConfigManager manager(testDir.path() / "nested" / "config.json");
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(testDir.path() / "nested" / "config.json"));
    }

    SECTION("Values are read from file") {
        writeFile(path, R"({
            "scanner": {"concurrency": 8, "timeout_ms": 250},
            "logging": {"level": "debug", "file": "/tmp/portprobe.log"},
            "output": {"indent": 4}
        })");

        ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE(manager.config().scanner.concurrency == 8);
        REQUIRE(manager.config().scanner.timeoutMs == 250);
        REQUIRE(manager.config().logging.level == "debug");
        REQUIRE(manager.config().logging.file == "/tmp/portprobe.log");
        REQUIRE(manager.config().jsonIndent == 4);
    }

    SECTION("Missing keys keep defaults") {
        writeFile(path, R"({"scanner": {"timeout_ms": 300}})");

        ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE(manager.config().scanner.concurrency == 50);
        REQUIRE(manager.config().scanner.timeoutMs == 300);
        REQUIRE(manager.config().logging.level == "warn");
    }

    SECTION("Malformed file keeps defaults") {
        writeFile(path, "{ this is not json");

        ConfigManager manager(path);
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().scanner.concurrency == 50);
    }

    SECTION("Wrongly typed value keeps defaults") {
        writeFile(path, R"({"scanner": {"concurrency": "many"}})");

        ConfigManager manager(path);
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().scanner.concurrency == 50);
    }
}

TEST_CASE("ConfigManager save and reload", "[ConfigManager]") {
    TestConfigDir testDir;
    auto path = testDir.path() / "config.json";

    {
        ConfigManager manager(path);
        manager.config().scanner.concurrency = 200;
        manager.config().scanner.timeoutMs = 500;
        manager.config().logging.level = "info";
        REQUIRE(manager.save());
    }

    ConfigManager reloaded(path);
    REQUIRE(reloaded.load());
    REQUIRE(reloaded.config().scanner.concurrency == 200);
    REQUIRE(reloaded.config().scanner.timeoutMs == 500);
    REQUIRE(reloaded.config().logging.level == "info");
}
