/**
 * @file test_config.cpp
 * @brief key=value configuration file and option overrides.
 */

#include <catch2/catch.hpp>

#include "server/server_config.hpp"
#include "test_utils.hpp"

#include <fstream>

using namespace test_helpers;

TEST_CASE("ServerConfig defaults", "[config]") {
    ServerConfig config;
    REQUIRE(config.port == DEFAULT_PORT);
    REQUIRE(config.minY == 1);
    REQUIRE(config.maxY == 255);
    REQUIRE(config.dayLength == 600);
    REQUIRE(config.threads > 0);
}

TEST_CASE("ServerConfig::apply sets known keys", "[config]") {
    ServerConfig config;
    REQUIRE(config.apply("port", "5000"));
    REQUIRE(config.apply("threads", "8"));
    REQUIRE(config.apply("motd", "Hello, builders"));
    REQUIRE(config.apply("save_dir", "/tmp/somewhere"));
    REQUIRE(config.apply("flush_dirty_threshold", "0"));
    REQUIRE(config.apply("verbose", "true"));

    REQUIRE(config.port == 5000);
    REQUIRE(config.threads == 8);
    REQUIRE(config.motd == "Hello, builders");
    REQUIRE(config.saveDir == "/tmp/somewhere");
    REQUIRE(config.flushDirtyThreshold == 0);
    REQUIRE(config.verbose);
}

TEST_CASE("ServerConfig::apply rejects unknown keys and bad values", "[config]") {
    ServerConfig config;
    REQUIRE_FALSE(config.apply("colour", "blue"));
    REQUIRE_FALSE(config.apply("port", "not-a-number"));
    REQUIRE_FALSE(config.apply("port", "70000"));
    REQUIRE_FALSE(config.apply("threads", "0"));
    REQUIRE_FALSE(config.apply("flush_interval_seconds", "0"));
    REQUIRE(config.port == DEFAULT_PORT);
}

TEST_CASE("ServerConfig::loadFromFile reads key=value lines", "[config]") {
    TempDir dir;
    std::string path = (dir.path() / "server.config").string();
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "\n"
            << "port = 4100\n"
            << "motd=Welcome = friends\n"
            << "this line is ignored\n"
            << "unknown_key=1\n"
            << "day_length=1200\r\n";
    }

    ServerConfig config;
    REQUIRE(config.loadFromFile(path));
    REQUIRE(config.port == 4100);
    REQUIRE(config.motd == "Welcome = friends");
    REQUIRE(config.dayLength == 1200);
}

TEST_CASE("A missing config file is created with the defaults", "[config]") {
    TempDir dir;
    std::string path = (dir.path() / "server.config").string();

    ServerConfig config;
    config.port = 4321;
    REQUIRE(config.loadFromFile(path));
    REQUIRE(std::filesystem::exists(path));

    ServerConfig reread;
    REQUIRE(reread.loadFromFile(path));
    REQUIRE(reread.port == 4321);
    REQUIRE(reread.motd == config.motd);
    REQUIRE(reread.saveDir == config.saveDir);
}
