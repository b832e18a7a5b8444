// Unit tests for the component logger registry
#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"

using namespace echosrv::util;

TEST_CASE("LogManager - component loggers", "[util][logging]") {
    SECTION("Known components have their own logger") {
        for (const char* name : {"network", "server", "client", "app"}) {
            auto logger = LogManager::GetLogger(name);
            REQUIRE(logger);
            REQUIRE(logger->name() == name);
        }
    }

    SECTION("Unknown component falls back to the default logger") {
        auto logger = LogManager::GetLogger("nonexistent");
        REQUIRE(logger);
        REQUIRE(logger->name() == "default");
    }
}

TEST_CASE("LogManager - component levels", "[util][logging]") {
    auto logger = LogManager::GetLogger("client");
    auto original = logger->level();

    LogManager::SetComponentLevel("client", "debug");
    REQUIRE(logger->level() == spdlog::level::debug);

    LogManager::SetComponentLevel("client", "off");
    REQUIRE(logger->level() == spdlog::level::off);

    // Other components keep their level
    auto server_level = LogManager::GetLogger("server")->level();
    LogManager::SetComponentLevel("nonexistent", "trace");
    REQUIRE(LogManager::GetLogger("server")->level() == server_level);

    logger->set_level(original);
}
