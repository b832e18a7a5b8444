// Unit tests for JSON server configuration loading
#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "util/errors.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace echosrv;
using namespace echosrv::config;
using echosrv::network::Address;
using echosrv::network::BindStrategy;
using echosrv::network::Protocol;

TEST_CASE("ParseServerConfig - defaults", "[config]") {
    auto config = ParseServerConfig("{}");
    const auto& server = config.server;

    REQUIRE(config.protocol == Protocol::Tcp);
    REQUIRE(server.service_name == "tcp-echo");
    REQUIRE(server.buffer_size == 1024);
    REQUIRE(server.max_connections == 100);
    REQUIRE(server.read_timeout == std::chrono::seconds(30));
    REQUIRE(server.write_timeout == std::chrono::seconds(30));
    REQUIRE(server.bind_strategy.kind() == BindStrategy::Kind::InheritOrBind);
    REQUIRE(server.bind_strategy.target()->ToString() == "127.0.0.1:8080");
}

TEST_CASE("ParseServerConfig - full document", "[config]") {
    auto config = ParseServerConfig(R"({
        "protocol": "udp",
        "service_name": "metrics-echo",
        "bind": "[::1]:9999",
        "inherit": "never",
        "buffer_size": 4096,
        "read_timeout_ms": 1500,
        "write_timeout_ms": 250,
        "max_connections": 7
    })");
    const auto& server = config.server;

    REQUIRE(config.protocol == Protocol::Udp);
    REQUIRE(server.service_name == "metrics-echo");
    REQUIRE(server.bind_strategy.kind() == BindStrategy::Kind::Bind);
    REQUIRE(server.bind_strategy.target()->ToString() == "[::1]:9999");
    REQUIRE(server.buffer_size == 4096);
    REQUIRE(server.read_timeout == std::chrono::milliseconds(1500));
    REQUIRE(server.write_timeout == std::chrono::milliseconds(250));
    REQUIRE(server.max_connections == 7);
}

TEST_CASE("ParseServerConfig - protocol-dependent defaults", "[config]") {
    SECTION("Unix stream") {
        auto config = ParseServerConfig(R"({"protocol": "unix-stream"})");
        REQUIRE(config.protocol == Protocol::UnixStream);
        REQUIRE(config.server.service_name == "unix-stream-echo");
        REQUIRE(config.server.bind_strategy.target()->ToString() == "unix:/tmp/echosrv.sock");
    }

    SECTION("Unix datagram") {
        auto config = ParseServerConfig(R"({"protocol": "unix-datagram"})");
        REQUIRE(config.server.bind_strategy.target()->ToString() ==
                "unix:/tmp/echosrv_datagram.sock");
    }
}

TEST_CASE("ParseServerConfig - inheritance settings", "[config]") {
    SECTION("Always inherit an explicit descriptor") {
        auto config = ParseServerConfig(R"({"inherit": "always", "inherit_fd": 3})");
        REQUIRE(config.server.bind_strategy.kind() == BindStrategy::Kind::Inherit);
        REQUIRE(config.server.bind_strategy.fd() == 3);
    }

    SECTION("Auto with explicit descriptor keeps the fallback") {
        auto config = ParseServerConfig(R"({"inherit_fd": 4, "bind": "127.0.0.1:7000"})");
        const auto& strategy = config.server.bind_strategy;
        REQUIRE(strategy.kind() == BindStrategy::Kind::InheritOrBind);
        REQUIRE(strategy.fd() == 4);
        REQUIRE(strategy.target()->port() == 7000);
    }

    SECTION("Always without a descriptor is rejected") {
        REQUIRE_THROWS_AS(ParseServerConfig(R"({"inherit": "always"})"), ConfigError);
    }

    SECTION("Unknown mode is rejected") {
        REQUIRE_THROWS_AS(ParseServerConfig(R"({"inherit": "sometimes"})"), ConfigError);
    }
}

TEST_CASE("ParseServerConfig - rejects invalid documents", "[config]") {
    CHECK_THROWS_AS(ParseServerConfig("not json"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig("[1, 2]"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"protocol": "sctp"})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"protocol": 6})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"bind": "localhost"})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"buffer_size": 0})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"buffer_size": -5})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"buffer_size": "big"})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"read_timeout_ms": 1.5})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"read_timeout_ms": 999999999999})"), ConfigError);
    // A zero deadline would let an idle peer hold a session forever
    CHECK_THROWS_AS(ParseServerConfig(R"({"read_timeout_ms": 0})"), ConfigError);
    CHECK_THROWS_AS(ParseServerConfig(R"({"write_timeout_ms": 0})"), ConfigError);
}

TEST_CASE("MakeBindStrategy - modes", "[config]") {
    auto bind = Address::Unix("/tmp/x.sock");

    CHECK(MakeBindStrategy("never", 3, bind).kind() == BindStrategy::Kind::Bind);
    CHECK(MakeBindStrategy("always", 3, bind).kind() == BindStrategy::Kind::Inherit);
    CHECK(MakeBindStrategy("auto", std::nullopt, bind).kind() ==
          BindStrategy::Kind::InheritOrBind);
    CHECK_THROWS_AS(MakeBindStrategy("always", std::nullopt, bind), ConfigError);
    CHECK_THROWS_AS(MakeBindStrategy("", std::nullopt, bind), ConfigError);
}

TEST_CASE("LoadServerConfig - files", "[config]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() /
                    ("echosrv_config_test_" + std::to_string(getpid()) + ".json");

    SECTION("Reads a document from disk") {
        {
            std::ofstream out(path);
            out << R"({"protocol": "tcp", "bind": "127.0.0.1:4242", "max_connections": 3})";
        }
        auto config = LoadServerConfig(path.string());
        REQUIRE(config.server.bind_strategy.target()->port() == 4242);
        REQUIRE(config.server.max_connections == 3);
        fs::remove(path);
    }

    SECTION("Errors name the file") {
        {
            std::ofstream out(path);
            out << R"({"protocol": "carrier-pigeon"})";
        }
        try {
            LoadServerConfig(path.string());
            FAIL("expected ConfigError");
        } catch (const ConfigError& e) {
            REQUIRE(std::string(e.what()).find(path.string()) != std::string::npos);
        }
        fs::remove(path);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(LoadServerConfig("/nonexistent/echosrv.json"), ConfigError);
    }
}
