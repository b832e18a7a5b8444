// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

// Shared helpers for the socket-level echo tests

#include "network/address.hpp"
#include "server/server_config.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <unistd.h>

namespace echosrv {
namespace test {

inline network::Address LoopbackAddress(uint16_t port = 0) {
    return network::Address::Network(boost::asio::ip::make_address("127.0.0.1"), port);
}

// Unique socket path in the temp directory; removed again on destruction
class TempSocketPath {
public:
    explicit TempSocketPath(const std::string& tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("echosrv_test_" + tag + "_" + std::to_string(getpid()) + "_" +
                 std::to_string(counter++) + ".sock");
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ~TempSocketPath() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    TempSocketPath(const TempSocketPath&) = delete;
    TempSocketPath& operator=(const TempSocketPath&) = delete;

    const std::filesystem::path& path() const { return path_; }
    network::Address address() const { return network::Address::Unix(path_); }

private:
    std::filesystem::path path_;
};

// Test servers never install signal handlers and bind where they are told
inline server::ServerConfig MakeTestConfig(const network::Address& bind,
                                           const std::string& service_name = "test-echo") {
    server::ServerConfig config;
    config.bind_strategy = network::BindStrategy::Bind(bind);
    config.service_name = service_name;
    config.handle_interrupt = false;
    config.read_timeout = std::chrono::seconds(5);
    config.write_timeout = std::chrono::seconds(5);
    return config;
}

// Poll until the predicate holds or the timeout expires
template <typename Predicate>
bool WaitUntil(Predicate predicate,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace test
} // namespace echosrv
