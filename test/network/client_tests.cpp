// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Tests for the blocking echo clients against misbehaving peers

#include <catch2/catch_test_macros.hpp>
#include "client/client.hpp"
#include "echo_test_helpers.hpp"
#include "network/real_transport.hpp"
#include "util/errors.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <functional>
#include <thread>

using namespace echosrv;
using namespace echosrv::client;
using namespace echosrv::network;
using namespace echosrv::test;

namespace {

// Accepts one connection and hands it to a scripted peer on its own thread
class ScriptedTcpPeer {
public:
    using Script = std::function<void(boost::asio::ip::tcp::socket&)>;

    explicit ScriptedTcpPeer(Script script)
        : acceptor_(io_, boost::asio::ip::tcp::endpoint(
                             boost::asio::ip::make_address("127.0.0.1"), 0)) {
        thread_ = std::thread([this, script = std::move(script)] {
            boost::asio::ip::tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (!ec) {
                script(socket);
            }
        });
    }

    ~ScriptedTcpPeer() { thread_.join(); }

    Address address() const {
        return LoopbackAddress(acceptor_.local_endpoint().port());
    }

private:
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
};

} // namespace

TEST_CASE("StreamClient - response larger than allowed", "[client][tcp]") {
    ScriptedTcpPeer peer([](boost::asio::ip::tcp::socket& socket) {
        char request[5];
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::buffer(request), ec);
        std::vector<uint8_t> flood(64, 'x');
        boost::asio::write(socket, boost::asio::buffer(flood), ec);
        // Hold the connection until the client gives up
        char sink[1];
        socket.read_some(boost::asio::buffer(sink), ec);
    });

    ClientConfig config;
    config.max_response_size = 16;
    auto client = StreamClient::Connect(std::make_shared<TcpTransport>(), peer.address(), config);
    REQUIRE_THROWS_AS(client.RequestString("hello"), TooLargeError);
    client.Close();
}

TEST_CASE("StreamClient - silent peer times out", "[client][tcp][timeout]") {
    ScriptedTcpPeer peer([](boost::asio::ip::tcp::socket& socket) {
        // Read the request, never answer, wait for the client to hang up
        char buf[64];
        boost::system::error_code ec;
        while (!ec) {
            socket.read_some(boost::asio::buffer(buf), ec);
        }
    });

    ClientConfig config;
    config.read_timeout = std::chrono::milliseconds(200);
    auto client = StreamClient::Connect(std::make_shared<TcpTransport>(), peer.address(), config);

    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(client.RequestString("anyone there?"), TimeoutError);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
    client.Close();
}

TEST_CASE("StreamClient - short reply then silence times out", "[client][tcp][timeout]") {
    ScriptedTcpPeer peer([](boost::asio::ip::tcp::socket& socket) {
        char request[8];
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::buffer(request), ec);
        boost::asio::write(socket, boost::asio::buffer("half", 4), ec);
        char sink[1];
        socket.read_some(boost::asio::buffer(sink), ec);
    });

    ClientConfig config;
    config.read_timeout = std::chrono::milliseconds(200);
    auto client = StreamClient::Connect(std::make_shared<TcpTransport>(), peer.address(), config);
    REQUIRE_THROWS_AS(client.RequestString("halfhalf"), TimeoutError);
    client.Close();
}

TEST_CASE("StreamClient - peer closes early", "[client][tcp]") {
    ScriptedTcpPeer peer([](boost::asio::ip::tcp::socket& socket) {
        char request[6];
        boost::system::error_code ec;
        boost::asio::read(socket, boost::asio::buffer(request), ec);
        boost::asio::write(socket, boost::asio::buffer("abc", 3), ec);
        socket.shutdown(boost::asio::socket_base::shutdown_send, ec);
        char sink[1];
        socket.read_some(boost::asio::buffer(sink), ec);
    });

    auto client = StreamClient::Connect(std::make_shared<TcpTransport>(), peer.address());
    // Whatever arrived before end of stream is returned
    REQUIRE(client.RequestString("abcdef") == "abc");
    client.Close();
}

TEST_CASE("StreamClient - request validation", "[client]") {
    ScriptedTcpPeer peer([](boost::asio::ip::tcp::socket& socket) {
        char buf[64];
        boost::system::error_code ec;
        while (!ec) {
            socket.read_some(boost::asio::buffer(buf), ec);
        }
    });

    ClientConfig config;
    config.max_response_size = 8;
    auto client = StreamClient::Connect(std::make_shared<TcpTransport>(), peer.address(), config);

    SECTION("Empty request needs no round trip") {
        REQUIRE(client.Request({}).empty());
    }

    SECTION("Request that could never be echoed in full") {
        REQUIRE_THROWS_AS(client.RequestString("more than eight bytes"), ConfigError);
    }

    SECTION("Idle tracking") {
        REQUIRE_FALSE(client.IsIdle(std::chrono::seconds(10)));
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        REQUIRE(client.IsIdle(std::chrono::milliseconds(10)));
    }

    REQUIRE(client.remote_address() == peer.address());
    client.Close();
}

TEST_CASE("StreamClient - connect failures", "[client]") {
    SECTION("Nothing listening") {
        // Grab a free port, then release it
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor probe(
            io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        auto port = probe.local_endpoint().port();
        probe.close();

        REQUIRE_THROWS_AS(StreamClient::Connect(std::make_shared<TcpTransport>(),
                                                LoopbackAddress(port)),
                          IoError);
    }

    SECTION("Address of the wrong kind") {
        REQUIRE_THROWS_AS(StreamClient::Connect(std::make_shared<TcpTransport>(),
                                                Address::Unix("/tmp/echosrv-none.sock")),
                          IoError);
    }

    SECTION("Missing unix socket") {
        REQUIRE_THROWS_AS(StreamClient::Connect(std::make_shared<UnixStreamTransport>(),
                                                Address::Unix("/tmp/echosrv-none.sock")),
                          IoError);
    }

    SECTION("Unix path too long for a socket address") {
        auto path = "/tmp/" + std::string(150, 'a') + ".sock";
        REQUIRE_THROWS_AS(StreamClient::Connect(std::make_shared<UnixStreamTransport>(),
                                                Address::Unix(path)),
                          IoError);
    }

    SECTION("No transport") {
        REQUIRE_THROWS_AS(StreamClient::Connect(nullptr, LoopbackAddress(1)), ConfigError);
    }
}

TEST_CASE("DatagramClient - no reply times out", "[client][udp][timeout]") {
    // Bound but never read
    boost::asio::io_context io;
    boost::asio::ip::udp::socket silent(
        io, boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    ClientConfig config;
    config.read_timeout = std::chrono::milliseconds(150);
    auto client = DatagramClient::Connect(std::make_shared<UdpTransport>(),
                                          LoopbackAddress(silent.local_endpoint().port()), config);
    REQUIRE_THROWS_AS(client.RequestString("hello?"), TimeoutError);
    REQUIRE(client.Request({}).empty());
}

TEST_CASE("DatagramClient - wrong address kind", "[client][udp]") {
    REQUIRE_THROWS_AS(DatagramClient::Connect(std::make_shared<UdpTransport>(),
                                              Address::Unix("/tmp/echosrv-none.sock")),
                      ConfigError);
}
