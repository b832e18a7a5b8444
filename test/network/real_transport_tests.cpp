// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Tests for the asio-backed transports and the protocol factory

#include <catch2/catch_test_macros.hpp>
#include "echo_test_helpers.hpp"
#include "network/real_transport.hpp"
#include "network/transport_factory.hpp"
#include "util/errors.hpp"
#include <boost/asio/io_context.hpp>
#include <sys/socket.h>

using namespace echosrv;
using namespace echosrv::network;
using namespace echosrv::test;

TEST_CASE("Transports - names and families", "[network][transport]") {
    CHECK(TcpTransport().name() == "tcp");
    CHECK(UdpTransport().name() == "udp");
    CHECK(UnixStreamTransport().name() == "unix-stream");
    CHECK(UnixDatagramTransport().name() == "unix-datagram");

    CHECK(TcpTransport().accepted_families() == std::vector<int>{AF_INET, AF_INET6});
    CHECK(UdpTransport().accepted_families() == std::vector<int>{AF_INET, AF_INET6});
    CHECK(UnixStreamTransport().accepted_families() == std::vector<int>{AF_UNIX});
    CHECK(UnixDatagramTransport().accepted_families() == std::vector<int>{AF_UNIX});
}

TEST_CASE("Transport factory - protocol names", "[network][transport]") {
    CHECK(ParseProtocol("tcp") == Protocol::Tcp);
    CHECK(ParseProtocol("udp") == Protocol::Udp);
    CHECK(ParseProtocol("unix-stream") == Protocol::UnixStream);
    CHECK(ParseProtocol("unix") == Protocol::UnixStream);
    CHECK(ParseProtocol("unix-datagram") == Protocol::UnixDatagram);
    CHECK_FALSE(ParseProtocol("TCP").has_value());
    CHECK_FALSE(ParseProtocol("").has_value());

    for (auto protocol : {Protocol::Tcp, Protocol::Udp, Protocol::UnixStream, Protocol::UnixDatagram}) {
        CHECK(ParseProtocol(ProtocolName(protocol)) == protocol);
    }

    CHECK(IsStreamProtocol(Protocol::Tcp));
    CHECK(IsStreamProtocol(Protocol::UnixStream));
    CHECK_FALSE(IsStreamProtocol(Protocol::Udp));
    CHECK_FALSE(IsStreamProtocol(Protocol::UnixDatagram));
}

TEST_CASE("Transport factory - construction", "[network][transport]") {
    CHECK(MakeStreamTransport(Protocol::Tcp)->name() == "tcp");
    CHECK(MakeStreamTransport(Protocol::UnixStream)->name() == "unix-stream");
    CHECK(MakeDatagramTransport(Protocol::Udp)->name() == "udp");
    CHECK(MakeDatagramTransport(Protocol::UnixDatagram)->name() == "unix-datagram");

    CHECK_THROWS_AS(MakeStreamTransport(Protocol::Udp), ConfigError);
    CHECK_THROWS_AS(MakeDatagramTransport(Protocol::Tcp), ConfigError);

    CHECK(DefaultBindAddress(Protocol::Tcp).ToString() == "127.0.0.1:8080");
    CHECK(DefaultBindAddress(Protocol::Udp).ToString() == "127.0.0.1:8080");
    CHECK(DefaultBindAddress(Protocol::UnixStream).ToString() == "unix:/tmp/echosrv.sock");
}

TEST_CASE("TcpTransport - accept, connect and deadlines", "[network][transport][tcp]") {
    boost::asio::io_context io;
    TcpTransport transport;
    auto listener = transport.bind_with_inheritance(io, MakeTestConfig(LoopbackAddress()),
                                                    InheritanceConfig{});
    auto addr = listener->local_address();
    REQUIRE(addr.port() != 0);

    std::unique_ptr<StreamConnection> inbound;
    std::unique_ptr<StreamConnection> outbound;
    listener->async_accept(std::chrono::seconds(2), [&](const boost::system::error_code& ec,
                                                        std::unique_ptr<StreamConnection> conn) {
        REQUIRE_FALSE(ec);
        inbound = std::move(conn);
    });
    transport.async_connect(io, addr, std::chrono::seconds(2),
                            [&](const boost::system::error_code& ec,
                                std::unique_ptr<StreamConnection> conn) {
                                REQUIRE_FALSE(ec);
                                outbound = std::move(conn);
                            });
    io.run();
    REQUIRE(inbound);
    REQUIRE(outbound);
    REQUIRE(inbound->is_open());
    REQUIRE(inbound->remote_address().ip().is_loopback());
    REQUIRE(outbound->remote_address() == addr);

    SECTION("Read deadline reports timed_out") {
        char buf[16];
        boost::system::error_code result;
        auto start = std::chrono::steady_clock::now();
        inbound->async_read_some(boost::asio::buffer(buf), std::chrono::milliseconds(100),
                                 [&](const boost::system::error_code& ec, size_t) { result = ec; });
        io.restart();
        io.run();
        REQUIRE(result == boost::asio::error::timed_out);
        REQUIRE(ClassifyError(result) == ErrorKind::Timeout);
        CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(80));
    }

    SECTION("Data arriving in time completes the read") {
        std::string message = "in time";
        char buf[16];
        size_t received = 0;
        boost::system::error_code read_ec;
        inbound->async_read_some(boost::asio::buffer(buf), std::chrono::seconds(2),
                                 [&](const boost::system::error_code& ec, size_t bytes) {
                                     read_ec = ec;
                                     received = bytes;
                                 });
        outbound->async_write(boost::asio::buffer(message), std::chrono::seconds(2),
                              [](const boost::system::error_code& ec, size_t) { REQUIRE_FALSE(ec); });
        io.restart();
        io.run();
        REQUIRE_FALSE(read_ec);
        REQUIRE(std::string(buf, received) == message);
    }

    SECTION("Zero timeout means no deadline") {
        std::string message = "eventually";
        char buf[16];
        size_t received = 0;
        inbound->async_read_some(boost::asio::buffer(buf), std::chrono::milliseconds(0),
                                 [&](const boost::system::error_code& ec, size_t bytes) {
                                     REQUIRE_FALSE(ec);
                                     received = bytes;
                                 });
        outbound->async_write(boost::asio::buffer(message), std::chrono::milliseconds(0),
                              [](const boost::system::error_code&, size_t) {});
        io.restart();
        io.run();
        REQUIRE(std::string(buf, received) == message);
    }

    SECTION("Closing the peer yields end of stream") {
        outbound->close();
        REQUIRE_FALSE(outbound->is_open());
        char buf[16];
        boost::system::error_code result;
        inbound->async_read_some(boost::asio::buffer(buf), std::chrono::seconds(2),
                                 [&](const boost::system::error_code& ec, size_t) { result = ec; });
        io.restart();
        io.run();
        REQUIRE(result == boost::asio::error::eof);
    }

    inbound.reset();
    outbound.reset();
    listener->close();
}

TEST_CASE("TcpTransport - accept deadline", "[network][transport][tcp][timeout]") {
    boost::asio::io_context io;
    TcpTransport transport;
    auto listener = transport.bind_with_inheritance(io, MakeTestConfig(LoopbackAddress()),
                                                    InheritanceConfig{});

    boost::system::error_code result;
    bool got_connection = true;
    listener->async_accept(std::chrono::milliseconds(100),
                           [&](const boost::system::error_code& ec,
                               std::unique_ptr<StreamConnection> conn) {
                               result = ec;
                               got_connection = conn != nullptr;
                           });
    io.run();
    REQUIRE(result == boost::asio::error::timed_out);
    REQUIRE_FALSE(got_connection);

    SECTION("Closing the listener aborts a pending accept") {
        listener->async_accept(std::chrono::milliseconds(0),
                               [&](const boost::system::error_code& ec,
                                   std::unique_ptr<StreamConnection>) { result = ec; });
        listener->close();
        io.restart();
        io.run();
        REQUIRE(result == boost::asio::error::operation_aborted);
    }
}

TEST_CASE("UdpTransport - send and receive", "[network][transport][udp]") {
    boost::asio::io_context io;
    UdpTransport transport;
    auto server = transport.bind_with_inheritance(io, MakeTestConfig(LoopbackAddress()),
                                                  InheritanceConfig{});
    auto client = transport.open_client(io, server->local_address());

    std::string message = "datagram";
    char buf[64];
    size_t received = 0;
    std::optional<Address> sender;
    server->async_receive_from(boost::asio::buffer(buf), std::chrono::seconds(2),
                               [&](const boost::system::error_code& ec, size_t bytes,
                                   const std::optional<Address>& from) {
                                   REQUIRE_FALSE(ec);
                                   received = bytes;
                                   sender = from;
                               });
    client->async_send_to(boost::asio::buffer(message), server->local_address(),
                          std::chrono::seconds(2),
                          [](const boost::system::error_code& ec, size_t) { REQUIRE_FALSE(ec); });
    io.run();

    REQUIRE(std::string(buf, received) == message);
    REQUIRE(sender.has_value());
    REQUIRE(sender->port() == client->local_address().port());

    SECTION("Receive deadline") {
        boost::system::error_code result;
        bool has_sender = true;
        server->async_receive_from(boost::asio::buffer(buf), std::chrono::milliseconds(50),
                                   [&](const boost::system::error_code& ec, size_t,
                                       const std::optional<Address>& from) {
                                       result = ec;
                                       has_sender = from.has_value();
                                   });
        io.restart();
        io.run();
        REQUIRE(result == boost::asio::error::timed_out);
        REQUIRE_FALSE(has_sender);
    }

    SECTION("Sending to a unix path fails without blocking") {
        boost::system::error_code result;
        client->async_send_to(boost::asio::buffer(message), Address::Unix("/tmp/x.sock"),
                              std::chrono::seconds(1),
                              [&](const boost::system::error_code& ec, size_t) { result = ec; });
        io.restart();
        io.run();
        REQUIRE(result == boost::asio::error::address_family_not_supported);
    }
}

TEST_CASE("Transports - bind target must match the transport", "[network][transport]") {
    boost::asio::io_context io;
    CHECK_THROWS_AS(UdpTransport().bind_with_inheritance(
                        io, MakeTestConfig(Address::Unix("/tmp/echosrv-wrong.sock")),
                        InheritanceConfig{}),
                    ConfigError);
    CHECK_THROWS_AS(UnixDatagramTransport().bind_with_inheritance(
                        io, MakeTestConfig(LoopbackAddress()), InheritanceConfig{}),
                    ConfigError);
}
