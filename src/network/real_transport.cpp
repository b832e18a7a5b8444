// Copyright (c) 2025 The Unicity Foundation
// Real transport implementations using boost::asio sockets

#include "network/real_transport.hpp"
#include "network/socket_provisioner.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <filesystem>
#include <optional>
#include <type_traits>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace echosrv {
namespace network {
namespace detail {

namespace fs = std::filesystem;
using boost::asio::ip::tcp;
using boost::asio::ip::udp;
namespace local = boost::asio::local;

// ============================================================================
// Protocol traits
// ============================================================================

template <typename Protocol> struct IpTraits {
  using endpoint_type = typename Protocol::endpoint;

  static bool Matches(const Address &address) { return address.is_network(); }

  static endpoint_type ToEndpoint(const Address &address) {
    return endpoint_type(address.ip(), address.port());
  }

  static Address FromEndpoint(const endpoint_type &endpoint) {
    return Address::Network(endpoint.address(), endpoint.port());
  }

  static std::optional<Address> ReplyAddress(const endpoint_type &endpoint) {
    return FromEndpoint(endpoint);
  }

  static Protocol FromFamily(int family) {
    return family == AF_INET6 ? Protocol::v6() : Protocol::v4();
  }

  static bool FitsEndpoint(const Address &) { return true; }

  static void PrepareBind(const Address &) {}

  // Port 0 on the server's family; the kernel picks the port
  static endpoint_type ClientEndpoint(const Address &server) {
    return endpoint_type(server.ip().is_v6() ? Protocol::v6() : Protocol::v4(), 0);
  }

  static std::optional<fs::path> OwnedPath(const endpoint_type &) { return std::nullopt; }
};

template <typename Protocol> struct LocalTraits {
  using endpoint_type = typename Protocol::endpoint;

  static bool Matches(const Address &address) { return address.is_unix(); }

  static endpoint_type ToEndpoint(const Address &address) {
    return endpoint_type(address.path().string());
  }

  static Address FromEndpoint(const endpoint_type &endpoint) {
    return Address::Unix(endpoint.path());
  }

  // Unbound peers have an empty path and cannot be answered
  static std::optional<Address> ReplyAddress(const endpoint_type &endpoint) {
    if (endpoint.path().empty()) {
      return std::nullopt;
    }
    return FromEndpoint(endpoint);
  }

  static Protocol FromFamily(int) { return Protocol(); }

  // sun_path needs room for the terminating NUL
  static bool FitsEndpoint(const Address &address) {
    return address.path().string().size() < sizeof(sockaddr_un::sun_path);
  }

  // A socket file nobody is listening on, left behind by an instance that
  // did not get to clean up
  static bool IsStaleSocket(const fs::path &path) {
    int fd = ::socket(AF_UNIX, Protocol().type() | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      return false;
    }
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string &name = path.string();
    std::memcpy(addr.sun_path, name.c_str(), name.size() + 1);
    int rc = ::connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
    int err = errno;
    ::close(fd);
    return rc != 0 && err == ECONNREFUSED;
  }

  static void PrepareBind(const Address &address) {
    const fs::path &path = address.path();
    if (!FitsEndpoint(address)) {
      throw BindError("socket path " + path.string() + " is too long (limit " +
                      std::to_string(sizeof(sockaddr_un::sun_path) - 1) + " bytes)");
    }
    std::error_code ec;
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path(), ec);
      if (ec) {
        throw BindError("failed to create directory " + path.parent_path().string() + ": " +
                        ec.message());
      }
    }
    auto status = fs::symlink_status(path, ec);
    if (!fs::exists(status)) {
      return;
    }
    if (!fs::is_socket(status) || !IsStaleSocket(path)) {
      throw BindError("socket path " + path.string() + " already exists");
    }
    LOG_NET_INFO("removing stale socket {}", path.string());
    if (!fs::remove(path, ec) && ec) {
      throw BindError("failed to remove stale socket " + path.string() + ": " + ec.message());
    }
  }

  static endpoint_type ClientEndpoint(const Address &) {
    static std::atomic<uint64_t> next_id{0};
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    std::string name = "echosrv_client_" + std::to_string(getpid()) + "_" +
                       std::to_string(nanos) + "_" + std::to_string(next_id++) + ".sock";
    return endpoint_type((fs::temp_directory_path() / name).string());
  }

  static std::optional<fs::path> OwnedPath(const endpoint_type &endpoint) {
    return fs::path(endpoint.path());
  }
};

template <typename Protocol> struct ProtocolTraits;
template <> struct ProtocolTraits<tcp> : IpTraits<tcp> {};
template <> struct ProtocolTraits<udp> : IpTraits<udp> {};
template <> struct ProtocolTraits<local::stream_protocol> : LocalTraits<local::stream_protocol> {};
template <>
struct ProtocolTraits<local::datagram_protocol> : LocalTraits<local::datagram_protocol> {};

// ============================================================================
// Deadlines
// ============================================================================

namespace {

struct DeadlineState {
  bool done{false};
  bool expired{false};
};

// Start an asynchronous socket operation guarded by a timer. When the timer
// fires first the socket is cancelled and the handler sees timed_out instead
// of operation_aborted. Runs entirely on the io_context thread, so the state
// needs no locking.
//
// The timer handler only touches the socket while the operation is still
// pending, which the owner of the socket guarantees by keeping it alive until
// the completion handler has run.
template <typename Socket, typename Initiate>
void StartWithDeadline(Socket &socket, std::chrono::milliseconds timeout, Initiate &&initiate,
                       IoHandler handler) {
  auto state = std::make_shared<DeadlineState>();
  std::shared_ptr<boost::asio::steady_timer> timer;

  if (timeout.count() > 0) {
    timer = std::make_shared<boost::asio::steady_timer>(socket.get_executor());
    timer->expires_after(timeout);
    timer->async_wait([state, &socket](const boost::system::error_code &ec) {
      if (ec || state->done) {
        return;
      }
      state->expired = true;
      boost::system::error_code ignored;
      socket.cancel(ignored);
    });
  }

  initiate([state, timer, handler = std::move(handler)](const boost::system::error_code &ec,
                                                          size_t bytes) {
    state->done = true;
    if (timer) {
      (void)timer->cancel();
    }
    boost::system::error_code result = ec;
    if (state->expired && ec == boost::asio::error::operation_aborted) {
      result = boost::asio::error::timed_out;
    }
    handler(result, bytes);
  });
}

template <typename Executor, typename Handler>
void PostError(const Executor &executor, Handler handler, boost::system::error_code ec) {
  boost::asio::post(executor, [handler = std::move(handler), ec]() { handler(ec, 0); });
}

template <typename Protocol> void CheckTargetKind(const Address &target, const std::string &name) {
  if (!ProtocolTraits<Protocol>::Matches(target)) {
    throw ConfigError(name + " cannot bind " + target.ToString() +
                      (target.is_unix() ? ": expected a network address"
                                        : ": expected a unix:/path address"));
  }
}

} // namespace

// ============================================================================
// AsioStreamConnection
// ============================================================================

template <typename Protocol> class AsioStreamConnection final : public StreamConnection {
public:
  using socket_type = typename Protocol::socket;

  AsioStreamConnection(socket_type socket, Address remote)
      : socket_(std::move(socket)), remote_(std::move(remote)) {
    if constexpr (std::is_same_v<Protocol, tcp>) {
      // Best-effort; echo replies should not wait on Nagle
      boost::system::error_code opt_ec;
      socket_.set_option(tcp::no_delay(true), opt_ec);
    }
  }

  ~AsioStreamConnection() override { close(); }

  AsioStreamConnection(const AsioStreamConnection &) = delete;
  AsioStreamConnection &operator=(const AsioStreamConnection &) = delete;

  void async_read_some(boost::asio::mutable_buffer buffer, std::chrono::milliseconds timeout,
                       IoHandler handler) override {
    StartWithDeadline(
        socket_, timeout,
        [this, buffer](auto completion) { socket_.async_read_some(buffer, std::move(completion)); },
        std::move(handler));
  }

  void async_write(boost::asio::const_buffer buffer, std::chrono::milliseconds timeout,
                   IoHandler handler) override {
    StartWithDeadline(
        socket_, timeout,
        [this, buffer](auto completion) {
          boost::asio::async_write(socket_, buffer, std::move(completion));
        },
        std::move(handler));
  }

  boost::system::error_code flush() override {
    if (!socket_.is_open()) {
      return boost::asio::error::not_connected;
    }
    return {};
  }

  void close() override {
    if (!socket_.is_open()) {
      return;
    }
    boost::system::error_code ec;
    socket_.shutdown(socket_base_type::shutdown_both, ec);
    socket_.close(ec);
  }

  bool is_open() const override { return socket_.is_open(); }

  Address remote_address() const override { return remote_; }

private:
  using socket_base_type = boost::asio::socket_base;

  socket_type socket_;
  Address remote_;
};

// ============================================================================
// AsioStreamListener
// ============================================================================

template <typename Protocol> class AsioStreamListener final : public StreamListener {
public:
  using acceptor_type = typename Protocol::acceptor;
  using socket_type = typename Protocol::socket;

  AsioStreamListener(acceptor_type acceptor, std::optional<fs::path> owned_path)
      : acceptor_(std::move(acceptor)), owned_path_(std::move(owned_path)) {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (!ec) {
      local_ = ProtocolTraits<Protocol>::FromEndpoint(endpoint);
    }
  }

  ~AsioStreamListener() override { close(); }

  AsioStreamListener(const AsioStreamListener &) = delete;
  AsioStreamListener &operator=(const AsioStreamListener &) = delete;

  void async_accept(std::chrono::milliseconds timeout, AcceptHandler handler) override {
    auto socket = std::make_shared<socket_type>(acceptor_.get_executor());
    StartWithDeadline(
        acceptor_, timeout,
        [this, socket](auto completion) {
          acceptor_.async_accept(*socket, [completion = std::move(completion)](
                                              const boost::system::error_code &ec) {
            completion(ec, 0);
          });
        },
        [socket, handler = std::move(handler)](const boost::system::error_code &ec, size_t) {
          if (ec) {
            handler(ec, nullptr);
            return;
          }
          boost::system::error_code ep_ec;
          auto endpoint = socket->remote_endpoint(ep_ec);
          Address remote =
              ep_ec ? Address::Unix("") : ProtocolTraits<Protocol>::FromEndpoint(endpoint);
          handler(ec, std::make_unique<AsioStreamConnection<Protocol>>(std::move(*socket),
                                                                       std::move(remote)));
        });
  }

  void close() override {
    boost::system::error_code ec;
    if (acceptor_.is_open()) {
      acceptor_.close(ec);
    }
    if (owned_path_) {
      std::error_code remove_ec;
      fs::remove(*owned_path_, remove_ec);
      owned_path_.reset();
    }
  }

  Address local_address() const override {
    return local_ ? *local_ : Address::Unix("");
  }

private:
  acceptor_type acceptor_;
  std::optional<fs::path> owned_path_;
  std::optional<Address> local_;
};

// ============================================================================
// AsioDatagramSocket
// ============================================================================

template <typename Protocol> class AsioDatagramSocket final : public DatagramSocket {
public:
  using socket_type = typename Protocol::socket;
  using endpoint_type = typename Protocol::endpoint;

  AsioDatagramSocket(socket_type socket, std::optional<fs::path> owned_path)
      : socket_(std::move(socket)), owned_path_(std::move(owned_path)) {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    if (!ec) {
      local_ = ProtocolTraits<Protocol>::FromEndpoint(endpoint);
    }
  }

  ~AsioDatagramSocket() override { close(); }

  AsioDatagramSocket(const AsioDatagramSocket &) = delete;
  AsioDatagramSocket &operator=(const AsioDatagramSocket &) = delete;

  void async_receive_from(boost::asio::mutable_buffer buffer, std::chrono::milliseconds timeout,
                          ReceiveHandler handler) override {
    auto sender = std::make_shared<endpoint_type>();
    StartWithDeadline(
        socket_, timeout,
        [this, buffer, sender](auto completion) {
          socket_.async_receive_from(buffer, *sender, std::move(completion));
        },
        [sender, handler = std::move(handler)](const boost::system::error_code &ec,
                                               size_t bytes) {
          if (ec) {
            handler(ec, bytes, std::nullopt);
            return;
          }
          handler(ec, bytes, ProtocolTraits<Protocol>::ReplyAddress(*sender));
        });
  }

  void async_send_to(boost::asio::const_buffer buffer, const Address &destination,
                     std::chrono::milliseconds timeout, IoHandler handler) override {
    if (!ProtocolTraits<Protocol>::Matches(destination)) {
      PostError(socket_.get_executor(), std::move(handler),
                boost::asio::error::address_family_not_supported);
      return;
    }
    if (!ProtocolTraits<Protocol>::FitsEndpoint(destination)) {
      PostError(socket_.get_executor(), std::move(handler), boost::asio::error::name_too_long);
      return;
    }
    auto endpoint = ProtocolTraits<Protocol>::ToEndpoint(destination);
    StartWithDeadline(
        socket_, timeout,
        [this, buffer, endpoint](auto completion) {
          socket_.async_send_to(buffer, endpoint, std::move(completion));
        },
        std::move(handler));
  }

  void close() override {
    boost::system::error_code ec;
    if (socket_.is_open()) {
      socket_.close(ec);
    }
    if (owned_path_) {
      std::error_code remove_ec;
      fs::remove(*owned_path_, remove_ec);
      owned_path_.reset();
    }
  }

  Address local_address() const override {
    return local_ ? *local_ : Address::Unix("");
  }

private:
  socket_type socket_;
  std::optional<fs::path> owned_path_;
  std::optional<Address> local_;
};

// ============================================================================
// AsioStreamTransport
// ============================================================================

template <typename Protocol>
std::unique_ptr<StreamListener>
AsioStreamTransport<Protocol>::bind_with_inheritance(boost::asio::io_context &io_context,
                                                     const server::ServerConfig &config,
                                                     const InheritanceConfig &inheritance) {
  using Traits = ProtocolTraits<Protocol>;
  typename Protocol::acceptor acceptor(io_context);

  SocketProvisioner provisioner(SOCK_STREAM, families_);
  SocketSource source = provisioner.Plan(config.bind_strategy, config.service_name, inheritance);

  if (source.is_inherit()) {
    int fd = *source.fd;
    int family = provisioner.AdoptDescriptor(fd);
    boost::system::error_code ec;
    acceptor.assign(Traits::FromFamily(family), fd, ec);
    if (ec) {
      throw FdInheritanceError("failed to adopt fd " + std::to_string(fd) + ": " + ec.message());
    }
    auto listener = std::make_unique<AsioStreamListener<Protocol>>(std::move(acceptor), std::nullopt);
    LOG_NET_INFO("{} listening on inherited fd {} ({})", name_, fd,
                 listener->local_address().ToString());
    return listener;
  }

  const Address &target = *source.target;
  CheckTargetKind<Protocol>(target, name_);
  Traits::PrepareBind(target);

  auto endpoint = Traits::ToEndpoint(target);
  boost::system::error_code ec;
  acceptor.open(endpoint.protocol(), ec);
  if (ec) {
    throw BindError("failed to open " + name_ + " socket: " + ec.message());
  }
  if constexpr (std::is_same_v<Protocol, tcp>) {
    acceptor.set_option(typename Protocol::acceptor::reuse_address(true), ec);
    if (ec) {
      LOG_NET_TRACE("failed to set SO_REUSEADDR: {}", ec.message());
    }
  }
  acceptor.bind(endpoint, ec);
  if (ec) {
    throw BindError("failed to bind " + target.ToString() + ": " + ec.message());
  }

  std::optional<fs::path> owned_path;
  if (target.is_unix()) {
    owned_path = target.path();
  }

  acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) {
    if (owned_path) {
      std::error_code remove_ec;
      fs::remove(*owned_path, remove_ec);
    }
    throw BindError("failed to listen on " + target.ToString() + ": " + ec.message());
  }

  auto listener = std::make_unique<AsioStreamListener<Protocol>>(std::move(acceptor),
                                                                 std::move(owned_path));
  LOG_NET_INFO("{} listening on {}", name_, listener->local_address().ToString());
  return listener;
}

template <typename Protocol>
void AsioStreamTransport<Protocol>::async_connect(boost::asio::io_context &io_context,
                                                  const Address &address,
                                                  std::chrono::milliseconds timeout,
                                                  ConnectHandler handler) {
  using Traits = ProtocolTraits<Protocol>;
  if (!Traits::Matches(address)) {
    boost::asio::post(io_context, [handler = std::move(handler)]() {
      handler(boost::asio::error::address_family_not_supported, nullptr);
    });
    return;
  }

  if (!Traits::FitsEndpoint(address)) {
    boost::asio::post(io_context, [handler = std::move(handler)]() {
      handler(boost::asio::error::name_too_long, nullptr);
    });
    return;
  }

  auto socket = std::make_shared<typename Protocol::socket>(io_context);
  auto endpoint = Traits::ToEndpoint(address);

  StartWithDeadline(
      *socket, timeout,
      [socket, endpoint](auto completion) {
        socket->async_connect(endpoint, [completion = std::move(completion)](
                                            const boost::system::error_code &ec) {
          completion(ec, 0);
        });
      },
      [socket, address, handler = std::move(handler)](const boost::system::error_code &ec,
                                                      size_t) {
        if (ec) {
          handler(ec, nullptr);
          return;
        }
        LOG_NET_TRACE("connected to {}", address.ToString());
        handler(ec, std::make_unique<AsioStreamConnection<Protocol>>(std::move(*socket), address));
      });
}

// ============================================================================
// AsioDatagramTransport
// ============================================================================

template <typename Protocol>
std::unique_ptr<DatagramSocket>
AsioDatagramTransport<Protocol>::bind_with_inheritance(boost::asio::io_context &io_context,
                                                       const server::ServerConfig &config,
                                                       const InheritanceConfig &inheritance) {
  using Traits = ProtocolTraits<Protocol>;
  typename Protocol::socket socket(io_context);

  SocketProvisioner provisioner(SOCK_DGRAM, families_);
  SocketSource source = provisioner.Plan(config.bind_strategy, config.service_name, inheritance);

  if (source.is_inherit()) {
    int fd = *source.fd;
    int family = provisioner.AdoptDescriptor(fd);
    boost::system::error_code ec;
    socket.assign(Traits::FromFamily(family), fd, ec);
    if (ec) {
      throw FdInheritanceError("failed to adopt fd " + std::to_string(fd) + ": " + ec.message());
    }
    auto result = std::make_unique<AsioDatagramSocket<Protocol>>(std::move(socket), std::nullopt);
    LOG_NET_INFO("{} bound on inherited fd {} ({})", name_, fd,
                 result->local_address().ToString());
    return result;
  }

  const Address &target = *source.target;
  CheckTargetKind<Protocol>(target, name_);
  Traits::PrepareBind(target);

  auto endpoint = Traits::ToEndpoint(target);
  boost::system::error_code ec;
  socket.open(endpoint.protocol(), ec);
  if (ec) {
    throw BindError("failed to open " + name_ + " socket: " + ec.message());
  }
  socket.bind(endpoint, ec);
  if (ec) {
    throw BindError("failed to bind " + target.ToString() + ": " + ec.message());
  }

  std::optional<fs::path> owned_path;
  if (target.is_unix()) {
    owned_path = target.path();
  }

  auto result = std::make_unique<AsioDatagramSocket<Protocol>>(std::move(socket),
                                                               std::move(owned_path));
  LOG_NET_INFO("{} bound on {}", name_, result->local_address().ToString());
  return result;
}

template <typename Protocol>
std::unique_ptr<DatagramSocket>
AsioDatagramTransport<Protocol>::open_client(boost::asio::io_context &io_context,
                                             const Address &server) {
  using Traits = ProtocolTraits<Protocol>;
  if (!Traits::Matches(server)) {
    throw ConfigError(name_ + " cannot reach " + server.ToString());
  }

  typename Protocol::socket socket(io_context);
  auto endpoint = Traits::ClientEndpoint(server);
  boost::system::error_code ec;
  socket.open(endpoint.protocol(), ec);
  if (ec) {
    throw IoError("failed to open " + name_ + " client socket: " + ec.message());
  }
  socket.bind(endpoint, ec);
  if (ec) {
    throw IoError("failed to bind " + name_ + " client socket: " + ec.message());
  }
  return std::make_unique<AsioDatagramSocket<Protocol>>(std::move(socket),
                                                        Traits::OwnedPath(endpoint));
}

template class AsioStreamTransport<tcp>;
template class AsioStreamTransport<local::stream_protocol>;
template class AsioDatagramTransport<udp>;
template class AsioDatagramTransport<local::datagram_protocol>;

} // namespace detail

// ============================================================================
// Concrete transports
// ============================================================================

TcpTransport::TcpTransport() : AsioStreamTransport("tcp", {AF_INET, AF_INET6}) {}

UdpTransport::UdpTransport() : AsioDatagramTransport("udp", {AF_INET, AF_INET6}) {}

UnixStreamTransport::UnixStreamTransport() : AsioStreamTransport("unix-stream", {AF_UNIX}) {}

UnixDatagramTransport::UnixDatagramTransport()
    : AsioDatagramTransport("unix-datagram", {AF_UNIX}) {}

} // namespace network
} // namespace echosrv
