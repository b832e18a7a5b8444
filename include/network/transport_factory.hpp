// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace echosrv {
namespace network {

enum class Protocol { Tcp, Udp, UnixStream, UnixDatagram };

// "tcp", "udp", "unix-stream", "unix-datagram"
std::optional<Protocol> ParseProtocol(const std::string &name);
const char *ProtocolName(Protocol protocol);

bool IsStreamProtocol(Protocol protocol);

// Where a server of this protocol binds when nothing else is configured
Address DefaultBindAddress(Protocol protocol);

// Throws ConfigError when protocol is not of the requested kind
std::shared_ptr<StreamTransport> MakeStreamTransport(Protocol protocol);
std::shared_ptr<DatagramTransport> MakeDatagramTransport(Protocol protocol);

} // namespace network
} // namespace echosrv
