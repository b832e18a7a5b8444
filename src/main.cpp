// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "config/config_loader.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <limits>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --protocol=<name>        tcp, udp, unix-stream or unix-datagram (default: tcp)\n"
      << "  --listen=<address>       Bind address: host:port, [v6]:port or unix:/path\n"
      << "                           Default: 127.0.0.1:8080, /tmp/echosrv.sock for unix\n"
      << "  --service=<name>         Name of the inherited socket in LISTEN_FDNAMES\n"
      << "                           Default: <protocol>-echo\n"
      << "  --inherit=<mode>         auto, never or always (default: auto)\n"
      << "  --fd=<n>                 Inherit this descriptor instead of looking it up\n"
      << "  --max-connections=<n>    Concurrent stream connections (default: 100)\n"
      << "  --buffer-size=<bytes>    Read buffer per connection (default: 1024)\n"
      << "  --read-timeout=<ms>      Read deadline (default: 30000)\n"
      << "  --write-timeout=<ms>     Write deadline (default: 30000)\n"
      << "  --config=<path>          Load settings from a JSON file; other options override it\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>       Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                           Default: info\n"
      << "  --debug=<component>      Enable trace logging for specific component(s)\n"
      << "                           Components: network, server, client, app, all\n"
      << "                           Can be comma-separated: --debug=network,server\n"
      << "  --logfile=<path>         Log to a rotating file instead of the console\n"
      << "\n"
      << "Other:\n"
      << "  --version                Show version information\n"
      << "  --help                   Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Command line values; unset ones fall back to the config file, then defaults
    std::optional<std::string> config_path;
    std::optional<echosrv::network::Protocol> protocol;
    std::optional<echosrv::network::Address> listen;
    std::optional<std::string> service;
    std::optional<std::string> inherit_mode;
    std::optional<int> inherit_fd;
    std::optional<int64_t> max_connections;
    std::optional<int64_t> buffer_size;
    std::optional<int64_t> read_timeout_ms;
    std::optional<int64_t> write_timeout_ms;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;

    constexpr int64_t kMaxTimeoutMs = 24LL * 60 * 60 * 1000;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << echosrv::GetFullVersionString() << std::endl;
        std::cout << echosrv::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        config_path = arg.substr(9);
      } else if (arg.find("--protocol=") == 0) {
        protocol = echosrv::network::ParseProtocol(arg.substr(11));
        if (!protocol) {
          std::cerr << "Error: Unknown protocol: " << arg.substr(11) << std::endl;
          std::cerr << "Protocol must be tcp, udp, unix-stream or unix-datagram" << std::endl;
          return 1;
        }
      } else if (arg.find("--listen=") == 0) {
        listen = echosrv::network::Address::Parse(arg.substr(9));
        if (!listen) {
          std::cerr << "Error: Invalid listen address: " << arg.substr(9) << std::endl;
          std::cerr << "Use host:port, [v6]:port or unix:/path" << std::endl;
          return 1;
        }
      } else if (arg.find("--service=") == 0) {
        service = arg.substr(10);
      } else if (arg.find("--inherit=") == 0) {
        inherit_mode = arg.substr(10);
      } else if (arg.find("--fd=") == 0) {
        inherit_fd = echosrv::util::SafeParseInt(arg.substr(5), 0, std::numeric_limits<int>::max());
        if (!inherit_fd) {
          std::cerr << "Error: Invalid descriptor: " << arg.substr(5) << std::endl;
          return 1;
        }
      } else if (arg.find("--max-connections=") == 0) {
        max_connections = echosrv::util::SafeParseInt64(arg.substr(18), 0, 1000000);
        if (!max_connections) {
          std::cerr << "Error: Invalid connection limit: " << arg.substr(18) << std::endl;
          std::cerr << "Limit must be a number between 0 and 1000000" << std::endl;
          return 1;
        }
      } else if (arg.find("--buffer-size=") == 0) {
        buffer_size = echosrv::util::SafeParseInt64(arg.substr(14), 1, 64 * 1024 * 1024);
        if (!buffer_size) {
          std::cerr << "Error: Invalid buffer size: " << arg.substr(14) << std::endl;
          std::cerr << "Size must be a number between 1 and 67108864" << std::endl;
          return 1;
        }
      } else if (arg.find("--read-timeout=") == 0) {
        read_timeout_ms = echosrv::util::SafeParseInt64(arg.substr(15), 1, kMaxTimeoutMs);
        if (!read_timeout_ms) {
          std::cerr << "Error: Invalid read timeout: " << arg.substr(15) << std::endl;
          return 1;
        }
      } else if (arg.find("--write-timeout=") == 0) {
        write_timeout_ms = echosrv::util::SafeParseInt64(arg.substr(16), 1, kMaxTimeoutMs);
        if (!write_timeout_ms) {
          std::cerr << "Error: Invalid write timeout: " << arg.substr(16) << std::endl;
          return 1;
        }
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,server
        for (const auto &component : echosrv::util::SplitString(arg.substr(8), ',')) {
          if (!component.empty()) {
            debug_components.push_back(component);
          }
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    echosrv::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        echosrv::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        echosrv::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        echosrv::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    echosrv::app::AppConfig config;
    try {
      echosrv::config::EchoConfig file_config;
      if (config_path) {
        file_config = echosrv::config::LoadServerConfig(*config_path);
      }
      config.protocol = protocol.value_or(file_config.protocol);
      config.server = file_config.server;

      auto &server = config.server;
      if (!config_path) {
        server.service_name = std::string(echosrv::network::ProtocolName(config.protocol)) + "-echo";
        server.bind_strategy = echosrv::config::MakeBindStrategy(
            inherit_mode.value_or("auto"), inherit_fd,
            listen.value_or(echosrv::network::DefaultBindAddress(config.protocol)));
      } else if (listen || inherit_mode || inherit_fd) {
        // Keep whatever the file set that the command line does not override
        const auto &current = server.bind_strategy;
        echosrv::network::Address bind =
            listen ? *listen
                   : (current.target() ? *current.target()
                                       : echosrv::network::DefaultBindAddress(config.protocol));
        std::optional<int> fd = inherit_fd ? inherit_fd : current.fd();
        std::string mode = inherit_mode.value_or(
            current.kind() == echosrv::network::BindStrategy::Kind::Bind      ? "never"
            : current.kind() == echosrv::network::BindStrategy::Kind::Inherit ? "always"
                                                                               : "auto");
        server.bind_strategy = echosrv::config::MakeBindStrategy(mode, fd, bind);
      }
      if (service) {
        server.service_name = *service;
      }

      if (max_connections) server.max_connections = static_cast<size_t>(*max_connections);
      if (buffer_size) server.buffer_size = static_cast<size_t>(*buffer_size);
      if (read_timeout_ms) server.read_timeout = std::chrono::milliseconds(*read_timeout_ms);
      if (write_timeout_ms) server.write_timeout = std::chrono::milliseconds(*write_timeout_ms);
    } catch (const echosrv::ConfigError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      echosrv::util::LogManager::Shutdown();
      return 1;
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    int exit_code = 0;
    {
      echosrv::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        exit_code = 1;
      } else if (!app.start()) {
        LOG_ERROR("Failed to start application");
        exit_code = 1;
      } else {
        // Run until SIGINT/SIGTERM, then drain active connections
        app.wait_for_shutdown();
      }
    }

    echosrv::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    echosrv::util::LogManager::Shutdown();
    return 1;
  }
}
