// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <string>
#include <vector>

namespace {

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --conf=<file>        JSON config file (applied before other flags)\n"
      << "  --datadir=<path>     Data directory (default: ~/.chaincraft)\n"
      << "  --port=<port>        Listen port (default: 8080)\n"
      << "  --listen             Enable inbound connections (default)\n"
      << "  --nolisten           Disable inbound connections\n"
      << "  --connect=<host:port> Bootstrap peer, may be repeated\n"
      << "  --maxpeers=<n>       Maximum connected peers (default: 50)\n"
      << "  --minpeers=<n>       Keep dialing below this many peers (default: 1)\n"
      << "  --threads=<n>        Number of IO threads (default: 2)\n"
      << "  --workers=<n>        Number of validation threads (default: 4)\n"
      << "  --validator=<name>   append-only, dependency or signed-dependency\n"
      << "  --testnet            Use test network magic\n"
      << "  --regtest            Use regression test network magic\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, gossip, consensus, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=network,gossip\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

std::vector<std::string> split_components(const std::string &list) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos < list.length()) {
    size_t comma = list.find(',', pos);
    if (comma == std::string::npos) {
      out.push_back(list.substr(pos));
      break;
    }
    out.push_back(list.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return out;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    chaincraft::app::AppConfig config;
    std::vector<std::string> debug_components;
    std::string error;

    // --conf is applied first so command-line flags override it
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--conf=") == 0) {
        if (!chaincraft::app::LoadConfigFile(arg.substr(7), config, error)) {
          std::cerr << "Error: " << error << std::endl;
          return 1;
        }
      }
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << chaincraft::GetFullVersionString() << std::endl;
        std::cout << chaincraft::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--conf=") == 0) {
        // handled above
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--port=") == 0) {
        config.node_config.port = static_cast<uint16_t>(std::stoi(arg.substr(7)));
      } else if (arg == "--listen") {
        config.node_config.listen_enabled = true;
      } else if (arg == "--nolisten") {
        config.node_config.listen_enabled = false;
      } else if (arg.find("--connect=") == 0) {
        auto addr = chaincraft::protocol::NetworkAddress::from_string(arg.substr(10));
        if (!addr) {
          std::cerr << "Malformed address: " << arg.substr(10) << std::endl;
          return 1;
        }
        config.node_config.bootstrap_addresses.push_back(*addr);
      } else if (arg.find("--maxpeers=") == 0) {
        config.node_config.max_peers = std::stoul(arg.substr(11));
      } else if (arg.find("--minpeers=") == 0) {
        config.node_config.min_peers = std::stoul(arg.substr(11));
      } else if (arg.find("--threads=") == 0) {
        config.node_config.io_threads = std::stoul(arg.substr(10));
      } else if (arg.find("--workers=") == 0) {
        config.node_config.worker_threads = std::stoul(arg.substr(10));
      } else if (arg.find("--validator=") == 0) {
        config.node_config.validator = arg.substr(12);
      } else if (arg == "--testnet") {
        config.node_config.network_magic = chaincraft::protocol::magic::TESTNET;
      } else if (arg == "--regtest") {
        config.node_config.network_magic = chaincraft::protocol::magic::REGTEST;
      } else if (arg == "--verbose") {
        config.verbose = true;
        config.log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (auto &c : split_components(arg.substr(8))) {
          debug_components.push_back(c);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (config.node_config.io_threads == 0) {
      std::cerr << "--threads must be at least 1" << std::endl;
      return 1;
    }
    if (config.node_config.min_peers > config.node_config.max_peers) {
      std::cerr << "--minpeers must not exceed --maxpeers" << std::endl;
      return 1;
    }

    // Log to <datadir>/debug.log
    if (!chaincraft::util::ensure_directory(config.datadir)) {
      std::cerr << "Cannot create data directory: " << config.datadir.string()
                << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    chaincraft::util::LogManager::Initialize(config.log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        chaincraft::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        chaincraft::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        chaincraft::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    chaincraft::app::Application app(config);

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      chaincraft::util::LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      chaincraft::util::LogManager::Shutdown();
      return 1;
    }

    app.wait_for_shutdown();

    const bool fatal = app.exited_fatally();
    chaincraft::util::LogManager::Shutdown();
    return fatal ? 1 : 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    chaincraft::util::LogManager::Shutdown();
    return 1;
  }
}
