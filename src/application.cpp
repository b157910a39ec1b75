// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <iostream> // Keep for signal handler
#include <stdexcept>
#include <thread>

namespace chaincraft {
namespace app {

using json = nlohmann::json;

AppConfig::AppConfig()
    : datadir(util::get_default_datadir()), log_level("info"), verbose(false) {}

bool ApplyConfigJson(const json &j, AppConfig &config, std::string &error) {
  if (!j.is_object()) {
    error = "config root must be a JSON object";
    return false;
  }

  network::NodeConfig &n = config.node_config;
  auto secs = [](const json &v) { return std::chrono::seconds(v.get<int64_t>()); };

  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const std::string &key = it.key();
      const json &v = it.value();

      if (key == "network") {
        const std::string net = v.get<std::string>();
        if (net == "mainnet") {
          n.network_magic = protocol::magic::MAINNET;
        } else if (net == "testnet") {
          n.network_magic = protocol::magic::TESTNET;
        } else if (net == "regtest") {
          n.network_magic = protocol::magic::REGTEST;
        } else {
          error = "unknown network '" + net + "'";
          return false;
        }
      } else if (key == "network_magic") {
        n.network_magic = v.get<uint32_t>();
      } else if (key == "port") {
        n.port = v.get<uint16_t>();
      } else if (key == "listen_enabled") {
        n.listen_enabled = v.get<bool>();
      } else if (key == "io_threads") {
        n.io_threads = v.get<size_t>();
      } else if (key == "worker_threads") {
        n.worker_threads = v.get<size_t>();
      } else if (key == "max_peers") {
        n.max_peers = v.get<size_t>();
      } else if (key == "min_peers") {
        n.min_peers = v.get<size_t>();
      } else if (key == "bootstrap_addresses") {
        n.bootstrap_addresses.clear();
        for (const auto &entry : v) {
          const std::string text = entry.get<std::string>();
          auto addr = protocol::NetworkAddress::from_string(text);
          if (!addr) {
            error = "malformed bootstrap address '" + text + "'";
            return false;
          }
          n.bootstrap_addresses.push_back(*addr);
        }
      } else if (key == "dedup_capacity") {
        n.dedup_capacity = v.get<size_t>();
      } else if (key == "dedup_ttl") {
        n.dedup_ttl = secs(v);
      } else if (key == "dedup_shards") {
        n.dedup_shards = v.get<size_t>();
      } else if (key == "peer_timeout") {
        n.peer_timeout = secs(v);
      } else if (key == "heartbeat_interval") {
        n.heartbeat_interval = secs(v);
      } else if (key == "handshake_timeout") {
        n.handshake_timeout = secs(v);
      } else if (key == "maintenance_interval") {
        n.maintenance_interval = secs(v);
      } else if (key == "backoff_base") {
        n.backoff_base = secs(v);
      } else if (key == "backoff_max") {
        n.backoff_max = secs(v);
      } else if (key == "ban_threshold") {
        n.ban_threshold = v.get<uint32_t>();
      } else if (key == "ban_duration") {
        n.ban_duration = v.get<int64_t>();
      } else if (key == "send_queue_limit") {
        n.send_queue_limit = v.get<size_t>();
      } else if (key == "deferred_max_retries") {
        n.deferred_max_retries = v.get<uint32_t>();
      } else if (key == "deferred_ttl") {
        n.deferred_ttl = secs(v);
      } else if (key == "deferred_max_entries") {
        n.deferred_max_entries = v.get<size_t>();
      } else if (key == "max_object_size") {
        n.max_object_size = v.get<size_t>();
      } else if (key == "validator") {
        n.validator = v.get<std::string>();
      } else if (key == "datadir") {
        config.datadir = v.get<std::string>();
      } else if (key == "log_level") {
        config.log_level = v.get<std::string>();
      } else {
        error = "unknown config key '" + key + "'";
        return false;
      }
    }
  } catch (const json::exception &e) {
    error = std::string("bad config value: ") + e.what();
    return false;
  }

  if (n.min_peers > n.max_peers) {
    error = "min_peers must not exceed max_peers";
    return false;
  }
  return true;
}

bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string &error) {
  auto contents = util::read_file_string(path);
  if (!contents) {
    error = "cannot read " + path.string();
    return false;
  }
  json j = json::parse(*contents, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    error = path.string() + " is not valid JSON";
    return false;
  }
  return ApplyConfigJson(j, config, error);
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("{}", GetFullVersionString());

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_node()) {
    LOG_APP_ERROR("Failed to initialize node");
    return false;
  }

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  setup_signal_handlers();

  if (!node_->start()) {
    LOG_APP_ERROR("Failed to start node");
    return false;
  }

  running_ = true;

  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  if (config_.node_config.listen_enabled) {
    LOG_APP_INFO("Listening on port: {}", config_.node_config.port);
  } else {
    LOG_APP_INFO("Inbound connections disabled");
  }
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

bool Application::exited_fatally() const {
  return node_ && node_->has_fatal_error();
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_APP_INFO("Shutting down...");

  if (node_) {
    node_->stop();
  }

  if (datadir_locked_) {
    util::UnlockDirectory(config_.datadir, ".lock");
    datadir_locked_ = false;
  }

  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}",
                  config_.datadir.string());
    return false;
  }

  switch (util::LockDirectory(config_.datadir, ".lock")) {
  case util::LockResult::Success:
    datadir_locked_ = true;
    return true;
  case util::LockResult::ErrorWrite:
    LOG_APP_ERROR("Cannot write to data directory: {}",
                  config_.datadir.string());
    return false;
  case util::LockResult::ErrorLock:
    LOG_APP_ERROR("Cannot obtain a lock on data directory {}. "
                  "chaincraftd is probably already running.",
                  config_.datadir.string());
    return false;
  }
  return false;
}

bool Application::init_node() {
  config_.node_config.datadir = config_.datadir.string();

  try {
    node_ = std::make_unique<network::Node>(config_.node_config);
  } catch (const std::invalid_argument &e) {
    LOG_APP_ERROR("Invalid node configuration: {}", e.what());
    return false;
  }

  node_->set_fatal_error_callback([this](const std::string &what) {
    LOG_APP_ERROR("Fatal node error: {}. Shutting down.", what);
    request_shutdown();
  });
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    std::cout << "\nReceived signal " << signal << std::endl;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace chaincraft
