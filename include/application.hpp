// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_APPLICATION_HPP
#define CHAINCRAFT_APPLICATION_HPP

#include "network/node.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace chaincraft {
namespace app {

struct AppConfig {
  std::filesystem::path datadir;
  network::NodeConfig node_config;
  std::string log_level;
  bool verbose;

  AppConfig();
};

/**
 * Apply a JSON config object onto config. Keys mirror NodeConfig field names;
 * durations are integer seconds and "bootstrap_addresses" is a list of
 * "host:port" strings.
 *
 * Returns false and sets error on an unknown key, a type mismatch or a
 * malformed address. Runs before logging is set up, so it never logs.
 */
bool ApplyConfigJson(const nlohmann::json &j, AppConfig &config,
                     std::string &error);

// Read and apply a config file (see ApplyConfigJson)
bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string &error);

/**
 * Application - chaincraftd process lifecycle
 *
 * initialize(): datadir + lock, build the Node
 * start():      signal handlers, Node::start()
 * wait_for_shutdown(): block until SIGINT/SIGTERM or a fatal node error
 */
class Application {
public:
  explicit Application(const AppConfig &config);
  ~Application();

  bool initialize();
  bool start();
  void stop();

  void wait_for_shutdown();
  void request_shutdown() { shutdown_requested_ = true; }

  // True if the node halted on a fatal error (exit code 1)
  bool exited_fatally() const;

  network::Node &node() { return *node_; }

  static Application *instance();

private:
  bool init_datadir();
  bool init_node();

  void shutdown();

  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;
  std::unique_ptr<network::Node> node_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  bool datadir_locked_{false};

  static Application *instance_;
};

} // namespace app
} // namespace chaincraft

#endif // CHAINCRAFT_APPLICATION_HPP
