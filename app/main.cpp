#include "LineFramer.h"
#include "Logger.h"
#include "Node.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

constexpr int STDIN_POLL_MS = 200;

std::atomic<bool> g_running{ true };

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
  }
}

// Feed stdin lines to the node until SIGINT; keeps running after EOF
void readPayloads(mc::Node &node, mc::logging::Logger &logger) {
  mc::network::LineFramer framer;
  bool stdinOpen = true;
  char buffer[1024];

  while (g_running) {
    if (!stdinOpen) {
      std::this_thread::sleep_for(std::chrono::milliseconds(STDIN_POLL_MS));
      continue;
    }

    struct pollfd pfd = { STDIN_FILENO, POLLIN, 0 };
    int ready = ::poll(&pfd, 1, STDIN_POLL_MS);
    if (ready <= 0) {
      continue;
    }

    ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (count <= 0) {
      logger.info << "Input closed, node keeps running until interrupted";
      stdinOpen = false;
      continue;
    }

    auto framed = framer.append(buffer, static_cast<size_t>(count),
                                [&](const std::string &line) {
                                  logger.info << "Submitting block data: "
                                              << line;
                                  node.submitData(line);
                                });
    if (!framed) {
      logger.warning << "Input line dropped: " << framed.error().message;
      framer.reset();
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "minichain-node - proof-of-work chain node" };

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  std::string logFile;
  app.add_option("--log-file", logFile, "Also write the log to this file");

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON configuration file")
      ->check(CLI::ExistingFile);

  std::string host = mc::Node::DEFAULT_HOST;
  app.add_option("--host", host, "Listen address")->capture_default_str();

  uint16_t port = mc::Node::DEFAULT_PORT;
  app.add_option("-p,--port", port, "Listen port")
      ->capture_default_str()
      ->check(CLI::Range(0, 65535));

  std::vector<std::string> peerSpecs;
  app.add_option("--peer", peerSpecs, "Peer to dial (host:port), repeatable");

  uint32_t difficulty = mc::Node::DEFAULT_DIFFICULTY;
  app.add_option("-d,--difficulty", difficulty, "Leading zero bytes required")
      ->capture_default_str()
      ->check(CLI::Range(0u, mc::ProofOfWork::MAX_DIFFICULTY));

  bool mineGenesis = false;
  app.add_flag("--genesis", mineGenesis, "Mine a genesis block on start");

  CLI11_PARSE(app, argc, argv);

  auto rootLogger = mc::logging::getRootLogger();
  rootLogger.setLevel(debug ? mc::logging::Level::DEBUG
                            : mc::logging::Level::INFO);
  if (!logFile.empty()) {
    try {
      rootLogger.addFileHandler(logFile);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  auto logger = mc::logging::getLogger("mc.app");

  mc::Node::Config config;
  if (!configPath.empty()) {
    auto json = mc::utl::loadJsonFile(configPath);
    if (!json) {
      std::cerr << "Error: " << json.error().message << "\n";
      return 1;
    }
    auto loaded = config.ltsFromJson(json.value());
    if (!loaded) {
      std::cerr << "Error: " << configPath << ": " << loaded.error().message
                << "\n";
      return 1;
    }
  }

  // Command line wins over the file
  if (app.count("--host") > 0) {
    config.endpoint.address = host;
  }
  if (app.count("--port") > 0) {
    config.endpoint.port = port;
  }
  if (app.count("--difficulty") > 0) {
    config.difficulty = difficulty;
  }
  if (mineGenesis) {
    config.mineGenesis = true;
  }
  for (const auto &spec : peerSpecs) {
    mc::network::IpEndpoint peer;
    if (!mc::utl::parseHostPort(spec, peer.address, peer.port)) {
      std::cerr << "Error: invalid peer address: " << spec << "\n";
      return 1;
    }
    config.peers.push_back(peer);
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  mc::Node node;
  auto initialized = node.init(config);
  if (!initialized) {
    std::cerr << "Error: " << initialized.error().message << "\n";
    return 1;
  }

  auto started = node.start();
  if (!started) {
    logger.error << "Failed to start node: " << started.error().message;
    return 1;
  }

  std::cout << "Node listening on port " << node.getListenPort()
            << ", difficulty " << config.difficulty << "\n";
  std::cout << "Type a line to mine it into a block, Ctrl+C to stop.\n";

  readPayloads(node, logger);

  node.stop();
  std::cout << node.getChain().describe() << "\n";
  return 0;
}
