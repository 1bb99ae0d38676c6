#include "Node.h"
#include "BlockCodec.h"
#include "TcpClient.h"
#include "Utilities.h"

#include <algorithm>

namespace mc {

namespace {

constexpr int ACCEPT_POLL_MS = 100;
constexpr size_t LOGGED_LINE_LIMIT = 80;

std::string clip(const std::string &line) {
  if (line.size() <= LOGGED_LINE_LIMIT) {
    return line;
  }
  return line.substr(0, LOGGED_LINE_LIMIT) + "...";
}

} // namespace

// ============ Config ============

nlohmann::json Node::Config::ltsToJson() const {
  nlohmann::json j;
  j["host"] = endpoint.address;
  j["port"] = endpoint.port;
  nlohmann::json peerList = nlohmann::json::array();
  for (const auto &peer : peers) {
    peerList.push_back(peer.ltsToString());
  }
  j["peers"] = peerList;
  j["difficulty"] = difficulty;
  j["reconnectDelayMs"] = reconnectDelay.count();
  j["maxMessageBytes"] = maxMessageBytes;
  j["mineGenesis"] = mineGenesis;
  j["genesisData"] = genesisData;
  return j;
}

Node::Roe<void> Node::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (jd.contains("host")) {
      if (!jd["host"].is_string()) {
        return Error(E_CONFIG, "Field 'host' must be a string");
      }
      endpoint.address = jd["host"].get<std::string>();
      if (endpoint.address.empty()) {
        return Error(E_CONFIG, "Field 'host' cannot be empty");
      }
    }

    // Port 0 lets the system pick one
    if (jd.contains("port")) {
      if (!utl::isNonNegativeInteger(jd["port"])) {
        return Error(E_CONFIG, "Field 'port' must be a non-negative number");
      }
      uint64_t portValue = jd["port"].get<uint64_t>();
      if (portValue > 65535) {
        return Error(E_CONFIG, "Field 'port' must be between 0 and 65535");
      }
      endpoint.port = static_cast<uint16_t>(portValue);
    }

    if (jd.contains("peers")) {
      if (!jd["peers"].is_array()) {
        return Error(E_CONFIG, "Field 'peers' must be an array of host:port");
      }
      peers.clear();
      for (const auto &item : jd["peers"]) {
        if (!item.is_string()) {
          return Error(E_CONFIG, "Field 'peers' must contain strings");
        }
        network::IpEndpoint peer;
        if (!utl::parseHostPort(item.get<std::string>(), peer.address,
                                peer.port)) {
          return Error(E_CONFIG, "Invalid peer address in 'peers': " +
                                     item.get<std::string>());
        }
        peers.push_back(peer);
      }
    }

    if (jd.contains("difficulty")) {
      if (!utl::isNonNegativeInteger(jd["difficulty"])) {
        return Error(E_CONFIG, "Field 'difficulty' must be a non-negative number");
      }
      uint64_t value = jd["difficulty"].get<uint64_t>();
      if (value > ProofOfWork::MAX_DIFFICULTY) {
        return Error(E_CONFIG, "Field 'difficulty' must not exceed " +
                                   std::to_string(ProofOfWork::MAX_DIFFICULTY));
      }
      difficulty = static_cast<uint32_t>(value);
    }

    if (jd.contains("reconnectDelayMs")) {
      if (!utl::isNonNegativeInteger(jd["reconnectDelayMs"])) {
        return Error(E_CONFIG,
                     "Field 'reconnectDelayMs' must be a non-negative number");
      }
      reconnectDelay = std::chrono::milliseconds(
          jd["reconnectDelayMs"].get<uint64_t>());
    }

    if (jd.contains("maxMessageBytes")) {
      if (!utl::isNonNegativeInteger(jd["maxMessageBytes"])) {
        return Error(E_CONFIG, "Field 'maxMessageBytes' must be a positive number");
      }
      maxMessageBytes = jd["maxMessageBytes"].get<size_t>();
      if (maxMessageBytes == 0) {
        return Error(E_CONFIG, "Field 'maxMessageBytes' cannot be 0");
      }
    }

    if (jd.contains("mineGenesis")) {
      if (!jd["mineGenesis"].is_boolean()) {
        return Error(E_CONFIG, "Field 'mineGenesis' must be a boolean");
      }
      mineGenesis = jd["mineGenesis"].get<bool>();
    }

    if (jd.contains("genesisData")) {
      if (!jd["genesisData"].is_string()) {
        return Error(E_CONFIG, "Field 'genesisData' must be a string");
      }
      genesisData = jd["genesisData"].get<std::string>();
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG,
                 "Failed to parse node configuration: " + std::string(e.what()));
  }
}

// ============ Node ============

Node::Node() : Service("mc.node") {
  peers_.redirectLogger(log().getFullName());
  createChain();
}

Node::~Node() { stop(); }

Node::Roe<void> Node::init(const Config &config) {
  if (!isStopSet()) {
    return Error(E_STATE, "Cannot reconfigure a running node");
  }
  if (config.maxMessageBytes == 0) {
    return Error(E_CONFIG, "Message buffer size cannot be 0");
  }

  config_ = config;
  createChain();
  {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    pending_.clear();
  }
  return {};
}

// Fresh chain at the configured difficulty, with a miner on top of it
void Node::createChain() {
  miner_.reset();
  chain_ = std::make_unique<BlockChain>(config_.difficulty);
  miner_ = std::make_unique<Miner>(*chain_);
  miner_->setOnMined([this](const Block &block) { onBlockMined(block); });
  chain_->redirectLogger(log().getFullName());
  miner_->redirectLogger(log().getFullName());
}

BlockChain &Node::getChain() { return *chain_; }

const BlockChain &Node::getChain() const { return *chain_; }

void Node::submitData(const std::string &payload) { miner_->submit(payload); }

size_t Node::getPendingCount() const {
  std::lock_guard<std::mutex> lock(pendingMutex_);
  return pending_.size();
}

size_t Node::broadcastBlock(const Block &block,
                            const network::IpEndpoint *exclude) {
  return peers_.broadcast(Message::blockLine(block), exclude);
}

Service::Roe<void> Node::onStart() {
  peers_.open();
  auto listening = server_.listen(config_.endpoint);
  if (!listening) {
    return Service::Error(E_NETWORK, "Failed to listen on " +
                                         config_.endpoint.ltsToString() + ": " +
                                         listening.error().message);
  }

  log().info << "Listening on " << server_.getEndpoint() << ", difficulty "
             << chain_->getDifficulty() << ", " << config_.peers.size()
             << " configured peers";

  auto minerStarted = miner_->start();
  if (!minerStarted) {
    server_.stop();
    return Service::Error(E_STATE, "Failed to start miner: " +
                                       minerStarted.error().message);
  }

  if (config_.mineGenesis && chain_->height() == 0) {
    log().info << "Mining genesis block";
    miner_->submit(config_.genesisData);
  }
  return {};
}

void Node::runLoop() {
  for (const auto &target : config_.peers) {
    spawnWorker([this, target] { dialLoop(target); });
  }

  while (!isStopSet()) {
    try {
      reapWorkers(false);

      auto ready = server_.waitForEvents(ACCEPT_POLL_MS);
      if (!ready) {
        if (ready.error().code != network::TcpServer::E_TIMEOUT) {
          log().warning << "Wait for connections failed: "
                        << ready.error().message;
          std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_MS));
        }
        continue;
      }
      acceptPending();
    } catch (const std::exception &e) {
      log().error << "Exception in accept loop: " << e.what();
    }
  }
}

void Node::onStopRequested() {
  {
    std::lock_guard<std::mutex> lock(waitMutex_);
  }
  waitCv_.notify_all();
  peers_.shutdownAll();
}

void Node::onStop() {
  miner_->stop();
  reapWorkers(true);
  server_.stop();
  log().info << "Node stopped with chain height " << chain_->height();
}

void Node::spawnWorker(std::function<void()> task) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread([this, task = std::move(task), done] {
    try {
      task();
    } catch (const std::exception &e) {
      log().error << "Worker terminated by exception: " << e.what();
    }
    *done = true;
  });

  std::lock_guard<std::mutex> lock(workersMutex_);
  workers_.push_back(Worker{ std::move(thread), done });
}

void Node::reapWorkers(bool all) {
  std::vector<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workersMutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
      if (all || *it->done) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

void Node::acceptPending() {
  while (!isStopSet()) {
    auto accepted = server_.accept();
    if (!accepted) {
      if (accepted.error().code != network::TcpServer::E_WOULD_BLOCK) {
        log().warning << "Accept failed: " << accepted.error().message;
      }
      return;
    }

    auto peer = std::make_shared<Peer>(std::move(accepted.value()), false);
    spawnWorker([this, peer] {
      if (attachPeer(peer)) {
        servePeer(peer);
      }
    });
  }
}

// Returns false when the node is stopping
bool Node::waitReconnectDelay() {
  std::unique_lock<std::mutex> lock(waitMutex_);
  return !waitCv_.wait_for(lock, config_.reconnectDelay,
                           [this] { return isStopSet(); });
}

void Node::dialLoop(const network::IpEndpoint &target) {
  while (!isStopSet()) {
    network::TcpClient client;
    auto connected = client.connect(target);
    if (!connected) {
      log().warning << "Failed to connect to " << target << ": "
                    << connected.error().message << ", retrying in "
                    << config_.reconnectDelay.count() << " ms";
      if (!waitReconnectDelay()) {
        return;
      }
      continue;
    }

    auto released = client.release();
    if (!released) {
      log().warning << "Lost connection to " << target << ": "
                    << released.error().message;
      if (!waitReconnectDelay()) {
        return;
      }
      continue;
    }

    auto peer = std::make_shared<Peer>(std::move(released.value()), true);
    if (!attachPeer(peer)) {
      return;
    }

    auto requested = peer->sendLine(Message::getChainLine());
    if (requested) {
      servePeer(peer);
    } else {
      log().warning << "Failed to request chain from " << target << ": "
                    << requested.error().message;
      peers_.remove(peer);
    }

    if (isStopSet()) {
      return;
    }
    log().info << "Disconnected from " << target << ", reconnecting in "
               << config_.reconnectDelay.count() << " ms";
    if (!waitReconnectDelay()) {
      return;
    }
  }
}

bool Node::attachPeer(const PeerPtr &peer) {
  // Mined blocks are broadcast under the same lock, so a new peer gets the
  // queued blocks before any newer one
  std::lock_guard<std::mutex> lock(pendingMutex_);
  if (!peers_.add(peer)) {
    peer->shutdown();
    return false;
  }
  flushPending(peer);
  return true;
}

// Caller holds pendingMutex_
void Node::flushPending(const PeerPtr &peer) {
  if (pending_.empty()) {
    return;
  }

  log().info << "Sending " << pending_.size() << " queued blocks to "
             << peer->endpoint;
  while (!pending_.empty()) {
    auto sent = peer->sendLine(Message::blockLine(pending_.front()));
    if (!sent) {
      log().warning << "Failed to send queued block to " << peer->endpoint
                    << ": " << sent.error().message;
      peers_.remove(peer);
      return;
    }
    pending_.pop_front();
  }
}

void Node::onBlockMined(const Block &block) {
  std::lock_guard<std::mutex> lock(pendingMutex_);
  size_t sent = broadcastBlock(block);
  if (sent == 0) {
    pending_.push_back(block);
    log().info << "No peer reached, queued block " << block.index << " ("
               << pending_.size() << " queued)";
    return;
  }
  log().info << "Broadcast block " << block.index << " to " << sent
             << " peers";
}

void Node::servePeer(const PeerPtr &peer) {
  network::LineFramer framer(config_.maxMessageBytes);
  SyncSession session;
  std::vector<char> buffer(config_.maxMessageBytes);

  auto onLine = [this, &peer, &session](const std::string &line) {
    try {
      handleMessage(peer, Message::parse(line), session);
    } catch (const std::exception &e) {
      log().error << "Failed to handle message from " << peer->endpoint
                  << ": " << e.what();
    }
  };

  while (!isStopSet()) {
    size_t room = std::min(buffer.size(), framer.writableBytes());
    auto received = peer->connection.receive(buffer.data(), room);
    if (!received) {
      log().info << "Peer " << peer->endpoint
                 << " disconnected: " << received.error().message;
      break;
    }

    auto framed = framer.append(buffer.data(), received.value(), onLine);
    if (!framed) {
      log().warning << "Closing connection to " << peer->endpoint << ": "
                    << framed.error().message;
      break;
    }
  }

  peers_.remove(peer);
}

void Node::handleMessage(const PeerPtr &peer, const Message &message,
                         SyncSession &session) {
  switch (message.type) {
  case Message::Type::BLOCK:
    handleBlock(peer, message.payload, session);
    break;
  case Message::Type::GET_CHAIN:
    handleGetChain(peer);
    break;
  case Message::Type::CHAIN_SYNC_COMPLETE:
    handleSyncComplete(peer, session);
    break;
  default:
    log().warning << "Ignoring unknown message from " << peer->endpoint
                  << ": " << clip(message.payload);
    break;
  }
}

void Node::handleBlock(const PeerPtr &peer, const std::string &payload,
                       SyncSession &session) {
  auto decoded = BlockCodec::decode(payload);
  if (!decoded) {
    log().warning << "Undecodable block from " << peer->endpoint << ": "
                  << decoded.error().message;
    return;
  }
  const Block &block = decoded.value();

  // A run of consecutive blocks from genesis may be a competing chain
  if (block.index == 0) {
    session.candidate.assign(1, block);
  } else if (!session.candidate.empty() &&
             block.index == session.candidate.back().index + 1) {
    session.candidate.push_back(block);
  } else {
    session.candidate.clear();
  }

  auto appended = chain_->append(block);
  if (appended) {
    size_t relayed = broadcastBlock(block, &peer->endpoint);
    log().debug << "Relayed block " << block.index << " to " << relayed
                << " peers";
    return;
  }

  if (appended.error().code == BlockChain::E_INVALID_POW) {
    session.candidate.clear();
  }
}

void Node::handleGetChain(const PeerPtr &peer) {
  auto blocks = chain_->snapshot();
  log().info << "Sending chain of height " << blocks.size() << " to "
             << peer->endpoint;

  for (const auto &block : blocks) {
    auto sent = peer->sendLine(Message::blockLine(block));
    if (!sent) {
      log().warning << "Failed to send chain to " << peer->endpoint << ": "
                    << sent.error().message;
      peers_.remove(peer);
      return;
    }
  }

  auto done = peer->sendLine(Message::syncCompleteLine());
  if (!done) {
    log().warning << "Failed to complete chain sync with " << peer->endpoint
                  << ": " << done.error().message;
    peers_.remove(peer);
  }
}

void Node::handleSyncComplete(const PeerPtr &peer, SyncSession &session) {
  if (session.candidate.empty()) {
    log().debug << "Chain sync with " << peer->endpoint << " complete";
    return;
  }

  auto replaced = chain_->replaceIfLonger(session.candidate);
  if (!replaced) {
    log().warning << "Discarded chain from " << peer->endpoint << ": "
                  << replaced.error().message;
  } else if (replaced.value()) {
    log().info << "Adopted chain of height " << session.candidate.size()
               << " from " << peer->endpoint;
  }
  session.candidate.clear();
}

} // namespace mc
