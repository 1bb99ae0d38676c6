#ifndef MINICHAIN_NODE_H
#define MINICHAIN_NODE_H

#include "BlockChain.h"
#include "LineFramer.h"
#include "Message.h"
#include "Miner.h"
#include "PeerList.h"
#include "ResultOrError.hpp"
#include "Service.h"
#include "TcpServer.h"
#include "Types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mc {

/**
 * A peer-to-peer chain node.
 *
 * The service thread accepts inbound connections; every connection gets a
 * reader thread and every configured peer a dialer thread that reconnects
 * after a fixed delay. Blocks received from a peer are appended and relayed
 * to all other peers. Locally mined blocks are broadcast, or queued until a
 * peer connects when nobody is there to receive them.
 */
class Node : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_CONFIG = 1;
  static constexpr int32_t E_NETWORK = 2;
  static constexpr int32_t E_STATE = 3;

  static constexpr const char *DEFAULT_HOST = "0.0.0.0";
  static constexpr uint16_t DEFAULT_PORT = 8000;
  static constexpr uint32_t DEFAULT_DIFFICULTY = 2;
  static constexpr int64_t DEFAULT_RECONNECT_DELAY_MS = 5000;
  static constexpr const char *DEFAULT_GENESIS_DATA = "Hello, Chain!";

  struct Config {
    network::IpEndpoint endpoint{ DEFAULT_HOST, DEFAULT_PORT };
    std::vector<network::IpEndpoint> peers;
    uint32_t difficulty{ DEFAULT_DIFFICULTY };
    std::chrono::milliseconds reconnectDelay{ DEFAULT_RECONNECT_DELAY_MS };
    size_t maxMessageBytes{ network::LineFramer::DEFAULT_CAPACITY };
    bool mineGenesis{ false };
    std::string genesisData{ DEFAULT_GENESIS_DATA };

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  Node();
  ~Node() override;

  /**
   * Apply configuration and create the chain. Only while stopped.
   */
  Roe<void> init(const Config &config);

  const Config &getConfig() const { return config_; }

  // Queue a payload for the miner
  void submitData(const std::string &payload);

  /**
   * Send block to every peer except exclude.
   * @return number of peers reached
   */
  size_t broadcastBlock(const Block &block,
                        const network::IpEndpoint *exclude = nullptr);

  BlockChain &getChain();
  const BlockChain &getChain() const;

  std::vector<network::IpEndpoint> getPeers() const { return peers_.endpoints(); }

  // Actual listening port, valid after start()
  uint16_t getListenPort() const { return server_.getPort(); }

  size_t getPendingCount() const;

protected:
  Service::Roe<void> onStart() override;
  void runLoop() override;
  void onStopRequested() override;
  void onStop() override;

private:
  // Blocks of a peer's GET_CHAIN reply that did not fit our chain
  struct SyncSession {
    std::vector<Block> candidate;
  };

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void createChain();

  void spawnWorker(std::function<void()> task);
  void reapWorkers(bool all);

  void acceptPending();
  void dialLoop(const network::IpEndpoint &target);
  bool waitReconnectDelay();

  bool attachPeer(const PeerPtr &peer);
  void servePeer(const PeerPtr &peer);
  void flushPending(const PeerPtr &peer);

  void handleMessage(const PeerPtr &peer, const Message &message,
                     SyncSession &session);
  void handleBlock(const PeerPtr &peer, const std::string &payload,
                   SyncSession &session);
  void handleGetChain(const PeerPtr &peer);
  void handleSyncComplete(const PeerPtr &peer, SyncSession &session);

  void onBlockMined(const Block &block);

  Config config_;
  std::unique_ptr<BlockChain> chain_;
  std::unique_ptr<Miner> miner_;
  network::TcpServer server_;
  PeerList peers_;

  mutable std::mutex pendingMutex_;
  std::deque<Block> pending_;

  std::mutex workersMutex_;
  std::vector<Worker> workers_;

  std::mutex waitMutex_;
  std::condition_variable waitCv_;
};

} // namespace mc

#endif // MINICHAIN_NODE_H
