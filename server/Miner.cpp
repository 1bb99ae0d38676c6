#include "Miner.h"
#include "BlockCodec.h"
#include "ProofOfWork.h"
#include "Utilities.h"

#include <chrono>

namespace mc {

Miner::Miner(BlockChain &chain) : Service("mc.miner"), chain_(chain) {}

Miner::~Miner() { stop(); }

void Miner::submit(const std::string &payload) {
  queue_.push(payload);
  log().debug << "Queued payload (" << payload.size() << " bytes), "
              << queue_.size() << " pending";
}

Miner::Roe<Block> Miner::produce(const std::string &payload) {
  if (!BlockCodec::isEncodable(payload)) {
    return Error(E_PAYLOAD, "Payload is not valid UTF-8 text");
  }
  for (int attempt = 0; attempt <= MAX_REBUILDS; ++attempt) {
    auto tip = chain_.tip();
    Block block = tip ? BlockChain::createNext(payload, *tip)
                      : BlockChain::createGenesis(
                            payload, {},
                            static_cast<uint64_t>(utl::getCurrentTime()));

    uint64_t attempts = 0;
    auto started = std::chrono::steady_clock::now();
    if (!ProofOfWork::mine(block, chain_.getDifficulty(), &cancel_,
                           &attempts)) {
      return Error(E_CANCELLED, "Mining of block " +
                                    std::to_string(block.index) +
                                    " cancelled");
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    log().info << "Mined block " << block.index << " after " << attempts
               << " attempts in " << elapsed.count() << " ms";

    auto appended = chain_.append(block);
    if (appended) {
      if (onMined_) {
        onMined_(block);
      }
      return block;
    }
    if (appended.error().code != BlockChain::E_DISCONTINUOUS) {
      return Error(E_APPEND, appended.error().message);
    }
    log().info << "Tip moved while mining block " << block.index
               << ", rebuilding";
  }
  return Error(E_APPEND, "Tip kept moving, gave up after " +
                             std::to_string(MAX_REBUILDS) + " rebuilds");
}

Service::Roe<void> Miner::onStart() {
  cancel_ = false;
  return {};
}

void Miner::runLoop() {
  while (!isStopSet()) {
    std::string payload;
    if (!queue_.waitPoll(payload, std::chrono::milliseconds(100))) {
      continue;
    }
    try {
      auto result = produce(payload);
      if (!result) {
        log().warning << "Dropped payload: " << result.error().message;
      }
    } catch (const std::exception &e) {
      log().error << "Exception while mining: " << e.what();
    }
  }
}

void Miner::onStopRequested() { cancel_ = true; }

} // namespace mc
