#ifndef MINICHAIN_MINER_H
#define MINICHAIN_MINER_H

#include "BlockChain.h"
#include "ResultOrError.hpp"
#include "Service.h"
#include "ThreadSafeQueue.hpp"

#include <atomic>
#include <functional>
#include <string>

namespace mc {

/**
 * Turns submitted payloads into mined blocks on top of the chain.
 *
 * Payloads are mined one at a time in the service thread. Each becomes the
 * successor of the current tip, or a genesis block on an empty chain. When
 * the tip moves while a block is being mined, the block is rebuilt on the
 * new tip. stop() cancels an in-flight search.
 */
class Miner : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_CANCELLED = 1;
  static constexpr int32_t E_APPEND = 2;
  static constexpr int32_t E_PAYLOAD = 3;

  // Rebuilds allowed when the tip keeps moving under a block
  static constexpr int MAX_REBUILDS = 8;

  using BlockHandler = std::function<void(const Block &)>;

  explicit Miner(BlockChain &chain);
  ~Miner() override;

  // Called from the mining thread for every block the chain accepted
  void setOnMined(BlockHandler handler) { onMined_ = std::move(handler); }

  void submit(const std::string &payload);

  size_t getPendingCount() const { return queue_.size(); }

  /**
   * Mine one block synchronously and append it.
   * @return the accepted block; E_CANCELLED when stopped meanwhile,
   *         E_PAYLOAD for text peers could not receive unchanged
   */
  Roe<Block> produce(const std::string &payload);

protected:
  Service::Roe<void> onStart() override;
  void runLoop() override;
  void onStopRequested() override;

private:
  BlockChain &chain_;
  ThreadSafeQueue<std::string> queue_;
  std::atomic<bool> cancel_{ false };
  BlockHandler onMined_;
};

} // namespace mc

#endif // MINICHAIN_MINER_H
