#ifndef MINICHAIN_PROOF_OF_WORK_H
#define MINICHAIN_PROOF_OF_WORK_H

#include "Block.h"

#include <atomic>
#include <cstdint>

namespace mc {

/**
 * Leading-zero-bytes proof of work over SHA-256.
 *
 * The hash input is, in order: index (LE u32), timestamp (LE u64),
 * nonce (LE u64), the 32 prev_hash bytes, then sender, receiver and
 * amount (LE u64) of each transaction, and finally the data bytes.
 * The hash field never hashes itself.
 */
class ProofOfWork {
public:
  static constexpr uint32_t MAX_DIFFICULTY = 32;

  // Mining loop iterations between two looks at the cancel flag
  static constexpr uint64_t CANCEL_CHECK_INTERVAL = 1024;

  explicit ProofOfWork(uint32_t difficulty);

  static Hash computeHash(const Block &block);

  // True iff the first min(difficulty, 32) bytes are zero
  static bool meetsDifficulty(const Hash &hash, uint32_t difficulty);

  /**
   * Search nonces upwards from block.nonce until the hash meets difficulty,
   * then store it in block.hash.
   * @param cancel Optional flag, polled periodically; when it becomes true
   *               the search stops and block.hash is left untouched
   * @param attempts Optional output, number of hashes computed
   * @return false only when cancelled
   */
  static bool mine(Block &block, uint32_t difficulty,
                   const std::atomic<bool> *cancel = nullptr,
                   uint64_t *attempts = nullptr);

  // Stored hash equals the recomputed one and meets this difficulty
  bool verify(const Block &block) const;

  uint32_t getDifficulty() const { return difficulty_; }

private:
  uint32_t difficulty_;
};

} // namespace mc

#endif // MINICHAIN_PROOF_OF_WORK_H
