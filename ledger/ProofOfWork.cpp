#include "ProofOfWork.h"
#include "ByteOrder.hpp"
#include "Sha256.h"

#include <algorithm>

namespace mc {

namespace {

template <size_t N>
void feed(Sha256 &hasher, const std::array<uint8_t, N> &bytes) {
  hasher.update(bytes.data(), bytes.size());
}

Hash hashWith(Sha256 &hasher, const Block &block) {
  feed(hasher, utl::toBytes(block.index));
  feed(hasher, utl::toBytes(block.timestamp));
  feed(hasher, utl::toBytes(block.nonce));
  feed(hasher, block.prevHash);
  for (const auto &tx : block.transactions) {
    hasher.update(tx.sender);
    hasher.update(tx.receiver);
    feed(hasher, utl::toBytes(tx.amount));
  }
  hasher.update(block.data);
  return hasher.finalize();
}

} // namespace

ProofOfWork::ProofOfWork(uint32_t difficulty)
    : difficulty_(std::min(difficulty, MAX_DIFFICULTY)) {}

Hash ProofOfWork::computeHash(const Block &block) {
  Sha256 hasher;
  return hashWith(hasher, block);
}

bool ProofOfWork::meetsDifficulty(const Hash &hash, uint32_t difficulty) {
  uint32_t zeros = std::min(difficulty, MAX_DIFFICULTY);
  return std::all_of(hash.begin(), hash.begin() + zeros,
                     [](uint8_t b) { return b == 0; });
}

bool ProofOfWork::mine(Block &block, uint32_t difficulty,
                       const std::atomic<bool> *cancel, uint64_t *attempts) {
  Sha256 hasher;
  uint64_t count = 0;
  while (true) {
    if (cancel && count % CANCEL_CHECK_INTERVAL == 0 && cancel->load()) {
      if (attempts) {
        *attempts = count;
      }
      return false;
    }
    Hash candidate = hashWith(hasher, block);
    ++count;
    if (meetsDifficulty(candidate, difficulty)) {
      block.hash = candidate;
      if (attempts) {
        *attempts = count;
      }
      return true;
    }
    ++block.nonce;
  }
}

bool ProofOfWork::verify(const Block &block) const {
  return computeHash(block) == block.hash &&
         meetsDifficulty(block.hash, difficulty_);
}

} // namespace mc
