#ifndef MINICHAIN_BLOCK_H
#define MINICHAIN_BLOCK_H

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace mc {

using Hash = std::array<uint8_t, 32>;

struct Transaction {
  std::string sender;
  std::string receiver;
  uint64_t amount{ 0 };

  bool operator==(const Transaction &other) const {
    return amount == other.amount && sender == other.sender &&
           receiver == other.receiver;
  }
  bool operator!=(const Transaction &other) const { return !(*this == other); }
};

/**
 * A block as mined, stored and exchanged.
 *
 * hash is only meaningful after mining; it covers every other field
 * (see ProofOfWork::computeHash). prevHash is all zero for genesis.
 */
struct Block {
  uint32_t index{ 0 };
  uint64_t timestamp{ 0 };
  Hash prevHash{};
  std::vector<Transaction> transactions;
  uint64_t nonce{ 0 };
  std::string data;
  Hash hash{};

  bool operator==(const Block &other) const;
  bool operator!=(const Block &other) const { return !(*this == other); }

  std::string hashHex() const;
  std::string prevHashHex() const;

  // One-line summary for logs
  std::string toString() const;
};

std::string toHex(const Hash &hash);

std::ostream &operator<<(std::ostream &os, const Block &block);

} // namespace mc

#endif // MINICHAIN_BLOCK_H
