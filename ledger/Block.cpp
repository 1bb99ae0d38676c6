#include "Block.h"
#include "Utilities.h"

#include <sstream>

namespace mc {

std::string toHex(const Hash &hash) {
  return utl::hexEncode(hash.data(), hash.size());
}

bool Block::operator==(const Block &other) const {
  return index == other.index && timestamp == other.timestamp &&
         nonce == other.nonce && prevHash == other.prevHash &&
         hash == other.hash && data == other.data &&
         transactions == other.transactions;
}

std::string Block::hashHex() const { return toHex(hash); }

std::string Block::prevHashHex() const { return toHex(prevHash); }

std::string Block::toString() const {
  std::ostringstream oss;
  oss << "#" << index << " " << hashHex().substr(0, 16) << " (nonce " << nonce
      << ", " << transactions.size() << " tx, " << data.size() << " bytes)";
  return oss.str();
}

std::ostream &operator<<(std::ostream &os, const Block &block) {
  return os << block.toString();
}

} // namespace mc
