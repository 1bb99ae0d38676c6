#ifndef MINICHAIN_MESSAGE_H
#define MINICHAIN_MESSAGE_H

#include "Block.h"

#include <string>

namespace mc {

/**
 * One line of the peer protocol, without its '\n' terminator.
 *
 *   BLOCK:<json>          a block (see BlockCodec)
 *   GET_CHAIN             ask the peer for its whole chain
 *   CHAIN_SYNC_COMPLETE   end of a GET_CHAIN reply
 *
 * Anything else parses as UNKNOWN and carries the raw line.
 */
struct Message {
  enum class Type { BLOCK, GET_CHAIN, CHAIN_SYNC_COMPLETE, UNKNOWN };

  static constexpr const char *BLOCK_PREFIX = "BLOCK:";
  static constexpr const char *GET_CHAIN = "GET_CHAIN";
  static constexpr const char *CHAIN_SYNC_COMPLETE = "CHAIN_SYNC_COMPLETE";

  Type type{ Type::UNKNOWN };
  // Block JSON for BLOCK, the whole line for UNKNOWN, empty otherwise
  std::string payload;

  static Message parse(const std::string &line);

  // Terminated wire lines
  static std::string blockLine(const Block &block);
  static std::string getChainLine();
  static std::string syncCompleteLine();

  static const char *typeName(Type type);
};

} // namespace mc

#endif // MINICHAIN_MESSAGE_H
