#include "Message.h"
#include "BlockCodec.h"

namespace mc {

static bool startsWith(const std::string &s, const char *prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

Message Message::parse(const std::string &line) {
  Message message;
  if (startsWith(line, BLOCK_PREFIX)) {
    message.type = Type::BLOCK;
    message.payload = line.substr(std::char_traits<char>::length(BLOCK_PREFIX));
  } else if (startsWith(line, GET_CHAIN)) {
    message.type = Type::GET_CHAIN;
  } else if (line == CHAIN_SYNC_COMPLETE) {
    message.type = Type::CHAIN_SYNC_COMPLETE;
  } else {
    message.payload = line;
  }
  return message;
}

std::string Message::blockLine(const Block &block) {
  return std::string(BLOCK_PREFIX) + BlockCodec::encode(block) + "\n";
}

std::string Message::getChainLine() { return std::string(GET_CHAIN) + "\n"; }

std::string Message::syncCompleteLine() {
  return std::string(CHAIN_SYNC_COMPLETE) + "\n";
}

const char *Message::typeName(Type type) {
  switch (type) {
  case Type::BLOCK:
    return "BLOCK";
  case Type::GET_CHAIN:
    return "GET_CHAIN";
  case Type::CHAIN_SYNC_COMPLETE:
    return "CHAIN_SYNC_COMPLETE";
  default:
    return "UNKNOWN";
  }
}

} // namespace mc
