#ifndef MINICHAIN_BLOCK_CODEC_H
#define MINICHAIN_BLOCK_CODEC_H

#include "Block.h"
#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace mc {

/**
 * JSON text form of a block, as carried after "BLOCK:" on the wire.
 *
 * {"index":1,"timestamp":...,"nonce":...,"data":"...",
 *  "prev_hash":"<64 hex>","hash":"<64 hex>",
 *  "transactions":[{"sender":"..","receiver":"..","amount":..}]}
 *
 * Every field is optional on decode; a present field must have the right
 * type. Strings travel verbatim, so the decoded block hashes the same as
 * the one its miner sealed.
 */
class BlockCodec {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr int32_t E_INVALID_FORMAT = 1;

  // Data given to blocks that arrive without one
  static constexpr const char *DEFAULT_DATA = "P2P Received Block";

  static nlohmann::json toJson(const Block &block);
  static Roe<Block> fromJson(const nlohmann::json &json);

  // False for text that is not valid UTF-8 and cannot be carried verbatim
  static bool isEncodable(const std::string &text);

  // Compact single-line text. Invalid UTF-8 is replaced, never thrown.
  static std::string encode(const Block &block);
  static Roe<Block> decode(const std::string &text);
};

} // namespace mc

#endif // MINICHAIN_BLOCK_CODEC_H
