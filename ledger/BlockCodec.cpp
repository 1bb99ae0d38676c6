#include "BlockCodec.h"
#include "Utilities.h"

#include <algorithm>
#include <limits>

namespace mc {

namespace {

BlockCodec::Error formatError(const std::string &message) {
  return BlockCodec::Error(BlockCodec::E_INVALID_FORMAT, message);
}

// Unsigned integer field; negative and fractional numbers are wrong types
bool readUnsigned(const nlohmann::json &json, const char *key, uint64_t max,
                  uint64_t &out, std::string &error) {
  auto it = json.find(key);
  if (it == json.end()) {
    return true;
  }
  if (!utl::isNonNegativeInteger(*it)) {
    error = std::string("Field '") + key + "' must be a non-negative integer";
    return false;
  }
  uint64_t value = it->get<uint64_t>();
  if (value > max) {
    error = std::string("Field '") + key + "' is out of range";
    return false;
  }
  out = value;
  return true;
}

bool readHash(const nlohmann::json &json, const char *key, Hash &out,
              std::string &error) {
  auto it = json.find(key);
  if (it == json.end()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("Field '") + key + "' must be a hex string";
    return false;
  }
  auto raw = utl::hexDecode(it->get<std::string>());
  if (!raw) {
    error = std::string("Field '") + key + "': " + raw.error().message;
    return false;
  }
  if (raw->size() != out.size()) {
    error = std::string("Field '") + key + "' must be " +
            std::to_string(out.size()) + " bytes, got " +
            std::to_string(raw->size());
    return false;
  }
  std::copy(raw->begin(), raw->end(), out.begin());
  return true;
}

} // namespace

nlohmann::json BlockCodec::toJson(const Block &block) {
  nlohmann::json transactions = nlohmann::json::array();
  for (const auto &tx : block.transactions) {
    transactions.push_back(
        nlohmann::json{ { "sender", tx.sender },
                        { "receiver", tx.receiver },
                        { "amount", tx.amount } });
  }

  nlohmann::json json;
  json["index"] = block.index;
  json["timestamp"] = block.timestamp;
  json["nonce"] = block.nonce;
  json["data"] = block.data;
  json["prev_hash"] = block.prevHashHex();
  json["hash"] = block.hashHex();
  json["transactions"] = std::move(transactions);
  return json;
}

BlockCodec::Roe<Block> BlockCodec::fromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return formatError("Block must be a JSON object");
  }

  Block block;
  block.data = DEFAULT_DATA;
  std::string error;

  uint64_t index = 0;
  if (!readUnsigned(json, "index", std::numeric_limits<uint32_t>::max(), index,
                    error) ||
      !readUnsigned(json, "timestamp", std::numeric_limits<uint64_t>::max(),
                    block.timestamp, error) ||
      !readUnsigned(json, "nonce", std::numeric_limits<uint64_t>::max(),
                    block.nonce, error) ||
      !readHash(json, "prev_hash", block.prevHash, error) ||
      !readHash(json, "hash", block.hash, error)) {
    return formatError(error);
  }
  block.index = static_cast<uint32_t>(index);

  auto data = json.find("data");
  if (data != json.end()) {
    if (!data->is_string()) {
      return formatError("Field 'data' must be a string");
    }
    block.data = data->get<std::string>();
  }

  auto transactions = json.find("transactions");
  if (transactions != json.end()) {
    if (!transactions->is_array()) {
      return formatError("Field 'transactions' must be an array");
    }
    for (size_t i = 0; i < transactions->size(); ++i) {
      const auto &item = (*transactions)[i];
      std::string where = "Transaction " + std::to_string(i);
      if (!item.is_object()) {
        return formatError(where + " must be an object");
      }
      if (!item.contains("sender") || !item.contains("receiver") ||
          !item.contains("amount")) {
        return formatError(where + " needs sender, receiver and amount");
      }
      if (!item["sender"].is_string() || !item["receiver"].is_string()) {
        return formatError(where + " sender and receiver must be strings");
      }
      if (!utl::isNonNegativeInteger(item["amount"])) {
        return formatError(where + " amount must be a non-negative integer");
      }
      block.transactions.push_back({ item["sender"].get<std::string>(),
                                     item["receiver"].get<std::string>(),
                                     item["amount"].get<uint64_t>() });
    }
  }

  return block;
}

bool BlockCodec::isEncodable(const std::string &text) {
  try {
    nlohmann::json(text).dump();
  } catch (const nlohmann::json::type_error &) {
    return false;
  }
  return true;
}

std::string BlockCodec::encode(const Block &block) {
  return toJson(block).dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace);
}

BlockCodec::Roe<Block> BlockCodec::decode(const std::string &text) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    return formatError(std::string("Failed to parse block JSON: ") + e.what());
  }
  return fromJson(json);
}

} // namespace mc
