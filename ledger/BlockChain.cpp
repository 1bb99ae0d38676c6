#include "BlockChain.h"
#include "Utilities.h"

#include <sstream>

namespace mc {

BlockChain::BlockChain(uint32_t difficulty)
    : Module("mc.chain"), pow_(difficulty) {}

BlockChain::Roe<void> BlockChain::checkBlock(const Block& block,
                                             const Block* predecessor) const {
    if (!pow_.verify(block)) {
        return Error(E_INVALID_POW, "Block " + std::to_string(block.index) +
                                        " fails proof of work at difficulty " +
                                        std::to_string(pow_.getDifficulty()));
    }

    uint64_t expectedIndex = predecessor ? uint64_t(predecessor->index) + 1 : 0;
    Hash expectedPrev = predecessor ? predecessor->hash : Hash{};
    if (block.index != expectedIndex) {
        return Error(E_DISCONTINUOUS, "Block index " + std::to_string(block.index) +
                                          " where " + std::to_string(expectedIndex) +
                                          " was expected");
    }
    if (block.prevHash != expectedPrev) {
        return Error(E_DISCONTINUOUS, "Block " + std::to_string(block.index) +
                                          " does not link to " + toHex(expectedPrev));
    }
    return {};
}

BlockChain::Roe<void> BlockChain::append(const Block& block) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = checkBlock(block, chain_.empty() ? nullptr : &chain_.back());
    if (!result) {
        log().warning << "Rejected block " << block << ": " << result.error().message;
        return result;
    }
    chain_.push_back(block);
    log().info << "Appended block " << block << ", height " << chain_.size();
    return {};
}

BlockChain::Roe<void> BlockChain::validateChain(const std::vector<Block>& blocks) const {
    const Block* predecessor = nullptr;
    for (const auto& block : blocks) {
        auto result = checkBlock(block, predecessor);
        if (!result) {
            return result;
        }
        predecessor = &block;
    }
    return {};
}

BlockChain::Roe<bool> BlockChain::replaceIfLonger(const std::vector<Block>& candidate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (candidate.size() <= chain_.size()) {
        log().debug << "Kept chain of height " << chain_.size()
                    << " over candidate of height " << candidate.size();
        return false;
    }

    auto valid = validateChain(candidate);
    if (!valid) {
        log().warning << "Rejected candidate chain of height " << candidate.size()
                      << ": " << valid.error().message;
        return Error(E_INVALID_CHAIN, valid.error().message);
    }

    log().info << "Replacing chain of height " << chain_.size()
               << " with candidate of height " << candidate.size();
    chain_ = candidate;
    return true;
}

size_t BlockChain::height() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_.size();
}

std::optional<Block> BlockChain::get(uint64_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= chain_.size()) {
        return std::nullopt;
    }
    return chain_[index];
}

std::optional<Block> BlockChain::tip() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (chain_.empty()) {
        return std::nullopt;
    }
    return chain_.back();
}

std::vector<Block> BlockChain::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_;
}

std::string BlockChain::describe() const {
    auto blocks = snapshot();
    std::ostringstream oss;
    oss << "Chain height " << blocks.size() << ", difficulty " << getDifficulty();
    for (const auto& block : blocks) {
        oss << "\n  Block " << block.index
            << "\n    timestamp: " << block.timestamp
            << "\n    nonce:     " << block.nonce
            << "\n    data:      " << block.data
            << "\n    prev:      " << block.prevHashHex()
            << "\n    hash:      " << block.hashHex();
        for (const auto& tx : block.transactions) {
            oss << "\n    tx:        " << tx.sender << " -> " << tx.receiver
                << " : " << tx.amount;
        }
    }
    return oss.str();
}

Block BlockChain::createNext(const std::string& payload, const Block& predecessor) {
    Block block;
    block.index = predecessor.index + 1;
    block.timestamp = static_cast<uint64_t>(utl::getCurrentTime());
    block.prevHash = predecessor.hash;
    block.data = payload;
    return block;
}

Block BlockChain::createGenesis(const std::string& payload,
                                const std::vector<Transaction>& transactions,
                                uint64_t timestamp) {
    Block block;
    block.timestamp = timestamp;
    block.transactions = transactions;
    block.data = payload;
    return block;
}

} // namespace mc
