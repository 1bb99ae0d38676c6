#pragma once

#include "Block.h"
#include "Module.h"
#include "ProofOfWork.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mc {

/**
 * In-memory chain of accepted blocks, index 0 = genesis.
 *
 * Every block admitted by append() or replaceIfLonger() has passed
 * proof-of-work verification at the chain's difficulty and links to its
 * predecessor (index + 1, prev_hash == predecessor hash). All members are
 * thread-safe; readers receive copies.
 */
class BlockChain : public Module {
public:
    struct Error : RoeErrorBase {
        using RoeErrorBase::RoeErrorBase;
    };

    template <typename T> using Roe = ResultOrError<T, Error>;

    static constexpr int32_t E_INVALID_POW = 1;
    static constexpr int32_t E_DISCONTINUOUS = 2;
    static constexpr int32_t E_INVALID_CHAIN = 3;

    explicit BlockChain(uint32_t difficulty);
    ~BlockChain() override = default;

    /**
     * Admit one block at the tip.
     * Fails with E_INVALID_POW or E_DISCONTINUOUS and leaves the chain as is.
     */
    Roe<void> append(const Block& block);

    /**
     * Longest-chain rule. A candidate longer than the current chain is fully
     * re-validated and then adopted as a whole.
     * @return true if adopted, false if not longer;
     *         E_INVALID_CHAIN when longer but invalid
     */
    Roe<bool> replaceIfLonger(const std::vector<Block>& candidate);

    /**
     * Check a whole chain from genesis: proof of work and linkage
     */
    Roe<void> validateChain(const std::vector<Block>& blocks) const;

    size_t height() const;
    std::optional<Block> get(uint64_t index) const;
    std::optional<Block> tip() const;
    std::vector<Block> snapshot() const;

    uint32_t getDifficulty() const { return pow_.getDifficulty(); }

    // Human-readable dump of every block
    std::string describe() const;

    /**
     * Unmined successor of predecessor: index + 1, timestamp now,
     * prev_hash = predecessor hash, no transactions, nonce 0, zero hash.
     */
    static Block createNext(const std::string& payload, const Block& predecessor);

    static Block createGenesis(const std::string& payload,
                               const std::vector<Transaction>& transactions,
                               uint64_t timestamp);

private:
    Roe<void> checkBlock(const Block& block, const Block* predecessor) const;

    ProofOfWork pow_;
    mutable std::mutex mutex_;
    std::vector<Block> chain_;
};

} // namespace mc
