#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "ledger/block.hpp"
#include "ledger/error.hpp"

namespace Tally::Ledger {

inline constexpr std::string_view kGenesisData = "Genesis Block";
inline constexpr std::string_view kGenesisPrevHash = "0";
// Every node must derive the same genesis hash, so its timestamp is fixed.
inline constexpr int64_t kGenesisTimestamp = 0;

/**
 * @brief Append-only, hash-linked sequence of blocks.
 *
 * Values are immutable: append operations return a new chain and leave the
 * original untouched.
 */
class Blockchain {
public:
    Blockchain() = default;

    /**
     * @brief One-block chain holding the genesis block
     */
    [[nodiscard]] static Blockchain genesis();

    /**
     * @brief Wrap an arbitrary block sequence (e.g. loaded or received), unvalidated
     */
    [[nodiscard]] static Blockchain from_blocks(std::vector<Block> blocks);

    /**
     * @brief Mint a new block on top of the tail
     * @return EmptyLedger if there is no tail
     */
    [[nodiscard]] std::expected<Blockchain, std::error_code> append(std::string data) const;

    /**
     * @brief Append an already built block
     * @return InvalidBlockHash, BrokenLink or EmptyLedger on rejection
     */
    [[nodiscard]] std::expected<Blockchain, std::error_code> append_block(const Block& block) const;

    [[nodiscard]] bool contains(const std::string& hash) const;

    [[nodiscard]] const std::vector<Block>& blocks() const noexcept { return blocks_; }
    [[nodiscard]] size_t size() const noexcept { return blocks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return blocks_.empty(); }

    // Throws std::out_of_range on an empty chain.
    [[nodiscard]] const Block& back() const;

    bool operator==(const Blockchain&) const = default;

private:
    explicit Blockchain(std::vector<Block> blocks)
        : blocks_(std::move(blocks))
    {
    }

    std::vector<Block> blocks_;
};

[[nodiscard]]
bool is_chain_valid(const Blockchain& chain);

} // namespace Tally::Ledger
