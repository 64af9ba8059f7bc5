#include "ledger/blockchain.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace Tally::Ledger {

Blockchain Blockchain::genesis()
{
    std::vector<Block> blocks;
    blocks.push_back(Block::create(std::string(kGenesisData), kGenesisTimestamp, std::string(kGenesisPrevHash)));
    return Blockchain(std::move(blocks));
}

Blockchain Blockchain::from_blocks(std::vector<Block> blocks)
{
    return Blockchain(std::move(blocks));
}

std::expected<Blockchain, std::error_code> Blockchain::append(std::string data) const
{
    if (blocks_.empty()) {
        return std::unexpected(make_error_code(Error::EmptyLedger));
    }
    return append_block(Block::create(std::move(data), blocks_.back().hash()));
}

std::expected<Blockchain, std::error_code> Blockchain::append_block(const Block& block) const
{
    if (blocks_.empty()) {
        return std::unexpected(make_error_code(Error::EmptyLedger));
    }
    if (!is_block_valid(block)) {
        return std::unexpected(make_error_code(Error::InvalidBlockHash));
    }
    if (!is_linked(blocks_.back(), block)) {
        return std::unexpected(make_error_code(Error::BrokenLink));
    }

    auto blocks = blocks_;
    blocks.push_back(block);
    return Blockchain(std::move(blocks));
}

bool Blockchain::contains(const std::string& hash) const
{
    return std::ranges::any_of(blocks_, [&](const Block& b) { return b.hash() == hash; });
}

const Block& Blockchain::back() const
{
    if (blocks_.empty()) {
        throw std::out_of_range("Blockchain is empty");
    }
    return blocks_.back();
}

/*
- empty chain: invalid
- single block: valid (genesis is trusted as is)
- otherwise: head must be internally consistent and linked to its successor,
  then the same check continues on the tail.
*/
bool is_chain_valid(const Blockchain& chain)
{
    const auto& blocks = chain.blocks();
    if (blocks.empty()) {
        return false;
    }
    for (size_t i = 0; i + 1 < blocks.size(); ++i) {
        if (!is_block_valid(blocks[i]) || !is_linked(blocks[i], blocks[i + 1])) {
            return false;
        }
    }
    return true;
}

} // namespace Tally::Ledger
