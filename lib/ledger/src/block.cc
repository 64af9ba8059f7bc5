#include "ledger/block.hpp"
#include "crypto/hash.hpp"
#include <chrono>
#include <utility>

namespace Tally::Ledger {

namespace {
    int64_t now_seconds()
    {
        using namespace std::chrono;
        return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    }
} // namespace

std::string compute_hash(const std::string& data, int64_t timestamp, const std::string& prev_hash)
{
    std::string preimage;
    preimage.reserve(data.size() + 20 + prev_hash.size());
    preimage.append(data);
    preimage.append(std::to_string(timestamp));
    preimage.append(prev_hash);
    return Crypto::sha256_hex(preimage);
}

Block Block::create(std::string data, std::string prev_hash)
{
    return create(std::move(data), now_seconds(), std::move(prev_hash));
}

Block Block::create(std::string data, int64_t timestamp, std::string prev_hash)
{
    auto hash = compute_hash(data, timestamp, prev_hash);
    return Block(std::move(data), timestamp, std::move(prev_hash), std::move(hash));
}

Block Block::restore(std::string data, int64_t timestamp, std::string prev_hash, std::string hash)
{
    return Block(std::move(data), timestamp, std::move(prev_hash), std::move(hash));
}

bool is_block_valid(const Block& block)
{
    return block.hash() == compute_hash(block.data(), block.timestamp(), block.prev_hash());
}

bool is_linked(const Block& prev, const Block& next)
{
    return next.prev_hash() == prev.hash();
}

} // namespace Tally::Ledger
