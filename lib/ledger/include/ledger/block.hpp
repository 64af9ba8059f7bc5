#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Tally::Ledger {

class Block {
public:
    // 以系统时钟 (Unix 秒) 作为时间戳
    [[nodiscard]]
    static Block create(std::string data, std::string prev_hash);

    [[nodiscard]]
    static Block create(std::string data, int64_t timestamp, std::string prev_hash);

    // Rebuilds a block from stored fields without recomputing the hash.
    // The result may be inconsistent; check it with is_block_valid().
    [[nodiscard]]
    static Block restore(std::string data, int64_t timestamp, std::string prev_hash, std::string hash);

    [[nodiscard]] const std::string& data() const noexcept { return data_; }
    [[nodiscard]] int64_t timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] const std::string& prev_hash() const noexcept { return prev_hash_; }
    [[nodiscard]] const std::string& hash() const noexcept { return hash_; }

    bool operator==(const Block&) const = default;

private:
    Block(std::string data, int64_t timestamp, std::string prev_hash, std::string hash)
        : data_(std::move(data))
        , timestamp_(timestamp)
        , prev_hash_(std::move(prev_hash))
        , hash_(std::move(hash))
    {
    }

    std::string data_;
    int64_t timestamp_;
    std::string prev_hash_;
    std::string hash_;
};

// SHA256(data ++ decimal(timestamp) ++ prev_hash), lowercase hex
[[nodiscard]]
std::string compute_hash(const std::string& data, int64_t timestamp, const std::string& prev_hash);

[[nodiscard]]
bool is_block_valid(const Block& block);

// next 是否以 prev 为前驱
[[nodiscard]]
bool is_linked(const Block& prev, const Block& next);

} // namespace Tally::Ledger
