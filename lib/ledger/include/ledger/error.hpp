#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Tally::Ledger {
enum class Error : std::uint8_t {
    Success = 0,
    EmptyLedger, // 没有尾块可以链接
    InvalidBlockHash, // hash 与内容不一致
    BrokenLink, // prev_hash 与尾块 hash 不一致
};

class LedgerErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "TallyLedger"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EmptyLedger:
            return "Ledger has no blocks to link against";
        case Error::InvalidBlockHash:
            return "Block hash does not match its contents";
        case Error::BrokenLink:
            return "Block does not link to the ledger tail";
        default:
            return "Unknown ledger error";
        }
    }
};

inline const std::error_category& ledger_category()
{
    static LedgerErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), ledger_category() };
}
} // namespace Tally::Ledger

namespace std {
template <>
struct is_error_code_enum<Tally::Ledger::Error> : true_type { };
} // namespace std
