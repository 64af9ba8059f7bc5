#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Tally::BFT {
enum class Error : std::uint8_t {
    Success = 0,
    InsufficientNodes, // N <= 3f
    InvalidFaultTolerance, // f < 0
    InvalidNodeId, // id 不在 [1, N]
    EmptyProposal, // 没有要共识的区块
};

class BFTErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "TallyBFT"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::InsufficientNodes:
            return "Total nodes must be greater than 3f";
        case Error::InvalidFaultTolerance:
            return "Fault tolerance f must not be negative";
        case Error::InvalidNodeId:
            return "Node id must be between 1 and total nodes";
        case Error::EmptyProposal:
            return "At least one block must be proposed";
        default:
            return "Unknown BFT error";
        }
    }
};

inline const std::error_category& bft_category()
{
    static BFTErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), bft_category() };
}
} // namespace Tally::BFT

namespace std {
template <>
struct is_error_code_enum<Tally::BFT::Error> : true_type { };
} // namespace std
