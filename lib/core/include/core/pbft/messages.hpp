#pragma once

#include "core/common.hpp"
#include "ledger/block.hpp"
#include <cstdint>
#include <string_view>
#include <variant>

namespace Tally::BFT::PBFT {

using Ledger::Block;

struct PrePreparePayload {
    Block block;
};

struct PreparePayload {
    Block block;
};

struct CommitPayload {
    Block block;
};

using PBFTPayload = std::variant<PrePreparePayload, PreparePayload, CommitPayload>;

struct PBFTMessage {
    NodeId sender;
    int view;
    PBFTPayload payload;

    [[nodiscard]] const Block& block() const
    {
        return std::visit([](const auto& p) -> const Block& { return p.block; }, payload);
    }
};

// Opaque delivery target. Its meaning belongs to the transport that issued it.
struct PeerHandle {
    uint64_t value;

    bool operator==(const PeerHandle&) const = default;
};

// Outbound message already resolved against the sender's peer directory
struct Envelope {
    NodeId target;
    PeerHandle handle;
    PBFTMessage msg;
};

inline std::string_view kind_name(const PBFTPayload& payload)
{
    if (std::holds_alternative<PrePreparePayload>(payload))
        return "PRE-PREPARE";
    if (std::holds_alternative<PreparePayload>(payload))
        return "PREPARE";
    return "COMMIT";
}

} // namespace Tally::BFT::PBFT
