#pragma once

#include "core/pbft/messages.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Tally::BFT::PBFT {

class Node;
struct Transition;

enum class Behavior : std::uint8_t {
    Honest,
    Byzantine, // silent fork on PRE-PREPARE, ignores everything else
    Randomized, // per message: obey, vote for a forged block, or stay silent
};

std::string_view to_string(Behavior behavior);

/**
 * @brief How a node reacts to one protocol message
 *
 * Implementations are stateless: everything a reaction depends on lives in
 * the Node and the message, and the reaction is returned as a new Node plus
 * the envelopes to send.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    [[nodiscard]] virtual Transition handle(const Node& node, const PBFTMessage& msg) const = 0;
    [[nodiscard]] virtual Behavior behavior() const noexcept = 0;
};

class HonestStrategy final : public Strategy {
public:
    [[nodiscard]] Transition handle(const Node& node, const PBFTMessage& msg) const override;
    [[nodiscard]] Behavior behavior() const noexcept override { return Behavior::Honest; }

private:
    Transition on_pre_prepare(const Node& node, const PBFTMessage& msg, const PrePreparePayload& p) const;
    Transition on_prepare(const Node& node, const PBFTMessage& msg, const PreparePayload& p) const;
    Transition on_commit(const Node& node, const PBFTMessage& msg, const CommitPayload& p) const;
};

class ByzantineStrategy final : public Strategy {
public:
    static constexpr int kForkCount = 3;

    [[nodiscard]] Transition handle(const Node& node, const PBFTMessage& msg) const override;
    [[nodiscard]] Behavior behavior() const noexcept override { return Behavior::Byzantine; }
};

class RandomFaultStrategy final : public Strategy {
public:
    enum class Action : std::uint8_t {
        Obey,
        ConflictingVote,
        Silent,
    };

    explicit RandomFaultStrategy(uint64_t seed)
        : seed_(seed)
    {
    }

    [[nodiscard]] Transition handle(const Node& node, const PBFTMessage& msg) const override;
    [[nodiscard]] Behavior behavior() const noexcept override { return Behavior::Randomized; }

    // Same seed, node and message always give the same action
    [[nodiscard]] Action choose(const Node& node, const PBFTMessage& msg) const;

private:
    uint64_t seed_;
    HonestStrategy honest_;
};

// Payload of the i-th block forged by node `id`
[[nodiscard]]
std::string forged_payload(NodeId id, int i);

[[nodiscard]]
std::shared_ptr<const Strategy> make_strategy(Behavior behavior, uint64_t seed = 0);

} // namespace Tally::BFT::PBFT
