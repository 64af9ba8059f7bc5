#pragma once

#include "core/error.hpp"
#include <expected>
#include <system_error>

namespace Tally::BFT {

/// Node identifier type, 1-based
using NodeId = int;

/// System-wide configuration parameters
struct SystemContext {
    int N; ///< Total number of nodes
    int f; ///< Maximum number of Byzantine faults tolerated

    /// Rejects configurations that cannot tolerate f faults (N <= 3f)
    [[nodiscard]] static std::expected<SystemContext, std::error_code> create(int N, int f)
    {
        if (f < 0) {
            return std::unexpected(make_error_code(Error::InvalidFaultTolerance));
        }
        if (N <= 3 * f || N < 1) {
            return std::unexpected(make_error_code(Error::InsufficientNodes));
        }
        return SystemContext { .N = N, .f = f };
    }

    /// Unique votes a single block hash needs to advance a phase
    [[nodiscard]] int quorum() const noexcept { return N - f - 1; }
};

} // namespace Tally::BFT
