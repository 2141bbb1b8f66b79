/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BUILD_RESULT_HPP
#define BUILD_RESULT_HPP

#include <cstdint>
#include <ostream>

namespace Driftwood {

// Outcome of a construction request. Every failure is recoverable.
enum class BuildResult : uint8_t {
    Success = 0,
    UnknownItem,            // item id not in the catalog
    InsufficientResources,  // ledger missing or cannot cover the full cost
    InvalidPlacement,       // occupancy/adjacency violation, or nothing at the target cell
    NoActiveSession         // confirm/cancel while idle
};

inline const char* buildResultToString(BuildResult result) {
    switch (result) {
        case BuildResult::Success: return "Success";
        case BuildResult::UnknownItem: return "UnknownItem";
        case BuildResult::InsufficientResources: return "InsufficientResources";
        case BuildResult::InvalidPlacement: return "InvalidPlacement";
        case BuildResult::NoActiveSession: return "NoActiveSession";
    }
    return "Unknown";
}

// Stream operator for Boost.Test
inline std::ostream& operator<<(std::ostream& os, BuildResult result) {
    return os << buildResultToString(result);
}

} // namespace Driftwood

#endif // BUILD_RESULT_HPP
