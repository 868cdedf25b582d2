#ifndef MEMHIST_HISTORY_CONFIG_H
#define MEMHIST_HISTORY_CONFIG_H

#include "memhist/core/types.h"
#include <cstddef>

namespace memhist {

inline constexpr std::size_t kDefaultUndoCapacityHint = 64;
inline constexpr std::size_t kDefaultRedoCapacityHint = 64;
inline constexpr std::size_t kDefaultScratchCapacity = 4096;
inline constexpr std::size_t kDefaultPendingCapacityHint = 32;

// Sizing for a HistoryManager. The stack and pending values are reservation
// hints only; scratchCapacity is the hard ceiling on a single region's length.
struct HistoryConfig {
    std::size_t undoCapacityHint = kDefaultUndoCapacityHint;
    std::size_t redoCapacityHint = kDefaultRedoCapacityHint;
    std::size_t scratchCapacity = kDefaultScratchCapacity;
    std::size_t pendingCapacityHint = kDefaultPendingCapacityHint;
};

inline HistoryError validateConfig(const HistoryConfig& config) noexcept {
    if (config.scratchCapacity == 0) return HistoryError::InvalidConfig;
    return HistoryError::Ok;
}

} // namespace memhist

#endif // MEMHIST_HISTORY_CONFIG_H
