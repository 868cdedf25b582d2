#ifndef MEMHIST_HISTORY_TYPES_H
#define MEMHIST_HISTORY_TYPES_H

#include "memhist/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace memhist {

// Bytes captured from a tracked region at registration time.
struct RegionSnapshot {
    TrackedAddress address = 0;
    std::vector<std::uint8_t> bytes;
};

// One entry of a committed batch. `bytes` always holds the state to restore
// at `address` when the change is applied; applying it swaps in the live bytes,
// so the meaning flips every time the batch moves between stacks.
struct HistoryChange {
    TrackedAddress address = 0;
    std::vector<std::uint8_t> bytes;
};

// A single entry in the undo/redo stacks. Changes keep commit order on both
// stacks; undo replays them back to front and redo front to back. Replaying
// back to front in both directions would leave the wrong bytes on redo when
// two regions of one batch overlap (a struct and one of its fields).
struct HistoryBatch {
    std::vector<HistoryChange> changes;
    std::string label;

    std::size_t byteSize() const noexcept {
        std::size_t total = 0;
        for (const auto& change : changes) total += change.bytes.size();
        return total;
    }
};

} // namespace memhist

#endif // MEMHIST_HISTORY_TYPES_H
