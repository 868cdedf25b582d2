#ifndef MEMHIST_HISTORY_PENDING_TRACKER_H
#define MEMHIST_HISTORY_PENDING_TRACKER_H

#include "memhist/core/types.h"
#include "memhist/history/history_types.h"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace memhist {

/**
 * PendingTracker: baselines of the regions registered since the last commit.
 *
 * Snapshots are kept in registration order; the address index only exists to
 * make repeated registration of the same address a no-op.
 */
class PendingTracker {
public:
    // Throws std::bad_alloc.
    void reserve(std::size_t count);

    /**
     * Capture `length` bytes at `address` as the baseline for that address.
     * @return Ok if captured or already tracked, OutOfMemory if the copy could
     *         not be allocated (nothing is registered in that case)
     */
    HistoryError capture(const void* address, std::size_t length);

    bool contains(TrackedAddress address) const;
    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }
    std::size_t byteSize() const noexcept;

    std::vector<RegionSnapshot>& entries() noexcept { return entries_; }
    const std::vector<RegionSnapshot>& entries() const noexcept { return entries_; }

    void clear() noexcept;
    // Like clear(), but also returns the reserved storage.
    void release() noexcept;

private:
    std::vector<RegionSnapshot> entries_;
    std::unordered_map<TrackedAddress, std::size_t> index_;
};

} // namespace memhist

#endif // MEMHIST_HISTORY_PENDING_TRACKER_H
