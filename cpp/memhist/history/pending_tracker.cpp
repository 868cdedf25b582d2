#include "memhist/history/pending_tracker.h"
#include "memhist/core/logging.h"
#include <new>
#include <utility>

namespace memhist {

void PendingTracker::reserve(std::size_t count) {
    entries_.reserve(count);
    index_.reserve(count);
}

HistoryError PendingTracker::capture(const void* address, std::size_t length) {
    const TrackedAddress key = toTrackedAddress(address);
    if (index_.find(key) != index_.end()) return HistoryError::Ok;

    const auto* src = static_cast<const std::uint8_t*>(address);
    try {
        RegionSnapshot snap{};
        snap.address = key;
        snap.bytes.assign(src, src + length);
        entries_.push_back(std::move(snap));
    } catch (const std::bad_alloc&) {
        MEMHIST_LOG_WARN("pending: out of memory capturing %zu bytes", length);
        return HistoryError::OutOfMemory;
    }

    try {
        index_.emplace(key, entries_.size() - 1);
    } catch (const std::bad_alloc&) {
        entries_.pop_back();
        MEMHIST_LOG_WARN("pending: out of memory indexing region");
        return HistoryError::OutOfMemory;
    }
    return HistoryError::Ok;
}

bool PendingTracker::contains(TrackedAddress address) const {
    return index_.find(address) != index_.end();
}

std::size_t PendingTracker::byteSize() const noexcept {
    std::size_t total = 0;
    for (const auto& snap : entries_) total += snap.bytes.size();
    return total;
}

void PendingTracker::clear() noexcept {
    entries_.clear();
    index_.clear();
}

void PendingTracker::release() noexcept {
    std::vector<RegionSnapshot>().swap(entries_);
    std::unordered_map<TrackedAddress, std::size_t>().swap(index_);
}

} // namespace memhist
