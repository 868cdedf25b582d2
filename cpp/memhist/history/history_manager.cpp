#include "memhist/history/history_manager.h"
#include "memhist/core/logging.h"

#include <cstring>
#include <limits>
#include <new>
#include <utility>

namespace memhist {

HistoryManager::~HistoryManager() {
    destroy();
}

HistoryError HistoryManager::init(const HistoryConfig& config) {
    if (state_ == State::Live) return lastError_ = HistoryError::AlreadyInitialized;
    if (state_ == State::Destroyed) return lastError_ = HistoryError::Destroyed;

    const HistoryError configError = validateConfig(config);
    if (configError != HistoryError::Ok) {
        MEMHIST_LOG_WARN("init: scratch capacity must be non-zero");
        return lastError_ = configError;
    }

    try {
        undoStack_.reserve(config.undoCapacityHint);
        redoStack_.reserve(config.redoCapacityHint);
        pending_.reserve(config.pendingCapacityHint);
        scratch_.assign(config.scratchCapacity, 0);
    } catch (const std::bad_alloc&) {
        undoStack_.release();
        redoStack_.release();
        pending_.release();
        std::vector<std::uint8_t>().swap(scratch_);
        MEMHIST_LOG_WARN("init: out of memory (scratch %zu bytes)", config.scratchCapacity);
        return lastError_ = HistoryError::OutOfMemory;
    }

    state_ = State::Live;
    MEMHIST_LOG_DEBUG("init: undo=%zu redo=%zu scratch=%zu pending=%zu",
        config.undoCapacityHint, config.redoCapacityHint, config.scratchCapacity, config.pendingCapacityHint);
    return lastError_ = HistoryError::Ok;
}

void HistoryManager::destroy() noexcept {
    if (state_ != State::Live) return;
    undoStack_.release();
    redoStack_.release();
    pending_.release();
    std::vector<std::uint8_t>().swap(scratch_);
    state_ = State::Destroyed;
    MEMHIST_LOG_DEBUG("destroy");
}

HistoryError HistoryManager::checkLive() const noexcept {
    switch (state_) {
        case State::Live: return HistoryError::Ok;
        case State::Destroyed: return HistoryError::Destroyed;
        case State::Uninitialized: break;
    }
    return HistoryError::NotInitialized;
}

HistoryError HistoryManager::push(void* address, std::size_t size) {
    return lastError_ = registerRegion(address, size);
}

HistoryError HistoryManager::pushSlice(void* first, std::size_t elementSize, std::size_t count) {
    if (count != 0 && elementSize > std::numeric_limits<std::size_t>::max() / count) {
        const HistoryError live = checkLive();
        return lastError_ = (live != HistoryError::Ok ? live : HistoryError::InvalidArgument);
    }
    return lastError_ = registerRegion(first, elementSize * count);
}

HistoryError HistoryManager::registerRegion(void* address, std::size_t length) {
    const HistoryError live = checkLive();
    if (live != HistoryError::Ok) return live;
    if (length == 0) return HistoryError::Ok;
    if (!address) {
        MEMHIST_LOG_WARN("push: null address for %zu bytes", length);
        return HistoryError::InvalidArgument;
    }
    if (length > scratch_.size()) {
        MEMHIST_LOG_WARN("push: region of %zu bytes exceeds scratch capacity %zu", length, scratch_.size());
        return HistoryError::RegionTooLarge;
    }
    return pending_.capture(address, length);
}

HistoryError HistoryManager::commit(std::string_view label, bool* committed) {
    if (committed) *committed = false;
    const HistoryError live = checkLive();
    if (live != HistoryError::Ok) return lastError_ = live;
    if (pending_.empty()) return lastError_ = HistoryError::Ok;

    auto& entries = pending_.entries();

    // Everything that can allocate happens before pending or the stacks change.
    HistoryBatch batch{};
    try {
        batch.changes.reserve(entries.size());
        batch.label.assign(label.data(), label.size());
        undoStack_.reserveSlot();
    } catch (const std::bad_alloc&) {
        MEMHIST_LOG_WARN("commit: out of memory building batch '%.*s'", static_cast<int>(label.size()), label.data());
        return lastError_ = HistoryError::OutOfMemory;
    }

    for (auto& snap : entries) {
        const std::uint8_t* liveBytes = fromTrackedAddress(snap.address);
        if (std::memcmp(liveBytes, snap.bytes.data(), snap.bytes.size()) == 0) continue;
        HistoryChange change{};
        change.address = snap.address;
        change.bytes = std::move(snap.bytes);
        batch.changes.push_back(std::move(change));
    }
    pending_.clear();

    if (batch.changes.empty()) return lastError_ = HistoryError::Ok;

    if (!redoStack_.empty()) {
        MEMHIST_LOG_DEBUG("commit: dropping %zu redo batches", redoStack_.size());
        redoStack_.clear();
    }
    MEMHIST_LOG_DEBUG("commit: '%s' with %zu changes", batch.label.c_str(), batch.changes.size());
    undoStack_.push(std::move(batch));
    generation_++;
    if (committed) *committed = true;
    return lastError_ = HistoryError::Ok;
}

bool HistoryManager::undo() {
    return applyTop(undoStack_, redoStack_, true, "undo");
}

bool HistoryManager::redo() {
    return applyTop(redoStack_, undoStack_, false, "redo");
}

bool HistoryManager::applyTop(HistoryStack& source, HistoryStack& dest, bool backwards, const char* direction) {
    const HistoryError live = checkLive();
    if (live != HistoryError::Ok) {
        lastError_ = live;
        return false;
    }

    const HistoryError saved = commit(kAutoCommitLabel);
    if (saved != HistoryError::Ok) {
        MEMHIST_LOG_WARN("%s: auto-commit failed (%s)", direction, errorName(saved));
        return false;
    }

    if (source.empty()) {
        lastError_ = HistoryError::Ok;
        return false;
    }

    try {
        dest.reserveSlot();
    } catch (const std::bad_alloc&) {
        MEMHIST_LOG_WARN("%s: out of memory growing stack", direction);
        lastError_ = HistoryError::OutOfMemory;
        return false;
    }

    // Undo walks the batch back to front and redo front to back, so regions
    // that overlap inside one batch come back in a consistent state.
    HistoryBatch batch = source.pop();
    if (backwards) {
        for (auto it = batch.changes.rbegin(); it != batch.changes.rend(); ++it) swapWithLive(*it);
    } else {
        for (auto& change : batch.changes) swapWithLive(change);
    }
    MEMHIST_LOG_DEBUG("%s: '%s' (%zu changes)", direction, batch.label.c_str(), batch.changes.size());
    dest.push(std::move(batch));

    generation_++;
    lastError_ = HistoryError::Ok;
    return true;
}

// Every change fits the scratch buffer: registerRegion() rejects longer regions
// and the buffer never shrinks while the manager is live.
void HistoryManager::swapWithLive(HistoryChange& change) noexcept {
    std::uint8_t* liveBytes = fromTrackedAddress(change.address);
    const std::size_t n = change.bytes.size();
    std::memcpy(scratch_.data(), liveBytes, n);
    std::memcpy(liveBytes, change.bytes.data(), n);
    std::memcpy(change.bytes.data(), scratch_.data(), n);
}

void HistoryManager::clear() noexcept {
    if (state_ != State::Live) return;
    pending_.clear();
    undoStack_.clear();
    redoStack_.clear();
    generation_++;
}

void HistoryManager::discardPending() noexcept {
    pending_.clear();
}

std::size_t HistoryManager::itemLen(bool redo) const noexcept {
    return stackFor(redo).size();
}

std::size_t HistoryManager::itemSize(bool redo) const noexcept {
    return stackFor(redo).byteSize();
}

bool HistoryManager::isTracked(const void* address) const {
    return pending_.contains(toTrackedAddress(address));
}

std::string_view HistoryManager::peekLabel(bool redo) const noexcept {
    const HistoryBatch* top = stackFor(redo).top();
    if (!top) return {};
    return top->label;
}

std::vector<std::string> HistoryManager::labels(bool redo) const {
    return stackFor(redo).labels();
}

} // namespace memhist
