#ifndef MEMHIST_HISTORY_MANAGER_H
#define MEMHIST_HISTORY_MANAGER_H

#include "memhist/core/types.h"
#include "memhist/history/history_config.h"
#include "memhist/history/history_stack.h"
#include "memhist/history/history_types.h"
#include "memhist/history/pending_tracker.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace memhist {

// Label given to the batch folded in by undo()/redo() when edits are pending.
inline constexpr const char* kAutoCommitLabel = "SaveCommit";

/**
 * HistoryManager: byte-snapshot undo/redo over fixed-address memory regions.
 *
 * Usage:
 * - push() the variables an action is about to touch
 * - mutate them freely
 * - commit("label") to record the ones that actually changed as one batch
 * - undo()/redo() swap the recorded bytes with live memory
 *
 * Tracked regions must not move while any pending entry or stored batch refers
 * to them. Storage owned by reallocating containers cannot be registered
 * through the typed overloads.
 *
 * Not thread-safe.
 */
class HistoryManager {
public:
    HistoryManager() = default;
    ~HistoryManager();

    HistoryManager(const HistoryManager&) = delete;
    HistoryManager& operator=(const HistoryManager&) = delete;

    // ==========================================================================
    // Lifecycle
    // ==========================================================================

    /**
     * Allocate the stacks, the pending index and the scratch buffer.
     * @return Ok, InvalidConfig, OutOfMemory, AlreadyInitialized, or Destroyed
     *         if destroy() has already run
     */
    HistoryError init(const HistoryConfig& config = HistoryConfig{});

    // Release every buffer. The manager rejects all operations afterwards.
    void destroy() noexcept;

    bool isInitialized() const noexcept { return state_ == State::Live; }

    // ==========================================================================
    // Registration
    // ==========================================================================

    /**
     * Capture the current bytes of a region as its baseline for the next commit.
     * Registering an address that is already pending is a no-op, as is a
     * zero-length region.
     * @return Ok, InvalidArgument (null address), RegionTooLarge (size exceeds
     *         the scratch capacity), OutOfMemory, NotInitialized or Destroyed
     */
    HistoryError push(void* address, std::size_t size);

    /**
     * Capture `count` contiguous elements starting at `first`, keyed on `first`.
     * @return as push(); InvalidArgument also if the total length overflows
     */
    HistoryError pushSlice(void* first, std::size_t elementSize, std::size_t count);

    template <typename T>
    HistoryError push(T& value) {
        static_assert(std::is_trivially_copyable<T>::value, "tracked values are restored by byte copy");
        static_assert(!std::is_const<T>::value, "tracked values are written back on undo");
        return push(static_cast<void*>(&value), sizeof(T));
    }

    template <typename T>
    HistoryError pushSlice(T* first, std::size_t count) {
        static_assert(std::is_trivially_copyable<T>::value, "tracked values are restored by byte copy");
        static_assert(!std::is_const<T>::value, "tracked values are written back on undo");
        return pushSlice(static_cast<void*>(first), sizeof(T), count);
    }

    template <typename T, std::size_t N>
    HistoryError pushSlice(T (&values)[N]) {
        return pushSlice(&values[0], N);
    }

    template <typename T, std::size_t N>
    HistoryError pushSlice(std::array<T, N>& values) {
        return pushSlice(values.data(), N);
    }

    // Reallocating containers move their elements; they cannot be tracked.
    template <typename T, typename A>
    HistoryError push(std::vector<T, A>&) = delete;
    template <typename T, typename A>
    HistoryError pushSlice(std::vector<T, A>&) = delete;
    template <typename C, typename Tr, typename A>
    HistoryError push(std::basic_string<C, Tr, A>&) = delete;
    template <typename C, typename Tr, typename A>
    HistoryError pushSlice(std::basic_string<C, Tr, A>&) = delete;
    template <typename T, typename A>
    HistoryError push(std::deque<T, A>&) = delete;
    template <typename T, typename A>
    HistoryError pushSlice(std::deque<T, A>&) = delete;

    // ==========================================================================
    // Commit / undo / redo
    // ==========================================================================

    /**
     * Diff every pending region against live memory and record the changed ones
     * as one batch on the undo stack. A produced batch clears the redo stack.
     * Pending is empty afterwards unless OutOfMemory is returned, in which case
     * nothing has been modified.
     * @param label Name stored with the batch
     * @param committed Optional; set to whether a batch was pushed
     */
    HistoryError commit(std::string_view label, bool* committed = nullptr);

    // Both auto-commit pending edits first. Return false when there is nothing
    // to apply or on failure; lastError() tells the two apart.
    bool undo();
    bool redo();

    // Status of the most recent operation.
    HistoryError lastError() const noexcept { return lastError_; }

    // ==========================================================================
    // State management
    // ==========================================================================

    // Drop pending entries and both stacks; the manager stays initialised.
    void clear() noexcept;
    // Forget pending baselines without recording anything.
    void discardPending() noexcept;

    // ==========================================================================
    // Introspection
    // ==========================================================================

    std::size_t itemLen(bool redo) const noexcept;
    std::size_t itemSize(bool redo) const noexcept;

    bool canUndo() const noexcept { return !undoStack_.empty(); }
    bool canRedo() const noexcept { return !redoStack_.empty(); }

    std::size_t pendingCount() const noexcept { return pending_.size(); }
    // Bytes held by pending baselines.
    std::size_t pendingSize() const noexcept { return pending_.byteSize(); }
    bool isTracked(const void* address) const;
    std::size_t scratchCapacity() const noexcept { return scratch_.size(); }
    std::uint32_t generation() const noexcept { return generation_; }

    // Label of the batch the next undo (or redo) would apply; empty if none.
    std::string_view peekLabel(bool redo) const noexcept;
    std::vector<std::string> labels(bool redo) const;

private:
    enum class State : std::uint8_t { Uninitialized, Live, Destroyed };

    HistoryError checkLive() const noexcept;
    HistoryError registerRegion(void* address, std::size_t length);
    bool applyTop(HistoryStack& source, HistoryStack& dest, bool backwards, const char* direction);
    void swapWithLive(HistoryChange& change) noexcept;

    const HistoryStack& stackFor(bool redo) const noexcept { return redo ? redoStack_ : undoStack_; }

    State state_ = State::Uninitialized;
    PendingTracker pending_;
    HistoryStack undoStack_;
    HistoryStack redoStack_;
    std::vector<std::uint8_t> scratch_;
    std::uint32_t generation_ = 0;
    HistoryError lastError_ = HistoryError::Ok;
};

} // namespace memhist

#endif // MEMHIST_HISTORY_MANAGER_H
