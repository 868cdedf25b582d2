#ifndef MEMHIST_HISTORY_STACK_H
#define MEMHIST_HISTORY_STACK_H

#include "memhist/history/history_types.h"
#include <cstddef>
#include <string>
#include <vector>

namespace memhist {

// One side of the timeline. The capacity passed to reserve() is a growth hint;
// the stack grows past it as needed.
class HistoryStack {
public:
    // Throws std::bad_alloc.
    void reserve(std::size_t hint);

    // Make sure the next push() cannot allocate. Throws std::bad_alloc.
    void reserveSlot();

    void push(HistoryBatch&& batch);
    // Precondition: !empty().
    HistoryBatch pop();

    const HistoryBatch* top() const noexcept;

    bool empty() const noexcept { return batches_.empty(); }
    std::size_t size() const noexcept { return batches_.size(); }
    std::size_t capacity() const noexcept { return batches_.capacity(); }

    // Sum of the stored change bytes of every batch. Not cached.
    std::size_t byteSize() const noexcept;

    // Labels from the bottom of the stack to the top.
    std::vector<std::string> labels() const;

    void clear() noexcept;
    void release() noexcept;

private:
    std::vector<HistoryBatch> batches_;
};

} // namespace memhist

#endif // MEMHIST_HISTORY_STACK_H
