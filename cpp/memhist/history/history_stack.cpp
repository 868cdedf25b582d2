#include "memhist/history/history_stack.h"
#include <utility>

namespace memhist {

void HistoryStack::reserve(std::size_t hint) {
    batches_.reserve(hint);
}

void HistoryStack::reserveSlot() {
    if (batches_.size() < batches_.capacity()) return;
    const std::size_t grown = batches_.empty() ? 8 : batches_.capacity() * 2;
    batches_.reserve(grown);
}

void HistoryStack::push(HistoryBatch&& batch) {
    batches_.push_back(std::move(batch));
}

HistoryBatch HistoryStack::pop() {
    HistoryBatch batch = std::move(batches_.back());
    batches_.pop_back();
    return batch;
}

const HistoryBatch* HistoryStack::top() const noexcept {
    if (batches_.empty()) return nullptr;
    return &batches_.back();
}

std::size_t HistoryStack::byteSize() const noexcept {
    std::size_t total = 0;
    for (const auto& batch : batches_) total += batch.byteSize();
    return total;
}

std::vector<std::string> HistoryStack::labels() const {
    std::vector<std::string> out;
    out.reserve(batches_.size());
    for (const auto& batch : batches_) out.push_back(batch.label);
    return out;
}

void HistoryStack::clear() noexcept {
    batches_.clear();
}

void HistoryStack::release() noexcept {
    std::vector<HistoryBatch>().swap(batches_);
}

} // namespace memhist
