// Queue scheduler: FIFO admission with manual reordering.
#include "furman/QueueScheduler.hpp"
#include <algorithm>
#include <utility>

namespace furman {

void QueueScheduler::enqueue(std::uint64_t id) {
    if (!contains(id)) pending_.push_back(id);
}

bool QueueScheduler::remove(std::uint64_t id) {
    auto it = std::find(pending_.begin(), pending_.end(), id);
    if (it == pending_.end()) return false;
    pending_.erase(it);
    return true;
}

bool QueueScheduler::moveUp(std::uint64_t id) {
    const int i = position(id);
    if (i < 0) return false;
    if (i > 0) std::swap(pending_[i], pending_[i - 1]);
    return true;
}

bool QueueScheduler::moveDown(std::uint64_t id) {
    const int i = position(id);
    if (i < 0) return false;
    if (i + 1 < (int)pending_.size()) std::swap(pending_[i], pending_[i + 1]);
    return true;
}

std::optional<std::uint64_t> QueueScheduler::admitNext(int slotsInUse, int maxConcurrent) {
    if (pending_.empty() || slotsInUse >= maxConcurrent) return std::nullopt;
    const std::uint64_t id = pending_.front();
    pending_.pop_front();
    return id;
}

bool QueueScheduler::contains(std::uint64_t id) const {
    return position(id) >= 0;
}

int QueueScheduler::position(std::uint64_t id) const {
    for (std::size_t i = 0; i < pending_.size(); ++i)
        if (pending_[i] == id) return (int)i;
    return -1;
}

} // namespace furman
