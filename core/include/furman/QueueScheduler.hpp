// Admission order for transfers that have not started yet.
#pragma once
#include <cstdint>
#include <deque>
#include <optional>

namespace furman {

// Strict FIFO line of queued transfer ids. Only moveUp/moveDown change the
// order; nothing here knows about statuses, the registry decides how many
// slots are in use.
class QueueScheduler {
public:
    void enqueue(std::uint64_t id);
    // Remove an id wherever it is (cancel). Returns false if absent.
    bool remove(std::uint64_t id);

    // Swap with the neighbour in the queued line. Returns false if the id is
    // not queued; at the edges the call succeeds without moving anything.
    bool moveUp(std::uint64_t id);
    bool moveDown(std::uint64_t id);

    // Pop the head if a slot is free (slotsInUse < maxConcurrent).
    std::optional<std::uint64_t> admitNext(int slotsInUse, int maxConcurrent);

    bool contains(std::uint64_t id) const;
    int position(std::uint64_t id) const; // -1 if absent
    bool empty() const { return pending_.empty(); }
    std::size_t size() const { return pending_.size(); }
    const std::deque<std::uint64_t>& order() const { return pending_; }

private:
    std::deque<std::uint64_t> pending_;
};

} // namespace furman
