#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <boost/lockfree/queue.hpp>
#include "price_entry.hpp"

namespace pricemesh {

// Lock-free set of slots written since the last gossip round. Writers on any
// thread mark; a single round drains. Each slot is queued at most once until
// drained, so the queue never holds more than capacity items.
class DirtySet {
public:
    explicit DirtySet(std::uint32_t capacity)
        : capacity_(capacity),
          flags_(new std::atomic<bool>[capacity]()),
          queue_(capacity) {}

    // Returns false only if the queue could not take the slot.
    bool mark(SlotIndex index) {
        if (index >= capacity_) {
            return false;
        }
        if (!flags_[index].exchange(true, std::memory_order_acq_rel)) {
            if (!queue_.push(index)) {
                flags_[index].store(false, std::memory_order_release);
                return false;
            }
        }
        return true;
    }

    // Calls fn(index) for each dirty slot. The flag is cleared before fn runs,
    // so a write racing with the drain is picked up now or next round.
    template<typename Fn>
    std::size_t drain(Fn&& fn) {
        std::size_t drained = 0;
        SlotIndex index;
        while (queue_.pop(index)) {
            flags_[index].store(false, std::memory_order_release);
            fn(index);
            ++drained;
        }
        return drained;
    }

    bool isDirty(SlotIndex index) const {
        return index < capacity_ && flags_[index].load(std::memory_order_acquire);
    }

private:
    const std::uint32_t capacity_;
    std::unique_ptr<std::atomic<bool>[]> flags_;
    boost::lockfree::queue<SlotIndex> queue_;
};

} // namespace pricemesh
