#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <tbb/concurrent_unordered_map.h>
#include "price_entry.hpp"

namespace pricemesh
{
    // Maps "chain:venue:pair" keys to dense slot indices. Lookups are lock-free;
    // assignment is serialized so two keys can never share an index. Indices are
    // never released for the lifetime of the index.
    class KeyIndex
    {
    public:
        using AssignCallback = std::function<void(SlotIndex)>;

        explicit KeyIndex(std::uint32_t capacity);

        // Returns the key's index, assigning the next free one if needed. The
        // callback runs before the new mapping becomes visible to find().
        // Throws CapacityExceeded when every slot is taken.
        SlotIndex indexOf(const std::string &key, const AssignCallback &on_assign = nullptr);

        std::optional<SlotIndex> find(const std::string &key) const;

        // Records a mapping discovered elsewhere (an attached shared segment).
        // Throws InvariantViolation if the index or key is already mapped differently.
        void adopt(const std::string &key, SlotIndex index);

        bool isAssigned(SlotIndex index) const;
        std::size_t size() const { return size_.load(std::memory_order_acquire); }
        std::uint32_t capacity() const { return capacity_; }

    private:
        const std::uint32_t capacity_;
        tbb::concurrent_unordered_map<std::string, SlotIndex> index_;
        mutable std::mutex assign_mutex_;
        std::vector<bool> taken_;
        std::uint32_t next_free_ = 0;
        std::atomic<std::size_t> size_{0};
    };

} // namespace pricemesh
