#include "key_index.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace pricemesh
{

    KeyIndex::KeyIndex(std::uint32_t capacity)
        : capacity_(capacity), taken_(capacity, false)
    {
    }

    std::optional<SlotIndex> KeyIndex::find(const std::string &key) const
    {
        auto it = index_.find(key);
        if (it != index_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    SlotIndex KeyIndex::indexOf(const std::string &key, const AssignCallback &on_assign)
    {
        if (auto existing = find(key))
        {
            return *existing;
        }

        std::lock_guard<std::mutex> lock(assign_mutex_);

        // Another writer may have assigned it while we waited
        if (auto existing = find(key))
        {
            return *existing;
        }

        while (next_free_ < capacity_ && taken_[next_free_])
        {
            ++next_free_;
        }
        if (next_free_ >= capacity_)
        {
            throw CapacityExceeded("key index full (" + std::to_string(capacity_) +
                                   " slots), cannot assign '" + key + "'");
        }

        SlotIndex index = next_free_++;
        taken_[index] = true;
        if (on_assign)
        {
            on_assign(index);
        }
        index_.emplace(key, index);
        size_.fetch_add(1, std::memory_order_release);

        spdlog::debug("Assigned slot {} to key {}", index, key);
        return index;
    }

    void KeyIndex::adopt(const std::string &key, SlotIndex index)
    {
        if (index >= capacity_)
        {
            throw InvariantViolation("adopted slot " + std::to_string(index) + " beyond capacity " +
                                     std::to_string(capacity_));
        }

        std::lock_guard<std::mutex> lock(assign_mutex_);
        auto existing = find(key);
        if (existing && *existing == index)
        {
            return;
        }
        if (existing || taken_[index])
        {
            throw InvariantViolation("index collision adopting key '" + key + "' at slot " +
                                     std::to_string(index));
        }

        taken_[index] = true;
        index_.emplace(key, index);
        size_.fetch_add(1, std::memory_order_release);
    }

    bool KeyIndex::isAssigned(SlotIndex index) const
    {
        std::lock_guard<std::mutex> lock(assign_mutex_);
        return index < capacity_ && taken_[index];
    }

} // namespace pricemesh
