#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <boost/interprocess/mapped_region.hpp>
#include "price_entry.hpp"

namespace pricemesh
{
    constexpr std::uint64_t kSegmentMagic = 0x314C48534D455250ULL; // "PREMSHL1"
    constexpr std::uint32_t kSegmentLayoutVersion = 2;

    struct alignas(kCacheLineSize) SegmentHeader
    {
        std::uint64_t magic;
        std::uint32_t layout_version;
        std::uint32_t capacity;
        // Slots that have been written at least once. Readers attached to the
        // segment compare it with what they have indexed before rescanning.
        std::atomic<std::uint32_t> published_slots;
    };

    static_assert(std::atomic<std::uint32_t>::is_always_lock_free,
                  "The segment header lives in shared memory");

    // Fixed-size block of slots, either private to this process or backed by a
    // named POSIX shared-memory segment. Stores borrow an arena; they never own
    // or create one themselves.
    class SlotArena
    {
    public:
        static SlotArena anonymous(std::uint32_t capacity);

        // Replaces any existing segment of the same name.
        static SlotArena createShared(const std::string &name, std::uint32_t capacity);

        // Attaches to a segment created by another process. Throws
        // std::runtime_error if the segment is missing or its header is invalid.
        static SlotArena openShared(const std::string &name);

        static bool removeShared(const std::string &name);

        SlotArena(SlotArena &&) = default;
        SlotArena &operator=(SlotArena &&) = default;
        SlotArena(const SlotArena &) = delete;
        SlotArena &operator=(const SlotArena &) = delete;

        std::uint32_t capacity() const { return header_->capacity; }
        Slot &slot(SlotIndex index) { return slots_[index]; }
        const Slot &slot(SlotIndex index) const { return slots_[index]; }

        // Called by the owning store once per slot, after its first publish.
        void notePublished() { header_->published_slots.fetch_add(1, std::memory_order_release); }
        std::uint32_t publishedSlots() const { return header_->published_slots.load(std::memory_order_acquire); }

        bool isShared() const { return !name_.empty(); }
        // True when opened over a segment some other process created.
        bool isAttached() const { return attached_; }
        const std::string &name() const { return name_; }
        std::size_t sizeBytes() const { return region_.get_size(); }

        static std::size_t requiredBytes(std::uint32_t capacity)
        {
            return sizeof(SegmentHeader) + static_cast<std::size_t>(capacity) * sizeof(Slot);
        }

    private:
        SlotArena(boost::interprocess::mapped_region region, std::string name, bool attached);

        void initialize(std::uint32_t capacity);

        boost::interprocess::mapped_region region_;
        std::string name_;
        bool attached_;
        SegmentHeader *header_;
        Slot *slots_;
    };

} // namespace pricemesh
