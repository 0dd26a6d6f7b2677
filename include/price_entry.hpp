#pragma once

#include <atomic>
#include <cstdint>
#include <cstring>
#include <string>

namespace pricemesh
{

    using SlotIndex = std::uint32_t;

    // Process-local id of the node whose write a slot currently holds.
    using OriginId = std::uint32_t;
    constexpr OriginId kLocalOrigin = 0;

    constexpr std::size_t kCacheLineSize = 64;
    constexpr std::size_t kMaxKeyLength = 39;

    struct PriceEntry
    {
        std::string key;
        double price = 0.0;
        std::int64_t timestamp = 0;
        std::uint64_t version = 0;
    };

    struct PriceUpdate
    {
        std::string key;
        double price;
        std::int64_t timestamp;
    };

    // Who produced a write: the local ingestion path or a gossip peer.
    enum class WriteSource
    {
        Local,
        Replica
    };

    // One cache line per key. version doubles as the seqlock guard:
    // 0 = never written, odd = write in progress, even = stable.
    struct alignas(kCacheLineSize) Slot
    {
        std::atomic<std::uint64_t> version;
        std::atomic<std::uint64_t> price_bits;
        std::atomic<std::int64_t> timestamp;
        char key[kMaxKeyLength + 1];
    };

    static_assert(sizeof(Slot) == kCacheLineSize, "Slot must occupy exactly one cache line");
    static_assert(std::atomic<std::uint64_t>::is_always_lock_free,
                  "Slots live in shared memory and need lock-free 64-bit atomics");

    inline std::uint64_t encodePrice(double price)
    {
        std::uint64_t bits;
        std::memcpy(&bits, &price, sizeof(bits));
        return bits;
    }

    inline double decodePrice(std::uint64_t bits)
    {
        double price;
        std::memcpy(&price, &bits, sizeof(price));
        return price;
    }

    inline bool isValidKey(const std::string &key)
    {
        return !key.empty() && key.size() <= kMaxKeyLength &&
               key.find('\0') == std::string::npos;
    }

    // Only called while the slot is unpublished (version == 0) or by the writer
    // that owns the slot claim.
    inline void writeSlotKey(Slot &slot, const std::string &key)
    {
        std::memset(slot.key, 0, sizeof(slot.key));
        std::memcpy(slot.key, key.data(), key.size());
    }

    inline std::string readSlotKey(const Slot &slot)
    {
        return std::string(slot.key, strnlen(slot.key, sizeof(slot.key)));
    }

} // namespace pricemesh
