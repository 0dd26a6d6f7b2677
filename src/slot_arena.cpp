#include "slot_arena.hpp"
#include <new>
#include <stdexcept>
#include <utility>
#include <boost/interprocess/anonymous_shared_memory.hpp>
#include <boost/interprocess/shared_memory_object.hpp>
#include <spdlog/spdlog.h>

namespace pricemesh
{
    namespace bip = boost::interprocess;

    SlotArena::SlotArena(bip::mapped_region region, std::string name, bool attached)
        : region_(std::move(region)),
          name_(std::move(name)),
          attached_(attached),
          header_(static_cast<SegmentHeader *>(region_.get_address())),
          slots_(reinterpret_cast<Slot *>(static_cast<char *>(region_.get_address()) + sizeof(SegmentHeader)))
    {
    }

    void SlotArena::initialize(std::uint32_t capacity)
    {
        new (header_) SegmentHeader{kSegmentMagic, kSegmentLayoutVersion, capacity, {}};
        header_->published_slots.store(0, std::memory_order_relaxed);
        for (std::uint32_t i = 0; i < capacity; ++i)
        {
            Slot *slot = new (&slots_[i]) Slot;
            slot->version.store(0, std::memory_order_relaxed);
            slot->price_bits.store(0, std::memory_order_relaxed);
            slot->timestamp.store(0, std::memory_order_relaxed);
            std::memset(slot->key, 0, sizeof(slot->key));
        }
        std::atomic_thread_fence(std::memory_order_release);
    }

    SlotArena SlotArena::anonymous(std::uint32_t capacity)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("slot arena capacity must be positive");
        }
        SlotArena arena(bip::anonymous_shared_memory(requiredBytes(capacity)), "", false);
        arena.initialize(capacity);
        spdlog::debug("Allocated anonymous slot arena: {} slots, {} bytes", capacity, arena.sizeBytes());
        return arena;
    }

    SlotArena SlotArena::createShared(const std::string &name, std::uint32_t capacity)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("slot arena capacity must be positive");
        }
        if (name.empty())
        {
            throw std::invalid_argument("shared segment name must not be empty");
        }

        bip::shared_memory_object::remove(name.c_str());
        bip::shared_memory_object shm(bip::create_only, name.c_str(), bip::read_write);
        shm.truncate(static_cast<bip::offset_t>(requiredBytes(capacity)));

        SlotArena arena(bip::mapped_region(shm, bip::read_write), name, false);
        arena.initialize(capacity);
        spdlog::info("Created shared slot arena '{}': {} slots, {} bytes", name, capacity, arena.sizeBytes());
        return arena;
    }

    SlotArena SlotArena::openShared(const std::string &name)
    {
        try
        {
            bip::shared_memory_object shm(bip::open_only, name.c_str(), bip::read_write);
            bip::mapped_region region(shm, bip::read_write);
            if (region.get_size() < sizeof(SegmentHeader))
            {
                throw std::runtime_error("segment smaller than its header");
            }

            const auto *header = static_cast<const SegmentHeader *>(region.get_address());
            if (header->magic != kSegmentMagic)
            {
                throw std::runtime_error("bad segment magic");
            }
            if (header->layout_version != kSegmentLayoutVersion)
            {
                throw std::runtime_error("unsupported layout version " + std::to_string(header->layout_version));
            }
            if (header->capacity == 0 || region.get_size() < requiredBytes(header->capacity))
            {
                throw std::runtime_error("segment size does not match capacity " + std::to_string(header->capacity));
            }

            SlotArena arena(std::move(region), name, true);
            spdlog::info("Attached to shared slot arena '{}': {} slots", name, arena.capacity());
            return arena;
        }
        catch (const bip::interprocess_exception &e)
        {
            throw std::runtime_error("cannot open shared segment '" + name + "': " + e.what());
        }
        catch (const std::runtime_error &e)
        {
            throw std::runtime_error("invalid shared segment '" + name + "': " + e.what());
        }
    }

    bool SlotArena::removeShared(const std::string &name)
    {
        return bip::shared_memory_object::remove(name.c_str());
    }

} // namespace pricemesh
