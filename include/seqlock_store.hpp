#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "errors.hpp"
#include "key_index.hpp"
#include "price_entry.hpp"
#include "slot_arena.hpp"

namespace pricemesh
{
    struct StoreConfig
    {
        // Read attempts before a stuck writer is reported as InvariantViolation.
        std::uint32_t max_read_retries = 1000000;
        // Distinct writers (this node plus its peers) whose origin is tracked.
        std::uint32_t max_origins = 1000;
    };

    struct StoreStats
    {
        std::uint64_t reads = 0;
        std::uint64_t writes = 0;
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::uint64_t stale_rejections = 0;
        std::uint64_t conflict_rejections = 0;
        std::uint64_t invalid_rejections = 0;
        std::uint64_t capacity_rejections = 0;
        std::uint64_t batch_reads = 0;
        std::uint64_t batch_writes = 0;
        std::uint64_t index_refreshes = 0;
    };

    struct MemoryUsage
    {
        std::size_t total_bytes = 0;
        std::size_t used_slots = 0;
        std::size_t total_slots = 0;
        double utilization_percent = 0.0;
    };

    // L1 price matrix. Readers never block: they retry while a write is in
    // flight. Writers claim a slot by moving its version from even to odd, so
    // concurrent writers to one key serialize on that slot only.
    //
    // Each slot remembers the origin of the write it holds. Two writes with the
    // same timestamp from different origins are ordered by origin name, inside
    // the writer claim: the lexicographically smaller name loses. Origins are
    // process-local and never stored in the shared segment.
    //
    // A store opened over an attached shared segment is a read-only view; any
    // write through it throws std::logic_error.
    class SeqlockStore
    {
    public:
        using WriteCallback = std::function<void(SlotIndex, WriteSource)>;

        explicit SeqlockStore(SlotArena &arena, StoreConfig config = StoreConfig{});

        SeqlockStore(const SeqlockStore &) = delete;
        SeqlockStore &operator=(const SeqlockStore &) = delete;

        // Local writes always carry kLocalOrigin; origin is only read for replicas.
        WriteStatus set(const std::string &key, double price, std::int64_t timestamp,
                        WriteSource source = WriteSource::Local, OriginId origin = kLocalOrigin);

        std::optional<PriceEntry> get(const std::string &key) const;
        std::optional<double> getPriceOnly(const std::string &key) const;

        // Reads a slot directly; empty if the slot was never written. The origin,
        // when requested, is read in the same consistent snapshot as the value.
        // Does not touch the read statistics.
        std::optional<PriceEntry> getAt(SlotIndex index, OriginId *origin = nullptr) const;

        std::vector<WriteStatus> setBatch(const std::vector<PriceUpdate> &updates,
                                          WriteSource source = WriteSource::Local,
                                          OriginId origin = kLocalOrigin);
        std::vector<std::optional<PriceEntry>> getBatch(const std::vector<std::string> &keys) const;

        // Reserves slots up front so hot-path writes never take the assignment lock.
        // Returns the number of keys that could not be registered.
        std::size_t registerKeys(const std::vector<std::string> &keys);

        std::optional<SlotIndex> slotOf(const std::string &key) const;

        // Names kLocalOrigin. Call once, before any replica write.
        void setLocalOrigin(const std::string &node_id);

        // Returns the id for a remote node, registering it on first sight.
        // Throws CapacityExceeded once max_origins ids are in use.
        OriginId internOrigin(const std::string &node_id);

        std::string originName(OriginId origin) const;

        // Invoked after every accepted write, on the writer's thread. Install
        // before any writer starts.
        void setWriteCallback(WriteCallback callback);

        bool isReadOnly() const { return read_only_; }
        std::uint32_t capacity() const { return arena_.capacity(); }
        std::size_t size() const { return index_.size(); }

        StoreStats stats() const;
        void resetStats();
        MemoryUsage memoryUsage() const;
        std::string prometheusMetrics() const;

    private:
        struct Counters
        {
            std::atomic<std::uint64_t> reads{0};
            std::atomic<std::uint64_t> writes{0};
            std::atomic<std::uint64_t> hits{0};
            std::atomic<std::uint64_t> misses{0};
            std::atomic<std::uint64_t> stale_rejections{0};
            std::atomic<std::uint64_t> conflict_rejections{0};
            std::atomic<std::uint64_t> invalid_rejections{0};
            std::atomic<std::uint64_t> capacity_rejections{0};
            std::atomic<std::uint64_t> batch_reads{0};
            std::atomic<std::uint64_t> batch_writes{0};
            std::atomic<std::uint64_t> index_refreshes{0};
        };

        std::optional<SlotIndex> lookup(const std::string &key) const;
        void refreshIndex() const;
        void requireWritable() const;

        // Spins until this writer owns the slot; returns the even version it replaced.
        std::uint64_t claim(Slot &slot, SlotIndex index);

        bool readSlot(SlotIndex index, bool with_timestamp, std::uint64_t &price_bits,
                      std::int64_t &timestamp, std::uint64_t &version, OriginId *origin = nullptr) const;

        // True when the incoming origin loses an equal-timestamp tie to the holder.
        bool losesTie(OriginId incoming, OriginId holder) const;

        SlotArena &arena_;
        const StoreConfig config_;
        const bool read_only_;
        mutable KeyIndex index_;
        mutable std::mutex refresh_mutex_;
        mutable Counters counters_;
        WriteCallback write_callback_;

        std::unique_ptr<std::atomic<OriginId>[]> slot_origins_;

        // Names are published through fixed pointer cells so the tiebreak can
        // read them under a slot claim without locking.
        std::unique_ptr<std::atomic<const std::string *>[]> origin_names_;
        std::deque<std::string> origin_storage_;
        std::unordered_map<std::string, OriginId> origin_ids_;
        OriginId next_origin_ = kLocalOrigin + 1;
        mutable std::mutex origin_mutex_;
    };

} // namespace pricemesh
