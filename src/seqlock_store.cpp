#include "seqlock_store.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

#if defined(__x86_64__) || defined(_M_X64)
#include <immintrin.h>
#define PRICEMESH_CPU_RELAX() _mm_pause()
#elif defined(__aarch64__)
#define PRICEMESH_CPU_RELAX() __asm__ __volatile__("yield" ::: "memory")
#else
#define PRICEMESH_CPU_RELAX() std::atomic_thread_fence(std::memory_order_seq_cst)
#endif

namespace pricemesh
{

    SeqlockStore::SeqlockStore(SlotArena &arena, StoreConfig config)
        : arena_(arena),
          config_(config),
          read_only_(arena.isAttached()),
          index_(arena.capacity()),
          slot_origins_(new std::atomic<OriginId>[arena.capacity()]()),
          origin_names_(new std::atomic<const std::string *>[config.max_origins]())
    {
        if (config_.max_read_retries == 0)
        {
            throw std::invalid_argument("max_read_retries must be positive");
        }
        if (config_.max_origins < 2)
        {
            throw std::invalid_argument("max_origins must leave room for at least one peer");
        }
        origin_storage_.emplace_back();
        origin_names_[kLocalOrigin].store(&origin_storage_.back(), std::memory_order_release);
        if (read_only_)
        {
            refreshIndex();
        }
        spdlog::info("SeqlockStore initialized: {} slots, {}{}", arena_.capacity(),
                     arena_.isShared() ? "shared segment " + arena_.name() : std::string("anonymous arena"),
                     read_only_ ? " (read-only view)" : "");
    }

    void SeqlockStore::setWriteCallback(WriteCallback callback)
    {
        write_callback_ = std::move(callback);
    }

    void SeqlockStore::requireWritable() const
    {
        if (read_only_)
        {
            throw std::logic_error("write through a read-only view of shared segment '" + arena_.name() + "'");
        }
    }

    std::uint64_t SeqlockStore::claim(Slot &slot, SlotIndex index)
    {
        std::uint64_t current = slot.version.load(std::memory_order_relaxed);
        for (std::uint32_t attempt = 0;; ++attempt)
        {
            if (attempt >= config_.max_read_retries)
            {
                spdlog::error("Seqlock writer could not claim slot {} after {} attempts (version {})",
                              index, attempt, current);
                throw InvariantViolation("slot " + std::to_string(index) + " held by a stalled writer");
            }
            if (current & 1)
            {
                PRICEMESH_CPU_RELAX();
                current = slot.version.load(std::memory_order_relaxed);
                continue;
            }
            if (slot.version.compare_exchange_weak(current, current + 1,
                                                   std::memory_order_acquire,
                                                   std::memory_order_relaxed))
            {
                break;
            }
        }
        // Order the odd version before the data stores that follow
        std::atomic_thread_fence(std::memory_order_release);
        return current;
    }

    void SeqlockStore::setLocalOrigin(const std::string &node_id)
    {
        std::lock_guard<std::mutex> lock(origin_mutex_);
        auto existing = origin_ids_.find(node_id);
        if (existing != origin_ids_.end() && existing->second != kLocalOrigin)
        {
            throw std::invalid_argument("node id '" + node_id + "' is already registered as a remote origin");
        }
        origin_ids_.erase(*origin_names_[kLocalOrigin].load(std::memory_order_relaxed));
        origin_storage_.push_back(node_id);
        origin_names_[kLocalOrigin].store(&origin_storage_.back(), std::memory_order_release);
        origin_ids_[node_id] = kLocalOrigin;
    }

    OriginId SeqlockStore::internOrigin(const std::string &node_id)
    {
        std::lock_guard<std::mutex> lock(origin_mutex_);
        auto it = origin_ids_.find(node_id);
        if (it != origin_ids_.end())
        {
            return it->second;
        }
        if (next_origin_ >= config_.max_origins)
        {
            throw CapacityExceeded("origin registry full: " + std::to_string(config_.max_origins) +
                                   " origins tracked, cannot add '" + node_id + "'");
        }
        const OriginId origin = next_origin_++;
        origin_storage_.push_back(node_id);
        origin_names_[origin].store(&origin_storage_.back(), std::memory_order_release);
        origin_ids_.emplace(node_id, origin);
        return origin;
    }

    std::string SeqlockStore::originName(OriginId origin) const
    {
        if (origin >= config_.max_origins)
        {
            return std::string();
        }
        const std::string *name = origin_names_[origin].load(std::memory_order_acquire);
        return name ? *name : std::string();
    }

    bool SeqlockStore::losesTie(OriginId incoming, OriginId holder) const
    {
        const std::string *incoming_name = origin_names_[incoming].load(std::memory_order_acquire);
        const std::string *holder_name = origin_names_[holder].load(std::memory_order_acquire);
        if (!incoming_name || !holder_name)
        {
            throw InvariantViolation("slot origin " + std::to_string(incoming_name ? holder : incoming) +
                                     " was never registered");
        }
        return *incoming_name < *holder_name;
    }

    WriteStatus SeqlockStore::set(const std::string &key, double price, std::int64_t timestamp,
                                  WriteSource source, OriginId origin)
    {
        requireWritable();

        const OriginId writer = source == WriteSource::Local ? kLocalOrigin : origin;
        if (writer >= config_.max_origins)
        {
            throw std::invalid_argument("origin id " + std::to_string(writer) + " out of range");
        }

        if (!std::isfinite(price))
        {
            counters_.invalid_rejections.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("Rejected non-finite price for {}", key);
            return WriteStatus::NonFinitePrice;
        }
        if (!isValidKey(key))
        {
            counters_.invalid_rejections.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("Rejected invalid key '{}' (length {}, max {})", key, key.size(), kMaxKeyLength);
            return WriteStatus::InvalidKey;
        }

        SlotIndex index;
        try
        {
            index = index_.indexOf(key, [this, &key](SlotIndex assigned)
                                   { writeSlotKey(arena_.slot(assigned), key); });
        }
        catch (const CapacityExceeded &e)
        {
            counters_.capacity_rejections.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("SeqlockStore capacity exceeded: {}", e.what());
            return WriteStatus::CapacityExceeded;
        }

        Slot &slot = arena_.slot(index);
        const std::uint64_t stable = claim(slot, index);

        const std::uint64_t price_bits = encodePrice(price);

        if (stable != 0)
        {
            const std::int64_t stored = slot.timestamp.load(std::memory_order_relaxed);
            bool stale = timestamp < stored;
            bool lost = false;
            if (timestamp == stored)
            {
                const OriginId holder = slot_origins_[index].load(std::memory_order_relaxed);
                if (holder != writer)
                {
                    try
                    {
                        lost = losesTie(writer, holder);
                    }
                    catch (const InvariantViolation &)
                    {
                        slot.version.store(stable, std::memory_order_release);
                        throw;
                    }
                }
                else
                {
                    // A replica repeating the value it already holds
                    stale = source == WriteSource::Replica &&
                            slot.price_bits.load(std::memory_order_relaxed) == price_bits;
                }
            }

            if (stale || lost)
            {
                // Release the claim without touching the data
                slot.version.store(stable, std::memory_order_release);
                if (lost)
                {
                    counters_.conflict_rejections.fetch_add(1, std::memory_order_relaxed);
                    spdlog::debug("Write for {} at ts {} lost the tie to origin {}", key, timestamp,
                                  slot_origins_[index].load(std::memory_order_relaxed));
                    return WriteStatus::ConflictLost;
                }
                counters_.stale_rejections.fetch_add(1, std::memory_order_relaxed);
                spdlog::debug("Rejected stale write for {}: ts {} not newer than stored", key, timestamp);
                return WriteStatus::StaleTimestamp;
            }
        }

        slot.price_bits.store(price_bits, std::memory_order_relaxed);
        slot.timestamp.store(timestamp, std::memory_order_relaxed);
        slot_origins_[index].store(writer, std::memory_order_relaxed);
        slot.version.store(stable + 2, std::memory_order_release);
        if (stable == 0)
        {
            arena_.notePublished();
        }

        counters_.writes.fetch_add(1, std::memory_order_relaxed);
        if (write_callback_)
        {
            write_callback_(index, source);
        }
        return WriteStatus::Accepted;
    }

    bool SeqlockStore::readSlot(SlotIndex index, bool with_timestamp, std::uint64_t &price_bits,
                                std::int64_t &timestamp, std::uint64_t &version, OriginId *origin) const
    {
        const Slot &slot = arena_.slot(index);
        for (std::uint32_t attempt = 0; attempt < config_.max_read_retries; ++attempt)
        {
            const std::uint64_t before = slot.version.load(std::memory_order_acquire);
            if (before & 1)
            {
                PRICEMESH_CPU_RELAX();
                continue;
            }
            if (before == 0)
            {
                return false;
            }

            price_bits = slot.price_bits.load(std::memory_order_relaxed);
            if (with_timestamp)
            {
                timestamp = slot.timestamp.load(std::memory_order_relaxed);
            }
            if (origin)
            {
                *origin = slot_origins_[index].load(std::memory_order_relaxed);
            }

            std::atomic_thread_fence(std::memory_order_acquire);
            const std::uint64_t after = slot.version.load(std::memory_order_relaxed);
            if (before == after)
            {
                version = before;
                return true;
            }
            PRICEMESH_CPU_RELAX();
        }

        spdlog::error("Seqlock read of slot {} exceeded {} retries; writer stalled mid-update",
                      index, config_.max_read_retries);
        throw InvariantViolation("seqlock read retry bound exceeded on slot " + std::to_string(index));
    }

    std::optional<SlotIndex> SeqlockStore::lookup(const std::string &key) const
    {
        auto index = index_.find(key);
        if (!index && read_only_ && arena_.publishedSlots() > index_.size())
        {
            // The owning process has published slots we have not indexed yet
            refreshIndex();
            index = index_.find(key);
        }
        return index;
    }

    void SeqlockStore::refreshIndex() const
    {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        if (arena_.publishedSlots() <= index_.size())
        {
            return;
        }
        counters_.index_refreshes.fetch_add(1, std::memory_order_relaxed);
        for (SlotIndex i = 0; i < arena_.capacity(); ++i)
        {
            if (index_.isAssigned(i))
            {
                continue;
            }
            // A published slot (version >= 2) always has its key in place
            const std::uint64_t version = arena_.slot(i).version.load(std::memory_order_acquire);
            if (version < 2)
            {
                continue;
            }
            std::string key = readSlotKey(arena_.slot(i));
            if (isValidKey(key))
            {
                index_.adopt(key, i);
            }
        }
    }

    std::optional<PriceEntry> SeqlockStore::get(const std::string &key) const
    {
        counters_.reads.fetch_add(1, std::memory_order_relaxed);

        auto index = lookup(key);
        if (!index)
        {
            counters_.misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        std::uint64_t price_bits = 0;
        std::int64_t timestamp = 0;
        std::uint64_t version = 0;
        if (!readSlot(*index, true, price_bits, timestamp, version))
        {
            counters_.misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        counters_.hits.fetch_add(1, std::memory_order_relaxed);
        return PriceEntry{key, decodePrice(price_bits), timestamp, version};
    }

    std::optional<double> SeqlockStore::getPriceOnly(const std::string &key) const
    {
        counters_.reads.fetch_add(1, std::memory_order_relaxed);

        auto index = lookup(key);
        if (!index)
        {
            counters_.misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        std::uint64_t price_bits = 0;
        std::int64_t unused_timestamp = 0;
        std::uint64_t version = 0;
        if (!readSlot(*index, false, price_bits, unused_timestamp, version))
        {
            counters_.misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        counters_.hits.fetch_add(1, std::memory_order_relaxed);
        return decodePrice(price_bits);
    }

    std::optional<PriceEntry> SeqlockStore::getAt(SlotIndex index, OriginId *origin) const
    {
        if (index >= arena_.capacity())
        {
            return std::nullopt;
        }

        std::uint64_t price_bits = 0;
        std::int64_t timestamp = 0;
        std::uint64_t version = 0;
        if (!readSlot(index, true, price_bits, timestamp, version, origin))
        {
            return std::nullopt;
        }
        return PriceEntry{readSlotKey(arena_.slot(index)), decodePrice(price_bits), timestamp, version};
    }

    std::vector<WriteStatus> SeqlockStore::setBatch(const std::vector<PriceUpdate> &updates, WriteSource source,
                                                    OriginId origin)
    {
        requireWritable();
        counters_.batch_writes.fetch_add(1, std::memory_order_relaxed);

        // Every entry takes the full single-write path, whatever the batch size
        std::vector<WriteStatus> results;
        results.reserve(updates.size());
        for (const auto &update : updates)
        {
            results.push_back(set(update.key, update.price, update.timestamp, source, origin));
        }
        return results;
    }

    std::vector<std::optional<PriceEntry>> SeqlockStore::getBatch(const std::vector<std::string> &keys) const
    {
        counters_.batch_reads.fetch_add(1, std::memory_order_relaxed);

        std::vector<std::optional<PriceEntry>> results;
        results.reserve(keys.size());
        for (const auto &key : keys)
        {
            results.push_back(get(key));
        }
        return results;
    }

    std::size_t SeqlockStore::registerKeys(const std::vector<std::string> &keys)
    {
        requireWritable();

        std::size_t failed = 0;
        for (const auto &key : keys)
        {
            if (!isValidKey(key))
            {
                spdlog::warn("Cannot register invalid key '{}'", key);
                ++failed;
                continue;
            }
            try
            {
                index_.indexOf(key, [this, &key](SlotIndex assigned)
                               { writeSlotKey(arena_.slot(assigned), key); });
            }
            catch (const CapacityExceeded &e)
            {
                spdlog::warn("Cannot register key: {}", e.what());
                ++failed;
            }
        }
        return failed;
    }

    std::optional<SlotIndex> SeqlockStore::slotOf(const std::string &key) const
    {
        return lookup(key);
    }

    StoreStats SeqlockStore::stats() const
    {
        StoreStats snapshot;
        snapshot.reads = counters_.reads.load(std::memory_order_relaxed);
        snapshot.writes = counters_.writes.load(std::memory_order_relaxed);
        snapshot.hits = counters_.hits.load(std::memory_order_relaxed);
        snapshot.misses = counters_.misses.load(std::memory_order_relaxed);
        snapshot.stale_rejections = counters_.stale_rejections.load(std::memory_order_relaxed);
        snapshot.conflict_rejections = counters_.conflict_rejections.load(std::memory_order_relaxed);
        snapshot.invalid_rejections = counters_.invalid_rejections.load(std::memory_order_relaxed);
        snapshot.capacity_rejections = counters_.capacity_rejections.load(std::memory_order_relaxed);
        snapshot.batch_reads = counters_.batch_reads.load(std::memory_order_relaxed);
        snapshot.batch_writes = counters_.batch_writes.load(std::memory_order_relaxed);
        snapshot.index_refreshes = counters_.index_refreshes.load(std::memory_order_relaxed);
        return snapshot;
    }

    void SeqlockStore::resetStats()
    {
        counters_.reads.store(0, std::memory_order_relaxed);
        counters_.writes.store(0, std::memory_order_relaxed);
        counters_.hits.store(0, std::memory_order_relaxed);
        counters_.misses.store(0, std::memory_order_relaxed);
        counters_.stale_rejections.store(0, std::memory_order_relaxed);
        counters_.conflict_rejections.store(0, std::memory_order_relaxed);
        counters_.invalid_rejections.store(0, std::memory_order_relaxed);
        counters_.capacity_rejections.store(0, std::memory_order_relaxed);
        counters_.batch_reads.store(0, std::memory_order_relaxed);
        counters_.batch_writes.store(0, std::memory_order_relaxed);
        counters_.index_refreshes.store(0, std::memory_order_relaxed);
    }

    MemoryUsage SeqlockStore::memoryUsage() const
    {
        MemoryUsage usage;
        usage.total_bytes = arena_.sizeBytes();
        usage.used_slots = index_.size();
        usage.total_slots = arena_.capacity();
        usage.utilization_percent = 100.0 * static_cast<double>(usage.used_slots) /
                                    static_cast<double>(usage.total_slots);
        return usage;
    }

    std::string SeqlockStore::prometheusMetrics() const
    {
        const StoreStats s = stats();
        const MemoryUsage memory = memoryUsage();

        std::stringstream ss;
        auto counter = [&ss](const char *name, const char *help, std::uint64_t value)
        {
            ss << "# HELP " << name << ' ' << help << '\n'
               << "# TYPE " << name << " counter\n"
               << name << ' ' << value << '\n';
        };

        counter("price_matrix_reads", "Total read operations", s.reads);
        counter("price_matrix_writes", "Total accepted write operations", s.writes);
        counter("price_matrix_hits", "Total cache hits", s.hits);
        counter("price_matrix_misses", "Total cache misses", s.misses);
        counter("price_matrix_stale_rejections", "Writes rejected for an older timestamp", s.stale_rejections);
        counter("price_matrix_conflict_rejections", "Equal-timestamp writes that lost the origin tiebreak",
                s.conflict_rejections);
        counter("price_matrix_invalid_rejections", "Writes rejected for invalid key or price", s.invalid_rejections);
        counter("price_matrix_capacity_rejections", "Writes rejected because the matrix is full", s.capacity_rejections);

        ss << "# HELP price_matrix_memory_bytes Total memory usage in bytes\n"
           << "# TYPE price_matrix_memory_bytes gauge\n"
           << "price_matrix_memory_bytes " << memory.total_bytes << '\n'
           << "# HELP price_matrix_used_slots Number of used slots\n"
           << "# TYPE price_matrix_used_slots gauge\n"
           << "price_matrix_used_slots " << memory.used_slots << '\n'
           << "# HELP price_matrix_utilization Cache utilization percentage\n"
           << "# TYPE price_matrix_utilization gauge\n"
           << "price_matrix_utilization " << std::fixed << std::setprecision(2)
           << memory.utilization_percent << '\n';
        return ss.str();
    }

} // namespace pricemesh
