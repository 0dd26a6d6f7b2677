#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "wire_buffer.hpp"

namespace pricemesh
{
    enum class ClockOrdering
    {
        Equal,
        Before,
        After,
        Concurrent
    };

    const char *toString(ClockOrdering ordering);

    // Node-id -> logical counter. A missing node-id reads as zero.
    //
    // Wire format (little-endian), entries sorted by node-id:
    //   [u32 nodeCount] ([u16 idLen][id bytes][u64 counter])*
    class VectorClock
    {
    public:
        VectorClock() = default;

        // Only the owning node bumps its own component. Returns the new value.
        std::uint64_t increment(const std::string &node_id);

        // Component-wise max over the union of node-ids.
        VectorClock merge(const VectorClock &other) const;

        // Copy with one component dropped, so a merge leaves that component alone.
        VectorClock without(const std::string &node_id) const;

        ClockOrdering compare(const VectorClock &other) const;
        bool happensBefore(const VectorClock &other) const { return compare(other) == ClockOrdering::Before; }
        bool isConcurrentWith(const VectorClock &other) const { return compare(other) == ClockOrdering::Concurrent; }

        std::uint64_t get(const std::string &node_id) const;
        std::size_t size() const { return counters_.size(); }
        bool empty() const { return counters_.empty(); }
        const std::map<std::string, std::uint64_t> &entries() const { return counters_; }

        Bytes toWire() const;
        static VectorClock fromWire(const Bytes &bytes);
        static VectorClock fromWire(const std::uint8_t *data, std::size_t size);

        // Embedded form used inside gossip messages.
        void encodeTo(WireWriter &writer) const;
        static VectorClock decodeFrom(WireReader &reader);

        bool operator==(const VectorClock &other) const { return counters_ == other.counters_; }
        bool operator!=(const VectorClock &other) const { return counters_ != other.counters_; }

    private:
        std::map<std::string, std::uint64_t> counters_;
    };

} // namespace pricemesh
