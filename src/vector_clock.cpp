#include "vector_clock.hpp"
#include <algorithm>
#include <stdexcept>

namespace pricemesh
{
    namespace
    {
        // u16 id length + at least one id byte + u64 counter
        constexpr std::size_t kMinClockEntryBytes = 2 + 1 + 8;
    }

    const char *toString(ClockOrdering ordering)
    {
        switch (ordering)
        {
        case ClockOrdering::Equal:
            return "equal";
        case ClockOrdering::Before:
            return "before";
        case ClockOrdering::After:
            return "after";
        case ClockOrdering::Concurrent:
            return "concurrent";
        }
        return "unknown";
    }

    std::uint64_t VectorClock::increment(const std::string &node_id)
    {
        if (node_id.empty() || node_id.size() > UINT16_MAX)
        {
            throw std::invalid_argument("node id must be 1..65535 bytes");
        }
        return ++counters_[node_id];
    }

    std::uint64_t VectorClock::get(const std::string &node_id) const
    {
        auto it = counters_.find(node_id);
        return it == counters_.end() ? 0 : it->second;
    }

    VectorClock VectorClock::merge(const VectorClock &other) const
    {
        VectorClock merged(*this);
        for (const auto &[node_id, counter] : other.counters_)
        {
            auto &mine = merged.counters_[node_id];
            mine = std::max(mine, counter);
        }
        return merged;
    }

    VectorClock VectorClock::without(const std::string &node_id) const
    {
        VectorClock copy(*this);
        copy.counters_.erase(node_id);
        return copy;
    }

    ClockOrdering VectorClock::compare(const VectorClock &other) const
    {
        bool some_less = false;
        bool some_greater = false;

        // Walk both sorted maps together; absent components count as zero
        auto a = counters_.begin();
        auto b = other.counters_.begin();
        while (a != counters_.end() || b != other.counters_.end())
        {
            std::uint64_t mine = 0;
            std::uint64_t theirs = 0;
            if (b == other.counters_.end() || (a != counters_.end() && a->first < b->first))
            {
                mine = a->second;
                ++a;
            }
            else if (a == counters_.end() || b->first < a->first)
            {
                theirs = b->second;
                ++b;
            }
            else
            {
                mine = a->second;
                theirs = b->second;
                ++a;
                ++b;
            }

            some_less |= mine < theirs;
            some_greater |= mine > theirs;
        }

        if (some_less && some_greater)
            return ClockOrdering::Concurrent;
        if (some_less)
            return ClockOrdering::Before;
        if (some_greater)
            return ClockOrdering::After;
        return ClockOrdering::Equal;
    }

    void VectorClock::encodeTo(WireWriter &writer) const
    {
        writer.putU32(static_cast<std::uint32_t>(counters_.size()));
        for (const auto &[node_id, counter] : counters_)
        {
            writer.putString16(node_id);
            writer.putU64(counter);
        }
    }

    VectorClock VectorClock::decodeFrom(WireReader &reader)
    {
        const std::uint32_t count = reader.getU32();
        if (static_cast<std::uint64_t>(count) * kMinClockEntryBytes > reader.remaining())
        {
            throw DecodeError("vector clock claims " + std::to_string(count) + " nodes but only " +
                              std::to_string(reader.remaining()) + " bytes remain");
        }

        VectorClock clock;
        for (std::uint32_t i = 0; i < count; ++i)
        {
            std::string node_id = reader.getString16();
            if (node_id.empty())
            {
                throw DecodeError("vector clock entry " + std::to_string(i) + " has an empty node id");
            }
            const std::uint64_t counter = reader.getU64();
            if (!clock.counters_.emplace(std::move(node_id), counter).second)
            {
                throw DecodeError("vector clock entry " + std::to_string(i) + " repeats a node id");
            }
        }
        return clock;
    }

    Bytes VectorClock::toWire() const
    {
        Bytes out;
        out.reserve(4 + counters_.size() * 24);
        WireWriter writer(out);
        encodeTo(writer);
        return out;
    }

    VectorClock VectorClock::fromWire(const std::uint8_t *data, std::size_t size)
    {
        WireReader reader(data, size);
        VectorClock clock = decodeFrom(reader);
        if (!reader.atEnd())
        {
            throw DecodeError("vector clock followed by " + std::to_string(reader.remaining()) + " trailing bytes");
        }
        return clock;
    }

    VectorClock VectorClock::fromWire(const Bytes &bytes)
    {
        return fromWire(bytes.data(), bytes.size());
    }

} // namespace pricemesh
