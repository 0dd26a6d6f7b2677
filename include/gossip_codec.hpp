#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "vector_clock.hpp"
#include "wire_buffer.hpp"

namespace pricemesh
{
    constexpr std::size_t kSignatureSize = 32;
    using Signature = std::array<std::uint8_t, kSignatureSize>;

    struct GossipEntry
    {
        std::string key;
        double price = 0.0;
        std::int64_t timestamp = 0;
        std::uint64_t version = 0;

        bool operator==(const GossipEntry &other) const
        {
            return key == other.key && price == other.price &&
                   timestamp == other.timestamp && version == other.version;
        }
    };

    struct GossipMessage
    {
        std::string sender_node_id;
        VectorClock vector_clock;
        // The entries hold every value the sender originated in rounds after
        // this one. A normal round sets it to the previous round; a resync
        // reaches back to what the slowest peer has acknowledged.
        std::uint64_t baseline = 0;
        std::vector<GossipEntry> entries;
        Signature signature{};
    };

    // The signed bytes of a frame and the signature trailer that covers them.
    struct SignedView
    {
        const std::uint8_t *payload;
        std::size_t payload_size;
        Signature signature;
    };

    // Frame layout (little-endian):
    //   [u16 senderLen][sender][vectorClockWire][u64 baseline][u32 entryCount][entry]*[signature:32]
    //   entry = [u16 keyLen][key][u64 priceBits][i64 timestamp][u64 version]
    // The signature covers every byte before it.
    class GossipCodec
    {
    public:
        // sender length + clock node count + baseline + entry count + signature
        static constexpr std::size_t kMinFrameSize = 2 + 4 + 8 + 4 + kSignatureSize;

        static Bytes encodePayload(const GossipMessage &message);
        static Bytes encode(const GossipMessage &message);

        // Appends the signature trailer to an encoded payload.
        static Bytes seal(Bytes payload, const Signature &signature);

        // Locates the signature without parsing the payload.
        static SignedView splitSignature(const Bytes &frame);

        static GossipMessage decode(const Bytes &frame);
    };

} // namespace pricemesh
