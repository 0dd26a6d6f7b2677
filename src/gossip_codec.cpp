#include "gossip_codec.hpp"
#include <algorithm>
#include <cmath>
#include "price_entry.hpp"

namespace pricemesh
{
    namespace
    {
        // u16 key length + one key byte + price + timestamp + version
        constexpr std::size_t kMinEntryBytes = 2 + 1 + 8 + 8 + 8;
    }

    Bytes GossipCodec::encodePayload(const GossipMessage &message)
    {
        Bytes out;
        out.reserve(64 + message.entries.size() * 48);
        WireWriter writer(out);

        writer.putString16(message.sender_node_id);
        message.vector_clock.encodeTo(writer);
        writer.putU64(message.baseline);
        writer.putU32(static_cast<std::uint32_t>(message.entries.size()));
        for (const auto &entry : message.entries)
        {
            writer.putString16(entry.key);
            writer.putU64(encodePrice(entry.price));
            writer.putI64(entry.timestamp);
            writer.putU64(entry.version);
        }
        return out;
    }

    Bytes GossipCodec::seal(Bytes payload, const Signature &signature)
    {
        payload.insert(payload.end(), signature.begin(), signature.end());
        return payload;
    }

    Bytes GossipCodec::encode(const GossipMessage &message)
    {
        return seal(encodePayload(message), message.signature);
    }

    SignedView GossipCodec::splitSignature(const Bytes &frame)
    {
        if (frame.size() < kMinFrameSize)
        {
            throw DecodeError("gossip frame of " + std::to_string(frame.size()) +
                              " bytes is shorter than the minimum " + std::to_string(kMinFrameSize));
        }

        SignedView view;
        view.payload = frame.data();
        view.payload_size = frame.size() - kSignatureSize;
        std::copy(frame.end() - kSignatureSize, frame.end(), view.signature.begin());
        return view;
    }

    GossipMessage GossipCodec::decode(const Bytes &frame)
    {
        const SignedView view = splitSignature(frame);
        WireReader reader(view.payload, view.payload_size);

        GossipMessage message;
        message.sender_node_id = reader.getString16();
        if (message.sender_node_id.empty())
        {
            throw DecodeError("gossip message has an empty sender node id");
        }

        message.vector_clock = VectorClock::decodeFrom(reader);
        message.baseline = reader.getU64();
        if (message.baseline >= message.vector_clock.get(message.sender_node_id) && message.baseline != 0)
        {
            throw DecodeError("gossip baseline " + std::to_string(message.baseline) +
                              " is not behind the sender's own clock component");
        }

        const std::uint32_t count = reader.getU32();
        if (static_cast<std::uint64_t>(count) * kMinEntryBytes > reader.remaining())
        {
            throw DecodeError("gossip message claims " + std::to_string(count) + " entries but only " +
                              std::to_string(reader.remaining()) + " payload bytes remain");
        }

        message.entries.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i)
        {
            GossipEntry entry;
            entry.key = reader.getString16();
            if (entry.key.empty())
            {
                throw DecodeError("gossip entry " + std::to_string(i) + " has an empty key");
            }
            entry.price = decodePrice(reader.getU64());
            if (!std::isfinite(entry.price))
            {
                throw DecodeError("gossip entry " + std::to_string(i) + " carries a non-finite price");
            }
            entry.timestamp = reader.getI64();
            entry.version = reader.getU64();
            message.entries.push_back(std::move(entry));
        }

        if (!reader.atEnd())
        {
            throw DecodeError("gossip payload followed by " + std::to_string(reader.remaining()) + " trailing bytes");
        }

        message.signature = view.signature;
        return message;
    }

} // namespace pricemesh
