#include <gtest/gtest.h>
#include <limits>
#include "gossip_codec.hpp"

using namespace pricemesh;

namespace {

GossipMessage sampleMessage() {
    GossipMessage message;
    message.sender_node_id = "bsc-a";
    message.vector_clock.increment("bsc-a");
    message.vector_clock.increment("bsc-a");
    message.vector_clock.increment("bsc-b");
    message.baseline = 1;
    message.entries.push_back({"BSC:PCS:WBNB-USDT", 30150000.0, 100, 4});
    message.entries.push_back({"ETH:UNI:WETH-USDC", 3500.25, 101, 2});
    message.signature.fill(0xab);
    return message;
}

} // namespace

TEST(GossipCodecTest, RoundTrip) {
    const GossipMessage message = sampleMessage();
    const Bytes frame = GossipCodec::encode(message);

    const GossipMessage decoded = GossipCodec::decode(frame);
    EXPECT_EQ(decoded.sender_node_id, message.sender_node_id);
    EXPECT_EQ(decoded.vector_clock, message.vector_clock);
    EXPECT_EQ(decoded.baseline, 1u);
    EXPECT_EQ(decoded.entries, message.entries);
    EXPECT_EQ(decoded.signature, message.signature);
}

TEST(GossipCodecTest, EmptyMessageIsMinimumSize) {
    GossipMessage message;
    message.sender_node_id = "n";
    const Bytes frame = GossipCodec::encode(message);
    EXPECT_EQ(frame.size(), GossipCodec::kMinFrameSize + 1);

    const auto decoded = GossipCodec::decode(frame);
    EXPECT_TRUE(decoded.entries.empty());
    EXPECT_TRUE(decoded.vector_clock.empty());
}

TEST(GossipCodecTest, SignatureCoversPayloadPrefix) {
    const GossipMessage message = sampleMessage();
    const Bytes payload = GossipCodec::encodePayload(message);
    const Bytes frame = GossipCodec::seal(payload, message.signature);

    const SignedView view = GossipCodec::splitSignature(frame);
    EXPECT_EQ(view.payload_size, payload.size());
    EXPECT_EQ(Bytes(view.payload, view.payload + view.payload_size), payload);
    EXPECT_EQ(view.signature, message.signature);
}

TEST(GossipCodecTest, TruncatedFramesRejected) {
    const Bytes frame = GossipCodec::encode(sampleMessage());
    for (size_t cut = 1; cut < frame.size(); ++cut) {
        Bytes truncated(frame.begin(), frame.end() - cut);
        EXPECT_THROW(GossipCodec::decode(truncated), DecodeError) << "cut " << cut;
    }
    EXPECT_THROW(GossipCodec::splitSignature(Bytes(10, 0)), DecodeError);
}

TEST(GossipCodecTest, TrailingBytesRejected) {
    GossipMessage message = sampleMessage();
    Bytes payload = GossipCodec::encodePayload(message);
    payload.push_back(0x00);
    EXPECT_THROW(GossipCodec::decode(GossipCodec::seal(payload, message.signature)), DecodeError);
}

TEST(GossipCodecTest, InflatedEntryCountRejected) {
    GossipMessage message = sampleMessage();
    Bytes payload = GossipCodec::encodePayload(message);

    // Entry count sits right after the sender, clock and baseline
    Bytes prefix;
    WireWriter writer(prefix);
    writer.putString16(message.sender_node_id);
    message.vector_clock.encodeTo(writer);
    writer.putU64(message.baseline);
    payload[prefix.size()] = 0xff;
    payload[prefix.size() + 1] = 0xff;
    payload[prefix.size() + 2] = 0xff;
    payload[prefix.size() + 3] = 0x7f;

    EXPECT_THROW(GossipCodec::decode(GossipCodec::seal(payload, message.signature)), DecodeError);
}

TEST(GossipCodecTest, InvalidFieldsRejected) {
    GossipMessage no_sender = sampleMessage();
    no_sender.sender_node_id.clear();
    EXPECT_THROW(GossipCodec::decode(GossipCodec::encode(no_sender)), DecodeError);

    GossipMessage empty_key = sampleMessage();
    empty_key.entries[0].key.clear();
    EXPECT_THROW(GossipCodec::decode(GossipCodec::encode(empty_key)), DecodeError);

    GossipMessage nan_price = sampleMessage();
    nan_price.entries[1].price = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(GossipCodec::decode(GossipCodec::encode(nan_price)), DecodeError);
}

TEST(GossipCodecTest, BaselineMustTrailSenderClock) {
    GossipMessage resync = sampleMessage();
    resync.baseline = 0;
    EXPECT_EQ(GossipCodec::decode(GossipCodec::encode(resync)).baseline, 0u);

    // bsc-a is at 2, so a baseline of 2 or more claims rounds it never ran
    GossipMessage ahead = sampleMessage();
    ahead.baseline = 2;
    EXPECT_THROW(GossipCodec::decode(GossipCodec::encode(ahead)), DecodeError);
    ahead.baseline = 7;
    EXPECT_THROW(GossipCodec::decode(GossipCodec::encode(ahead)), DecodeError);
}
