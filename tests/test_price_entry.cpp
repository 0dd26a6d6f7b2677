#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "price_entry.hpp"
#include "wire_buffer.hpp"

using namespace pricemesh;

TEST(PriceEntryTest, PriceBitsPreserveExactValue) {
    const double prices[] = {0.0, -0.0, 30150000.0, 1e-300, -42.125,
                             std::numeric_limits<double>::max(),
                             std::numeric_limits<double>::denorm_min()};
    for (double price : prices) {
        const double decoded = decodePrice(encodePrice(price));
        EXPECT_EQ(encodePrice(decoded), encodePrice(price));
    }
    EXPECT_TRUE(std::signbit(decodePrice(encodePrice(-0.0))));
}

TEST(PriceEntryTest, KeyValidation) {
    EXPECT_TRUE(isValidKey("BSC:PCS:WBNB-USDT"));
    EXPECT_TRUE(isValidKey(std::string(kMaxKeyLength, 'k')));
    EXPECT_FALSE(isValidKey(""));
    EXPECT_FALSE(isValidKey(std::string(kMaxKeyLength + 1, 'k')));
    EXPECT_FALSE(isValidKey(std::string("ab\0cd", 5)));
}

TEST(PriceEntryTest, SlotKeyFitsWithTerminator) {
    Slot slot{};
    const std::string key(kMaxKeyLength, 'x');
    writeSlotKey(slot, key);
    EXPECT_EQ(readSlotKey(slot), key);

    writeSlotKey(slot, "ETH:UNI:WETH-USDC");
    EXPECT_EQ(readSlotKey(slot), "ETH:UNI:WETH-USDC");
}

TEST(WireBufferTest, LittleEndianLayout) {
    Bytes out;
    WireWriter writer(out);
    writer.putU16(0x0102);
    writer.putU32(0x03040506);
    ASSERT_EQ(out.size(), 6u);
    EXPECT_EQ(out[0], 0x02);
    EXPECT_EQ(out[1], 0x01);
    EXPECT_EQ(out[2], 0x06);
    EXPECT_EQ(out[5], 0x03);

    WireReader reader(out.data(), out.size());
    EXPECT_EQ(reader.getU16(), 0x0102);
    EXPECT_EQ(reader.getU32(), 0x03040506u);
    EXPECT_TRUE(reader.atEnd());
}

TEST(WireBufferTest, ReadPastEndThrows) {
    Bytes out;
    WireWriter writer(out);
    writer.putU16(10);
    out.push_back('a');

    WireReader reader(out.data(), out.size());
    EXPECT_THROW(reader.getString16(), DecodeError);

    WireReader short_reader(out.data(), 1);
    EXPECT_THROW(short_reader.getU64(), DecodeError);
}

TEST(WireBufferTest, OversizedStringRejected) {
    Bytes out;
    WireWriter writer(out);
    EXPECT_THROW(writer.putString16(std::string(70000, 'a')), std::length_error);
}
