#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include "errors.hpp"

namespace pricemesh
{
    using Bytes = std::vector<std::uint8_t>;

    // Little-endian writer for the gossip wire format.
    class WireWriter
    {
    public:
        explicit WireWriter(Bytes &out) : out_(out) {}

        void putU8(std::uint8_t value) { out_.push_back(value); }

        void putU16(std::uint16_t value) { putLittleEndian(value, 2); }
        void putU32(std::uint32_t value) { putLittleEndian(value, 4); }
        void putU64(std::uint64_t value) { putLittleEndian(value, 8); }
        void putI64(std::int64_t value) { putLittleEndian(static_cast<std::uint64_t>(value), 8); }

        // u16 length prefix followed by the raw bytes.
        void putString16(const std::string &value)
        {
            if (value.size() > UINT16_MAX)
            {
                throw std::length_error("string too long for u16 length prefix: " +
                                        std::to_string(value.size()));
            }
            putU16(static_cast<std::uint16_t>(value.size()));
            out_.insert(out_.end(), value.begin(), value.end());
        }

    private:
        void putLittleEndian(std::uint64_t value, int width)
        {
            for (int i = 0; i < width; ++i)
            {
                out_.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
            }
        }

        Bytes &out_;
    };

    // Bounds-checked reader. Every read past the end throws DecodeError.
    class WireReader
    {
    public:
        WireReader(const std::uint8_t *data, std::size_t size) : data_(data), size_(size) {}

        std::uint8_t getU8() { return static_cast<std::uint8_t>(getLittleEndian(1, "u8")); }
        std::uint16_t getU16() { return static_cast<std::uint16_t>(getLittleEndian(2, "u16")); }
        std::uint32_t getU32() { return static_cast<std::uint32_t>(getLittleEndian(4, "u32")); }
        std::uint64_t getU64() { return getLittleEndian(8, "u64"); }
        std::int64_t getI64() { return static_cast<std::int64_t>(getLittleEndian(8, "i64")); }

        std::string getString16()
        {
            std::uint16_t length = getU16();
            require(length, "string body");
            std::string value(reinterpret_cast<const char *>(data_ + offset_), length);
            offset_ += length;
            return value;
        }

        std::size_t remaining() const { return size_ - offset_; }
        std::size_t offset() const { return offset_; }
        bool atEnd() const { return offset_ == size_; }

    private:
        void require(std::size_t count, const char *what) const
        {
            if (remaining() < count)
            {
                throw DecodeError(std::string("truncated input reading ") + what + " at offset " +
                                  std::to_string(offset_) + " (" + std::to_string(remaining()) +
                                  " bytes left, need " + std::to_string(count) + ")");
            }
        }

        std::uint64_t getLittleEndian(std::size_t width, const char *what)
        {
            require(width, what);
            std::uint64_t value = 0;
            for (std::size_t i = 0; i < width; ++i)
            {
                value |= static_cast<std::uint64_t>(data_[offset_ + i]) << (8 * i);
            }
            offset_ += width;
            return value;
        }

        const std::uint8_t *data_;
        std::size_t size_;
        std::size_t offset_ = 0;
    };

} // namespace pricemesh
