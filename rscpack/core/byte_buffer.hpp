#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rscpack::core {

// ============================================================================
// ByteWriter - little-endian serialization into a growing buffer
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    void write_u8(std::uint8_t v) {
        data_.push_back(v);
    }

    void write_u16(std::uint16_t v) {
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    }

    void write_u32(std::uint32_t v) {
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    }

    void write_bool(bool v) {
        write_u8(v ? 1 : 0);
    }

    // u16 length prefix followed by the raw bytes.
    void write_string(std::string_view s) {
        if (s.size() > 0xFFFF) {
            throw std::runtime_error("String too long for serialization");
        }
        write_u16(static_cast<std::uint16_t>(s.size()));
        data_.insert(data_.end(), s.begin(), s.end());
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    template <std::size_t N>
    void write_tag(const std::array<unsigned char, N>& tag) {
        data_.insert(data_.end(), tag.begin(), tag.end());
    }

    std::size_t size() const { return data_.size(); }
    std::span<const std::uint8_t> data() const { return data_; }
    std::vector<std::uint8_t> take() { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
};

// ============================================================================
// ByteReader - bounds-checked little-endian deserialization
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data)
        : data_(data), pos_(0) {}

    std::uint8_t read_u8() {
        check_remaining(1);
        return data_[pos_++];
    }

    std::uint16_t read_u16() {
        check_remaining(2);
        std::uint16_t v = static_cast<std::uint16_t>(data_[pos_])
                       | static_cast<std::uint16_t>(static_cast<std::uint16_t>(data_[pos_ + 1]) << 8);
        pos_ += 2;
        return v;
    }

    std::uint32_t read_u32() {
        check_remaining(4);
        std::uint32_t v = static_cast<std::uint32_t>(data_[pos_])
                       | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8)
                       | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16)
                       | (static_cast<std::uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    // Strict: anything other than 0 or 1 is malformed.
    bool read_bool() {
        const std::uint8_t v = read_u8();
        if (v > 1) {
            throw std::runtime_error("ByteReader: invalid bool value");
        }
        return v != 0;
    }

    std::string read_string() {
        std::uint16_t len = read_u16();
        check_remaining(len);
        std::string s(reinterpret_cast<const char*>(data_.data() + pos_), len);
        pos_ += len;
        return s;
    }

    template <std::size_t N>
    bool read_tag(const std::array<unsigned char, N>& expected) {
        check_remaining(N);
        const bool match = std::memcmp(data_.data() + pos_, expected.data(), N) == 0;
        pos_ += N;
        return match;
    }

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    void check_remaining(std::size_t need) {
        if (need > data_.size() - pos_) {
            throw std::runtime_error("ByteReader: not enough data");
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_;
};

} // namespace rscpack::core
