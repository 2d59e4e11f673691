// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file binary_format.h
/// @brief Compact tagged binary backend for the Serializer interface.
///
/// Every item starts with a one-byte tag; multi-byte payloads use the
/// native (little-endian on all supported targets) byte order.
///
/// Binary Format Type Tags (1 byte):
///   0x00 = option none
///   0x01 = option some (followed by the value)
///   0x02 = bool (1 byte: 0x00=false, 0x01=true)
///   0x03 = signed integer (8 bytes)
///   0x04 = unsigned integer (8 bytes)
///   0x05 = double (8 bytes, IEEE 754)
///   0x06 = string (4-byte length + UTF-8 data)
///   0x07 = sequence (4-byte count + elements)
///   0x08 = struct (4-byte field count + field values in declaration order)

#pragma once

#include "api.h"
#include "serializer.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dltypes {

/// @brief Byte buffer type for binary serialization
using ByteBuffer = std::vector<uint8_t>;

namespace binary_tag {
inline constexpr uint8_t none     = 0x00;
inline constexpr uint8_t some     = 0x01;
inline constexpr uint8_t boolean  = 0x02;
inline constexpr uint8_t int64    = 0x03;
inline constexpr uint8_t uint64   = 0x04;
inline constexpr uint8_t float64  = 0x05;
inline constexpr uint8_t string   = 0x06;
inline constexpr uint8_t sequence = 0x07;
inline constexpr uint8_t record   = 0x08;
} // namespace binary_tag

/// Lengths and counts are stored as u32; write_string, begin_seq and
/// begin_struct throw std::length_error for anything larger.
class DLTYPES_CLASS BinarySerializer final : public Serializer {
public:
    BinarySerializer() = default;

    void write_bool(bool v) override;
    void write_i64(int64_t v) override;
    void write_u64(uint64_t v) override;
    void write_f64(double v) override;
    void write_string(std::string_view v) override;
    void begin_option(bool present) override;
    void begin_seq(std::size_t size) override;
    void end_seq() override {}
    void begin_struct(std::string_view name, std::size_t field_count) override;
    void field(std::string_view) override {}
    void end_struct() override {}

    [[nodiscard]] const ByteBuffer& buffer() const noexcept { return buffer_; }

    /// Move the encoded document out; the serializer is empty afterwards.
    [[nodiscard]] ByteBuffer take() noexcept;

private:
    void put_u8(uint8_t v);
    void put_u32(uint32_t v);
    static uint32_t checked_length(std::size_t n, const char* what);
    void put_raw(const void* data, std::size_t n);

    ByteBuffer buffer_;
};

class DLTYPES_CLASS BinaryDeserializer final : public Deserializer {
public:
    BinaryDeserializer(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit BinaryDeserializer(const ByteBuffer& buffer)
        : BinaryDeserializer(buffer.data(), buffer.size()) {}

    bool read_bool() override;
    int64_t read_i64() override;
    uint64_t read_u64() override;
    double read_f64() override;
    std::string read_string() override;
    bool read_option() override;
    std::size_t begin_seq() override;
    bool has_next() override;
    void end_seq() override;
    void begin_struct(std::string_view name, std::size_t field_count) override;
    void field(std::string_view) override {}
    void end_struct() override {}
    void finish() override;

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    bool has_bytes(std::size_t n) const noexcept { return n <= size_ - pos_; }
    void expect_tag(uint8_t tag, const char* what);
    uint8_t get_u8();
    uint32_t get_u32();
    void get_raw(void* out, std::size_t n);

    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
    std::vector<uint32_t> remaining_;  // unread elements per open sequence
};

} // namespace dltypes
