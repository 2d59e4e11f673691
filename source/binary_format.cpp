// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// binary_format.cpp - Tagged binary Serializer/Deserializer

#include <dltypes/binary_format.h>

#include <cstdio>     // for std::snprintf
#include <cstring>    // for std::memcpy
#include <limits>
#include <stdexcept>  // for std::logic_error, std::length_error
#include <utility>    // for std::move

namespace dltypes {

namespace {

const char* tag_name(uint8_t tag) {
    switch (tag) {
        case binary_tag::none:     return "none";
        case binary_tag::some:     return "some";
        case binary_tag::boolean:  return "bool";
        case binary_tag::int64:    return "int64";
        case binary_tag::uint64:   return "uint64";
        case binary_tag::float64:  return "double";
        case binary_tag::string:   return "string";
        case binary_tag::sequence: return "sequence";
        case binary_tag::record:   return "struct";
        default:                   return "unknown";
    }
}

std::string offset_suffix(std::size_t pos) {
    return " at offset " + std::to_string(pos);
}

} // anonymous namespace

// ============================================================
// BinarySerializer
// ============================================================

void BinarySerializer::put_u8(uint8_t v) {
    buffer_.push_back(v);
}

void BinarySerializer::put_u32(uint32_t v) {
    put_raw(&v, sizeof(v));
}

// Checked before the tag is written so a rejected item leaves the buffer untouched.
uint32_t BinarySerializer::checked_length(std::size_t n, const char* what) {
    if (n > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error(std::string("BinarySerializer: ") + what + " of " + std::to_string(n) +
                                " elements exceeds the u32 length field");
    }
    return static_cast<uint32_t>(n);
}

// OPTIMIZATION: memcpy instead of per-byte pushes
void BinarySerializer::put_raw(const void* data, std::size_t n) {
    std::size_t old_size = buffer_.size();
    buffer_.resize(old_size + n);
    std::memcpy(buffer_.data() + old_size, data, n);
}

void BinarySerializer::write_bool(bool v) {
    put_u8(binary_tag::boolean);
    put_u8(v ? 0x01 : 0x00);
}

void BinarySerializer::write_i64(int64_t v) {
    put_u8(binary_tag::int64);
    put_raw(&v, sizeof(v));
}

void BinarySerializer::write_u64(uint64_t v) {
    put_u8(binary_tag::uint64);
    put_raw(&v, sizeof(v));
}

void BinarySerializer::write_f64(double v) {
    put_u8(binary_tag::float64);
    put_raw(&v, sizeof(v));
}

void BinarySerializer::write_string(std::string_view v) {
    uint32_t len = checked_length(v.size(), "string");
    put_u8(binary_tag::string);
    put_u32(len);
    put_raw(v.data(), v.size());
}

void BinarySerializer::begin_option(bool present) {
    put_u8(present ? binary_tag::some : binary_tag::none);
}

void BinarySerializer::begin_seq(std::size_t size) {
    uint32_t count = checked_length(size, "sequence");
    put_u8(binary_tag::sequence);
    put_u32(count);
}

void BinarySerializer::begin_struct(std::string_view, std::size_t field_count) {
    uint32_t count = checked_length(field_count, "struct");
    put_u8(binary_tag::record);
    put_u32(count);
}

ByteBuffer BinarySerializer::take() noexcept {
    ByteBuffer out = std::move(buffer_);
    buffer_.clear();
    return out;
}

// ============================================================
// BinaryDeserializer
// ============================================================

uint8_t BinaryDeserializer::get_u8() {
    if (!has_bytes(1)) throw MalformedValue("Unexpected end of buffer" + offset_suffix(pos_));
    return data_[pos_++];
}

uint32_t BinaryDeserializer::get_u32() {
    uint32_t v;
    get_raw(&v, sizeof(v));
    return v;
}

void BinaryDeserializer::get_raw(void* out, std::size_t n) {
    if (!has_bytes(n)) throw MalformedValue("Unexpected end of buffer" + offset_suffix(pos_));
    std::memcpy(out, data_ + pos_, n);
    pos_ += n;
}

void BinaryDeserializer::expect_tag(uint8_t tag, const char* what) {
    std::size_t at = pos_;
    uint8_t found = get_u8();
    if (found != tag) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02x", static_cast<unsigned int>(found));
        throw MalformedValue(std::string("Expected ") + what + ", found tag " + buf +
                             " (" + tag_name(found) + ")" + offset_suffix(at));
    }
}

bool BinaryDeserializer::read_bool() {
    expect_tag(binary_tag::boolean, "bool");
    std::size_t at = pos_;
    uint8_t v = get_u8();
    if (v > 0x01) {
        throw MalformedValue("Invalid bool byte " + std::to_string(v) + offset_suffix(at));
    }
    return v == 0x01;
}

int64_t BinaryDeserializer::read_i64() {
    expect_tag(binary_tag::int64, "int64");
    int64_t v;
    get_raw(&v, sizeof(v));
    return v;
}

uint64_t BinaryDeserializer::read_u64() {
    expect_tag(binary_tag::uint64, "uint64");
    uint64_t v;
    get_raw(&v, sizeof(v));
    return v;
}

double BinaryDeserializer::read_f64() {
    expect_tag(binary_tag::float64, "double");
    double v;
    get_raw(&v, sizeof(v));
    return v;
}

std::string BinaryDeserializer::read_string() {
    expect_tag(binary_tag::string, "string");
    uint32_t len = get_u32();
    if (!has_bytes(len)) throw MalformedValue("Unexpected end of buffer" + offset_suffix(pos_));
    std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
    pos_ += len;
    return s;
}

bool BinaryDeserializer::read_option() {
    std::size_t at = pos_;
    uint8_t tag = get_u8();
    if (tag == binary_tag::none) return false;
    if (tag == binary_tag::some) return true;
    throw MalformedValue(std::string("Expected option, found ") + tag_name(tag) + offset_suffix(at));
}

std::size_t BinaryDeserializer::begin_seq() {
    expect_tag(binary_tag::sequence, "sequence");
    uint32_t count = get_u32();
    remaining_.push_back(count);
    return count;
}

bool BinaryDeserializer::has_next() {
    if (remaining_.empty()) {
        throw std::logic_error("BinaryDeserializer::has_next called outside a sequence");
    }
    if (remaining_.back() == 0) return false;
    --remaining_.back();
    return true;
}

void BinaryDeserializer::end_seq() {
    if (remaining_.empty()) {
        throw std::logic_error("BinaryDeserializer::end_seq called outside a sequence");
    }
    uint32_t left = remaining_.back();
    remaining_.pop_back();
    if (left != 0) {
        throw MalformedValue("Sequence has " + std::to_string(left) + " unread elements" +
                             offset_suffix(pos_));
    }
}

void BinaryDeserializer::begin_struct(std::string_view name, std::size_t field_count) {
    expect_tag(binary_tag::record, "struct");
    uint32_t count = get_u32();
    if (count != field_count) {
        throw MalformedValue("Struct " + std::string(name) + " expects " +
                             std::to_string(field_count) + " fields, found " +
                             std::to_string(count) + offset_suffix(pos_));
    }
}

void BinaryDeserializer::finish() {
    if (pos_ != size_) {
        throw MalformedValue(std::to_string(size_ - pos_) + " trailing bytes" + offset_suffix(pos_));
    }
}

} // namespace dltypes
