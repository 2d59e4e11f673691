// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serializer.h
/// @brief Format-independent serializer interface used by all Codec implementations.
///
/// The data model is deliberately small: booleans, 64-bit integers, doubles,
/// strings, optionals, sequences and structs with named fields. Every value
/// type in dltypes is described in terms of these items, and each concrete
/// format (see binary_format.h and json_format.h) decides how they are laid out.
///
/// Usage:
/// @code
///   struct Point {
///       int64_t x = 0;
///       int64_t y = 0;
///
///       void serialize(Serializer& s) const {
///           s.begin_struct("Point", 2);
///           write_field(s, "x", x);
///           write_field(s, "y", y);
///           s.end_struct();
///       }
///   };
/// @endcode

#pragma once

#include "api.h"
#include "error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dltypes {

// ============================================================
// Serializer
// ============================================================

/// Sink for one serialized document.
///
/// Implementations are single-use and not thread-safe. None of the write
/// operations fail on their own.
class DLTYPES_CLASS Serializer {
public:
    virtual ~Serializer() = default;

    virtual void write_bool(bool v) = 0;
    virtual void write_i64(int64_t v) = 0;
    virtual void write_u64(uint64_t v) = 0;
    virtual void write_f64(double v) = 0;
    virtual void write_string(std::string_view v) = 0;

    /// Start an optional value. When @p present is true the contained value
    /// must be written next.
    virtual void begin_option(bool present) = 0;

    /// Start a sequence of exactly @p size elements.
    virtual void begin_seq(std::size_t size) = 0;
    virtual void end_seq() = 0;

    /// Start a struct. Each of the @p field_count fields is written as
    /// field(name) followed by its value, in declaration order.
    virtual void begin_struct(std::string_view name, std::size_t field_count) = 0;
    virtual void field(std::string_view name) = 0;
    virtual void end_struct() = 0;
};

// ============================================================
// Deserializer
// ============================================================

/// Source for one serialized document.
///
/// Every read operation throws MalformedValue when the input does not hold
/// the requested item at the current position.
class DLTYPES_CLASS Deserializer {
public:
    virtual ~Deserializer() = default;

    virtual bool read_bool() = 0;
    virtual int64_t read_i64() = 0;
    virtual uint64_t read_u64() = 0;
    virtual double read_f64() = 0;
    virtual std::string read_string() = 0;

    /// @return true if an optional value is present and must be read next
    virtual bool read_option() = 0;

    /// Enter a sequence. Elements are consumed with has_next() followed by
    /// a read; end_seq() must be called once has_next() returned false.
    /// @return the element count if the format records it up front, else 0
    virtual std::size_t begin_seq() = 0;
    virtual bool has_next() = 0;
    virtual void end_seq() = 0;

    virtual void begin_struct(std::string_view name, std::size_t field_count) = 0;
    virtual void field(std::string_view name) = 0;
    virtual void end_struct() = 0;

    /// Verify the whole input has been consumed.
    virtual void finish() = 0;

    /// Advance to the next element of a fixed-size sequence.
    /// @throws MalformedValue if the sequence is already exhausted
    void expect_element() {
        if (!has_next()) {
            throw MalformedValue("Sequence is shorter than expected");
        }
    }
};

} // namespace dltypes
