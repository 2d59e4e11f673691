// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_format.h
/// @brief JSON text backend for the Serializer interface.
///
/// Mapping of the data model:
/// - bool -> true / false
/// - integers -> JSON numbers (full 64-bit precision, never routed through double)
/// - double -> JSON number, non-finite values as null
/// - string -> escaped JSON string
/// - option none -> null, option some -> the value itself
/// - sequence -> array
/// - struct -> object, fields in declaration order
///
/// Limitations:
/// - The deserializer expects struct fields in declaration order.
/// - Nesting deeper than DLTYPES_JSON_MAX_DEPTH is rejected.

#pragma once

#include "api.h"
#include "dltypes_config.h"
#include "serializer.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dltypes {

class DLTYPES_CLASS JsonSerializer final : public Serializer {
public:
    /// @param compact If true, produce minimal output; if false, pretty-print with indentation
    explicit JsonSerializer(bool compact = true) : compact_(compact) {}

    void write_bool(bool v) override;
    void write_i64(int64_t v) override;
    void write_u64(uint64_t v) override;
    void write_f64(double v) override;
    void write_string(std::string_view v) override;
    void begin_option(bool present) override;
    void begin_seq(std::size_t size) override;
    void end_seq() override;
    void begin_struct(std::string_view name, std::size_t field_count) override;
    void field(std::string_view name) override;
    void end_struct() override;

    [[nodiscard]] const std::string& str() const noexcept { return out_; }

    /// Move the encoded document out; the serializer is empty afterwards.
    [[nodiscard]] std::string take() noexcept;

private:
    struct Scope {
        bool is_struct;
        bool empty;
    };

    void before_value();
    void close(char bracket);
    void newline_indent(std::size_t depth);

    bool compact_;
    std::string out_;
    std::vector<Scope> scopes_;
};

class DLTYPES_CLASS JsonDeserializer final : public Deserializer {
public:
    /// @param json Document text; must outlive the deserializer
    explicit JsonDeserializer(std::string_view json) : json_(json) {}

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
    void field(std::string_view name) override;
    void end_struct() override;
    void finish() override;

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    char peek() const noexcept { return pos_ < json_.size() ? json_[pos_] : '\0'; }
    char consume() noexcept { return pos_ < json_.size() ? json_[pos_++] : '\0'; }
    void skip_whitespace() noexcept;
    void expect(char c);
    bool consume_literal(std::string_view word);
    std::string_view number_token();
    void push_scope();
    [[noreturn]] void fail(const std::string& message) const;

    std::string_view json_;
    std::size_t pos_ = 0;
    std::vector<bool> first_;  // per open array/object: no element consumed yet
};

} // namespace dltypes
