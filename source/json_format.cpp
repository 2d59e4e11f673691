// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// json_format.cpp - JSON text Serializer/Deserializer

#include <dltypes/json_format.h>
#include <dltypes/log.h>

#include <charconv>   // for std::from_chars, std::to_chars
#include <cmath>      // for std::isfinite
#include <cstdio>     // for std::snprintf
#include <stdexcept>  // for std::logic_error
#include <utility>    // for std::move

namespace dltypes {

namespace {

// OPTIMIZATION: Use string::reserve + append instead of ostringstream for better performance
void append_escaped(std::string& out, std::string_view s) {
    out.reserve(out.size() + s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_utf8(std::string& out, uint32_t codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

bool is_number_char(char c) {
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

} // anonymous namespace

// ============================================================
// JsonSerializer
// ============================================================

void JsonSerializer::newline_indent(std::size_t depth) {
    if (compact_) return;
    out_ += '\n';
    out_.append(depth * 2, ' ');
}

// Array elements need a separator and indentation; struct values follow
// the key already written by field().
void JsonSerializer::before_value() {
    if (scopes_.empty() || scopes_.back().is_struct) return;
    Scope& top = scopes_.back();
    if (!top.empty) out_ += ',';
    top.empty = false;
    newline_indent(scopes_.size());
}

void JsonSerializer::close(char bracket) {
    if (scopes_.empty()) {
        throw std::logic_error("JsonSerializer: unbalanced end of sequence or struct");
    }
    bool had_children = !scopes_.back().empty;
    scopes_.pop_back();
    if (had_children) newline_indent(scopes_.size());
    out_ += bracket;
}

void JsonSerializer::write_bool(bool v) {
    before_value();
    out_ += v ? "true" : "false";
}

void JsonSerializer::write_i64(int64_t v) {
    before_value();
    out_ += std::to_string(v);
}

void JsonSerializer::write_u64(uint64_t v) {
    before_value();
    out_ += std::to_string(v);
}

void JsonSerializer::write_f64(double v) {
    before_value();
    if (!std::isfinite(v)) {
        detail::log_warning("JsonSerializer", "non-finite double written as null");
        out_ += "null";
        return;
    }
    // Shortest round-trip form, independent of the global locale
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{}) {
        throw std::logic_error("JsonSerializer: double does not fit the format buffer");
    }
    out_.append(buf, end);
}

void JsonSerializer::write_string(std::string_view v) {
    before_value();
    append_escaped(out_, v);
}

void JsonSerializer::begin_option(bool present) {
    if (!present) {
        before_value();
        out_ += "null";
    }
}

void JsonSerializer::begin_seq(std::size_t) {
    before_value();
    out_ += '[';
    scopes_.push_back({false, true});
}

void JsonSerializer::end_seq() {
    close(']');
}

void JsonSerializer::begin_struct(std::string_view, std::size_t) {
    before_value();
    out_ += '{';
    scopes_.push_back({true, true});
}

void JsonSerializer::field(std::string_view name) {
    if (scopes_.empty() || !scopes_.back().is_struct) {
        throw std::logic_error("JsonSerializer::field called outside a struct");
    }
    Scope& top = scopes_.back();
    if (!top.empty) out_ += ',';
    top.empty = false;
    newline_indent(scopes_.size());
    append_escaped(out_, name);
    out_ += ':';
    if (!compact_) out_ += ' ';
}

void JsonSerializer::end_struct() {
    close('}');
}

std::string JsonSerializer::take() noexcept {
    std::string out = std::move(out_);
    out_.clear();
    scopes_.clear();
    return out;
}

// ============================================================
// JsonDeserializer
// ============================================================

void JsonDeserializer::fail(const std::string& message) const {
    throw MalformedValue(message + " at position " + std::to_string(pos_));
}

void JsonDeserializer::skip_whitespace() noexcept {
    while (pos_ < json_.size()) {
        char c = json_[pos_];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
        ++pos_;
    }
}

void JsonDeserializer::expect(char c) {
    skip_whitespace();
    if (peek() != c) {
        if (pos_ >= json_.size()) {
            fail(std::string("Expected '") + c + "', found end of input");
        }
        fail(std::string("Expected '") + c + "', found '" + peek() + "'");
    }
    ++pos_;
}

bool JsonDeserializer::consume_literal(std::string_view word) {
    skip_whitespace();
    if (json_.substr(pos_).starts_with(word)) {
        pos_ += word.size();
        return true;
    }
    return false;
}

std::string_view JsonDeserializer::number_token() {
    skip_whitespace();
    std::size_t start = pos_;
    while (pos_ < json_.size() && is_number_char(json_[pos_])) {
        ++pos_;
    }
    if (start == pos_) {
        fail("Expected number");
    }
    return json_.substr(start, pos_ - start);
}

void JsonDeserializer::push_scope() {
    if (first_.size() >= DLTYPES_JSON_MAX_DEPTH) {
        fail("Nesting deeper than " + std::to_string(DLTYPES_JSON_MAX_DEPTH));
    }
    first_.push_back(true);
}

bool JsonDeserializer::read_bool() {
    if (consume_literal("true")) return true;
    if (consume_literal("false")) return false;
    fail("Expected 'true' or 'false'");
}

int64_t JsonDeserializer::read_i64() {
    std::string_view tok = number_token();
    int64_t v = 0;
    auto [end, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
    if (ec == std::errc::result_out_of_range) {
        fail("Integer out of range: " + std::string(tok));
    }
    if (ec != std::errc{} || end != tok.data() + tok.size()) {
        fail("Expected integer, found '" + std::string(tok) + "'");
    }
    return v;
}

uint64_t JsonDeserializer::read_u64() {
    std::string_view tok = number_token();
    uint64_t v = 0;
    auto [end, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
    if (ec == std::errc::result_out_of_range) {
        fail("Integer out of range: " + std::string(tok));
    }
    if (ec != std::errc{} || end != tok.data() + tok.size()) {
        fail("Expected unsigned integer, found '" + std::string(tok) + "'");
    }
    return v;
}

double JsonDeserializer::read_f64() {
    std::string_view tok = number_token();
    double v = 0.0;
    auto [end, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), v);
    if (ec != std::errc{} || end != tok.data() + tok.size()) {
        fail("Invalid number '" + std::string(tok) + "'");
    }
    return v;
}

std::string JsonDeserializer::read_string() {
    expect('"');
    std::string result;

    auto parse_hex4 = [this]() -> uint32_t {
        if (pos_ + 4 > json_.size()) {
            fail("Invalid unicode escape");
        }
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("Invalid unicode escape");
        }
        return cp;
    };

    while (pos_ < json_.size()) {
        char c = consume();
        if (c == '"') {
            return result;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            fail("Unescaped control character in string");
        }
        if (c != '\\') {
            result += c;
            continue;
        }
        if (pos_ >= json_.size()) {
            fail("Unexpected end of string escape");
        }
        char escaped = consume();
        switch (escaped) {
            case '"':  result += '"'; break;
            case '\\': result += '\\'; break;
            case '/':  result += '/'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case 'n':  result += '\n'; break;
            case 'r':  result += '\r'; break;
            case 't':  result += '\t'; break;
            case 'u': {
                uint32_t cp = parse_hex4();
                // Surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (consume() != '\\' || consume() != 'u') {
                        fail("Unpaired surrogate in unicode escape");
                    }
                    uint32_t low = parse_hex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("Invalid low surrogate in unicode escape");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    fail("Unpaired surrogate in unicode escape");
                }
                append_utf8(result, cp);
                break;
            }
            default:
                fail("Invalid escape sequence: \\" + std::string(1, escaped));
        }
    }

    fail("Unterminated string");
}

bool JsonDeserializer::read_option() {
    return !consume_literal("null");
}

std::size_t JsonDeserializer::begin_seq() {
    expect('[');
    push_scope();
    return 0;
}

bool JsonDeserializer::has_next() {
    if (first_.empty()) {
        throw std::logic_error("JsonDeserializer::has_next called outside a sequence");
    }
    skip_whitespace();
    if (peek() == ']') return false;
    if (!first_.back()) expect(',');
    first_.back() = false;
    return true;
}

void JsonDeserializer::end_seq() {
    if (first_.empty()) {
        throw std::logic_error("JsonDeserializer::end_seq called outside a sequence");
    }
    expect(']');
    first_.pop_back();
}

void JsonDeserializer::begin_struct(std::string_view, std::size_t) {
    expect('{');
    push_scope();
}

void JsonDeserializer::field(std::string_view name) {
    if (first_.empty()) {
        throw std::logic_error("JsonDeserializer::field called outside a struct");
    }
    if (!first_.back()) expect(',');
    first_.back() = false;
    skip_whitespace();
    if (peek() != '"') {
        fail("Expected field '" + std::string(name) + "'");
    }
    std::string key = read_string();
    if (key != name) {
        fail("Expected field '" + std::string(name) + "', found '" + key + "'");
    }
    expect(':');
}

void JsonDeserializer::end_struct() {
    if (first_.empty()) {
        throw std::logic_error("JsonDeserializer::end_struct called outside a struct");
    }
    expect('}');
    first_.pop_back();
}

void JsonDeserializer::finish() {
    skip_whitespace();
    if (pos_ != json_.size()) {
        fail("Trailing characters after document");
    }
}

} // namespace dltypes
