// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file codec.h
/// @brief Codec customization point and document-level (de)serialization helpers.
///
/// `Codec<T>` describes how a value of type T maps onto the Serializer data
/// model. It is specialized here for primitives, strings and standard and
/// immer containers; any other type opts in by providing
///
/// @code
///   void serialize(Serializer& s) const;
///   static T deserialize(Deserializer& d);
/// @endcode
///
/// Container specializations are only usable when their element types are,
/// so `Serializable<std::vector<X>>` holds exactly when `Serializable<X>` does.
///
/// Usage:
/// @code
///   std::vector<std::string> names = {"a", "b"};
///   ByteBuffer bytes = to_bytes(names);
///   auto restored = from_bytes<std::vector<std::string>>(bytes);
///
///   std::string json = to_json(names);           // ["a","b"]
///   auto parsed = try_from_json<std::vector<std::string>>(json, &error);
/// @endcode

#pragma once

#include "dltypes_config.h"

#include "api.h"
#include "binary_format.h"
#include "error.h"
#include "json_format.h"
#include "serializer.h"

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <algorithm>  // for std::min
#include <cmath>      // for std::isfinite, std::fabs
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>    // for std::in_range
#include <vector>

namespace dltypes {

// ============================================================
// Customization Point
// ============================================================

/// Primary template: no codec. Specializations provide
/// `static void serialize(Serializer&, const T&)` and
/// `static T deserialize(Deserializer&)`.
template <typename T>
struct Codec {};

template <typename T>
concept Serializable = requires(Serializer& s, const T& v) {
    Codec<T>::serialize(s, v);
};

template <typename T>
concept Deserializable = requires(Deserializer& d) {
    { Codec<T>::deserialize(d) } -> std::same_as<T>;
};

/// Types that carry their own serialize/deserialize members (generated structs).
template <typename T>
concept MemberCodec = requires(Serializer& s, Deserializer& d, const T& v) {
    v.serialize(s);
    { T::deserialize(d) } -> std::same_as<T>;
};

/// A codec for T: Codec<T> itself, or a field-specific codec such as ArrayMapCodec.
template <typename C, typename T>
concept CodecFor = requires(Serializer& s, Deserializer& d, const T& v) {
    C::serialize(s, v);
    { C::deserialize(d) } -> std::same_as<T>;
};

namespace detail {

inline std::size_t capped_reserve(std::size_t hint) noexcept {
    return std::min<std::size_t>(hint, DLTYPES_MAX_RESERVE);
}

/// Integer types usable with std::in_range (character types and bool excluded).
template <typename T>
concept StandardInteger = std::integral<T> &&
                          !std::same_as<T, bool> &&
                          !std::same_as<T, char> &&
                          !std::same_as<T, wchar_t> &&
                          !std::same_as<T, char8_t> &&
                          !std::same_as<T, char16_t> &&
                          !std::same_as<T, char32_t>;

} // namespace detail

// ============================================================
// Primitive Codecs
// ============================================================

template <>
struct Codec<bool> {
    static void serialize(Serializer& s, bool v) { s.write_bool(v); }
    static bool deserialize(Deserializer& d) { return d.read_bool(); }
};

template <std::signed_integral T>
    requires detail::StandardInteger<T>
struct Codec<T> {
    static void serialize(Serializer& s, T v) { s.write_i64(static_cast<int64_t>(v)); }

    static T deserialize(Deserializer& d) {
        int64_t v = d.read_i64();
        if (!std::in_range<T>(v)) {
            throw MalformedValue("Integer " + std::to_string(v) + " out of range for " +
                                 std::to_string(sizeof(T) * 8) + "-bit signed field");
        }
        return static_cast<T>(v);
    }
};

template <std::unsigned_integral T>
    requires detail::StandardInteger<T>
struct Codec<T> {
    static void serialize(Serializer& s, T v) { s.write_u64(static_cast<uint64_t>(v)); }

    static T deserialize(Deserializer& d) {
        uint64_t v = d.read_u64();
        if (!std::in_range<T>(v)) {
            throw MalformedValue("Integer " + std::to_string(v) + " out of range for " +
                                 std::to_string(sizeof(T) * 8) + "-bit unsigned field");
        }
        return static_cast<T>(v);
    }
};

/// Doubles on the wire; narrower targets reject finite values they cannot hold.
template <std::floating_point T>
struct Codec<T> {
    static void serialize(Serializer& s, T v) { s.write_f64(static_cast<double>(v)); }

    static T deserialize(Deserializer& d) {
        double v = d.read_f64();
        if constexpr (std::numeric_limits<T>::max() < std::numeric_limits<double>::max()) {
            if (std::isfinite(v) && std::fabs(v) > static_cast<double>(std::numeric_limits<T>::max())) {
                throw MalformedValue("Floating-point value out of range for " +
                                     std::to_string(sizeof(T) * 8) + "-bit field");
            }
        }
        return static_cast<T>(v);
    }
};

template <>
struct Codec<std::string> {
    static void serialize(Serializer& s, const std::string& v) { s.write_string(v); }
    static std::string deserialize(Deserializer& d) { return d.read_string(); }
};

// ============================================================
// Container Codecs
// ============================================================

template <typename T, typename A>
struct Codec<std::vector<T, A>> {
    static void serialize(Serializer& s, const std::vector<T, A>& v)
        requires Serializable<T>
    {
        s.begin_seq(v.size());
        for (const auto& item : v) {
            Codec<T>::serialize(s, item);
        }
        s.end_seq();
    }

    static std::vector<T, A> deserialize(Deserializer& d)
        requires Deserializable<T>
    {
        std::vector<T, A> out;
        out.reserve(detail::capped_reserve(d.begin_seq()));
        while (d.has_next()) {
            out.push_back(Codec<T>::deserialize(d));
        }
        d.end_seq();
        return out;
    }
};

/// immer::vector is written as a plain sequence; reads batch through a transient.
template <typename T, typename MP, immer::detail::rbts::bits_t B, immer::detail::rbts::bits_t BL>
struct Codec<immer::vector<T, MP, B, BL>> {
    using vector_type = immer::vector<T, MP, B, BL>;

    static void serialize(Serializer& s, const vector_type& v)
        requires Serializable<T>
    {
        s.begin_seq(v.size());
        for (const auto& item : v) {
            Codec<T>::serialize(s, item);
        }
        s.end_seq();
    }

    static vector_type deserialize(Deserializer& d)
        requires Deserializable<T>
    {
        auto transient = vector_type{}.transient();
        d.begin_seq();
        while (d.has_next()) {
            transient.push_back(Codec<T>::deserialize(d));
        }
        d.end_seq();
        return transient.persistent();
    }
};

template <typename T, typename C, typename A>
struct Codec<std::set<T, C, A>> {
    static void serialize(Serializer& s, const std::set<T, C, A>& v)
        requires Serializable<T>
    {
        s.begin_seq(v.size());
        for (const auto& item : v) {
            Codec<T>::serialize(s, item);
        }
        s.end_seq();
    }

    static std::set<T, C, A> deserialize(Deserializer& d)
        requires Deserializable<T>
    {
        std::set<T, C, A> out;
        d.begin_seq();
        while (d.has_next()) {
            out.insert(Codec<T>::deserialize(d));
        }
        d.end_seq();
        return out;
    }
};

/// Pairs are written as a two-element sequence.
template <typename A, typename B>
struct Codec<std::pair<A, B>> {
    static void serialize(Serializer& s, const std::pair<A, B>& v)
        requires Serializable<A> && Serializable<B>
    {
        s.begin_seq(2);
        Codec<A>::serialize(s, v.first);
        Codec<B>::serialize(s, v.second);
        s.end_seq();
    }

    static std::pair<A, B> deserialize(Deserializer& d)
        requires Deserializable<A> && Deserializable<B>
    {
        d.begin_seq();
        d.expect_element();
        A first = Codec<A>::deserialize(d);
        d.expect_element();
        B second = Codec<B>::deserialize(d);
        if (d.has_next()) {
            throw MalformedValue("Pair has more than two elements");
        }
        d.end_seq();
        return {std::move(first), std::move(second)};
    }
};

/// Maps keep their keys: a sequence of [key, value] pairs in key order.
/// Use ArrayMapCodec (array_map.h) to drop keys that are derivable from values.
template <typename K, typename V, typename C, typename A>
struct Codec<std::map<K, V, C, A>> {
    static void serialize(Serializer& s, const std::map<K, V, C, A>& m)
        requires Serializable<K> && Serializable<V>
    {
        s.begin_seq(m.size());
        for (const auto& [key, value] : m) {
            s.begin_seq(2);
            Codec<K>::serialize(s, key);
            Codec<V>::serialize(s, value);
            s.end_seq();
        }
        s.end_seq();
    }

    static std::map<K, V, C, A> deserialize(Deserializer& d)
        requires Deserializable<K> && Deserializable<V>
    {
        std::map<K, V, C, A> out;
        d.begin_seq();
        while (d.has_next()) {
            auto entry = Codec<std::pair<K, V>>::deserialize(d);
            out.insert_or_assign(std::move(entry.first), std::move(entry.second));
        }
        d.end_seq();
        return out;
    }
};

template <typename T>
struct Codec<std::optional<T>> {
    static void serialize(Serializer& s, const std::optional<T>& v)
        requires Serializable<T>
    {
        s.begin_option(v.has_value());
        if (v) {
            Codec<T>::serialize(s, *v);
        }
    }

    static std::optional<T> deserialize(Deserializer& d)
        requires Deserializable<T>
    {
        if (!d.read_option()) {
            return std::nullopt;
        }
        return Codec<T>::deserialize(d);
    }
};

template <MemberCodec T>
struct Codec<T> {
    static void serialize(Serializer& s, const T& v) { v.serialize(s); }
    static T deserialize(Deserializer& d) { return T::deserialize(d); }
};

// ============================================================
// Struct Field Helpers
// ============================================================

/// Write one named field of a struct through Codec<T>.
template <Serializable T>
void write_field(Serializer& s, std::string_view name, const T& value) {
    s.field(name);
    Codec<T>::serialize(s, value);
}

/// Read one named field of a struct through Codec<T>.
template <Deserializable T>
[[nodiscard]] T read_field(Deserializer& d, std::string_view name) {
    d.field(name);
    return Codec<T>::deserialize(d);
}

/// Write one named field through a field-specific codec (e.g. an ArrayMapCodec).
template <typename FieldCodec, typename T>
    requires CodecFor<FieldCodec, T>
void write_field_with(Serializer& s, std::string_view name, const T& value) {
    s.field(name);
    FieldCodec::serialize(s, value);
}

/// Read one named field through a field-specific codec.
template <typename FieldCodec>
[[nodiscard]] auto read_field_with(Deserializer& d, std::string_view name)
    -> decltype(FieldCodec::deserialize(d))
{
    d.field(name);
    return FieldCodec::deserialize(d);
}

// ============================================================
// Binary Documents
// ============================================================

/// Encode @p value as a binary document using codec @p C.
template <typename C, typename T>
    requires requires(Serializer& s, const T& v) { C::serialize(s, v); }
[[nodiscard]] ByteBuffer to_bytes_with(const T& value) {
    BinarySerializer s;
    C::serialize(s, value);
    return s.take();
}

/// @throws MalformedValue on invalid or trailing data
template <typename C>
[[nodiscard]] auto from_bytes_with(const uint8_t* data, std::size_t size)
    -> decltype(C::deserialize(std::declval<Deserializer&>()))
{
    BinaryDeserializer d(data, size);
    auto value = C::deserialize(d);
    d.finish();
    return value;
}

template <Serializable T>
[[nodiscard]] ByteBuffer to_bytes(const T& value) {
    return to_bytes_with<Codec<T>>(value);
}

/// @throws MalformedValue on invalid or trailing data
template <Deserializable T>
[[nodiscard]] T from_bytes(const uint8_t* data, std::size_t size) {
    return from_bytes_with<Codec<T>>(data, size);
}

template <Deserializable T>
[[nodiscard]] T from_bytes(const ByteBuffer& buffer) {
    return from_bytes<T>(buffer.data(), buffer.size());
}

/// @param error_out If provided, receives the error message on failure
/// @return The decoded value, or std::nullopt if the buffer is malformed
template <Deserializable T>
[[nodiscard]] std::optional<T> try_from_bytes(const ByteBuffer& buffer, std::string* error_out = nullptr) {
    try {
        return from_bytes<T>(buffer);
    } catch (const MalformedValue& e) {
        if (error_out) *error_out = e.what();
        return std::nullopt;
    }
}

// ============================================================
// JSON Documents
// ============================================================

/// Encode @p value as JSON using codec @p C.
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
template <typename C, typename T>
    requires requires(Serializer& s, const T& v) { C::serialize(s, v); }
[[nodiscard]] std::string to_json_with(const T& value, bool compact = true) {
    JsonSerializer s(compact);
    C::serialize(s, value);
    return s.take();
}

/// @throws MalformedValue on invalid JSON or a value of the wrong shape
template <typename C>
[[nodiscard]] auto from_json_with(std::string_view json)
    -> decltype(C::deserialize(std::declval<Deserializer&>()))
{
    JsonDeserializer d(json);
    auto value = C::deserialize(d);
    d.finish();
    return value;
}

template <Serializable T>
[[nodiscard]] std::string to_json(const T& value, bool compact = true) {
    return to_json_with<Codec<T>>(value, compact);
}

/// @throws MalformedValue on invalid JSON or a value of the wrong shape
template <Deserializable T>
[[nodiscard]] T from_json(std::string_view json) {
    return from_json_with<Codec<T>>(json);
}

/// @param error_out If provided, receives the error message on failure
/// @return The decoded value, or std::nullopt on parse error
template <Deserializable T>
[[nodiscard]] std::optional<T> try_from_json(std::string_view json, std::string* error_out = nullptr) {
    try {
        return from_json<T>(json);
    } catch (const MalformedValue& e) {
        if (error_out) *error_out = e.what();
        return std::nullopt;
    }
}

} // namespace dltypes
