// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_map.h
/// @brief Serialize an OrderedMap as a bare sequence of values, re-deriving keys on load.
///
/// When every key of a map is a deterministic function of its value, storing
/// the keys is redundant. ArrayMapCodec writes only the values, in ascending
/// key order, and rebuilds the map on load by calling the key function on
/// each value:
///
///   {1: "a", 2: "bb"}  --serialize-->  ["a", "bb"]  --deserialize-->  {1: "a", 2: "bb"}
///                                                     (key = length of value)
///
/// Duplicate derived keys are resolved last-write-wins: among values that
/// derive the same key, the one appearing later in the sequence is kept and
/// no error is raised. Readers of existing documents depend on this exact
/// tie-break, so it must not be turned into a rejection.
///
/// Preconditions (not checked):
/// - for every entry, `KeyFn(value) == key`
/// - KeyFn is total and keeps the same meaning on the writing and reading side
///
/// Usage:
/// @code
///   struct Port { std::string name; uint16_t number; ... };
///   inline std::string port_name(const Port& p) { return p.name; }
///
///   DLTYPES_MAP_FROM_ARRAY(PortsByName, std::string, Port, port_name);
///
///   struct Switch {
///       OrderedMap<std::string, Port> ports;
///
///       void serialize(Serializer& s) const {
///           s.begin_struct("Switch", 1);
///           write_field_with<PortsByName>(s, "ports", ports);
///           s.end_struct();
///       }
///       static Switch deserialize(Deserializer& d) {
///           Switch sw;
///           d.begin_struct("Switch", 1);
///           sw.ports = read_field_with<PortsByName>(d, "ports");
///           d.end_struct();
///           return sw;
///       }
///   };
/// @endcode

#pragma once

#include "concepts.h"
#include "log.h"
#include "ordered_map.h"

#include <immer/vector_transient.hpp>

#include <cstddef>
#include <functional>
#include <utility>

namespace dltypes {

/// @tparam K      Key type
/// @tparam V      Value type
/// @tparam KeyFn  Function (reference or pointer) deriving a value's key
///
/// Stateless: all operations are static and hold nothing across calls.
template <typename K, typename V, auto KeyFn>
    requires Val<K> && Val<V> && KeyFunction<decltype(KeyFn), K, V>
struct ArrayMapCodec {
    using key_type        = K;
    using value_type      = V;
    using map_type        = OrderedMap<K, V>;
    using serialized_type = SerializedForm<V>;

    [[nodiscard]] static K derive_key(const V& value) {
        return std::invoke(KeyFn, value);
    }

    /// Values of @p map in ascending key order.
    [[nodiscard]] static serialized_type to_sequence(const map_type& map) {
        auto transient = serialized_type{}.transient();
        for (const auto& [key, value] : map) {
            transient.push_back(value);
        }
        return transient.persistent();
    }

    /// Rebuild a map from values, last write wins on duplicate derived keys.
    [[nodiscard]] static map_type from_sequence(const serialized_type& seq) {
        map_type result;
        for (const auto& value : seq) {
            result.insert_or_assign(derive_key(value), value);
        }
        return result;
    }

    /// Write @p map as a sequence of values through Codec<V>.
    static void serialize(Serializer& s, const map_type& map) {
        s.begin_seq(map.size());
        for (const auto& [key, value] : map) {
            Codec<V>::serialize(s, value);
        }
        s.end_seq();
    }

    /// Read a sequence of values and key each one with KeyFn.
    /// @throws MalformedValue if any element fails to decode; nothing is returned
    ///         for the map in that case
    [[nodiscard]] static map_type deserialize(Deserializer& d) {
        map_type result;
        d.begin_seq();
        std::size_t index = 0;
        while (d.has_next()) {
            V value;
            try {
                value = Codec<V>::deserialize(d);
            } catch (const MalformedValue& e) {
                detail::log_decode_error("ArrayMapCodec", index, e.what());
                throw;
            }
            K key = derive_key(value);
            result.insert_or_assign(std::move(key), std::move(value));
            ++index;
        }
        d.end_seq();
        return result;
    }
};

} // namespace dltypes

/// Declare @p name as the array-backed codec for an OrderedMap<ktype, vtype>
/// field whose keys are computed by @p kfunc.
#define DLTYPES_MAP_FROM_ARRAY(name, ktype, vtype, kfunc) \
    using name = ::dltypes::ArrayMapCodec<ktype, vtype, kfunc>
