// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file hash.h
/// @brief Hashing for program values, including composite standard containers.
///
/// `Hasher<T>` resolves, in order of preference:
/// - `std::hash<T>` when it is enabled (primitives, std::string, ...)
/// - a member `std::size_t hash() const` (generated structs)
/// - element-wise combination for std::vector, std::set, std::map,
///   std::optional and std::pair whose elements are themselves hashable
///
/// Equal values always produce equal hashes; containers hash their size
/// first so that nested empty containers stay distinguishable.

#pragma once

#include "dltypes_config.h"

#include <boost/container_hash/hash.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace dltypes {

template <typename T>
struct Hasher {};

template <typename T>
concept Hashable = requires(const T& v) {
    { Hasher<T>{}(v) } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept StdHashable = requires(const T& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept MemberHashable = requires(const T& v) {
    { v.hash() } -> std::convertible_to<std::size_t>;
};

/// Hash a value with Hasher<T>.
template <Hashable T>
[[nodiscard]] std::size_t hash_value(const T& value) {
    return Hasher<T>{}(value);
}

namespace detail {

template <typename It>
std::size_t hash_range(std::size_t count, It first, It last) {
    std::size_t seed = 0;
    boost::hash_combine(seed, count);
    for (; first != last; ++first) {
        boost::hash_combine(seed, dltypes::hash_value(*first));
    }
    return seed;
}

} // namespace detail

template <StdHashable T>
struct Hasher<T> {
    std::size_t operator()(const T& v) const { return std::hash<T>{}(v); }
};

template <MemberHashable T>
    requires(!StdHashable<T>)
struct Hasher<T> {
    std::size_t operator()(const T& v) const { return static_cast<std::size_t>(v.hash()); }
};

template <Hashable T, typename A>
    requires(!StdHashable<std::vector<T, A>>)
struct Hasher<std::vector<T, A>> {
    std::size_t operator()(const std::vector<T, A>& v) const {
        return detail::hash_range(v.size(), v.begin(), v.end());
    }
};

template <Hashable T, typename C, typename A>
struct Hasher<std::set<T, C, A>> {
    std::size_t operator()(const std::set<T, C, A>& v) const {
        return detail::hash_range(v.size(), v.begin(), v.end());
    }
};

template <Hashable K, Hashable V, typename C, typename A>
struct Hasher<std::map<K, V, C, A>> {
    std::size_t operator()(const std::map<K, V, C, A>& m) const {
        std::size_t seed = 0;
        boost::hash_combine(seed, m.size());
        for (const auto& [key, value] : m) {
            boost::hash_combine(seed, dltypes::hash_value(key));
            boost::hash_combine(seed, dltypes::hash_value(value));
        }
        return seed;
    }
};

template <Hashable A, Hashable B>
struct Hasher<std::pair<A, B>> {
    std::size_t operator()(const std::pair<A, B>& p) const {
        std::size_t seed = 0;
        boost::hash_combine(seed, dltypes::hash_value(p.first));
        boost::hash_combine(seed, dltypes::hash_value(p.second));
        return seed;
    }
};

template <Hashable T>
    requires(!StdHashable<std::optional<T>>)
struct Hasher<std::optional<T>> {
    std::size_t operator()(const std::optional<T>& v) const {
        std::size_t seed = 0;
        boost::hash_combine(seed, v.has_value());
        if (v) {
            boost::hash_combine(seed, dltypes::hash_value(*v));
        }
        return seed;
    }
};

} // namespace dltypes
