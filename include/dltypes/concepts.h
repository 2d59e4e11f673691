// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for the value types flowing through generated code.
///
/// `Val<T>` is the value contract: every type stored in a relation, used as a
/// map key or map value, or nested inside another value must satisfy it.
/// Conformance is structural; nothing needs to be declared. A generated
/// struct conforms once it has
/// - a default constructor
/// - `auto operator<=>(const T&) const = default;` (and the implied operator==)
/// - `std::size_t hash() const` or a std::hash specialization
/// - `void serialize(Serializer&) const` and `static T deserialize(Deserializer&)`
///
/// Standard containers of conforming types conform automatically.
///
/// Floating-point types are serializable but are not values: `<=>` on them
/// yields std::partial_ordering (NaN is unordered and unequal to itself), so
/// neither they nor any container or struct holding them satisfies `Val`.
///
/// A type missing any capability is rejected at compile time wherever `Val`
/// constrains a template, never later at runtime.

#pragma once

#include "codec.h"
#include "hash.h"

#include <compare>
#include <concepts>
#include <functional>
#include <type_traits>

namespace dltypes {

// ============================================================
// Value Contract
// ============================================================

/// Values own their data: no pointers and no references.
template <typename T>
concept SelfContained = std::is_object_v<T> && !std::is_pointer_v<T>;

/// `<` and `<=>` agree and every pair of values is comparable.
/// Rejects anything whose `<=>` only yields std::partial_ordering.
template <typename T>
concept StrictlyOrdered = std::totally_ordered<T> &&
                          std::three_way_comparable<T, std::weak_ordering>;

template <typename T>
concept Val = SelfContained<T> &&
              std::default_initializable<T> &&
              std::equality_comparable<T> &&
              StrictlyOrdered<T> &&
              std::copyable<T> &&
              Hashable<T> &&
              Serializable<T> &&
              Deserializable<T>;

// ============================================================
// Callable Concepts
// ============================================================

/// Function computing the key a value is stored under.
template <typename Fn, typename K, typename V>
concept KeyFunction = std::regular_invocable<Fn, const V&> &&
                      std::convertible_to<std::invoke_result_t<Fn, const V&>, K>;

} // namespace dltypes

/// Assert at the point of definition that a generated type satisfies the value contract.
#define DLTYPES_ASSERT_VAL(T) \
    static_assert(::dltypes::Val<T>, #T " does not satisfy the dltypes value contract")
