// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ordered_map.h
/// @brief Container aliases for key-value program data and its serialized form.

#pragma once

#include "dltypes_config.h"

#include <immer/vector.hpp>

#include <map>

namespace dltypes {

/// Ordered associative container with unique keys, iterated in ascending key order.
/// Owned by the generated structure that embeds it.
template <typename K, typename V>
using OrderedMap = std::map<K, V>;

/// The values of an OrderedMap in ascending key order, keys dropped.
/// Only exists for the duration of a (de)serialization pass.
template <typename V>
using SerializedForm = immer::vector<V>;

} // namespace dltypes
