// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

namespace strata {

/*
Alias templates to fast hash maps and sets, i.e. Abseil "Swiss tables"

FlatHashMap – a hash map that might not have pointer stability.
FlatHashSet – a hash set that might not have pointer stability.

Values that must survive a rehash are held through std::shared_ptr.

See https://abseil.io/docs/cpp/guides/container#hash-tables
*/

template <class K, class V>
using FlatHashMap = absl::flat_hash_map<K, V>;

template <class T>
using FlatHashSet = absl::flat_hash_set<T>;

}  // namespace strata
