// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include <intx/intx.hpp>

#include <strata/core/common/assert.hpp>

namespace strata {

using namespace std::string_view_literals;

//! TxnId is the global, contiguous and chain-ordered number of a transaction
using TxnId = uint64_t;

//! Half-open range [start, end) of transaction numbers
struct TxnIdRange {
    TxnId start;
    TxnId end;
    TxnIdRange(TxnId start1, TxnId end1) : start(start1), end(end1) {}
    friend bool operator==(const TxnIdRange&, const TxnIdRange&) = default;
    bool contains(TxnId num) const { return (start <= num) && (num < end); }
    bool empty() const { return start >= end; }
    TxnId size() const { return empty() ? 0 : end - start; }
    std::string to_string() const { return std::string("[") + std::to_string(start) + ", " + std::to_string(end) + ")"; }
};

using BlockNum = uint64_t;

inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

using BlockTime = uint64_t;

inline constexpr BlockNum kEarliestBlockNum{0ul};

inline constexpr uint64_t kGiga{1'000'000'000};   // = 10^9
inline constexpr uint64_t kEther{kGiga * kGiga};  // = 10^18

}  // namespace strata
