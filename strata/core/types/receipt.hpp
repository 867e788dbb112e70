// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <strata/core/types/bloom.hpp>
#include <strata/core/types/log.hpp>
#include <strata/core/types/transaction.hpp>

namespace strata {

struct Receipt {
    TransactionType type{TransactionType::kLegacy};
    bool success{false};
    uint64_t cumulative_gas_used{0};
    Bloom bloom{};
    std::vector<Log> logs;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

}  // namespace strata
