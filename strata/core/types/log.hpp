// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <strata/core/common/bytes.hpp>

namespace strata {

struct Log {
    evmc::address address;
    std::vector<evmc::bytes32> topics;
    Bytes data;

    friend bool operator==(const Log&, const Log&) = default;
};

}  // namespace strata
