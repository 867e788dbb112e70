// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

namespace strata {

//! Block and transaction hashes are carried as opaque 32-byte values computed outside this library
using Hash = evmc::bytes32;

}  // namespace strata
