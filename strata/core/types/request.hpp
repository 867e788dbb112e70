// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <strata/core/common/bytes.hpp>

namespace strata {

//! \brief EIP-7685 execution layer requests of one block, each one an opaque type-prefixed payload
//! \see https://eips.ethereum.org/EIPS/eip-7685
using Requests = std::vector<Bytes>;

}  // namespace strata
