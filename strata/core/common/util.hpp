// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/core/common/bytes.hpp>

namespace strata {

//! \brief Returns a string representing the hex form of provided bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

inline std::string to_hex(const evmc::bytes32& value, bool with_prefix = true) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

inline std::string to_hex(const evmc::address& value, bool with_prefix = true) {
    return to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace strata

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);
std::ostream& operator<<(std::ostream& out, const evmc::bytes32& hash);

}  // namespace evmc
