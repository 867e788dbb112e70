// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <array>

namespace strata {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static constexpr std::array<char, 16> kHexDigits{'0', '1', '2', '3', '4', '5', '6', '7',
                                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    size_t pos{0};
    if (with_prefix) {
        out[pos++] = '0';
        out[pos++] = 'x';
    }
    for (const auto& b : bytes) {
        out[pos++] = kHexDigits[b >> 4];
        out[pos++] = kHexDigits[b & 0x0f];
    }
    return out;
}

}  // namespace strata

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    out << strata::to_hex(address);
    return out;
}

std::ostream& operator<<(std::ostream& out, const evmc::bytes32& hash) {
    out << strata::to_hex(hash);
    return out;
}

}  // namespace evmc
