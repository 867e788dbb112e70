// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "account.hpp"

#include <strata/core/common/util.hpp>

namespace strata {

std::string Account::to_string() const {
    std::string out;
    out.append("nonce: " + std::to_string(nonce));
    out.append(" balance: " + intx::to_string(balance));
    out.append(" code_hash: " + to_hex(code_hash));
    out.append(" incarnation: " + std::to_string(incarnation));
    return out;
}

}  // namespace strata
