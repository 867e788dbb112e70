// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/core/common/empty_hashes.hpp>

namespace strata {

inline constexpr uint64_t kDefaultIncarnation{1};

struct Account {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 code_hash{kEmptyHash};
    uint64_t incarnation{0};

    friend bool operator==(const Account&, const Account&) = default;

    std::string to_string() const;
};

//! \brief Pre-state of one account as it was before the block that changed it was applied
//! \remarks std::nullopt as info means the account did not exist
struct AccountBeforeTx {
    evmc::address address;
    std::optional<Account> info;

    friend bool operator==(const AccountBeforeTx&, const AccountBeforeTx&) = default;
};

}  // namespace strata
