// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/types/account.hpp>
#include <strata/core/types/hash.hpp>

namespace strata {

//! \brief Read-only point-in-time view of the world state
//! \remarks A view owns whatever it needs to stay valid after the reader that produced it is gone
class StateView {
  public:
    virtual ~StateView() = default;

    virtual std::optional<Account> read_account(const evmc::address& address) const = 0;

    //! \return std::nullopt if the slot was never written, its current value otherwise
    virtual std::optional<evmc::bytes32> read_storage(const evmc::address& address,
                                                      const evmc::bytes32& location) const = 0;

    virtual std::optional<Bytes> read_code(const evmc::bytes32& code_hash) const = 0;

    //! \brief Canonical hash of an ancestor block, as needed by the BLOCKHASH opcode
    virtual std::optional<Hash> block_hash(BlockNum block_num) const = 0;
};

}  // namespace strata
