// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <strata/chain_state/in_memory_chain.hpp>
#include <strata/db/state/state_view.hpp>

namespace strata::chain_state {

//! \brief State at the end of an in-memory block
//! \details Changes of the in-memory blocks, newest first, are layered above the durable historical state taken at
//! their anchor. Lookups stop at the newest block that touched the key.
class MemoryOverlayStateView : public StateView {
  public:
    MemoryOverlayStateView(std::vector<BlockStatePtr> in_memory, std::unique_ptr<StateView> historical);

    std::optional<Account> read_account(const evmc::address& address) const override;

    std::optional<evmc::bytes32> read_storage(const evmc::address& address,
                                              const evmc::bytes32& location) const override;

    std::optional<Bytes> read_code(const evmc::bytes32& code_hash) const override;

    std::optional<Hash> block_hash(BlockNum block_num) const override;

    const std::vector<BlockStatePtr>& in_memory() const { return in_memory_; }

  private:
    //! Newest first
    std::vector<BlockStatePtr> in_memory_;
    std::unique_ptr<StateView> historical_;
};

}  // namespace strata::chain_state
