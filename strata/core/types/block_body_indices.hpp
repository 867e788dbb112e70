// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <strata/core/common/base.hpp>

namespace strata {

//! \brief Global transaction numbering of one block body as persisted in the durable store
//! \details Transactions of block N occupy [first_tx_num, first_tx_num + tx_count) and the numbering is
//! contiguous across consecutive blocks
struct StoredBlockBodyIndices {
    TxnId first_tx_num{0};
    uint64_t tx_count{0};

    //! \brief First transaction number of the next block
    TxnId next_tx_num() const { return first_tx_num + tx_count; }

    //! \brief Last transaction number of this block
    //! \remarks For an empty body this is the last number of the previous block, saturating at zero
    TxnId last_tx_num() const { return next_tx_num() == 0 ? 0 : next_tx_num() - 1; }

    bool contains_tx(TxnId tx_num) const { return first_tx_num <= tx_num && tx_num < next_tx_num(); }

    bool empty() const { return tx_count == 0; }

    TxnIdRange tx_num_range() const { return {first_tx_num, next_tx_num()}; }

    friend bool operator==(const StoredBlockBodyIndices&, const StoredBlockBodyIndices&) = default;
};

}  // namespace strata
