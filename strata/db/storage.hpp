// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/core/chain/config.hpp>
#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/types/account.hpp>
#include <strata/core/types/block.hpp>
#include <strata/core/types/block_body_indices.hpp>
#include <strata/core/types/block_id.hpp>
#include <strata/core/types/receipt.hpp>
#include <strata/core/types/request.hpp>
#include <strata/core/types/transaction.hpp>
#include <strata/db/prune.hpp>
#include <strata/db/stages.hpp>
#include <strata/db/state/state_view.hpp>

namespace strata::db {

using HeaderPredicate = std::function<bool(const SealedHeader&)>;

//! \brief Read access to the blocks persisted up to and including the durable boundary
//! \details A reader is a short-lived handle opened for one logical query. All block ranges are inclusive
//! [first, last] and all transaction ranges are half-open [start, end). Range queries return the prefix the store
//! holds, possibly empty. Any exception thrown by an implementation signals a storage failure.
class DurableReader {
  public:
    virtual ~DurableReader() = default;

    //! \brief Highest persisted block number, i.e. the durable boundary
    virtual BlockNum last_block_number() const = 0;

    virtual std::optional<BlockNum> block_number(const Hash& hash) const = 0;

    //! \brief Canonical hash at given block number
    virtual std::optional<Hash> block_hash(BlockNum block_num) const = 0;

    virtual std::vector<Hash> canonical_hashes_range(BlockNum first, BlockNum last) const = 0;

    virtual std::optional<SealedHeader> sealed_header(BlockHashOrNumber id) const = 0;

    virtual std::vector<SealedHeader> sealed_headers_range(BlockNum first, BlockNum last) const = 0;

    //! \brief Headers in range as long as the predicate holds, stopping at the first rejected header
    virtual std::vector<SealedHeader> sealed_headers_while(BlockNum first, BlockNum last,
                                                           const HeaderPredicate& predicate) const = 0;

    virtual std::optional<intx::uint256> header_td_by_number(BlockNum block_num) const = 0;

    virtual std::optional<StoredBlockBodyIndices> block_body_indices(BlockNum block_num) const = 0;

    virtual std::optional<SealedBlock> block(BlockHashOrNumber id) const = 0;

    virtual std::optional<SealedBlockWithSenders> sealed_block_with_senders(BlockHashOrNumber id) const = 0;

    virtual std::vector<SealedBlockWithSenders> sealed_block_with_senders_range(BlockNum first, BlockNum last) const = 0;

    //! \brief Global transaction number from the transaction hash index
    virtual std::optional<TxnId> transaction_id(const Hash& tx_hash) const = 0;

    virtual std::optional<Transaction> transaction_by_id(TxnId id) const = 0;

    virtual std::optional<std::pair<Transaction, TransactionMeta>> transaction_by_hash_with_meta(const Hash& tx_hash) const = 0;

    //! \brief Number of the block owning given transaction
    virtual std::optional<BlockNum> transaction_block(TxnId id) const = 0;

    virtual std::vector<Transaction> transactions_by_tx_range(TxnIdRange range) const = 0;

    virtual std::vector<evmc::address> senders_by_tx_range(TxnIdRange range) const = 0;

    virtual std::optional<evmc::address> transaction_sender(TxnId id) const = 0;

    virtual std::optional<Receipt> receipt(TxnId id) const = 0;

    virtual std::optional<Receipt> receipt_by_hash(const Hash& tx_hash) const = 0;

    virtual std::optional<std::vector<Receipt>> receipts_by_block(BlockHashOrNumber id) const = 0;

    virtual std::vector<Receipt> receipts_by_tx_range(TxnIdRange range) const = 0;

    //! \brief EIP-7685 requests of given block, if the store has them
    virtual std::optional<Requests> requests_by_block(BlockHashOrNumber id) const = 0;

    virtual std::optional<StageCheckpoint> stage_checkpoint(StageId id) const = 0;

    //! \brief Opaque intermediate progress a stage saved while unwinding or executing
    virtual std::optional<Bytes> stage_checkpoint_progress(StageId id) const = 0;

    virtual std::vector<std::pair<StageId, StageCheckpoint>> stage_checkpoints() const = 0;

    virtual std::optional<PruneCheckpoint> prune_checkpoint(PruneSegment segment) const = 0;

    virtual std::vector<std::pair<PruneSegment, PruneCheckpoint>> prune_checkpoints() const = 0;

    //! \brief Pre-state of each account the given block changed
    virtual std::vector<AccountBeforeTx> account_block_changeset(BlockNum block_num) const = 0;

    virtual std::optional<BlockNum> last_finalized_block_number() const = 0;

    virtual std::optional<BlockNum> last_safe_block_number() const = 0;

    //! \brief State as of the durable boundary
    virtual std::unique_ptr<StateView> latest_state() const = 0;

    //! \brief State as of the end of given durable block
    //! \return nullptr if the block is not persisted
    virtual std::unique_ptr<StateView> history_by_block_hash(const Hash& block_hash) const = 0;
};

//! \brief Factory of read handles on the durable store
class DurableStore {
  public:
    virtual ~DurableStore() = default;

    virtual const ChainConfig& chain_config() const = 0;

    virtual std::unique_ptr<DurableReader> begin_read() const = 0;
};

}  // namespace strata::db
