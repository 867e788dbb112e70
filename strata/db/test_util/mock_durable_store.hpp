// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

#include <strata/db/storage.hpp>

namespace strata::db::test_util {

class MockDurableReader : public DurableReader {
  public:
    MOCK_METHOD((BlockNum), last_block_number, (), (const, override));
    MOCK_METHOD((std::optional<BlockNum>), block_number, (const Hash&), (const, override));
    MOCK_METHOD((std::optional<Hash>), block_hash, (BlockNum), (const, override));
    MOCK_METHOD((std::vector<Hash>), canonical_hashes_range, (BlockNum, BlockNum), (const, override));

    MOCK_METHOD((std::optional<SealedHeader>), sealed_header, (BlockHashOrNumber), (const, override));
    MOCK_METHOD((std::vector<SealedHeader>), sealed_headers_range, (BlockNum, BlockNum), (const, override));
    MOCK_METHOD((std::vector<SealedHeader>), sealed_headers_while, (BlockNum, BlockNum, const HeaderPredicate&),
                (const, override));
    MOCK_METHOD((std::optional<intx::uint256>), header_td_by_number, (BlockNum), (const, override));

    MOCK_METHOD((std::optional<StoredBlockBodyIndices>), block_body_indices, (BlockNum), (const, override));
    MOCK_METHOD((std::optional<SealedBlock>), block, (BlockHashOrNumber), (const, override));
    MOCK_METHOD((std::optional<SealedBlockWithSenders>), sealed_block_with_senders, (BlockHashOrNumber), (const, override));
    MOCK_METHOD((std::vector<SealedBlockWithSenders>), sealed_block_with_senders_range, (BlockNum, BlockNum),
                (const, override));

    MOCK_METHOD((std::optional<TxnId>), transaction_id, (const Hash&), (const, override));
    MOCK_METHOD((std::optional<Transaction>), transaction_by_id, (TxnId), (const, override));
    MOCK_METHOD((std::optional<std::pair<Transaction, TransactionMeta>>), transaction_by_hash_with_meta, (const Hash&),
                (const, override));
    MOCK_METHOD((std::optional<BlockNum>), transaction_block, (TxnId), (const, override));
    MOCK_METHOD((std::vector<Transaction>), transactions_by_tx_range, (TxnIdRange), (const, override));
    MOCK_METHOD((std::vector<evmc::address>), senders_by_tx_range, (TxnIdRange), (const, override));
    MOCK_METHOD((std::optional<evmc::address>), transaction_sender, (TxnId), (const, override));

    MOCK_METHOD((std::optional<Receipt>), receipt, (TxnId), (const, override));
    MOCK_METHOD((std::optional<Receipt>), receipt_by_hash, (const Hash&), (const, override));
    MOCK_METHOD((std::optional<std::vector<Receipt>>), receipts_by_block, (BlockHashOrNumber), (const, override));
    MOCK_METHOD((std::vector<Receipt>), receipts_by_tx_range, (TxnIdRange), (const, override));
    MOCK_METHOD((std::optional<Requests>), requests_by_block, (BlockHashOrNumber), (const, override));

    MOCK_METHOD((std::optional<StageCheckpoint>), stage_checkpoint, (StageId), (const, override));
    MOCK_METHOD((std::optional<Bytes>), stage_checkpoint_progress, (StageId), (const, override));
    MOCK_METHOD((std::vector<std::pair<StageId, StageCheckpoint>>), stage_checkpoints, (), (const, override));
    MOCK_METHOD((std::optional<PruneCheckpoint>), prune_checkpoint, (PruneSegment), (const, override));
    MOCK_METHOD((std::vector<std::pair<PruneSegment, PruneCheckpoint>>), prune_checkpoints, (), (const, override));

    MOCK_METHOD((std::vector<AccountBeforeTx>), account_block_changeset, (BlockNum), (const, override));
    MOCK_METHOD((std::optional<BlockNum>), last_finalized_block_number, (), (const, override));
    MOCK_METHOD((std::optional<BlockNum>), last_safe_block_number, (), (const, override));

    MOCK_METHOD((std::unique_ptr<StateView>), latest_state, (), (const, override));
    MOCK_METHOD((std::unique_ptr<StateView>), history_by_block_hash, (const Hash&), (const, override));
};

class MockDurableStore : public DurableStore {
  public:
    MOCK_METHOD((const ChainConfig&), chain_config, (), (const, override));
    MOCK_METHOD((std::unique_ptr<DurableReader>), begin_read, (), (const, override));
};

}  // namespace strata::db::test_util
