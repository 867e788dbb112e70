// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/chain_state/chain_info_tracker.hpp>
#include <strata/chain_state/notifications.hpp>
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
#include <strata/core/types/withdrawal.hpp>
#include <strata/db/prune.hpp>
#include <strata/db/stages.hpp>
#include <strata/db/state/state_view.hpp>
#include <strata/db/storage.hpp>
#include <strata/provider/evm_env.hpp>

// Narrow read interfaces over the chain, one per query family.
// Block ranges are inclusive [first, last]: an absent last means up to the best block. Transaction ranges are
// half-open [start, end). Plain absence of data is std::nullopt or an empty vector; ProviderError is thrown only
// for data that should exist.

namespace strata::provider {

//! \brief Where find_block_by_hash looks for the block
enum class BlockSource : uint8_t {
    kAny,        // canonical blocks, in memory or durable
    kPending,    // the pending block only
    kCanonical,  // canonical blocks only
};

class ChainSpecReader {
  public:
    virtual ~ChainSpecReader() = default;

    virtual const ChainConfig& chain_config() const = 0;
};

class BlockHashReader {
  public:
    virtual ~BlockHashReader() = default;

    //! \brief Canonical hash at given block number
    virtual std::optional<Hash> block_hash(BlockNum block_num) const = 0;

    //! \brief The hash itself, or the canonical hash at the number
    virtual std::optional<Hash> convert_block_hash(const BlockHashOrNumber& id) const = 0;

    virtual std::vector<Hash> canonical_hashes_range(BlockNum first, BlockNum last) const = 0;
};

class BlockNumReader {
  public:
    virtual ~BlockNumReader() = default;

    virtual ChainInfo chain_info() const = 0;

    //! \brief Number of the canonical head, possibly an in-memory block
    virtual BlockNum best_block_number() const = 0;

    //! \brief Highest durable block number
    virtual BlockNum last_block_number() const = 0;

    virtual std::optional<BlockNum> block_number(const Hash& hash) const = 0;

    //! \brief The number itself, or the number of the block with given hash
    virtual std::optional<BlockNum> convert_hash_or_number(const BlockHashOrNumber& id) const = 0;
};

class BlockIdReader {
  public:
    virtual ~BlockIdReader() = default;

    //! \brief Resolves a tag to the block number it currently points to
    virtual std::optional<BlockNum> convert_block_number(const BlockNumberOrTag& number_or_tag) const = 0;

    virtual std::optional<Hash> block_hash_for_id(const BlockId& id) const = 0;
    virtual std::optional<BlockNum> block_number_for_id(const BlockId& id) const = 0;

    virtual std::optional<BlockNumHash> pending_block_num_hash() const = 0;
    virtual std::optional<BlockNumHash> safe_block_num_hash() const = 0;
    virtual std::optional<BlockNumHash> finalized_block_num_hash() const = 0;

    std::optional<BlockNum> safe_block_number() const {
        const auto num_hash{safe_block_num_hash()};
        return num_hash ? std::make_optional(num_hash->number) : std::nullopt;
    }
    std::optional<BlockNum> finalized_block_number() const {
        const auto num_hash{finalized_block_num_hash()};
        return num_hash ? std::make_optional(num_hash->number) : std::nullopt;
    }
    std::optional<Hash> safe_block_hash() const {
        const auto num_hash{safe_block_num_hash()};
        return num_hash ? std::make_optional(num_hash->hash) : std::nullopt;
    }
    std::optional<Hash> finalized_block_hash() const {
        const auto num_hash{finalized_block_num_hash()};
        return num_hash ? std::make_optional(num_hash->hash) : std::nullopt;
    }
};

class HeaderReader {
  public:
    virtual ~HeaderReader() = default;

    virtual std::optional<BlockHeader> header(const Hash& block_hash) const = 0;
    virtual std::optional<BlockHeader> header_by_number(BlockNum block_num) const = 0;

    virtual std::optional<intx::uint256> header_td(const Hash& block_hash) const = 0;

    //! \brief Total difficulty up to and including given block
    //! \details In-memory blocks are post-merge with zero difficulty, so they share the last durable total difficulty
    virtual std::optional<intx::uint256> header_td_by_number(BlockNum block_num) const = 0;

    virtual std::vector<BlockHeader> headers_range(BlockNum first, std::optional<BlockNum> last) const = 0;

    virtual std::optional<SealedHeader> sealed_header(BlockNum block_num) const = 0;
    virtual std::vector<SealedHeader> sealed_headers_range(BlockNum first, std::optional<BlockNum> last) const = 0;

    //! \brief Headers in range up to the first one rejected by the predicate, which is never evaluated past it
    virtual std::vector<SealedHeader> sealed_headers_while(BlockNum first, std::optional<BlockNum> last,
                                                           const db::HeaderPredicate& predicate) const = 0;

    bool is_known(const Hash& block_hash) const { return header(block_hash).has_value(); }
};

class BlockReader {
  public:
    virtual ~BlockReader() = default;

    virtual std::optional<Block> find_block_by_hash(const Hash& block_hash, BlockSource source) const = 0;

    virtual std::optional<Block> block(const BlockHashOrNumber& id) const = 0;

    std::optional<Block> block_by_hash(const Hash& block_hash) const { return block(block_hash); }
    std::optional<Block> block_by_number(BlockNum block_num) const { return block(block_num); }

    virtual std::optional<SealedBlock> pending_block() const = 0;
    virtual std::optional<SealedBlockWithSenders> pending_block_with_senders() const = 0;
    virtual std::optional<std::pair<SealedBlock, std::vector<Receipt>>> pending_block_and_receipts() const = 0;

    //! \brief Ommers of given block, always empty once the chain is known to be merged
    virtual std::optional<std::vector<BlockHeader>> ommers(const BlockHashOrNumber& id) const = 0;

    //! \brief Transaction numbering of given block body, reconstructed for in-memory blocks
    //! \throws ProviderError kBlockBodyIndicesNotFound if the anchor of an in-memory block has no durable indices
    virtual std::optional<StoredBlockBodyIndices> block_body_indices(BlockNum block_num) const = 0;

    virtual std::optional<BlockWithSenders> block_with_senders(const BlockHashOrNumber& id) const = 0;
    virtual std::optional<SealedBlockWithSenders> sealed_block_with_senders(const BlockHashOrNumber& id) const = 0;

    virtual std::vector<Block> block_range(BlockNum first, std::optional<BlockNum> last) const = 0;
    virtual std::vector<BlockWithSenders> block_with_senders_range(BlockNum first,
                                                                   std::optional<BlockNum> last) const = 0;
    virtual std::vector<SealedBlockWithSenders> sealed_block_with_senders_range(BlockNum first,
                                                                                std::optional<BlockNum> last) const = 0;
};

class BlockReaderIdExt {
  public:
    virtual ~BlockReaderIdExt() = default;

    //! \brief Block with given id, restricted to canonical blocks when the hash requires it
    virtual std::optional<Block> block_by_id(const BlockId& id) const = 0;
    virtual std::optional<Block> block_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const = 0;

    virtual std::optional<BlockHeader> header_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const = 0;
    virtual std::optional<SealedHeader> sealed_header_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const = 0;
    virtual std::optional<BlockHeader> header_by_id(const BlockId& id) const = 0;
    virtual std::optional<SealedHeader> sealed_header_by_id(const BlockId& id) const = 0;

    virtual std::optional<std::vector<BlockHeader>> ommers_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const = 0;
    virtual std::optional<std::vector<BlockHeader>> ommers_by_id(const BlockId& id) const = 0;

    std::optional<SealedHeader> latest_header() const { return sealed_header_by_number_or_tag(BlockNumberOrTag::latest()); }
    std::optional<SealedHeader> pending_header() const { return sealed_header_by_number_or_tag(BlockNumberOrTag::pending()); }
    std::optional<SealedHeader> safe_header() const { return sealed_header_by_number_or_tag(BlockNumberOrTag::safe()); }
    std::optional<SealedHeader> finalized_header() const {
        return sealed_header_by_number_or_tag(BlockNumberOrTag::finalized());
    }
};

class TransactionReader {
  public:
    virtual ~TransactionReader() = default;

    //! \brief Global transaction number of the transaction with given hash
    virtual std::optional<TxnId> transaction_id(const Hash& tx_hash) const = 0;

    virtual std::optional<Transaction> transaction_by_id(TxnId id) const = 0;
    virtual std::optional<TransactionNoHash> transaction_by_id_no_hash(TxnId id) const = 0;

    virtual std::optional<Transaction> transaction_by_hash(const Hash& tx_hash) const = 0;
    virtual std::optional<std::pair<Transaction, TransactionMeta>> transaction_by_hash_with_meta(const Hash& tx_hash) const = 0;

    //! \brief Number of the block owning given transaction
    virtual std::optional<BlockNum> transaction_block(TxnId id) const = 0;

    virtual std::optional<std::vector<Transaction>> transactions_by_block(const BlockHashOrNumber& id) const = 0;
    virtual std::vector<std::vector<Transaction>> transactions_by_block_range(BlockNum first,
                                                                              std::optional<BlockNum> last) const = 0;

    virtual std::vector<Transaction> transactions_by_tx_range(TxnIdRange range) const = 0;
    virtual std::vector<evmc::address> senders_by_tx_range(TxnIdRange range) const = 0;

    virtual std::optional<evmc::address> transaction_sender(TxnId id) const = 0;
};

class ReceiptReader {
  public:
    virtual ~ReceiptReader() = default;

    virtual std::optional<Receipt> receipt(TxnId id) const = 0;
    virtual std::optional<Receipt> receipt_by_hash(const Hash& tx_hash) const = 0;
    virtual std::optional<std::vector<Receipt>> receipts_by_block(const BlockHashOrNumber& id) const = 0;
    virtual std::vector<Receipt> receipts_by_tx_range(TxnIdRange range) const = 0;
};

class ReceiptReaderIdExt {
  public:
    virtual ~ReceiptReaderIdExt() = default;

    virtual std::optional<std::vector<Receipt>> receipts_by_block_id(const BlockId& id) const = 0;
    virtual std::optional<std::vector<Receipt>> receipts_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const = 0;
};

class WithdrawalsReader {
  public:
    virtual ~WithdrawalsReader() = default;

    //! \brief Withdrawals of given block, std::nullopt if they are not active at its timestamp
    virtual std::optional<std::vector<Withdrawal>> withdrawals_by_block(const BlockHashOrNumber& id,
                                                                        BlockTime timestamp) const = 0;

    //! \brief Last withdrawal of the best block
    virtual std::optional<Withdrawal> latest_withdrawal() const = 0;
};

class RequestsReader {
  public:
    virtual ~RequestsReader() = default;

    //! \brief EIP-7685 requests of given block, std::nullopt if they are not active at its timestamp
    virtual std::optional<Requests> requests_by_block(const BlockHashOrNumber& id, BlockTime timestamp) const = 0;
};

class StageCheckpointReader {
  public:
    virtual ~StageCheckpointReader() = default;

    virtual std::optional<db::StageCheckpoint> stage_checkpoint(db::StageId id) const = 0;
    virtual std::optional<Bytes> stage_checkpoint_progress(db::StageId id) const = 0;
    virtual std::vector<std::pair<db::StageId, db::StageCheckpoint>> stage_checkpoints() const = 0;
};

class PruneCheckpointReader {
  public:
    virtual ~PruneCheckpointReader() = default;

    virtual std::optional<db::PruneCheckpoint> prune_checkpoint(db::PruneSegment segment) const = 0;
    virtual std::vector<std::pair<db::PruneSegment, db::PruneCheckpoint>> prune_checkpoints() const = 0;
};

class ChangeSetReader {
  public:
    virtual ~ChangeSetReader() = default;

    //! \brief Pre-state of the accounts changed by given block
    virtual std::vector<AccountBeforeTx> account_block_changeset(BlockNum block_num) const = 0;
};

class AccountReader {
  public:
    virtual ~AccountReader() = default;

    //! \brief Account as of the latest state
    virtual std::optional<Account> basic_account(const evmc::address& address) const = 0;
};

//! \brief Builds point-in-time views of the world state
//! \details Views stay valid after the provider observed further chain updates
class StateProviderFactory {
  public:
    virtual ~StateProviderFactory() = default;

    //! \brief State at the canonical head
    virtual std::unique_ptr<StateView> latest() const = 0;

    //! \throws ProviderError kFinalizedBlockNotFound / kSafeBlockNotFound if the tag was never set,
    //! kHeaderNotFound or kStateForHashNotFound if the block is unknown
    virtual std::unique_ptr<StateView> state_by_block_number_or_tag(const BlockNumberOrTag& number_or_tag) const = 0;

    //! \throws ProviderError kHeaderNotFound if the block is above the best block or unknown
    virtual std::unique_ptr<StateView> history_by_block_number(BlockNum block_num) const = 0;

    //! \throws ProviderError kStateForHashNotFound if the block is neither durable nor in memory
    virtual std::unique_ptr<StateView> history_by_block_hash(const Hash& block_hash) const = 0;

    //! \brief Historical state, or the pending state if the hash is the pending block's
    //! \throws ProviderError kStateForHashNotFound if neither applies
    virtual std::unique_ptr<StateView> state_by_block_hash(const Hash& block_hash) const = 0;

    //! \brief State at the pending block, the latest one if there is no pending block
    virtual std::unique_ptr<StateView> pending() const = 0;

    //! \return nullptr unless the hash is the pending block's
    virtual std::unique_ptr<StateView> pending_state_by_hash(const Hash& block_hash) const = 0;
};

class EvmEnvProvider {
  public:
    virtual ~EvmEnvProvider() = default;

    //! \throws ProviderError kHeaderNotFound if the block or its total difficulty is unknown
    virtual void fill_env_at(const BlockHashOrNumber& at, CfgEnv& cfg, BlockEnv& block_env,
                             const EvmEnvConfigurator& configurator) const = 0;
    virtual void fill_env_with_header(const BlockHeader& header, CfgEnv& cfg, BlockEnv& block_env,
                                      const EvmEnvConfigurator& configurator) const = 0;
    virtual void fill_cfg_env_at(const BlockHashOrNumber& at, CfgEnv& cfg,
                                 const EvmEnvConfigurator& configurator) const = 0;
    virtual void fill_cfg_env_with_header(const BlockHeader& header, CfgEnv& cfg,
                                          const EvmEnvConfigurator& configurator) const = 0;
};

//! \brief Fork-choice bookkeeping driven by the consensus layer
class CanonChainTracker {
  public:
    using TimePoint = chain_state::ChainInfoTracker::Clock::time_point;

    virtual ~CanonChainTracker() = default;

    virtual void on_forkchoice_update_received() = 0;
    virtual std::optional<TimePoint> last_received_update_timestamp() const = 0;

    virtual void on_transition_configuration_exchanged() = 0;
    virtual std::optional<TimePoint> last_exchanged_transition_configuration_timestamp() const = 0;

    virtual void set_canonical_head(SealedHeader header) = 0;
    virtual void set_safe(SealedHeader header) = 0;
    virtual void set_finalized(SealedHeader header) = 0;
};

class CanonStateSubscriptions {
  public:
    virtual ~CanonStateSubscriptions() = default;

    //! \brief Subscription receiving every canonical chain update published from now on
    virtual chain_state::CanonStateNotifications subscribe_to_canonical_state() = 0;
};

}  // namespace strata::provider
