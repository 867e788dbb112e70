// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <strata/chain_state/canonical_in_memory_state.hpp>
#include <strata/db/storage.hpp>
#include <strata/provider/errors.hpp>
#include <strata/provider/readers.hpp>
#include <strata/provider/settings.hpp>

namespace strata::provider {

//! \brief Read access to the whole chain, merging the durable store with the in-memory canonical overlay
//! \details Point lookups check the overlay first and fall back to the durable store. Block ranges are served by the
//! durable store for the prefix it holds and by the overlay for the rest, stopping at the first block found in
//! neither. Transaction numbers of in-memory blocks are reconstructed by walking the overlay forward from the durable
//! boundary.
//! The provider holds no lock: the overlay publishes immutable snapshots and a durable read handle is opened per
//! logical query. ProviderSettings::read_consistency decides whether multi-step queries pin one overlay snapshot.
class BlockchainProvider : public ChainSpecReader,
                           public BlockHashReader,
                           public BlockNumReader,
                           public BlockIdReader,
                           public HeaderReader,
                           public BlockReader,
                           public BlockReaderIdExt,
                           public TransactionReader,
                           public ReceiptReader,
                           public ReceiptReaderIdExt,
                           public WithdrawalsReader,
                           public RequestsReader,
                           public StageCheckpointReader,
                           public PruneCheckpointReader,
                           public ChangeSetReader,
                           public AccountReader,
                           public StateProviderFactory,
                           public EvmEnvProvider,
                           public CanonChainTracker,
                           public CanonStateSubscriptions {
  public:
    BlockchainProvider(db::DurableStore& store,
                       std::shared_ptr<chain_state::CanonicalInMemoryState> in_memory_state,
                       ProviderSettings settings = {});

    //! \brief Provider over the durable store alone, with the canonical head at the durable boundary
    //! \details The last finalized and safe durable blocks seed the fork-choice pointers
    //! \throws ProviderError kHeaderNotFound if the store has no header at its last block number
    static std::unique_ptr<BlockchainProvider> create(db::DurableStore& store, ProviderSettings settings = {});

    const std::shared_ptr<chain_state::CanonicalInMemoryState>& canonical_in_memory_state() const {
        return in_memory_state_;
    }
    const ProviderSettings& settings() const { return settings_; }

    // ChainSpecReader
    const ChainConfig& chain_config() const override;

    // BlockHashReader
    std::optional<Hash> block_hash(BlockNum block_num) const override;
    std::optional<Hash> convert_block_hash(const BlockHashOrNumber& id) const override;
    std::vector<Hash> canonical_hashes_range(BlockNum first, BlockNum last) const override;

    // BlockNumReader
    ChainInfo chain_info() const override;
    BlockNum best_block_number() const override;
    BlockNum last_block_number() const override;
    std::optional<BlockNum> block_number(const Hash& hash) const override;
    std::optional<BlockNum> convert_hash_or_number(const BlockHashOrNumber& id) const override;

    // BlockIdReader
    std::optional<BlockNum> convert_block_number(const BlockNumberOrTag& number_or_tag) const override;
    std::optional<Hash> block_hash_for_id(const BlockId& id) const override;
    std::optional<BlockNum> block_number_for_id(const BlockId& id) const override;
    std::optional<BlockNumHash> pending_block_num_hash() const override;
    std::optional<BlockNumHash> safe_block_num_hash() const override;
    std::optional<BlockNumHash> finalized_block_num_hash() const override;

    // HeaderReader
    std::optional<BlockHeader> header(const Hash& block_hash) const override;
    std::optional<BlockHeader> header_by_number(BlockNum block_num) const override;
    std::optional<intx::uint256> header_td(const Hash& block_hash) const override;
    std::optional<intx::uint256> header_td_by_number(BlockNum block_num) const override;
    std::vector<BlockHeader> headers_range(BlockNum first, std::optional<BlockNum> last) const override;
    std::optional<SealedHeader> sealed_header(BlockNum block_num) const override;
    std::vector<SealedHeader> sealed_headers_range(BlockNum first, std::optional<BlockNum> last) const override;
    std::vector<SealedHeader> sealed_headers_while(BlockNum first, std::optional<BlockNum> last,
                                                   const db::HeaderPredicate& predicate) const override;

    // BlockReader
    std::optional<Block> find_block_by_hash(const Hash& block_hash, BlockSource source) const override;
    std::optional<Block> block(const BlockHashOrNumber& id) const override;
    std::optional<SealedBlock> pending_block() const override;
    std::optional<SealedBlockWithSenders> pending_block_with_senders() const override;
    std::optional<std::pair<SealedBlock, std::vector<Receipt>>> pending_block_and_receipts() const override;
    std::optional<std::vector<BlockHeader>> ommers(const BlockHashOrNumber& id) const override;
    std::optional<StoredBlockBodyIndices> block_body_indices(BlockNum block_num) const override;
    std::optional<BlockWithSenders> block_with_senders(const BlockHashOrNumber& id) const override;
    std::optional<SealedBlockWithSenders> sealed_block_with_senders(const BlockHashOrNumber& id) const override;
    std::vector<Block> block_range(BlockNum first, std::optional<BlockNum> last) const override;
    std::vector<BlockWithSenders> block_with_senders_range(BlockNum first, std::optional<BlockNum> last) const override;
    std::vector<SealedBlockWithSenders> sealed_block_with_senders_range(BlockNum first,
                                                                        std::optional<BlockNum> last) const override;

    // BlockReaderIdExt
    std::optional<Block> block_by_id(const BlockId& id) const override;
    std::optional<Block> block_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const override;
    std::optional<BlockHeader> header_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const override;
    std::optional<SealedHeader> sealed_header_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const override;
    std::optional<BlockHeader> header_by_id(const BlockId& id) const override;
    std::optional<SealedHeader> sealed_header_by_id(const BlockId& id) const override;
    std::optional<std::vector<BlockHeader>> ommers_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const override;
    std::optional<std::vector<BlockHeader>> ommers_by_id(const BlockId& id) const override;

    // TransactionReader
    std::optional<TxnId> transaction_id(const Hash& tx_hash) const override;
    std::optional<Transaction> transaction_by_id(TxnId id) const override;
    std::optional<TransactionNoHash> transaction_by_id_no_hash(TxnId id) const override;
    std::optional<Transaction> transaction_by_hash(const Hash& tx_hash) const override;
    std::optional<std::pair<Transaction, TransactionMeta>> transaction_by_hash_with_meta(const Hash& tx_hash) const override;
    std::optional<BlockNum> transaction_block(TxnId id) const override;
    std::optional<std::vector<Transaction>> transactions_by_block(const BlockHashOrNumber& id) const override;
    std::vector<std::vector<Transaction>> transactions_by_block_range(BlockNum first,
                                                                      std::optional<BlockNum> last) const override;
    std::vector<Transaction> transactions_by_tx_range(TxnIdRange range) const override;
    std::vector<evmc::address> senders_by_tx_range(TxnIdRange range) const override;
    std::optional<evmc::address> transaction_sender(TxnId id) const override;

    // ReceiptReader
    std::optional<Receipt> receipt(TxnId id) const override;
    std::optional<Receipt> receipt_by_hash(const Hash& tx_hash) const override;
    std::optional<std::vector<Receipt>> receipts_by_block(const BlockHashOrNumber& id) const override;
    std::vector<Receipt> receipts_by_tx_range(TxnIdRange range) const override;

    // ReceiptReaderIdExt
    std::optional<std::vector<Receipt>> receipts_by_block_id(const BlockId& id) const override;
    std::optional<std::vector<Receipt>> receipts_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const override;

    // WithdrawalsReader
    std::optional<std::vector<Withdrawal>> withdrawals_by_block(const BlockHashOrNumber& id,
                                                                BlockTime timestamp) const override;
    std::optional<Withdrawal> latest_withdrawal() const override;

    // RequestsReader
    std::optional<Requests> requests_by_block(const BlockHashOrNumber& id, BlockTime timestamp) const override;

    // StageCheckpointReader
    std::optional<db::StageCheckpoint> stage_checkpoint(db::StageId id) const override;
    std::optional<Bytes> stage_checkpoint_progress(db::StageId id) const override;
    std::vector<std::pair<db::StageId, db::StageCheckpoint>> stage_checkpoints() const override;

    // PruneCheckpointReader
    std::optional<db::PruneCheckpoint> prune_checkpoint(db::PruneSegment segment) const override;
    std::vector<std::pair<db::PruneSegment, db::PruneCheckpoint>> prune_checkpoints() const override;

    // ChangeSetReader
    std::vector<AccountBeforeTx> account_block_changeset(BlockNum block_num) const override;

    // AccountReader
    std::optional<Account> basic_account(const evmc::address& address) const override;

    // StateProviderFactory
    std::unique_ptr<StateView> latest() const override;
    std::unique_ptr<StateView> state_by_block_number_or_tag(const BlockNumberOrTag& number_or_tag) const override;
    std::unique_ptr<StateView> history_by_block_number(BlockNum block_num) const override;
    std::unique_ptr<StateView> history_by_block_hash(const Hash& block_hash) const override;
    std::unique_ptr<StateView> state_by_block_hash(const Hash& block_hash) const override;
    std::unique_ptr<StateView> pending() const override;
    std::unique_ptr<StateView> pending_state_by_hash(const Hash& block_hash) const override;

    // EvmEnvProvider
    void fill_env_at(const BlockHashOrNumber& at, CfgEnv& cfg, BlockEnv& block_env,
                     const EvmEnvConfigurator& configurator) const override;
    void fill_env_with_header(const BlockHeader& header, CfgEnv& cfg, BlockEnv& block_env,
                              const EvmEnvConfigurator& configurator) const override;
    void fill_cfg_env_at(const BlockHashOrNumber& at, CfgEnv& cfg, const EvmEnvConfigurator& configurator) const override;
    void fill_cfg_env_with_header(const BlockHeader& header, CfgEnv& cfg,
                                  const EvmEnvConfigurator& configurator) const override;

    // CanonChainTracker
    void on_forkchoice_update_received() override;
    std::optional<TimePoint> last_received_update_timestamp() const override;
    void on_transition_configuration_exchanged() override;
    std::optional<TimePoint> last_exchanged_transition_configuration_timestamp() const override;
    void set_canonical_head(SealedHeader header) override;
    void set_safe(SealedHeader header) override;
    void set_finalized(SealedHeader header) override;

    // CanonStateSubscriptions
    chain_state::CanonStateNotifications subscribe_to_canonical_state() override;

  private:
    class OverlayCursor;

    //! Position of a transaction: the owning in-memory block and the index in its body, or no block if durable
    struct TxLocation {
        chain_state::BlockStatePtr state;
        uint64_t index{0};
    };

    std::unique_ptr<db::DurableReader> durable() const { return store_.begin_read(); }

    OverlayCursor overlay_cursor() const;

    BlockNum resolve_last(std::optional<BlockNum> last) const;

    //! Durable prefix of [first, last] followed by in-memory blocks up to the first miss
    template <typename T, typename DurableFetch, typename FromMemory>
    std::vector<T> merge_range(BlockNum first, BlockNum last, DurableFetch&& fetch_durable, FromMemory&& from_memory) const;

    //! Durable prefix of the transaction range followed by the in-memory transactions numbered past the boundary
    template <typename T, typename DurableFetch, typename FromMemory>
    std::vector<T> merge_tx_range(TxnIdRange range, DurableFetch&& fetch_durable, FromMemory&& from_memory) const;

    //! Resolves a global transaction number against the durable boundary and the in-memory blocks above it
    std::optional<TxLocation> locate_transaction(const OverlayCursor& cursor, const db::DurableReader& reader,
                                                 TxnId id) const;

    //! Ensures the block number is not above the best block
    void ensure_canonical_block(BlockNum block_num) const;

    //! State at the end of an in-memory block, layered above the durable state of its anchor
    std::unique_ptr<StateView> block_state_provider(const db::DurableReader& reader,
                                                    const chain_state::InMemoryChain& chain,
                                                    const chain_state::BlockStatePtr& state) const;

    //! Historical state by block hash, nullptr if neither durable nor in memory
    std::unique_ptr<StateView> find_history_by_block_hash(const Hash& block_hash) const;

    db::DurableStore& store_;
    std::shared_ptr<chain_state::CanonicalInMemoryState> in_memory_state_;
    ProviderSettings settings_;
};

}  // namespace strata::provider
