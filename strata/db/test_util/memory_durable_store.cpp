// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_durable_store.hpp"

#include <algorithm>
#include <string>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/ensure.hpp>

namespace strata::db::test_util {

namespace {

    class MemoryStateView : public StateView {
      public:
        MemoryStateView(std::shared_ptr<const WorldState> state, std::vector<Hash> canonical_hashes)
            : state_{std::move(state)}, canonical_hashes_{std::move(canonical_hashes)} {}

        std::optional<Account> read_account(const evmc::address& address) const override {
            const auto it{state_->accounts.find(address)};
            if (it == state_->accounts.end()) return std::nullopt;
            return it->second;
        }

        std::optional<evmc::bytes32> read_storage(const evmc::address& address,
                                                  const evmc::bytes32& location) const override {
            const auto account_it{state_->storage.find(address)};
            if (account_it == state_->storage.end()) return std::nullopt;
            const auto slot_it{account_it->second.find(location)};
            if (slot_it == account_it->second.end()) return std::nullopt;
            return slot_it->second;
        }

        std::optional<Bytes> read_code(const evmc::bytes32& code_hash) const override {
            const auto it{state_->code.find(code_hash)};
            if (it == state_->code.end()) return std::nullopt;
            return it->second;
        }

        std::optional<Hash> block_hash(BlockNum block_num) const override {
            if (block_num >= canonical_hashes_.size()) return std::nullopt;
            return canonical_hashes_[block_num];
        }

      private:
        std::shared_ptr<const WorldState> state_;
        std::vector<Hash> canonical_hashes_;
    };

    class MemoryDurableReader : public DurableReader {
      public:
        explicit MemoryDurableReader(std::shared_ptr<const MemoryDurableStore::Data> data) : data_{std::move(data)} {}

        BlockNum last_block_number() const override {
            return data_->blocks.empty() ? 0 : data_->blocks.size() - 1;
        }

        std::optional<BlockNum> block_number(const Hash& hash) const override {
            const auto it{data_->block_numbers.find(hash)};
            if (it == data_->block_numbers.end()) return std::nullopt;
            return it->second;
        }

        std::optional<Hash> block_hash(BlockNum block_num) const override {
            if (!has_block(block_num)) return std::nullopt;
            return data_->blocks[block_num].block.hash();
        }

        std::vector<Hash> canonical_hashes_range(BlockNum first, BlockNum last) const override {
            std::vector<Hash> hashes;
            for_each_block(first, last, [&](const SealedBlockWithSenders& block) {
                hashes.push_back(block.block.hash());
                return true;
            });
            return hashes;
        }

        std::optional<SealedHeader> sealed_header(BlockHashOrNumber id) const override {
            const auto block_num{resolve(id)};
            if (!block_num) return std::nullopt;
            return data_->blocks[*block_num].block.header;
        }

        std::vector<SealedHeader> sealed_headers_range(BlockNum first, BlockNum last) const override {
            return sealed_headers_while(first, last, [](const SealedHeader&) { return true; });
        }

        std::vector<SealedHeader> sealed_headers_while(BlockNum first, BlockNum last,
                                                       const HeaderPredicate& predicate) const override {
            std::vector<SealedHeader> headers;
            for_each_block(first, last, [&](const SealedBlockWithSenders& block) {
                if (!predicate(block.block.header)) return false;
                headers.push_back(block.block.header);
                return true;
            });
            return headers;
        }

        std::optional<intx::uint256> header_td_by_number(BlockNum block_num) const override {
            if (!has_block(block_num)) return std::nullopt;
            return data_->total_difficulties[block_num];
        }

        std::optional<StoredBlockBodyIndices> block_body_indices(BlockNum block_num) const override {
            if (!has_block(block_num)) return std::nullopt;
            return data_->body_indices[block_num];
        }

        std::optional<SealedBlock> block(BlockHashOrNumber id) const override {
            const auto block_num{resolve(id)};
            if (!block_num) return std::nullopt;
            return data_->blocks[*block_num].block;
        }

        std::optional<SealedBlockWithSenders> sealed_block_with_senders(BlockHashOrNumber id) const override {
            const auto block_num{resolve(id)};
            if (!block_num) return std::nullopt;
            return data_->blocks[*block_num];
        }

        std::vector<SealedBlockWithSenders> sealed_block_with_senders_range(BlockNum first, BlockNum last) const override {
            std::vector<SealedBlockWithSenders> blocks;
            for_each_block(first, last, [&](const SealedBlockWithSenders& block) {
                blocks.push_back(block);
                return true;
            });
            return blocks;
        }

        std::optional<TxnId> transaction_id(const Hash& tx_hash) const override {
            const auto it{data_->tx_lookup.find(tx_hash)};
            if (it == data_->tx_lookup.end()) return std::nullopt;
            return it->second;
        }

        std::optional<Transaction> transaction_by_id(TxnId id) const override {
            if (id >= data_->transactions.size()) return std::nullopt;
            return data_->transactions[id];
        }

        std::optional<std::pair<Transaction, TransactionMeta>> transaction_by_hash_with_meta(
            const Hash& tx_hash) const override {
            const auto id{transaction_id(tx_hash)};
            if (!id) return std::nullopt;
            const auto block_num{transaction_block(*id)};
            if (!block_num) return std::nullopt;
            const SealedHeader& header{data_->blocks[*block_num].block.header};
            TransactionMeta meta{
                .tx_hash = tx_hash,
                .index = *id - data_->body_indices[*block_num].first_tx_num,
                .block_hash = header.hash,
                .block_num = header.number(),
                .base_fee = header.header.base_fee_per_gas,
                .excess_blob_gas = header.header.excess_blob_gas,
                .timestamp = header.header.timestamp,
            };
            return std::make_pair(data_->transactions[*id], meta);
        }

        std::optional<BlockNum> transaction_block(TxnId id) const override {
            const auto& indices{data_->body_indices};
            const auto it{std::find_if(indices.begin(), indices.end(),
                                       [&](const StoredBlockBodyIndices& i) { return i.contains_tx(id); })};
            if (it == indices.end()) return std::nullopt;
            return static_cast<BlockNum>(it - indices.begin());
        }

        std::vector<Transaction> transactions_by_tx_range(TxnIdRange range) const override {
            return slice(data_->transactions, range);
        }

        std::vector<evmc::address> senders_by_tx_range(TxnIdRange range) const override {
            return slice(data_->senders, range);
        }

        std::optional<evmc::address> transaction_sender(TxnId id) const override {
            if (id >= data_->senders.size()) return std::nullopt;
            return data_->senders[id];
        }

        std::optional<Receipt> receipt(TxnId id) const override {
            if (id >= data_->tx_receipts.size()) return std::nullopt;
            return data_->tx_receipts[id];
        }

        std::optional<Receipt> receipt_by_hash(const Hash& tx_hash) const override {
            const auto id{transaction_id(tx_hash)};
            if (!id) return std::nullopt;
            return receipt(*id);
        }

        std::optional<std::vector<Receipt>> receipts_by_block(BlockHashOrNumber id) const override {
            const auto block_num{resolve(id)};
            if (!block_num) return std::nullopt;
            return data_->receipts[*block_num];
        }

        std::vector<Receipt> receipts_by_tx_range(TxnIdRange range) const override {
            return slice(data_->tx_receipts, range);
        }

        std::optional<Requests> requests_by_block(BlockHashOrNumber id) const override {
            const auto block_num{resolve(id)};
            if (!block_num) return std::nullopt;
            return data_->requests[*block_num];
        }

        std::optional<StageCheckpoint> stage_checkpoint(StageId id) const override {
            const auto it{data_->stage_checkpoints.find(id)};
            if (it == data_->stage_checkpoints.end()) return std::nullopt;
            return it->second;
        }

        std::optional<Bytes> stage_checkpoint_progress(StageId id) const override {
            const auto it{data_->stage_progress.find(id)};
            if (it == data_->stage_progress.end()) return std::nullopt;
            return it->second;
        }

        std::vector<std::pair<StageId, StageCheckpoint>> stage_checkpoints() const override {
            return std::vector<std::pair<StageId, StageCheckpoint>>(data_->stage_checkpoints.begin(),
                                                                  data_->stage_checkpoints.end());
        }

        std::optional<PruneCheckpoint> prune_checkpoint(PruneSegment segment) const override {
            const auto it{data_->prune_checkpoints.find(segment)};
            if (it == data_->prune_checkpoints.end()) return std::nullopt;
            return it->second;
        }

        std::vector<std::pair<PruneSegment, PruneCheckpoint>> prune_checkpoints() const override {
            return std::vector<std::pair<PruneSegment, PruneCheckpoint>>(data_->prune_checkpoints.begin(),
                                                                       data_->prune_checkpoints.end());
        }

        std::vector<AccountBeforeTx> account_block_changeset(BlockNum block_num) const override {
            if (!has_block(block_num)) return {};
            return data_->changesets[block_num];
        }

        std::optional<BlockNum> last_finalized_block_number() const override { return data_->finalized; }

        std::optional<BlockNum> last_safe_block_number() const override { return data_->safe; }

        std::unique_ptr<StateView> latest_state() const override {
            if (data_->blocks.empty()) {
                return std::make_unique<MemoryStateView>(std::make_shared<const WorldState>(), std::vector<Hash>{});
            }
            return state_at(last_block_number());
        }

        std::unique_ptr<StateView> history_by_block_hash(const Hash& block_hash) const override {
            const auto block_num{block_number(block_hash)};
            if (!block_num) return nullptr;
            return state_at(*block_num);
        }

      private:
        bool has_block(BlockNum block_num) const { return block_num < data_->blocks.size(); }

        std::optional<BlockNum> resolve(const BlockHashOrNumber& id) const {
            if (id.is_hash()) return block_number(id.hash());
            if (!has_block(id.number())) return std::nullopt;
            return id.number();
        }

        //! Visits stored blocks in [first, last] until the visitor returns false
        template <typename Visitor>
        void for_each_block(BlockNum first, BlockNum last, Visitor&& visitor) const {
            for (BlockNum block_num{first}; block_num <= last && has_block(block_num); ++block_num) {
                if (!visitor(data_->blocks[block_num])) break;
            }
        }

        template <typename T>
        static std::vector<T> slice(const std::vector<T>& items, TxnIdRange range) {
            if (range.start >= items.size()) return {};
            const TxnId end{std::min<TxnId>(range.end, items.size())};
            if (range.start >= end) return {};
            return std::vector<T>(items.begin() + static_cast<std::ptrdiff_t>(range.start),
                                  items.begin() + static_cast<std::ptrdiff_t>(end));
        }

        std::unique_ptr<StateView> state_at(BlockNum block_num) const {
            std::vector<Hash> hashes;
            hashes.reserve(block_num + 1);
            for (BlockNum n{0}; n <= block_num; ++n) {
                hashes.push_back(data_->blocks[n].block.hash());
            }
            return std::make_unique<MemoryStateView>(data_->states[block_num], std::move(hashes));
        }

        std::shared_ptr<const MemoryDurableStore::Data> data_;
    };

    //! Applies the post-state changes of one block on top of the previous world state
    std::shared_ptr<const WorldState> apply(const WorldState& previous, const chain_state::ExecutionOutcome& outcome) {
        auto state{std::make_shared<WorldState>(previous)};
        for (const auto& [address, account] : outcome.accounts) {
            if (account) {
                state->accounts.insert_or_assign(address, *account);
            } else {
                state->accounts.erase(address);
                state->storage.erase(address);
            }
        }
        for (const auto& [address, changes] : outcome.storage) {
            auto& slots{state->storage[address]};
            if (changes.wiped) slots.clear();
            for (const auto& [location, value] : changes.slots) {
                if (value == evmc::bytes32{}) {
                    slots.erase(location);
                } else {
                    slots.insert_or_assign(location, value);
                }
            }
        }
        for (const auto& [code_hash, code] : outcome.code) {
            state->code.insert_or_assign(code_hash, code);
        }
        return state;
    }

}  // namespace

MemoryDurableStore::MemoryDurableStore(ChainConfig config)
    : config_{std::move(config)}, data_{std::make_shared<const Data>()} {}

std::unique_ptr<DurableReader> MemoryDurableStore::begin_read() const {
    std::scoped_lock lock{mutex_};
    ++read_count_;
    return std::make_unique<MemoryDurableReader>(data_);
}

size_t MemoryDurableStore::read_count() const {
    std::scoped_lock lock{mutex_};
    return read_count_;
}

std::shared_ptr<const MemoryDurableStore::Data> MemoryDurableStore::data() const {
    std::scoped_lock lock{mutex_};
    return data_;
}

template <typename Mutation>
void MemoryDurableStore::write(Mutation&& mutation) {
    std::scoped_lock lock{mutex_};
    auto updated{std::make_shared<Data>(*data_)};
    mutation(*updated);
    data_ = std::move(updated);
}

void MemoryDurableStore::append(const chain_state::ExecutedBlock& block) {
    const auto current{data()};
    const BlockNum expected_num{current->blocks.size()};
    ensure_pre_condition(block.number() == expected_num, [&]() {
        return "block " + std::to_string(block.number()) + " persisted while expecting " + std::to_string(expected_num);
    });
    ensure_pre_condition(current->blocks.empty() || block.sealed_header().parent_hash() == current->blocks.back().block.hash(),
                         [&]() { return "block " + std::to_string(block.number()) + " does not extend " + to_hex(current->blocks.back().block.hash()); });
    ensure_pre_condition(block.senders->size() == block.sealed_block().body.transactions.size() &&
                             block.receipts().size() == block.sealed_block().body.transactions.size(),
                         [&]() { return "block " + std::to_string(block.number()) + " has mismatching senders or receipts"; });

    write([&](Data& data) {
        const TxnId first_tx_num{data.body_indices.empty() ? 0 : data.body_indices.back().next_tx_num()};
        const intx::uint256 parent_td{data.total_difficulties.empty() ? intx::uint256{0} : data.total_difficulties.back()};
        const auto& transactions{block.sealed_block().body.transactions};

        data.blocks.push_back(block.sealed_block_with_senders());
        data.total_difficulties.push_back(parent_td + block.sealed_header().header.difficulty);
        data.body_indices.push_back(StoredBlockBodyIndices{.first_tx_num = first_tx_num, .tx_count = transactions.size()});
        data.receipts.push_back(block.receipts());
        data.requests.push_back(block.execution_outcome->requests);
        data.changesets.push_back(block.execution_outcome->account_reverts);
        data.states.push_back(apply(data.states.empty() ? WorldState{} : *data.states.back(), *block.execution_outcome));
        data.block_numbers.insert_or_assign(block.hash(), block.number());

        for (size_t index{0}; index < transactions.size(); ++index) {
            data.tx_lookup.insert_or_assign(transactions[index].hash, data.transactions.size());
            data.transactions.push_back(transactions[index]);
            data.senders.push_back((*block.senders)[index]);
            data.tx_receipts.push_back(block.receipts()[index]);
        }
    });
}

void MemoryDurableStore::set_finalized(std::optional<BlockNum> block_num) {
    write([&](Data& data) { data.finalized = block_num; });
}

void MemoryDurableStore::set_safe(std::optional<BlockNum> block_num) {
    write([&](Data& data) { data.safe = block_num; });
}

void MemoryDurableStore::set_stage_checkpoint(StageId id, StageCheckpoint checkpoint, std::optional<Bytes> progress) {
    write([&](Data& data) {
        data.stage_checkpoints.insert_or_assign(id, checkpoint);
        if (progress) data.stage_progress.insert_or_assign(id, *progress);
    });
}

void MemoryDurableStore::set_prune_checkpoint(PruneSegment segment, PruneCheckpoint checkpoint) {
    write([&](Data& data) { data.prune_checkpoints.insert_or_assign(segment, checkpoint); });
}

}  // namespace strata::db::test_util
