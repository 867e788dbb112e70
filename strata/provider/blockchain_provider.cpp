// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "blockchain_provider.hpp"

#include <string>

#include <strata/core/common/assert.hpp>
#include <strata/core/common/util.hpp>
#include <strata/infra/common/log.hpp>

namespace strata::provider {

using chain_state::BlockState;
using chain_state::BlockStatePtr;
using chain_state::InMemoryChain;

//! \brief Access to the in-memory overlay for queries reading it in several steps
//! \details In snapshot mode the overlay is pinned when the cursor is created, otherwise every step reads the
//! latest published snapshot
class BlockchainProvider::OverlayCursor {
  public:
    OverlayCursor(const chain_state::CanonicalInMemoryState& state, ReadConsistency consistency)
        : state_{state},
          pinned_{consistency == ReadConsistency::kSnapshot ? state.snapshot() : nullptr} {}

    std::shared_ptr<const InMemoryChain> chain() const { return pinned_ ? pinned_ : state_.snapshot(); }

    BlockStatePtr state_by_number(BlockNum block_num) const { return chain()->state_by_number(block_num); }

  private:
    const chain_state::CanonicalInMemoryState& state_;
    std::shared_ptr<const InMemoryChain> pinned_;
};

//! In-memory canonical block with given hash or number
static BlockStatePtr state_by_id(const chain_state::CanonicalInMemoryState& state, const BlockHashOrNumber& id) {
    return id.is_hash() ? state.state_by_hash(id.hash()) : state.state_by_number(id.number());
}

BlockchainProvider::BlockchainProvider(db::DurableStore& store,
                                       std::shared_ptr<chain_state::CanonicalInMemoryState> in_memory_state,
                                       ProviderSettings settings)
    : store_{store}, in_memory_state_{std::move(in_memory_state)}, settings_{settings} {
    STRATA_ASSERT(in_memory_state_);
}

std::unique_ptr<BlockchainProvider> BlockchainProvider::create(db::DurableStore& store, ProviderSettings settings) {
    std::optional<SealedHeader> head;
    std::optional<SealedHeader> finalized;
    std::optional<SealedHeader> safe;
    {
        const auto reader{store.begin_read()};
        const BlockNum best_block_num{reader->last_block_number()};
        head = reader->sealed_header(best_block_num);
        if (!head) {
            throw header_not_found(BlockHashOrNumber{best_block_num});
        }
        if (const auto finalized_num{reader->last_finalized_block_number()}) {
            finalized = reader->sealed_header(*finalized_num);
        }
        if (const auto safe_num{reader->last_safe_block_number()}) {
            safe = reader->sealed_header(*safe_num);
        }
    }
    STRATA_DEBUG_M("BlockchainProvider: created from durable store",
                   {"head", std::to_string(head->number()),
                    "finalized", finalized ? std::to_string(finalized->number()) : "none",
                    "safe", safe ? std::to_string(safe->number()) : "none"});
    auto in_memory_state{std::make_shared<chain_state::CanonicalInMemoryState>(std::move(*head), std::move(finalized),
                                                                               std::move(safe))};
    return std::make_unique<BlockchainProvider>(store, std::move(in_memory_state), settings);
}

BlockchainProvider::OverlayCursor BlockchainProvider::overlay_cursor() const {
    return OverlayCursor{*in_memory_state_, settings_.read_consistency};
}

BlockNum BlockchainProvider::resolve_last(std::optional<BlockNum> last) const {
    return last ? *last : in_memory_state_->canonical_block_number();
}

template <typename T, typename DurableFetch, typename FromMemory>
std::vector<T> BlockchainProvider::merge_range(BlockNum first, BlockNum last, DurableFetch&& fetch_durable,
                                               FromMemory&& from_memory) const {
    if (first > last) return {};

    // Pin before reading the durable prefix: blocks persisted meanwhile are still in the pinned snapshot
    const OverlayCursor cursor{overlay_cursor()};
    std::vector<T> items{fetch_durable(*durable(), first, last)};
    if (items.size() > last - first) return items;

    for (BlockNum block_num{first + items.size()};; ++block_num) {
        const BlockStatePtr state{cursor.state_by_number(block_num)};
        if (!state) break;
        items.push_back(from_memory(*state));
        if (block_num == last) break;
    }
    return items;
}

template <typename T, typename DurableFetch, typename FromMemory>
std::vector<T> BlockchainProvider::merge_tx_range(TxnIdRange range, DurableFetch&& fetch_durable,
                                                  FromMemory&& from_memory) const {
    if (range.empty()) return {};

    const OverlayCursor cursor{overlay_cursor()};
    std::vector<T> items;
    BlockNum last_durable{0};
    std::optional<StoredBlockBodyIndices> boundary_indices;
    {
        const auto reader{durable()};
        items = fetch_durable(*reader, range);
        last_durable = reader->last_block_number();
        boundary_indices = reader->block_body_indices(last_durable);
    }

    const TxnId next{range.start + items.size()};
    // A durable prefix shorter than what the store holds leaves a gap the overlay cannot fill
    if (next >= range.end || !boundary_indices || next < boundary_indices->next_tx_num()) {
        return items;
    }

    TxnId first_tx{boundary_indices->next_tx_num()};
    for (BlockNum block_num{last_durable + 1}; first_tx < range.end; ++block_num) {
        const BlockStatePtr state{cursor.state_by_number(block_num)};
        if (!state) break;
        const uint64_t tx_count{state->transactions().size()};
        for (uint64_t index{0}; index < tx_count; ++index) {
            const TxnId tx_num{first_tx + index};
            if (tx_num >= next && tx_num < range.end) {
                items.push_back(from_memory(*state, index));
            }
        }
        first_tx += tx_count;
    }
    return items;
}

std::optional<BlockchainProvider::TxLocation> BlockchainProvider::locate_transaction(const OverlayCursor& cursor,
                                                                                     const db::DurableReader& reader,
                                                                                     TxnId id) const {
    const BlockNum last_durable{reader.last_block_number()};
    const auto boundary_indices{reader.block_body_indices(last_durable)};
    if (!boundary_indices) return std::nullopt;

    // Below the first in-memory transaction number the durable store owns the transaction
    if (id < boundary_indices->next_tx_num()) return TxLocation{};

    TxnId first_tx{boundary_indices->next_tx_num()};
    for (BlockNum block_num{last_durable + 1};; ++block_num) {
        const BlockStatePtr state{cursor.state_by_number(block_num)};
        if (!state) return std::nullopt;
        const uint64_t tx_count{state->transactions().size()};
        if (id < first_tx + tx_count) {
            return TxLocation{state, id - first_tx};
        }
        first_tx += tx_count;
    }
}

void BlockchainProvider::ensure_canonical_block(BlockNum block_num) const {
    if (block_num > best_block_number()) {
        throw header_not_found(BlockHashOrNumber{block_num});
    }
}

std::unique_ptr<StateView> BlockchainProvider::block_state_provider(const db::DurableReader& reader,
                                                                    const InMemoryChain& chain,
                                                                    const BlockStatePtr& state) const {
    const BlockNumHash anchor{chain.anchor(*state)};
    auto historical{reader.history_by_block_hash(anchor.hash)};
    if (!historical) {
        throw state_for_hash_not_found(anchor.hash);
    }
    return in_memory_state_->state_provider(chain, state, std::move(historical));
}

std::unique_ptr<StateView> BlockchainProvider::find_history_by_block_hash(const Hash& block_hash) const {
    const auto chain{in_memory_state_->snapshot()};
    const auto reader{durable()};
    if (auto view{reader->history_by_block_hash(block_hash)}) {
        STRATA_TRACE_M("BlockchainProvider: durable historical state", {"hash", to_hex(block_hash)});
        return view;
    }
    if (const auto state{chain->state_by_hash(block_hash)}) {
        STRATA_TRACE_M("BlockchainProvider: in-memory historical state",
                       {"number", std::to_string(state->number()), "hash", to_hex(block_hash)});
        return block_state_provider(*reader, *chain, state);
    }
    return nullptr;
}

// ChainSpecReader

const ChainConfig& BlockchainProvider::chain_config() const {
    return store_.chain_config();
}

// BlockHashReader

std::optional<Hash> BlockchainProvider::block_hash(BlockNum block_num) const {
    if (const auto state{in_memory_state_->state_by_number(block_num)}) {
        return state->hash();
    }
    return durable()->block_hash(block_num);
}

std::optional<Hash> BlockchainProvider::convert_block_hash(const BlockHashOrNumber& id) const {
    if (id.is_hash()) return id.hash();
    return block_hash(id.number());
}

std::vector<Hash> BlockchainProvider::canonical_hashes_range(BlockNum first, BlockNum last) const {
    return merge_range<Hash>(
        first, last,
        [](const db::DurableReader& reader, BlockNum from, BlockNum to) { return reader.canonical_hashes_range(from, to); },
        [](const BlockState& state) { return state.hash(); });
}

// BlockNumReader

ChainInfo BlockchainProvider::chain_info() const {
    return in_memory_state_->chain_info();
}

BlockNum BlockchainProvider::best_block_number() const {
    return in_memory_state_->canonical_block_number();
}

BlockNum BlockchainProvider::last_block_number() const {
    return durable()->last_block_number();
}

std::optional<BlockNum> BlockchainProvider::block_number(const Hash& hash) const {
    if (const auto state{in_memory_state_->state_by_hash(hash)}) {
        return state->number();
    }
    return durable()->block_number(hash);
}

std::optional<BlockNum> BlockchainProvider::convert_hash_or_number(const BlockHashOrNumber& id) const {
    if (id.is_number()) return id.number();
    return block_number(id.hash());
}

// BlockIdReader

std::optional<BlockNum> BlockchainProvider::convert_block_number(const BlockNumberOrTag& number_or_tag) const {
    switch (number_or_tag.kind()) {
        case BlockNumberOrTag::Kind::kLatest:
            return best_block_number();
        case BlockNumberOrTag::Kind::kFinalized:
            return finalized_block_number();
        case BlockNumberOrTag::Kind::kSafe:
            return safe_block_number();
        case BlockNumberOrTag::Kind::kPending: {
            const auto pending{pending_block_num_hash()};
            return pending ? std::make_optional(pending->number) : std::nullopt;
        }
        case BlockNumberOrTag::Kind::kEarliest:
        case BlockNumberOrTag::Kind::kNumber:
            return number_or_tag.as_number();
    }
    return std::nullopt;
}

std::optional<Hash> BlockchainProvider::block_hash_for_id(const BlockId& id) const {
    if (id.is_hash()) return id.hash_id().hash;
    const BlockNumberOrTag& number_or_tag{id.number_or_tag()};
    switch (number_or_tag.kind()) {
        case BlockNumberOrTag::Kind::kLatest:
            return chain_info().best_hash;
        case BlockNumberOrTag::Kind::kFinalized:
            return finalized_block_hash();
        case BlockNumberOrTag::Kind::kSafe:
            return safe_block_hash();
        case BlockNumberOrTag::Kind::kPending: {
            const auto pending{pending_block_num_hash()};
            return pending ? std::make_optional(pending->hash) : std::nullopt;
        }
        case BlockNumberOrTag::Kind::kEarliest:
        case BlockNumberOrTag::Kind::kNumber:
            return block_hash(*number_or_tag.as_number());
    }
    return std::nullopt;
}

std::optional<BlockNum> BlockchainProvider::block_number_for_id(const BlockId& id) const {
    if (id.is_hash()) return block_number(id.hash_id().hash);
    return convert_block_number(id.number_or_tag());
}

std::optional<BlockNumHash> BlockchainProvider::pending_block_num_hash() const {
    return in_memory_state_->pending_block_num_hash();
}

std::optional<BlockNumHash> BlockchainProvider::safe_block_num_hash() const {
    return in_memory_state_->safe_num_hash();
}

std::optional<BlockNumHash> BlockchainProvider::finalized_block_num_hash() const {
    return in_memory_state_->finalized_num_hash();
}

// HeaderReader

std::optional<BlockHeader> BlockchainProvider::header(const Hash& block_hash) const {
    if (const auto state{in_memory_state_->state_by_hash(block_hash)}) {
        return state->header();
    }
    auto sealed{durable()->sealed_header(block_hash)};
    if (!sealed) return std::nullopt;
    return std::move(sealed->header);
}

std::optional<BlockHeader> BlockchainProvider::header_by_number(BlockNum block_num) const {
    if (const auto state{in_memory_state_->state_by_number(block_num)}) {
        return state->header();
    }
    auto sealed{durable()->sealed_header(block_num)};
    if (!sealed) return std::nullopt;
    return std::move(sealed->header);
}

std::optional<intx::uint256> BlockchainProvider::header_td(const Hash& block_hash) const {
    const auto block_num{block_number(block_hash)};
    if (!block_num) return std::nullopt;
    return header_td_by_number(*block_num);
}

std::optional<intx::uint256> BlockchainProvider::header_td_by_number(BlockNum block_num) const {
    const auto chain{in_memory_state_->snapshot()};
    const auto reader{durable()};
    if (auto td{reader->header_td_by_number(block_num)}) {
        return td;
    }
    if (chain->state_by_number(block_num)) {
        // In-memory blocks are post-merge and add zero difficulty
        return reader->header_td_by_number(reader->last_block_number());
    }
    return std::nullopt;
}

std::vector<BlockHeader> BlockchainProvider::headers_range(BlockNum first, std::optional<BlockNum> last) const {
    return merge_range<BlockHeader>(
        first, resolve_last(last),
        [](const db::DurableReader& reader, BlockNum from, BlockNum to) {
            std::vector<BlockHeader> headers;
            for (auto& sealed : reader.sealed_headers_range(from, to)) {
                headers.push_back(std::move(sealed.header));
            }
            return headers;
        },
        [](const BlockState& state) { return state.header(); });
}

std::optional<SealedHeader> BlockchainProvider::sealed_header(BlockNum block_num) const {
    if (const auto state{in_memory_state_->state_by_number(block_num)}) {
        return state->sealed_header();
    }
    return durable()->sealed_header(block_num);
}

std::vector<SealedHeader> BlockchainProvider::sealed_headers_range(BlockNum first, std::optional<BlockNum> last) const {
    return merge_range<SealedHeader>(
        first, resolve_last(last),
        [](const db::DurableReader& reader, BlockNum from, BlockNum to) { return reader.sealed_headers_range(from, to); },
        [](const BlockState& state) { return state.sealed_header(); });
}

std::vector<SealedHeader> BlockchainProvider::sealed_headers_while(BlockNum first, std::optional<BlockNum> last,
                                                                   const db::HeaderPredicate& predicate) const {
    const BlockNum end{resolve_last(last)};
    if (first > end) return {};

    const OverlayCursor cursor{overlay_cursor()};
    bool rejected{false};
    std::vector<SealedHeader> headers{durable()->sealed_headers_while(first, end, [&](const SealedHeader& header) {
        if (predicate(header)) return true;
        rejected = true;
        return false;
    })};
    if (rejected || headers.size() > end - first) return headers;

    for (BlockNum block_num{first + headers.size()};; ++block_num) {
        const BlockStatePtr state{cursor.state_by_number(block_num)};
        if (!state || !predicate(state->sealed_header())) break;
        headers.push_back(state->sealed_header());
        if (block_num == end) break;
    }
    return headers;
}

// BlockReader

std::optional<Block> BlockchainProvider::find_block_by_hash(const Hash& block_hash, BlockSource source) const {
    switch (source) {
        case BlockSource::kAny:
        case BlockSource::kCanonical: {
            if (const auto state{in_memory_state_->state_by_hash(block_hash)}) {
                return state->sealed_block().unseal();
            }
            const auto block{durable()->block(block_hash)};
            if (!block) return std::nullopt;
            return block->unseal();
        }
        case BlockSource::kPending: {
            const auto pending{in_memory_state_->pending_state()};
            if (!pending || pending->hash() != block_hash) return std::nullopt;
            return pending->sealed_block().unseal();
        }
    }
    return std::nullopt;
}

std::optional<Block> BlockchainProvider::block(const BlockHashOrNumber& id) const {
    if (id.is_hash()) {
        return find_block_by_hash(id.hash(), BlockSource::kAny);
    }
    if (const auto state{in_memory_state_->state_by_number(id.number())}) {
        return state->sealed_block().unseal();
    }
    const auto block{durable()->block(id)};
    if (!block) return std::nullopt;
    return block->unseal();
}

std::optional<SealedBlock> BlockchainProvider::pending_block() const {
    return in_memory_state_->pending_block();
}

std::optional<SealedBlockWithSenders> BlockchainProvider::pending_block_with_senders() const {
    return in_memory_state_->pending_block_with_senders();
}

std::optional<std::pair<SealedBlock, std::vector<Receipt>>> BlockchainProvider::pending_block_and_receipts() const {
    return in_memory_state_->pending_block_and_receipts();
}

std::optional<std::vector<BlockHeader>> BlockchainProvider::ommers(const BlockHashOrNumber& id) const {
    if (const auto block_num{convert_hash_or_number(id)}) {
        if (chain_config().is_merged(*block_num)) {
            return std::vector<BlockHeader>{};
        }
        if (const auto state{in_memory_state_->state_by_number(*block_num)}) {
            return state->sealed_block().body.ommers;
        }
    }
    auto block{durable()->block(id)};
    if (!block) return std::nullopt;
    return std::move(block->body.ommers);
}

std::optional<StoredBlockBodyIndices> BlockchainProvider::block_body_indices(BlockNum block_num) const {
    const auto chain{in_memory_state_->snapshot()};
    const auto reader{durable()};
    if (auto indices{reader->block_body_indices(block_num)}) {
        return indices;
    }

    const auto state{chain->state_by_number(block_num)};
    if (!state) return std::nullopt;

    // Walk forward from the anchor, whose durable indices give the first in-memory transaction number
    const BlockNumHash anchor{chain->anchor(*state)};
    const auto anchor_indices{reader->block_body_indices(anchor.number)};
    if (!anchor_indices) {
        throw block_body_indices_not_found(anchor.number);
    }
    StoredBlockBodyIndices indices{.first_tx_num = anchor_indices->next_tx_num(), .tx_count = 0};
    const auto parents{chain->parent_state_chain(*state)};
    for (auto it{parents.rbegin()}; it != parents.rend(); ++it) {
        indices.first_tx_num += (*it)->transactions().size();
    }
    indices.tx_count = state->transactions().size();
    return indices;
}

std::optional<BlockWithSenders> BlockchainProvider::block_with_senders(const BlockHashOrNumber& id) const {
    if (const auto state{state_by_id(*in_memory_state_, id)}) {
        return state->block().block_with_senders();
    }
    const auto block{durable()->sealed_block_with_senders(id)};
    if (!block) return std::nullopt;
    return block->unseal();
}

std::optional<SealedBlockWithSenders> BlockchainProvider::sealed_block_with_senders(const BlockHashOrNumber& id) const {
    if (const auto state{state_by_id(*in_memory_state_, id)}) {
        return state->block().sealed_block_with_senders();
    }
    return durable()->sealed_block_with_senders(id);
}

std::vector<Block> BlockchainProvider::block_range(BlockNum first, std::optional<BlockNum> last) const {
    return merge_range<Block>(
        first, resolve_last(last),
        [](const db::DurableReader& reader, BlockNum from, BlockNum to) {
            std::vector<Block> blocks;
            for (const auto& block : reader.sealed_block_with_senders_range(from, to)) {
                blocks.push_back(block.block.unseal());
            }
            return blocks;
        },
        [](const BlockState& state) { return state.sealed_block().unseal(); });
}

std::vector<BlockWithSenders> BlockchainProvider::block_with_senders_range(BlockNum first,
                                                                           std::optional<BlockNum> last) const {
    return merge_range<BlockWithSenders>(
        first, resolve_last(last),
        [](const db::DurableReader& reader, BlockNum from, BlockNum to) {
            std::vector<BlockWithSenders> blocks;
            for (const auto& block : reader.sealed_block_with_senders_range(from, to)) {
                blocks.push_back(block.unseal());
            }
            return blocks;
        },
        [](const BlockState& state) { return state.block().block_with_senders(); });
}

std::vector<SealedBlockWithSenders> BlockchainProvider::sealed_block_with_senders_range(BlockNum first,
                                                                                        std::optional<BlockNum> last) const {
    return merge_range<SealedBlockWithSenders>(
        first, resolve_last(last),
        [](const db::DurableReader& reader, BlockNum from, BlockNum to) {
            return reader.sealed_block_with_senders_range(from, to);
        },
        [](const BlockState& state) { return state.block().sealed_block_with_senders(); });
}

// BlockReaderIdExt

std::optional<Block> BlockchainProvider::block_by_id(const BlockId& id) const {
    if (id.is_number_or_tag()) {
        return block_by_number_or_tag(id.number_or_tag());
    }
    const BlockHashId& hash_id{id.hash_id()};
    if (hash_id.require_canonical.value_or(false)) {
        return find_block_by_hash(hash_id.hash, BlockSource::kCanonical);
    }
    return block_by_hash(hash_id.hash);
}

std::optional<Block> BlockchainProvider::block_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const {
    if (number_or_tag.is_pending()) {
        const auto pending{pending_block()};
        if (!pending) return std::nullopt;
        return pending->unseal();
    }
    const auto block_num{convert_block_number(number_or_tag)};
    if (!block_num) return std::nullopt;
    return block_by_number(*block_num);
}

std::optional<BlockHeader> BlockchainProvider::header_by_number_or_tag(const BlockNumberOrTag& number_or_tag) const {
    auto sealed{sealed_header_by_number_or_tag(number_or_tag)};
    if (!sealed) return std::nullopt;
    return std::move(sealed->header);
}

std::optional<SealedHeader> BlockchainProvider::sealed_header_by_number_or_tag(
    const BlockNumberOrTag& number_or_tag) const {
    switch (number_or_tag.kind()) {
        case BlockNumberOrTag::Kind::kLatest:
            return in_memory_state_->canonical_head();
        case BlockNumberOrTag::Kind::kFinalized:
            return in_memory_state_->finalized_header();
        case BlockNumberOrTag::Kind::kSafe:
            return in_memory_state_->safe_header();
        case BlockNumberOrTag::Kind::kPending:
            return in_memory_state_->pending_sealed_header();
        case BlockNumberOrTag::Kind::kEarliest:
        case BlockNumberOrTag::Kind::kNumber:
            return sealed_header(*number_or_tag.as_number());
    }
    return std::nullopt;
}

std::optional<BlockHeader> BlockchainProvider::header_by_id(const BlockId& id) const {
    if (id.is_hash()) return header(id.hash_id().hash);
    return header_by_number_or_tag(id.number_or_tag());
}

std::optional<SealedHeader> BlockchainProvider::sealed_header_by_id(const BlockId& id) const {
    if (id.is_number_or_tag()) {
        return sealed_header_by_number_or_tag(id.number_or_tag());
    }
    const Hash& block_hash{id.hash_id().hash};
    if (const auto state{in_memory_state_->state_by_hash(block_hash)}) {
        return state->sealed_header();
    }
    return durable()->sealed_header(block_hash);
}

std::optional<std::vector<BlockHeader>> BlockchainProvider::ommers_by_number_or_tag(
    const BlockNumberOrTag& number_or_tag) const {
    const auto block_num{convert_block_number(number_or_tag)};
    if (!block_num) return std::nullopt;
    return ommers(*block_num);
}

std::optional<std::vector<BlockHeader>> BlockchainProvider::ommers_by_id(const BlockId& id) const {
    if (id.is_number_or_tag()) {
        return ommers_by_number_or_tag(id.number_or_tag());
    }
    return ommers(id.hash_id().hash);
}

// TransactionReader

std::optional<TxnId> BlockchainProvider::transaction_id(const Hash& tx_hash) const {
    const OverlayCursor cursor{overlay_cursor()};
    const auto reader{durable()};
    const BlockNum last_durable{reader->last_block_number()};
    const auto boundary_indices{reader->block_body_indices(last_durable)};

    BlockStatePtr state{cursor.state_by_number(last_durable + 1)};
    if (state && !boundary_indices) {
        throw block_body_indices_not_found(last_durable);
    }
    for (TxnId first_tx{boundary_indices ? boundary_indices->next_tx_num() : 0}; state;
         state = cursor.state_by_number(state->number() + 1)) {
        const auto& transactions{state->transactions()};
        for (uint64_t index{0}; index < transactions.size(); ++index) {
            if (transactions[index].hash == tx_hash) {
                return first_tx + index;
            }
        }
        first_tx += transactions.size();
    }

    return reader->transaction_id(tx_hash);
}

std::optional<Transaction> BlockchainProvider::transaction_by_id(TxnId id) const {
    const OverlayCursor cursor{overlay_cursor()};
    const auto reader{durable()};
    const auto location{locate_transaction(cursor, *reader, id)};
    if (!location) return std::nullopt;
    if (!location->state) return reader->transaction_by_id(id);
    return location->state->transactions()[location->index];
}

std::optional<TransactionNoHash> BlockchainProvider::transaction_by_id_no_hash(TxnId id) const {
    const auto transaction{transaction_by_id(id)};
    if (!transaction) return std::nullopt;
    return transaction->without_hash();
}

std::optional<Transaction> BlockchainProvider::transaction_by_hash(const Hash& tx_hash) const {
    if (auto transaction{in_memory_state_->transaction_by_hash(tx_hash)}) {
        return transaction;
    }
    auto found{durable()->transaction_by_hash_with_meta(tx_hash)};
    if (!found) return std::nullopt;
    return std::move(found->first);
}

std::optional<std::pair<Transaction, TransactionMeta>> BlockchainProvider::transaction_by_hash_with_meta(
    const Hash& tx_hash) const {
    if (auto found{in_memory_state_->transaction_by_hash_with_meta(tx_hash)}) {
        return found;
    }
    return durable()->transaction_by_hash_with_meta(tx_hash);
}

std::optional<BlockNum> BlockchainProvider::transaction_block(TxnId id) const {
    const OverlayCursor cursor{overlay_cursor()};
    const auto reader{durable()};
    const auto location{locate_transaction(cursor, *reader, id)};
    if (!location) return std::nullopt;
    if (!location->state) return reader->transaction_block(id);
    return location->state->number();
}

std::optional<std::vector<Transaction>> BlockchainProvider::transactions_by_block(const BlockHashOrNumber& id) const {
    if (const auto state{state_by_id(*in_memory_state_, id)}) {
        return state->transactions();
    }
    auto block{durable()->block(id)};
    if (!block) return std::nullopt;
    return std::move(block->body.transactions);
}

std::vector<std::vector<Transaction>> BlockchainProvider::transactions_by_block_range(BlockNum first,
                                                                                      std::optional<BlockNum> last) const {
    return merge_range<std::vector<Transaction>>(
        first, resolve_last(last),
        [](const db::DurableReader& reader, BlockNum from, BlockNum to) {
            std::vector<std::vector<Transaction>> transactions;
            for (auto& block : reader.sealed_block_with_senders_range(from, to)) {
                transactions.push_back(std::move(block.block.body.transactions));
            }
            return transactions;
        },
        [](const BlockState& state) { return state.transactions(); });
}

std::vector<Transaction> BlockchainProvider::transactions_by_tx_range(TxnIdRange range) const {
    return merge_tx_range<Transaction>(
        range,
        [](const db::DurableReader& reader, TxnIdRange tx_range) { return reader.transactions_by_tx_range(tx_range); },
        [](const BlockState& state, uint64_t index) { return state.transactions()[index]; });
}

std::vector<evmc::address> BlockchainProvider::senders_by_tx_range(TxnIdRange range) const {
    return merge_tx_range<evmc::address>(
        range,
        [](const db::DurableReader& reader, TxnIdRange tx_range) { return reader.senders_by_tx_range(tx_range); },
        [](const BlockState& state, uint64_t index) { return state.block().senders->at(index); });
}

std::optional<evmc::address> BlockchainProvider::transaction_sender(TxnId id) const {
    const OverlayCursor cursor{overlay_cursor()};
    const auto reader{durable()};
    const auto location{locate_transaction(cursor, *reader, id)};
    if (!location) return std::nullopt;
    if (!location->state) return reader->transaction_sender(id);
    const auto& senders{*location->state->block().senders};
    if (location->index >= senders.size()) return std::nullopt;
    return senders[location->index];
}

// ReceiptReader

std::optional<Receipt> BlockchainProvider::receipt(TxnId id) const {
    const OverlayCursor cursor{overlay_cursor()};
    const auto reader{durable()};
    const auto location{locate_transaction(cursor, *reader, id)};
    if (!location) return std::nullopt;
    if (!location->state) return reader->receipt(id);
    const auto& receipts{location->state->receipts()};
    if (location->index >= receipts.size()) return std::nullopt;
    return receipts[location->index];
}

std::optional<Receipt> BlockchainProvider::receipt_by_hash(const Hash& tx_hash) const {
    for (const auto& state : in_memory_state_->canonical_chain()) {
        const auto& transactions{state->transactions()};
        const auto& receipts{state->receipts()};
        STRATA_ASSERT(transactions.size() == receipts.size());
        for (size_t index{0}; index < transactions.size(); ++index) {
            if (transactions[index].hash == tx_hash) {
                return receipts[index];
            }
        }
    }
    return durable()->receipt_by_hash(tx_hash);
}

std::optional<std::vector<Receipt>> BlockchainProvider::receipts_by_block(const BlockHashOrNumber& id) const {
    if (const auto state{state_by_id(*in_memory_state_, id)}) {
        return state->receipts();
    }
    return durable()->receipts_by_block(id);
}

std::vector<Receipt> BlockchainProvider::receipts_by_tx_range(TxnIdRange range) const {
    return merge_tx_range<Receipt>(
        range,
        [](const db::DurableReader& reader, TxnIdRange tx_range) { return reader.receipts_by_tx_range(tx_range); },
        [](const BlockState& state, uint64_t index) { return state.receipts().at(index); });
}

// ReceiptReaderIdExt

std::optional<std::vector<Receipt>> BlockchainProvider::receipts_by_block_id(const BlockId& id) const {
    if (id.is_hash()) {
        const BlockHashId& hash_id{id.hash_id()};
        auto receipts{receipts_by_block(hash_id.hash)};
        if (!receipts && !hash_id.require_canonical.value_or(false)) {
            // The pending block is the only non-canonical block the overlay knows about
            const auto pending{in_memory_state_->pending_state()};
            if (pending && pending->hash() == hash_id.hash) {
                receipts = pending->receipts();
            }
        }
        return receipts;
    }
    if (id.is_pending()) {
        const auto pending{in_memory_state_->pending_state()};
        if (!pending) return std::nullopt;
        return pending->receipts();
    }
    const auto block_num{convert_block_number(id.number_or_tag())};
    if (!block_num) return std::nullopt;
    return receipts_by_block(*block_num);
}

std::optional<std::vector<Receipt>> BlockchainProvider::receipts_by_number_or_tag(
    const BlockNumberOrTag& number_or_tag) const {
    return receipts_by_block_id(number_or_tag);
}

// WithdrawalsReader

std::optional<std::vector<Withdrawal>> BlockchainProvider::withdrawals_by_block(const BlockHashOrNumber& id,
                                                                                BlockTime timestamp) const {
    if (!chain_config().withdrawals_activated(timestamp)) return std::nullopt;

    const auto block_num{convert_hash_or_number(id)};
    if (!block_num) return std::nullopt;
    if (const auto state{in_memory_state_->state_by_number(*block_num)}) {
        return state->sealed_block().body.withdrawals;
    }
    auto block{durable()->block(id)};
    if (!block) return std::nullopt;
    return std::move(block->body.withdrawals);
}

std::optional<Withdrawal> BlockchainProvider::latest_withdrawal() const {
    std::optional<std::vector<Withdrawal>> withdrawals;
    if (const auto state{in_memory_state_->state_by_number(best_block_number())}) {
        withdrawals = state->sealed_block().body.withdrawals;
    } else {
        const auto reader{durable()};
        auto block{reader->block(reader->last_block_number())};
        if (block) withdrawals = std::move(block->body.withdrawals);
    }
    if (!withdrawals || withdrawals->empty()) return std::nullopt;
    return withdrawals->back();
}

// RequestsReader

std::optional<Requests> BlockchainProvider::requests_by_block(const BlockHashOrNumber& id, BlockTime timestamp) const {
    if (!chain_config().is_prague(timestamp)) return std::nullopt;

    const auto block_num{convert_hash_or_number(id)};
    if (!block_num) return std::nullopt;
    if (const auto state{in_memory_state_->state_by_number(*block_num)}) {
        return state->block().execution_outcome->requests;
    }
    return durable()->requests_by_block(id);
}

// StageCheckpointReader

std::optional<db::StageCheckpoint> BlockchainProvider::stage_checkpoint(db::StageId id) const {
    return durable()->stage_checkpoint(id);
}

std::optional<Bytes> BlockchainProvider::stage_checkpoint_progress(db::StageId id) const {
    return durable()->stage_checkpoint_progress(id);
}

std::vector<std::pair<db::StageId, db::StageCheckpoint>> BlockchainProvider::stage_checkpoints() const {
    return durable()->stage_checkpoints();
}

// PruneCheckpointReader

std::optional<db::PruneCheckpoint> BlockchainProvider::prune_checkpoint(db::PruneSegment segment) const {
    return durable()->prune_checkpoint(segment);
}

std::vector<std::pair<db::PruneSegment, db::PruneCheckpoint>> BlockchainProvider::prune_checkpoints() const {
    return durable()->prune_checkpoints();
}

// ChangeSetReader

std::vector<AccountBeforeTx> BlockchainProvider::account_block_changeset(BlockNum block_num) const {
    if (const auto state{in_memory_state_->state_by_number(block_num)}) {
        return state->block().execution_outcome->account_reverts;
    }
    return durable()->account_block_changeset(block_num);
}

// AccountReader

std::optional<Account> BlockchainProvider::basic_account(const evmc::address& address) const {
    return latest()->read_account(address);
}

// StateProviderFactory

std::unique_ptr<StateView> BlockchainProvider::latest() const {
    const auto chain{in_memory_state_->snapshot()};
    if (const auto head{chain->tip()}) {
        STRATA_TRACE_M("BlockchainProvider: latest state from head block", {"number", std::to_string(head->number())});
        return block_state_provider(*durable(), *chain, head);
    }
    STRATA_TRACE_M("BlockchainProvider: latest state from durable store");
    return durable()->latest_state();
}

std::unique_ptr<StateView> BlockchainProvider::state_by_block_number_or_tag(
    const BlockNumberOrTag& number_or_tag) const {
    switch (number_or_tag.kind()) {
        case BlockNumberOrTag::Kind::kLatest:
            return latest();
        case BlockNumberOrTag::Kind::kFinalized: {
            // Finalized and safe states are only addressable by hash
            const auto finalized_hash{finalized_block_hash()};
            if (!finalized_hash) throw finalized_block_not_found();
            return state_by_block_hash(*finalized_hash);
        }
        case BlockNumberOrTag::Kind::kSafe: {
            const auto safe_hash{safe_block_hash()};
            if (!safe_hash) throw safe_block_not_found();
            return state_by_block_hash(*safe_hash);
        }
        case BlockNumberOrTag::Kind::kEarliest:
            return history_by_block_number(kEarliestBlockNum);
        case BlockNumberOrTag::Kind::kPending:
            return pending();
        case BlockNumberOrTag::Kind::kNumber:
            break;
    }
    const BlockNum block_num{*number_or_tag.as_number()};
    const auto hash{block_hash(block_num)};
    if (!hash) throw header_not_found(BlockHashOrNumber{block_num});
    return state_by_block_hash(*hash);
}

std::unique_ptr<StateView> BlockchainProvider::history_by_block_number(BlockNum block_num) const {
    STRATA_TRACE_M("BlockchainProvider: history by block number", {"number", std::to_string(block_num)});
    ensure_canonical_block(block_num);
    const auto hash{block_hash(block_num)};
    if (!hash) throw header_not_found(BlockHashOrNumber{block_num});
    return history_by_block_hash(*hash);
}

std::unique_ptr<StateView> BlockchainProvider::history_by_block_hash(const Hash& block_hash) const {
    auto view{find_history_by_block_hash(block_hash)};
    if (!view) throw state_for_hash_not_found(block_hash);
    return view;
}

std::unique_ptr<StateView> BlockchainProvider::state_by_block_hash(const Hash& block_hash) const {
    STRATA_TRACE_M("BlockchainProvider: state by block hash", {"hash", to_hex(block_hash)});
    if (auto view{find_history_by_block_hash(block_hash)}) {
        return view;
    }
    if (auto view{pending_state_by_hash(block_hash)}) {
        return view;
    }
    throw state_for_hash_not_found(block_hash);
}

std::unique_ptr<StateView> BlockchainProvider::pending() const {
    const auto chain{in_memory_state_->snapshot()};
    if (const auto pending_state{chain->pending()}) {
        STRATA_TRACE_M("BlockchainProvider: pending state", {"number", std::to_string(pending_state->number())});
        return block_state_provider(*durable(), *chain, pending_state);
    }
    return latest();
}

std::unique_ptr<StateView> BlockchainProvider::pending_state_by_hash(const Hash& block_hash) const {
    const auto chain{in_memory_state_->snapshot()};
    const auto pending_state{chain->pending()};
    if (!pending_state || pending_state->hash() != block_hash) return nullptr;
    return block_state_provider(*durable(), *chain, pending_state);
}

// EvmEnvProvider

void BlockchainProvider::fill_env_at(const BlockHashOrNumber& at, CfgEnv& cfg, BlockEnv& block_env,
                                     const EvmEnvConfigurator& configurator) const {
    const auto hash{convert_block_hash(at)};
    const auto found{hash ? header(*hash) : std::nullopt};
    if (!found) throw header_not_found(at);
    fill_env_with_header(*found, cfg, block_env, configurator);
}

void BlockchainProvider::fill_env_with_header(const BlockHeader& block_header, CfgEnv& cfg, BlockEnv& block_env,
                                              const EvmEnvConfigurator& configurator) const {
    const auto total_difficulty{header_td_by_number(block_header.number)};
    if (!total_difficulty) throw header_not_found(BlockHashOrNumber{block_header.number});
    configurator.fill_cfg_and_block_env(cfg, block_env, chain_config(), block_header, *total_difficulty);
}

void BlockchainProvider::fill_cfg_env_at(const BlockHashOrNumber& at, CfgEnv& cfg,
                                         const EvmEnvConfigurator& configurator) const {
    const auto hash{convert_block_hash(at)};
    const auto found{hash ? header(*hash) : std::nullopt};
    if (!found) throw header_not_found(at);
    fill_cfg_env_with_header(*found, cfg, configurator);
}

void BlockchainProvider::fill_cfg_env_with_header(const BlockHeader& block_header, CfgEnv& cfg,
                                                  const EvmEnvConfigurator& configurator) const {
    const auto total_difficulty{header_td_by_number(block_header.number)};
    if (!total_difficulty) throw header_not_found(BlockHashOrNumber{block_header.number});
    configurator.fill_cfg_env(cfg, chain_config(), block_header, *total_difficulty);
}

// CanonChainTracker

void BlockchainProvider::on_forkchoice_update_received() {
    in_memory_state_->on_forkchoice_update_received();
}

std::optional<CanonChainTracker::TimePoint> BlockchainProvider::last_received_update_timestamp() const {
    return in_memory_state_->last_received_update_timestamp();
}

void BlockchainProvider::on_transition_configuration_exchanged() {
    in_memory_state_->on_transition_configuration_exchanged();
}

std::optional<CanonChainTracker::TimePoint> BlockchainProvider::last_exchanged_transition_configuration_timestamp() const {
    return in_memory_state_->last_exchanged_transition_configuration_timestamp();
}

void BlockchainProvider::set_canonical_head(SealedHeader header) {
    in_memory_state_->set_canonical_head(std::move(header));
}

void BlockchainProvider::set_safe(SealedHeader header) {
    in_memory_state_->set_safe(std::move(header));
}

void BlockchainProvider::set_finalized(SealedHeader header) {
    in_memory_state_->set_finalized(std::move(header));
}

// CanonStateSubscriptions

chain_state::CanonStateNotifications BlockchainProvider::subscribe_to_canonical_state() {
    return in_memory_state_->subscribe_canon_state();
}

}  // namespace strata::provider
