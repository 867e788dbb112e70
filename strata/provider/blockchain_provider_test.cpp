// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "blockchain_provider.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>
#include <magic_enum.hpp>

#include <strata/chain_state/test_util/sample_chain.hpp>
#include <strata/db/test_util/memory_durable_store.hpp>
#include <strata/db/test_util/mock_durable_store.hpp>
#include <strata/infra/test_util/log.hpp>

namespace strata::provider {

using chain_state::CanonicalInMemoryState;
using chain_state::ExecutedBlock;
using chain_state::NewCanonicalChain;
using db::test_util::MemoryDurableStore;
using db::test_util::MockDurableReader;
using db::test_util::MockDurableStore;
using testing::_;
using testing::NiceMock;
using testing::Return;
using namespace test_util;

static constexpr BlockNum kLastPersisted{4};
static constexpr BlockNum kBestBlock{9};
static constexpr uint64_t kTxPerBlock{2};

static Catch::Matchers::Generic::PredicateMatcher<ProviderError> has_code(ProviderErrorCode code) {
    return Catch::Predicate<ProviderError>([code](const ProviderError& e) { return e.code() == code; },
                                           "has error code " + std::string{magic_enum::enum_name(code)});
}

//! Blocks 0..4 persisted in the durable store, blocks 5..9 in the in-memory overlay
class BlockchainProviderTest {
  public:
    BlockchainProviderTest() {
        blocks.push_back(sample_genesis());
        for (auto& block : sample_children(blocks.back(), kLastPersisted)) {
            blocks.push_back(std::move(block));
        }
        for (auto& block : sample_children(blocks.back(), kBestBlock - kLastPersisted, {.post_merge = true})) {
            blocks.push_back(std::move(block));
        }
        for (BlockNum n{0}; n <= kLastPersisted; ++n) {
            store.append(blocks[n]);
        }
        in_memory_state = std::make_shared<CanonicalInMemoryState>(blocks[kLastPersisted].sealed_header());
        in_memory_state->update_chain(NewCanonicalChain::commit(
            std::vector<ExecutedBlock>(blocks.begin() + kLastPersisted + 1, blocks.end())));
        provider = std::make_unique<BlockchainProvider>(store, in_memory_state);
    }

  protected:
    const Transaction& tx(BlockNum block_num, size_t index) const {
        return blocks.at(block_num).sealed_block().body.transactions.at(index);
    }

    //! Moves block 5 from the overlay to the durable store
    void persist_next_block() {
        const ExecutedBlock& next{blocks[kLastPersisted + 1]};
        store.append(next);
        in_memory_state->remove_persisted_blocks({next.number(), next.hash()});
    }

    ExecutedBlock pending_block() const { return sample_child(blocks.back(), {.fork = 3, .post_merge = true}); }

    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    MemoryDurableStore store{sample_chain_config()};
    std::vector<ExecutedBlock> blocks;
    std::shared_ptr<CanonicalInMemoryState> in_memory_state;
    std::unique_ptr<BlockchainProvider> provider;
};

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider boundary and best block") {
    CHECK(provider->last_block_number() == kLastPersisted);
    CHECK(provider->best_block_number() == kBestBlock);
    CHECK(provider->chain_info() == ChainInfo{blocks[kBestBlock].hash(), kBestBlock});
    CHECK(provider->chain_config().chain_id == 1337);
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider hash and number lookups") {
    for (BlockNum n{0}; n <= kBestBlock; ++n) {
        const auto hash{provider->block_hash(n)};
        REQUIRE(hash == blocks[n].hash());
        CHECK(provider->block_number(*hash) == n);
        CHECK(provider->convert_hash_or_number(*hash) == n);
        CHECK(provider->convert_block_hash(n) == hash);
        CHECK(provider->header(*hash) == blocks[n].sealed_header().header);
        CHECK(provider->header_by_number(n) == blocks[n].sealed_header().header);
        CHECK(provider->sealed_header(n) == blocks[n].sealed_header());
        CHECK(provider->is_known(*hash));
    }
    CHECK_FALSE(provider->block_hash(kBestBlock + 1));
    CHECK_FALSE(provider->header_by_number(kBestBlock + 1));
    CHECK_FALSE(provider->block_number(sample_hash(SampleHashKind::kBlock, 7, 3)));
    CHECK_FALSE(provider->is_known(sample_hash(SampleHashKind::kBlock, 7, 3)));
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider range queries merge durable and in-memory blocks") {
    SECTION("range past the best block stops at the first miss") {
        const auto headers{provider->headers_range(0, kBestBlock + 1)};
        REQUIRE(headers.size() == kBestBlock + 1);
        for (BlockNum n{0}; n <= kBestBlock; ++n) {
            CHECK(headers[n].number == n);
        }
        CHECK(provider->sealed_headers_range(0, kBestBlock + 1).size() == kBestBlock + 1);
        CHECK(provider->canonical_hashes_range(0, kBestBlock + 1).back() == blocks[kBestBlock].hash());
        CHECK(provider->block_range(0, kBestBlock + 1).size() == kBestBlock + 1);
    }

    SECTION("open range ends at the best block") {
        const auto sealed{provider->sealed_block_with_senders_range(3, std::nullopt)};
        REQUIRE(sealed.size() == 7);
        CHECK(sealed.front().block.hash() == blocks[3].hash());
        CHECK(sealed.back().block.hash() == blocks[kBestBlock].hash());
        CHECK(sealed[4].senders == *blocks[7].senders);
    }

    SECTION("range within the durable store") {
        const auto with_senders{provider->block_with_senders_range(1, 3)};
        REQUIRE(with_senders.size() == 3);
        CHECK(with_senders[0].block.header.number == 1);
        CHECK(with_senders[2].senders == *blocks[3].senders);
    }

    SECTION("range within the overlay") {
        const auto transactions{provider->transactions_by_block_range(6, 8)};
        REQUIRE(transactions.size() == 3);
        CHECK(transactions[0] == blocks[6].sealed_block().body.transactions);
        CHECK(transactions[2] == blocks[8].sealed_block().body.transactions);
    }

    SECTION("range straddling the boundary") {
        const auto transactions{provider->transactions_by_block_range(3, 6)};
        REQUIRE(transactions.size() == 4);
        CHECK(transactions[1].front().hash == tx(4, 0).hash);
        CHECK(transactions[2].front().hash == tx(5, 0).hash);
    }

    SECTION("empty ranges") {
        CHECK(provider->headers_range(5, 4).empty());
        CHECK(provider->canonical_hashes_range(kBestBlock + 1, kBestBlock + 5).empty());
        CHECK(provider->headers_range(7, 7).size() == 1);
        CHECK(provider->headers_range(4, 4).size() == 1);
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider sealed_headers_while") {
    std::vector<BlockNum> evaluated;

    SECTION("rejection in the durable store") {
        const auto headers{provider->sealed_headers_while(0, kBestBlock + 1, [&](const SealedHeader& header) {
            evaluated.push_back(header.number());
            return header.number() < 3;
        })};
        CHECK(headers.size() == 3);
        CHECK(evaluated == std::vector<BlockNum>{0, 1, 2, 3});
    }

    SECTION("rejection in the overlay") {
        const auto headers{provider->sealed_headers_while(0, kBestBlock + 1, [&](const SealedHeader& header) {
            evaluated.push_back(header.number());
            return header.number() < 7;
        })};
        REQUIRE(headers.size() == 7);
        CHECK(headers.back().hash == blocks[6].hash());
        CHECK(evaluated.back() == 7);
    }

    SECTION("rejection at the tip") {
        const auto headers{provider->sealed_headers_while(0, kBestBlock + 1, [&](const SealedHeader& header) {
            evaluated.push_back(header.number());
            return header.number() <= 8;
        })};
        REQUIRE(headers.size() == 9);
        CHECK(headers.back().number() == 8);
        // Scan halts on the rejected tip, past-the-tip numbers are never evaluated
        CHECK(evaluated.back() == kBestBlock);
        CHECK(std::find(evaluated.begin(), evaluated.end(), kBestBlock + 1) == evaluated.end());
    }

    SECTION("accepting predicate") {
        const auto headers{provider->sealed_headers_while(2, 8, [](const SealedHeader&) { return true; })};
        REQUIRE(headers.size() == 7);
        CHECK(headers.front().number() == 2);
        CHECK(headers.back().number() == 8);
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider transaction numbering") {
    SECTION("body indices continue the durable numbering") {
        for (BlockNum n{0}; n <= kBestBlock; ++n) {
            const auto indices{provider->block_body_indices(n)};
            REQUIRE(indices);
            CHECK(indices->first_tx_num == n * kTxPerBlock);
            CHECK(indices->tx_count == kTxPerBlock);
        }
        CHECK_FALSE(provider->block_body_indices(kBestBlock + 1));
    }

    SECTION("transaction id matches body indices") {
        for (BlockNum n{0}; n <= kBestBlock; ++n) {
            const TxnId first_tx_num{provider->block_body_indices(n)->first_tx_num};
            for (size_t i{0}; i < kTxPerBlock; ++i) {
                const TxnId id{first_tx_num + i};
                CHECK(provider->transaction_id(tx(n, i).hash) == id);
                CHECK(provider->transaction_by_id(id) == tx(n, i));
                CHECK(provider->transaction_by_id_no_hash(id) == tx(n, i).without_hash());
                CHECK(provider->transaction_block(id) == n);
                CHECK(provider->transaction_sender(id) == blocks[n].senders->at(i));
                CHECK(provider->receipt(id) == blocks[n].receipts().at(i));
            }
        }
    }

    SECTION("unknown transactions") {
        const TxnId past_end{(kBestBlock + 1) * kTxPerBlock};
        CHECK_FALSE(provider->transaction_by_id(past_end));
        CHECK_FALSE(provider->transaction_block(past_end));
        CHECK_FALSE(provider->transaction_sender(past_end));
        CHECK_FALSE(provider->receipt(past_end));
        CHECK_FALSE(provider->transaction_id(sample_hash(SampleHashKind::kTransaction, 9, 1)));
        CHECK_FALSE(provider->transaction_by_hash(sample_hash(SampleHashKind::kTransaction, 9, 1)));
    }

    SECTION("transaction by hash with metadata") {
        const auto durable{provider->transaction_by_hash_with_meta(tx(2, 1).hash)};
        REQUIRE(durable);
        CHECK(durable->second.block_num == 2);
        CHECK(durable->second.index == 1);
        CHECK(durable->second.block_hash == blocks[2].hash());

        const auto in_memory{provider->transaction_by_hash_with_meta(tx(8, 0).hash)};
        REQUIRE(in_memory);
        CHECK(in_memory->first == tx(8, 0));
        CHECK(in_memory->second.block_num == 8);
        CHECK(in_memory->second.index == 0);
        CHECK(in_memory->second.timestamp == sample_timestamp(8));
        CHECK(provider->transaction_by_hash(tx(1, 0).hash) == tx(1, 0));
    }

    SECTION("transactions by block") {
        CHECK(provider->transactions_by_block(BlockNum{3}) == blocks[3].sealed_block().body.transactions);
        CHECK(provider->transactions_by_block(blocks[7].hash()) == blocks[7].sealed_block().body.transactions);
        CHECK_FALSE(provider->transactions_by_block(BlockNum{kBestBlock + 1}));
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider transaction ranges across the boundary") {
    const TxnIdRange range{6, 14};
    const auto transactions{provider->transactions_by_tx_range(range)};
    REQUIRE(transactions.size() == 8);
    CHECK(transactions.front().hash == tx(3, 0).hash);
    CHECK(transactions[3].hash == tx(4, 1).hash);
    CHECK(transactions[4].hash == tx(5, 0).hash);
    CHECK(transactions.back().hash == tx(6, 1).hash);

    const auto senders{provider->senders_by_tx_range(range)};
    REQUIRE(senders.size() == 8);
    CHECK(senders[5] == blocks[5].senders->at(1));

    const auto receipts{provider->receipts_by_tx_range(range)};
    REQUIRE(receipts.size() == 8);
    CHECK(receipts[7] == blocks[6].receipts().at(1));

    SECTION("range within the overlay") {
        const auto in_memory{provider->transactions_by_tx_range({11, 13})};
        REQUIRE(in_memory.size() == 2);
        CHECK(in_memory[0].hash == tx(5, 1).hash);
        CHECK(in_memory[1].hash == tx(6, 0).hash);
    }

    SECTION("range past the last transaction") {
        CHECK(provider->transactions_by_tx_range({18, 25}).size() == 2);
        CHECK(provider->transactions_by_tx_range({25, 30}).empty());
        CHECK(provider->transactions_by_tx_range({8, 8}).empty());
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider total difficulty") {
    const intx::uint256 persisted_td{intx::uint256{kLastPersisted + 1} * kSamplePowDifficulty};
    CHECK(provider->header_td_by_number(0) == kSamplePowDifficulty);
    CHECK(provider->header_td_by_number(kLastPersisted) == persisted_td);
    for (BlockNum n{kLastPersisted + 1}; n <= kBestBlock; ++n) {
        CHECK(provider->header_td_by_number(n) == persisted_td);
        CHECK(provider->header_td(blocks[n].hash()) == persisted_td);
    }
    CHECK_FALSE(provider->header_td_by_number(kBestBlock + 1));
    CHECK_FALSE(provider->header_td(sample_hash(SampleHashKind::kBlock, 7, 2)));
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider blocks") {
    CHECK(provider->block(BlockNum{2}) == blocks[2].sealed_block().unseal());
    CHECK(provider->block(blocks[6].hash()) == blocks[6].sealed_block().unseal());
    CHECK(provider->block_by_number(7) == blocks[7].sealed_block().unseal());
    CHECK(provider->block_by_hash(blocks[1].hash()) == blocks[1].sealed_block().unseal());
    CHECK_FALSE(provider->block(BlockNum{kBestBlock + 1}));
    CHECK(provider->block_with_senders(BlockNum{8})->senders == *blocks[8].senders);
    CHECK(provider->block_with_senders(blocks[3].hash())->block.header.number == 3);
    CHECK(provider->sealed_block_with_senders(BlockNum{4})->block.hash() == blocks[4].hash());
    CHECK(provider->sealed_block_with_senders(blocks[9].hash())->block.hash() == blocks[9].hash());
    CHECK(provider->find_block_by_hash(blocks[5].hash(), BlockSource::kCanonical));
    CHECK(provider->find_block_by_hash(blocks[2].hash(), BlockSource::kAny));
    CHECK_FALSE(provider->find_block_by_hash(blocks[5].hash(), BlockSource::kPending));

    SECTION("ommers") {
        CHECK(provider->ommers(BlockNum{3}) == std::vector<BlockHeader>{});
        CHECK(provider->ommers(blocks[6].hash()) == std::vector<BlockHeader>{});
        CHECK_FALSE(provider->ommers(BlockNum{kBestBlock + 1}));
        CHECK(provider->ommers_by_number_or_tag(BlockNumberOrTag::latest()) == std::vector<BlockHeader>{});
    }

    SECTION("by id") {
        CHECK(provider->block_by_id(BlockId{BlockNum{5}})->header.number == 5);
        CHECK(provider->block_by_id(BlockId::latest())->header.number == kBestBlock);
        CHECK(provider->block_by_id(BlockHashId{blocks[3].hash(), true})->header.number == 3);
        CHECK(provider->block_by_id(blocks[8].hash())->header.number == 8);
        CHECK(provider->block_by_number_or_tag(BlockNumberOrTag::earliest())->header.number == 0);
        CHECK_FALSE(provider->block_by_number_or_tag(BlockNumberOrTag::pending()));
        CHECK_FALSE(provider->block_by_number_or_tag(BlockNumberOrTag::finalized()));
        CHECK(provider->header_by_id(blocks[2].hash())->number == 2);
        CHECK(provider->sealed_header_by_id(blocks[7].hash())->hash == blocks[7].hash());
        CHECK(provider->sealed_header_by_id(BlockId{BlockNum{1}})->hash == blocks[1].hash());
        CHECK(provider->header_by_number_or_tag(BlockNumberOrTag{6})->number == 6);
        CHECK(provider->latest_header()->hash == blocks[kBestBlock].hash());
        CHECK_FALSE(provider->pending_header());
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider block id resolution") {
    CHECK(provider->convert_block_number(BlockNumberOrTag::latest()) == kBestBlock);
    CHECK(provider->convert_block_number(BlockNumberOrTag::earliest()) == 0);
    CHECK(provider->convert_block_number(BlockNumberOrTag{3}) == 3);
    CHECK_FALSE(provider->convert_block_number(BlockNumberOrTag::pending()));
    CHECK_FALSE(provider->convert_block_number(BlockNumberOrTag::safe()));
    CHECK_FALSE(provider->finalized_block_hash());

    provider->set_safe(blocks[6].sealed_header());
    provider->set_finalized(blocks[3].sealed_header());
    CHECK(provider->convert_block_number(BlockNumberOrTag::safe()) == 6);
    CHECK(provider->finalized_block_number() == 3);
    CHECK(provider->safe_block_hash() == blocks[6].hash());
    CHECK(provider->safe_block_num_hash() == BlockNumHash{6, blocks[6].hash()});
    CHECK(provider->finalized_header()->hash == blocks[3].hash());

    CHECK(provider->block_hash_for_id(BlockNumberOrTag::finalized()) == blocks[3].hash());
    CHECK(provider->block_hash_for_id(BlockId::latest()) == blocks[kBestBlock].hash());
    CHECK(provider->block_hash_for_id(BlockId{BlockNum{7}}) == blocks[7].hash());
    CHECK(provider->block_number_for_id(blocks[8].hash()) == 8);
    CHECK(provider->block_number_for_id(BlockNumberOrTag::safe()) == 6);
    CHECK_FALSE(provider->block_number_for_id(BlockId::pending()));
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider receipts") {
    CHECK(provider->receipts_by_block(BlockNum{2}) == blocks[2].receipts());
    CHECK(provider->receipts_by_block(blocks[6].hash()) == blocks[6].receipts());
    CHECK_FALSE(provider->receipts_by_block(BlockNum{kBestBlock + 1}));
    CHECK(provider->receipt_by_hash(tx(7, 1).hash) == blocks[7].receipts().at(1));
    CHECK(provider->receipt_by_hash(tx(1, 0).hash) == blocks[1].receipts().at(0));
    CHECK_FALSE(provider->receipt_by_hash(sample_hash(SampleHashKind::kTransaction, 5, 5)));
    CHECK(provider->receipts_by_number_or_tag(BlockNumberOrTag::latest()) == blocks[kBestBlock].receipts());
    CHECK(provider->receipts_by_block_id(BlockId{BlockNum{3}}) == blocks[3].receipts());
    CHECK_FALSE(provider->receipts_by_block_id(BlockId::pending()));
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider withdrawals and requests") {
    SECTION("withdrawals are gated on Shanghai") {
        const auto in_memory{provider->withdrawals_by_block(BlockNum{6}, sample_timestamp(6))};
        REQUIRE(in_memory);
        REQUIRE(in_memory->size() == 1);
        CHECK(in_memory->front().index == 6);
        const auto durable{provider->withdrawals_by_block(blocks[2].hash(), sample_timestamp(2))};
        REQUIRE(durable);
        CHECK(durable->front().validator_index == 102);
        CHECK_FALSE(provider->withdrawals_by_block(BlockNum{6}, kSampleGenesisTime - 1));
        CHECK_FALSE(provider->withdrawals_by_block(BlockNum{kBestBlock + 1}, sample_timestamp(kBestBlock + 1)));
    }

    SECTION("latest withdrawal comes from the best block") {
        const auto latest{provider->latest_withdrawal()};
        REQUIRE(latest);
        CHECK(latest->index == kBestBlock);
    }

    SECTION("requests are gated on Prague") {
        CHECK(provider->requests_by_block(BlockNum{8}, sample_timestamp(8)) == Requests{Bytes{0x00, 0x08}});
        CHECK(provider->requests_by_block(blocks[9].hash(), sample_timestamp(9)) == Requests{Bytes{0x00, 0x09}});
        CHECK_FALSE(provider->requests_by_block(BlockNum{8}, sample_timestamp(kSamplePragueBlockNum - 1)));
        CHECK_FALSE(provider->requests_by_block(BlockNum{3}, sample_timestamp(3)));
        CHECK_FALSE(provider->requests_by_block(BlockNum{3}, sample_timestamp(8)));
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider state resolution") {
    SECTION("latest state is the head of the overlay") {
        const auto latest{provider->latest()};
        CHECK(latest->read_account(kSampleBeneficiary)->balance == intx::uint256{(kBestBlock + 1) * kEther});
        CHECK(latest->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(kBestBlock));
        CHECK(latest->read_code(kSampleCodeHash));
        CHECK(provider->basic_account(kSampleContract)->code_hash == kSampleCodeHash);
    }

    SECTION("historical state of durable and in-memory blocks") {
        const auto durable{provider->history_by_block_number(2)};
        CHECK(durable->read_account(kSampleBeneficiary)->balance == intx::uint256{3 * kEther});
        CHECK(durable->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(2));

        const auto in_memory{provider->history_by_block_hash(blocks[7].hash())};
        CHECK(in_memory->read_account(kSampleBeneficiary)->balance == intx::uint256{8 * kEther});
        CHECK(in_memory->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(7));
        CHECK(in_memory->block_hash(6) == blocks[6].hash());
        CHECK(in_memory->block_hash(1) == blocks[1].hash());

        CHECK(provider->state_by_block_number_or_tag(BlockNumberOrTag{5})->read_storage(kSampleContract, kSampleSlot) ==
              sample_slot_value(5));
        CHECK(provider->state_by_block_number_or_tag(BlockNumberOrTag::earliest())
                  ->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(0));
    }

    SECTION("unknown blocks") {
        CHECK_THROWS_MATCHES(provider->history_by_block_number(kBestBlock + 1), ProviderError,
                             has_code(ProviderErrorCode::kHeaderNotFound));
        const Hash unknown{sample_hash(SampleHashKind::kBlock, 8, 3)};
        CHECK_THROWS_MATCHES(provider->history_by_block_hash(unknown), ProviderError,
                             has_code(ProviderErrorCode::kStateForHashNotFound));
        CHECK_THROWS_AS(provider->state_by_block_hash(unknown), ProviderError);
        CHECK_THROWS_AS(provider->state_by_block_number_or_tag(BlockNumberOrTag{kBestBlock + 1}), ProviderError);
    }

    SECTION("finalized and safe states") {
        CHECK_THROWS_MATCHES(provider->state_by_block_number_or_tag(BlockNumberOrTag::finalized()), ProviderError,
                             has_code(ProviderErrorCode::kFinalizedBlockNotFound));
        CHECK_THROWS_MATCHES(provider->state_by_block_number_or_tag(BlockNumberOrTag::safe()), ProviderError,
                             has_code(ProviderErrorCode::kSafeBlockNotFound));

        provider->set_finalized(blocks[3].sealed_header());
        provider->set_safe(blocks[6].sealed_header());
        CHECK(provider->state_by_block_number_or_tag(BlockNumberOrTag::finalized())
                  ->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(3));
        CHECK(provider->state_by_block_number_or_tag(BlockNumberOrTag::safe())
                  ->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(6));
    }

    SECTION("pending state falls back to latest") {
        CHECK(provider->pending()->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(kBestBlock));
        CHECK(provider->pending_state_by_hash(blocks[kBestBlock].hash()) == nullptr);
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider pending block") {
    const ExecutedBlock pending{pending_block()};
    in_memory_state->set_pending_block(pending);

    CHECK(provider->pending_block_num_hash() == BlockNumHash{kBestBlock + 1, pending.hash()});
    CHECK(provider->pending_block()->hash() == pending.hash());
    CHECK(provider->pending_block_with_senders()->senders == *pending.senders);
    CHECK(provider->pending_block_and_receipts()->second == pending.receipts());
    CHECK(provider->pending_header()->hash == pending.hash());
    CHECK(provider->convert_block_number(BlockNumberOrTag::pending()) == kBestBlock + 1);
    CHECK(provider->block_hash_for_id(BlockId::pending()) == pending.hash());
    CHECK(provider->block_by_number_or_tag(BlockNumberOrTag::pending())->header.number == kBestBlock + 1);
    // Not part of the canonical chain
    CHECK(provider->best_block_number() == kBestBlock);
    CHECK_FALSE(provider->block_hash(kBestBlock + 1));

    SECTION("lookup by hash from the pending source") {
        CHECK(provider->find_block_by_hash(pending.hash(), BlockSource::kPending));
        CHECK_FALSE(provider->find_block_by_hash(blocks[kBestBlock].hash(), BlockSource::kPending));
    }

    SECTION("pending state") {
        const auto state{provider->pending()};
        CHECK(state->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(kBestBlock + 1));
        CHECK(provider->pending_state_by_hash(pending.hash()));
        CHECK(provider->state_by_block_hash(pending.hash())->read_account(kSampleBeneficiary)->balance ==
              intx::uint256{(kBestBlock + 2) * kEther});
        CHECK(provider->state_by_block_number_or_tag(BlockNumberOrTag::pending()));
    }

    SECTION("pending receipts") {
        CHECK(provider->receipts_by_block_id(BlockId::pending()) == pending.receipts());
        CHECK(provider->receipts_by_block_id(BlockHashId{pending.hash()}) == pending.receipts());
        CHECK_FALSE(provider->receipts_by_block_id(BlockHashId{pending.hash(), true}));
        CHECK(provider->receipts_by_block_id(BlockHashId{blocks[8].hash(), true}) == blocks[8].receipts());
    }
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider change sets") {
    const auto in_memory{provider->account_block_changeset(6)};
    REQUIRE(in_memory.size() == 1);
    CHECK(in_memory[0].address == kSampleBeneficiary);
    CHECK(in_memory[0].info->balance == intx::uint256{6 * kEther});

    const auto durable{provider->account_block_changeset(0)};
    REQUIRE(durable.size() == 2);
    CHECK_FALSE(durable[0].info);
    CHECK(durable[1].address == kSampleContract);

    CHECK(provider->account_block_changeset(kBestBlock + 1).empty());
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider checkpoints") {
    CHECK_FALSE(provider->stage_checkpoint(db::StageId::kExecution));
    store.set_stage_checkpoint(db::StageId::kExecution, {kLastPersisted}, Bytes{0x01, 0x02});
    store.set_stage_checkpoint(db::StageId::kHeaders, {kLastPersisted});
    store.set_prune_checkpoint(db::PruneSegment::kReceipts,
                               {.block_num = 2, .tx_num = 5, .mode = db::BlockAmount{db::BlockAmount::Type::kBefore, 3}});

    CHECK(provider->stage_checkpoint(db::StageId::kExecution)->block_num == kLastPersisted);
    CHECK(provider->stage_checkpoint_progress(db::StageId::kExecution) == Bytes{0x01, 0x02});
    CHECK_FALSE(provider->stage_checkpoint_progress(db::StageId::kHeaders));
    CHECK(provider->stage_checkpoints().size() == 2);
    CHECK(provider->prune_checkpoint(db::PruneSegment::kReceipts)->tx_num == 5);
    CHECK_FALSE(provider->prune_checkpoint(db::PruneSegment::kAccountHistory));
    CHECK(provider->prune_checkpoints().size() == 1);
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider EVM environment") {
    const EthereumEvmEnvConfigurator configurator;
    CfgEnv cfg;
    BlockEnv block_env;

    provider->fill_env_at(BlockNum{8}, cfg, block_env, configurator);
    CHECK(cfg.chain_id == 1337);
    CHECK(cfg.revision == EVMC_PRAGUE);
    CHECK(block_env.number == 8);
    CHECK(block_env.coinbase == kSampleBeneficiary);
    CHECK(block_env.timestamp == sample_timestamp(8));

    provider->fill_cfg_env_at(blocks[2].hash(), cfg, configurator);
    CHECK(cfg.revision == EVMC_SHANGHAI);

    provider->fill_env_with_header(blocks[5].sealed_header().header, cfg, block_env, configurator);
    CHECK(block_env.number == 5);

    CHECK_THROWS_AS(provider->fill_env_at(BlockNum{kBestBlock + 1}, cfg, block_env, configurator), ProviderError);
    CHECK_THROWS_AS(provider->fill_cfg_env_at(sample_hash(SampleHashKind::kBlock, 4, 4), cfg, configurator),
                    ProviderError);
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider canonical chain tracking") {
    CHECK_FALSE(provider->last_received_update_timestamp());
    provider->on_forkchoice_update_received();
    CHECK(provider->last_received_update_timestamp());
    provider->on_transition_configuration_exchanged();
    CHECK(provider->last_exchanged_transition_configuration_timestamp());

    auto subscription{provider->subscribe_to_canonical_state()};
    const ExecutedBlock next{sample_child(blocks.back(), {.post_merge = true})};
    in_memory_state->update_chain(NewCanonicalChain::commit({next}));
    const auto notification{subscription.try_next()};
    REQUIRE(notification);
    CHECK((*notification)->tip().hash() == next.hash());
    CHECK(provider->best_block_number() == kBestBlock + 1);
    CHECK(provider->block_body_indices(kBestBlock + 1)->first_tx_num == (kBestBlock + 1) * kTxPerBlock);

    provider->set_canonical_head(blocks[kBestBlock].sealed_header());
    CHECK(provider->chain_info().best_number == kBestBlock);
}

TEST_CASE_METHOD(BlockchainProviderTest, "BlockchainProvider blocks moving to the durable store") {
    const auto before{provider->headers_range(0, std::nullopt)};
    persist_next_block();
    CHECK(provider->last_block_number() == kLastPersisted + 1);
    CHECK(provider->headers_range(0, std::nullopt) == before);
    CHECK(provider->block_body_indices(kLastPersisted + 3)->first_tx_num == (kLastPersisted + 3) * kTxPerBlock);
    CHECK(provider->transaction_id(tx(kLastPersisted + 1, 1).hash) == (kLastPersisted + 1) * kTxPerBlock + 1);
    CHECK(provider->transaction_id(tx(kBestBlock, 1).hash) == kBestBlock * kTxPerBlock + 1);
    CHECK(provider->transactions_by_tx_range({8, 14}).size() == 6);
    CHECK(provider->history_by_block_number(kBestBlock)->read_storage(kSampleContract, kSampleSlot) ==
          sample_slot_value(kBestBlock));
}

//! Durable store whose headers range read is followed by the persistence of block 5, before the overlay is read
class RacingPersistenceTest : public BlockchainProviderTest {
  public:
    RacingPersistenceTest() {
        EXPECT_CALL(racing_store, begin_read()).WillOnce([this]() -> std::unique_ptr<db::DurableReader> {
            auto reader{std::make_unique<NiceMock<MockDurableReader>>()};
            ON_CALL(*reader, sealed_headers_range(_, _)).WillByDefault([this](BlockNum first, BlockNum last) {
                auto headers{store.begin_read()->sealed_headers_range(first, last)};
                persist_next_block();
                return headers;
            });
            return reader;
        });
    }

  protected:
    MockDurableStore racing_store;
};

TEST_CASE_METHOD(RacingPersistenceTest, "BlockchainProvider snapshot read consistency") {
    const BlockchainProvider snapshot_provider{racing_store, in_memory_state, {.read_consistency = ReadConsistency::kSnapshot}};
    const auto headers{snapshot_provider.sealed_headers_range(0, kBestBlock)};
    REQUIRE(headers.size() == kBestBlock + 1);
    CHECK(headers[kLastPersisted + 1].hash == blocks[kLastPersisted + 1].hash());
}

TEST_CASE_METHOD(RacingPersistenceTest, "BlockchainProvider per-step read consistency") {
    const BlockchainProvider per_step_provider{racing_store, in_memory_state};
    CHECK(per_step_provider.settings().read_consistency == ReadConsistency::kPerStep);
    // The block persisted after the durable read has left the overlay by the time it is read
    const auto headers{per_step_provider.sealed_headers_range(0, kBestBlock)};
    CHECK(headers.size() == kLastPersisted + 1);
}

//! Blocks with uneven transaction counts: 0..2 persisted with {2, 0, 3}, 3..5 in the overlay with {0, 3, 1}
class UnevenTransactionsTest {
  public:
    //! Owning block and body index of each global transaction number
    struct TxPosition {
        BlockNum block_num{0};
        size_t index{0};
    };

    UnevenTransactionsTest() {
        blocks.push_back(sample_genesis({.tx_count = 2}));
        for (const size_t tx_count : {0, 3}) {
            blocks.push_back(sample_child(blocks.back(), {.tx_count = tx_count}));
        }
        for (const size_t tx_count : {0, 3, 1}) {
            blocks.push_back(sample_child(blocks.back(), {.tx_count = tx_count, .post_merge = true}));
        }
        for (BlockNum n{0}; n <= kUnevenLastPersisted; ++n) {
            store.append(blocks[n]);
        }
        in_memory_state = std::make_shared<CanonicalInMemoryState>(blocks[kUnevenLastPersisted].sealed_header());
        in_memory_state->update_chain(NewCanonicalChain::commit(
            std::vector<ExecutedBlock>(blocks.begin() + kUnevenLastPersisted + 1, blocks.end())));
        provider = std::make_unique<BlockchainProvider>(store, in_memory_state);
    }

  protected:
    static constexpr BlockNum kUnevenLastPersisted{2};
    static constexpr TxnId kTxCount{9};

    //! Moves the empty block 3 from the overlay to the durable store
    void persist_empty_block() {
        const ExecutedBlock& next{blocks[kUnevenLastPersisted + 1]};
        store.append(next);
        in_memory_state->remove_persisted_blocks({next.number(), next.hash()});
    }

    const Transaction& tx(const TxPosition& position) const {
        return blocks.at(position.block_num).sealed_block().body.transactions.at(position.index);
    }

    void check_transaction_numbering() const {
        const std::vector<StoredBlockBodyIndices> expected_indices{
            {.first_tx_num = 0, .tx_count = 2},
            {.first_tx_num = 2, .tx_count = 0},
            {.first_tx_num = 2, .tx_count = 3},
            {.first_tx_num = 5, .tx_count = 0},
            {.first_tx_num = 5, .tx_count = 3},
            {.first_tx_num = 8, .tx_count = 1},
        };
        for (BlockNum n{0}; n < expected_indices.size(); ++n) {
            CHECK(provider->block_body_indices(n) == expected_indices[n]);
        }
        CHECK_FALSE(provider->block_body_indices(expected_indices.size()));

        const std::vector<TxPosition> positions{{0, 0}, {0, 1}, {2, 0}, {2, 1}, {2, 2},
                                                {4, 0}, {4, 1}, {4, 2}, {5, 0}};
        REQUIRE(positions.size() == kTxCount);
        for (TxnId id{0}; id < kTxCount; ++id) {
            const TxPosition& position{positions[id]};
            const ExecutedBlock& block{blocks[position.block_num]};
            CHECK(expected_indices[position.block_num].first_tx_num + position.index == id);
            CHECK(provider->transaction_id(tx(position).hash) == id);
            const auto transaction{provider->transaction_by_id(id)};
            REQUIRE(transaction);
            CHECK(transaction->hash == tx(position).hash);
            CHECK(provider->transaction_block(id) == position.block_num);
            CHECK(provider->transaction_sender(id) == block.senders->at(position.index));
            CHECK(provider->receipt(id) == block.receipts().at(position.index));
        }
        CHECK_FALSE(provider->transaction_by_id(kTxCount));
        CHECK_FALSE(provider->transaction_block(kTxCount));
        CHECK_FALSE(provider->transaction_sender(kTxCount));
        CHECK_FALSE(provider->receipt(kTxCount));

        const auto transactions{provider->transactions_by_tx_range({0, kTxCount + 5})};
        REQUIRE(transactions.size() == kTxCount);
        for (TxnId id{0}; id < kTxCount; ++id) {
            CHECK(transactions[id].hash == tx(positions[id]).hash);
        }
        CHECK(provider->senders_by_tx_range({0, kTxCount}).size() == kTxCount);
        CHECK(provider->receipts_by_tx_range({0, kTxCount}).size() == kTxCount);

        // Ranges starting at the first transaction past an empty block
        const auto straddling{provider->transactions_by_tx_range({4, 6})};
        REQUIRE(straddling.size() == 2);
        CHECK(straddling[0].hash == tx({2, 2}).hash);
        CHECK(straddling[1].hash == tx({4, 0}).hash);
        const auto after_empty{provider->receipts_by_tx_range({5, 6})};
        REQUIRE(after_empty.size() == 1);
        CHECK(after_empty[0] == blocks[4].receipts()[0]);
        CHECK(provider->senders_by_tx_range({8, 20}) == std::vector<evmc::address>{blocks[5].senders->at(0)});
    }

    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    MemoryDurableStore store{sample_chain_config()};
    std::vector<ExecutedBlock> blocks;
    std::shared_ptr<CanonicalInMemoryState> in_memory_state;
    std::unique_ptr<BlockchainProvider> provider;
};

TEST_CASE_METHOD(UnevenTransactionsTest, "BlockchainProvider transaction numbering with uneven blocks") {
    SECTION("empty block in the overlay") {
        check_transaction_numbering();
    }

    SECTION("empty block at the durable boundary") {
        persist_empty_block();
        REQUIRE(provider->last_block_number() == kUnevenLastPersisted + 1);
        check_transaction_numbering();
    }
}

TEST_CASE("BlockchainProvider create") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    MemoryDurableStore store{sample_chain_config()};

    SECTION("empty store") {
        CHECK_THROWS_MATCHES(BlockchainProvider::create(store), ProviderError,
                             has_code(ProviderErrorCode::kHeaderNotFound));
    }

    SECTION("head, finalized and safe from the durable store") {
        const auto genesis{sample_genesis()};
        store.append(genesis);
        for (const auto& block : sample_children(genesis, 3)) {
            store.append(block);
        }
        store.set_finalized(1);
        store.set_safe(2);

        const auto provider{BlockchainProvider::create(store, {.read_consistency = ReadConsistency::kSnapshot})};
        CHECK(provider->settings().read_consistency == ReadConsistency::kSnapshot);
        CHECK(provider->best_block_number() == 3);
        CHECK(provider->last_block_number() == 3);
        CHECK(provider->finalized_block_number() == 1);
        CHECK(provider->safe_block_number() == 2);
        CHECK(provider->canonical_in_memory_state()->snapshot()->empty());
        CHECK(provider->headers_range(0, std::nullopt).size() == 4);
        CHECK(provider->block_body_indices(3)->first_tx_num == 6);
        CHECK(provider->latest()->read_storage(kSampleContract, kSampleSlot) == sample_slot_value(3));
    }
}

TEST_CASE("BlockchainProvider with a failing durable store") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const auto genesis{sample_genesis()};
    const auto blocks{sample_children(genesis, 3)};
    MockDurableStore store;
    auto in_memory_state{std::make_shared<CanonicalInMemoryState>(genesis.sealed_header())};
    in_memory_state->update_chain(NewCanonicalChain::commit(blocks));
    const BlockchainProvider provider{store, in_memory_state};

    SECTION("in-memory hits never open the durable store") {
        EXPECT_CALL(store, begin_read()).Times(0);
        CHECK(provider.block_number(blocks[1].hash()) == 2);
        CHECK(provider.block_hash(3) == blocks[2].hash());
        CHECK(provider.header(blocks[0].hash())->number == 1);
        CHECK(provider.transaction_by_hash(blocks[2].sealed_block().body.transactions[0].hash));
    }

    SECTION("storage failures propagate") {
        EXPECT_CALL(store, begin_read()).WillOnce([]() -> std::unique_ptr<db::DurableReader> {
            auto reader{std::make_unique<MockDurableReader>()};
            EXPECT_CALL(*reader, block_hash(0)).WillOnce(testing::Throw(std::runtime_error{"storage failure"}));
            return reader;
        });
        CHECK_THROWS_WITH(provider.block_hash(0), "storage failure");
    }

    SECTION("missing boundary indices") {
        EXPECT_CALL(store, begin_read()).WillRepeatedly([]() -> std::unique_ptr<db::DurableReader> {
            auto reader{std::make_unique<NiceMock<MockDurableReader>>()};
            ON_CALL(*reader, last_block_number()).WillByDefault(Return(0));
            return reader;
        });
        CHECK_THROWS_MATCHES(provider.block_body_indices(2), ProviderError,
                             has_code(ProviderErrorCode::kBlockBodyIndicesNotFound));
        CHECK_THROWS_MATCHES(provider.transaction_id(sample_hash(SampleHashKind::kTransaction, 0, 2, 1)), ProviderError,
                             has_code(ProviderErrorCode::kBlockBodyIndicesNotFound));
        // Walks over a missing boundary report absence
        CHECK_FALSE(provider.transaction_by_id(4));
        CHECK(provider.transactions_by_tx_range({0, 10}).empty());
    }

    SECTION("missing anchor state") {
        EXPECT_CALL(store, begin_read()).WillRepeatedly([]() -> std::unique_ptr<db::DurableReader> {
            return std::make_unique<NiceMock<MockDurableReader>>();
        });
        CHECK_THROWS_MATCHES(provider.latest(), ProviderError,
                             has_code(ProviderErrorCode::kStateForHashNotFound));
    }
}

TEST_CASE("BlockchainProvider opens one durable reader per query") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const auto genesis{sample_genesis()};
    const auto blocks{sample_children(genesis, 3, {.post_merge = true})};
    MemoryDurableStore anchor_store{sample_chain_config()};
    anchor_store.append(genesis);

    MockDurableStore store;
    auto in_memory_state{std::make_shared<CanonicalInMemoryState>(genesis.sealed_header())};
    in_memory_state->update_chain(NewCanonicalChain::commit(blocks));
    const BlockchainProvider provider{store, in_memory_state};

    size_t reads{0};
    EXPECT_CALL(store, begin_read()).WillRepeatedly([&]() -> std::unique_ptr<db::DurableReader> {
        ++reads;
        auto reader{std::make_unique<NiceMock<MockDurableReader>>()};
        ON_CALL(*reader, last_block_number()).WillByDefault(Return(0));
        ON_CALL(*reader, block_body_indices(0)).WillByDefault(Return(StoredBlockBodyIndices{.first_tx_num = 0, .tx_count = 2}));
        ON_CALL(*reader, header_td_by_number(0)).WillByDefault(Return(kSamplePowDifficulty));
        ON_CALL(*reader, transaction_by_id(1)).WillByDefault(Return(genesis.sealed_block().body.transactions[1]));
        ON_CALL(*reader, history_by_block_hash(genesis.hash())).WillByDefault([&](const Hash&) {
            return anchor_store.begin_read()->latest_state();
        });
        return reader;
    });

    SECTION("body indices of an in-memory block") {
        CHECK(provider.block_body_indices(2) == StoredBlockBodyIndices{.first_tx_num = 4, .tx_count = 2});
    }

    SECTION("total difficulty of an in-memory block") {
        CHECK(provider.header_td_by_number(2) == kSamplePowDifficulty);
    }

    SECTION("state of an in-memory block") {
        CHECK(provider.history_by_block_hash(blocks[1].hash())->read_storage(kSampleContract, kSampleSlot) ==
              sample_slot_value(2));
    }

    SECTION("durable transaction by id") {
        CHECK(provider.transaction_by_id(1)->hash == genesis.sealed_block().body.transactions[1].hash);
    }

    SECTION("in-memory transaction by id") {
        CHECK(provider.transaction_by_id(4)->hash == blocks[1].sealed_block().body.transactions[0].hash);
    }

    CHECK(reads == 1);
}

}  // namespace strata::provider
