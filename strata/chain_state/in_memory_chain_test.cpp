// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_chain.hpp"

#include <catch2/catch.hpp>

#include <strata/chain_state/test_util/sample_chain.hpp>

namespace strata::chain_state {

using test_util::sample_children;
using test_util::sample_genesis;

static FlatHashMap<Hash, BlockStatePtr> index_blocks(const std::vector<ExecutedBlock>& blocks) {
    FlatHashMap<Hash, BlockStatePtr> indexed;
    for (const auto& block : blocks) {
        indexed.emplace(block.hash(), std::make_shared<const BlockState>(block));
    }
    return indexed;
}

TEST_CASE("InMemoryChain empty") {
    const InMemoryChain chain;
    CHECK(chain.empty());
    CHECK(chain.size() == 0);
    CHECK(chain.tip() == nullptr);
    CHECK(chain.lowest() == nullptr);
    CHECK_FALSE(chain.tip_number());
    CHECK(chain.canonical_chain().empty());
    CHECK(chain.pending() == nullptr);
}

TEST_CASE("InMemoryChain canonical index") {
    // Blocks 3..6 above a durable boundary at block 2
    const auto durable{sample_children(sample_genesis(), 2)};
    const auto blocks{sample_children(durable.back(), 4)};
    const InMemoryChain chain{index_blocks(blocks), blocks.back().hash(), nullptr};

    REQUIRE(chain.size() == 4);
    CHECK(chain.tip()->number() == 6);
    CHECK(chain.lowest()->number() == 3);
    CHECK(chain.tip_number() == 6);
    for (const auto& block : blocks) {
        REQUIRE(chain.state_by_number(block.number()));
        CHECK(chain.state_by_number(block.number())->hash() == block.hash());
        CHECK(chain.state_by_hash(block.hash())->number() == block.number());
    }
    CHECK(chain.state_by_number(2) == nullptr);
    CHECK(chain.state_by_number(7) == nullptr);

    SECTION("canonical chain is newest first") {
        const auto canonical{chain.canonical_chain()};
        REQUIRE(canonical.size() == 4);
        CHECK(canonical.front()->number() == 6);
        CHECK(canonical.back()->number() == 3);
        const auto ascending{chain.ascending()};
        CHECK(ascending.front()->number() == 3);
        CHECK(ascending.back()->number() == 6);
    }

    SECTION("anchor is the durable parent of the lowest block") {
        const BlockNumHash anchor{chain.anchor(*chain.tip())};
        CHECK(anchor.number == 2);
        CHECK(anchor.hash == durable.back().hash());
        CHECK(chain.anchor(*chain.lowest()) == anchor);
    }

    SECTION("parent state chain excludes the block itself") {
        const auto parents{chain.parent_state_chain(*chain.state_by_number(5))};
        REQUIRE(parents.size() == 2);
        CHECK(parents[0]->number() == 4);
        CHECK(parents[1]->number() == 3);
        const auto from{chain.chain_from(chain.state_by_number(5))};
        REQUIRE(from.size() == 3);
        CHECK(from[0]->number() == 5);
        CHECK(chain.chain_from(nullptr).empty());
    }
}

TEST_CASE("InMemoryChain drops blocks off the canonical chain") {
    const auto genesis{sample_genesis()};
    const auto canonical{sample_children(genesis, 3)};
    auto all{canonical};
    const auto side{sample_children(canonical[0], 2, {.fork = 1})};
    all.insert(all.end(), side.begin(), side.end());

    const InMemoryChain chain{index_blocks(all), canonical.back().hash(), nullptr};
    CHECK(chain.size() == 3);
    CHECK(chain.state_by_hash(side[0].hash()) == nullptr);
    CHECK(chain.blocks().size() == 3);

    const InMemoryChain side_chain{index_blocks(all), side.back().hash(), nullptr};
    CHECK(side_chain.size() == 3);
    CHECK(side_chain.state_by_number(1)->hash() == canonical[0].hash());
    CHECK(side_chain.state_by_number(3)->hash() == side.back().hash());
}

TEST_CASE("InMemoryChain pending block") {
    const auto blocks{sample_children(sample_genesis(), 2)};
    const InMemoryChain chain{index_blocks(blocks), blocks.back().hash(), nullptr};
    const auto pending{std::make_shared<const BlockState>(test_util::sample_child(blocks.back()))};

    const InMemoryChain with_pending{chain.with_pending(pending)};
    CHECK(with_pending.pending() == pending);
    CHECK(with_pending.size() == chain.size());
    CHECK(with_pending.state_by_number(3) == nullptr);
    CHECK(with_pending.anchor(*pending).number == 0);
    CHECK(with_pending.without_pending().pending() == nullptr);
    CHECK(chain.pending() == nullptr);
}

}  // namespace strata::chain_state
