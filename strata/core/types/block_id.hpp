// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <variant>

#include <strata/core/common/base.hpp>
#include <strata/core/types/hash.hpp>

namespace strata {

struct BlockNumHash {
    BlockNum number{0};
    Hash hash;

    friend bool operator==(const BlockNumHash&, const BlockNumHash&) = default;
};

//! \brief Best block of the canonical chain
struct ChainInfo {
    Hash best_hash;
    BlockNum best_number{0};

    friend bool operator==(const ChainInfo&, const ChainInfo&) = default;
};

class BlockHashOrNumber {
  public:
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    BlockHashOrNumber(BlockNum block_num) noexcept : value_{block_num} {}
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    BlockHashOrNumber(const Hash& hash) noexcept : value_{hash} {}

    bool is_number() const { return std::holds_alternative<BlockNum>(value_); }
    BlockNum number() const { return is_number() ? *std::get_if<BlockNum>(&value_) : 0; }

    bool is_hash() const { return std::holds_alternative<Hash>(value_); }
    Hash hash() const { return is_hash() ? *std::get_if<Hash>(&value_) : Hash{}; }

    std::string to_string() const;

    friend bool operator==(const BlockHashOrNumber&, const BlockHashOrNumber&) = default;

  private:
    std::variant<BlockNum, Hash> value_;
};

//! \brief Block number or one of the named positions on the chain
class BlockNumberOrTag {
  public:
    enum class Kind : uint8_t {
        kLatest,
        kFinalized,
        kSafe,
        kEarliest,
        kPending,
        kNumber,
    };

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    BlockNumberOrTag(BlockNum block_num) noexcept : kind_{Kind::kNumber}, number_{block_num} {}

    static BlockNumberOrTag latest() { return BlockNumberOrTag{Kind::kLatest}; }
    static BlockNumberOrTag finalized() { return BlockNumberOrTag{Kind::kFinalized}; }
    static BlockNumberOrTag safe() { return BlockNumberOrTag{Kind::kSafe}; }
    static BlockNumberOrTag earliest() { return BlockNumberOrTag{Kind::kEarliest}; }
    static BlockNumberOrTag pending() { return BlockNumberOrTag{Kind::kPending}; }

    Kind kind() const { return kind_; }
    bool is_number() const { return kind_ == Kind::kNumber; }
    bool is_latest() const { return kind_ == Kind::kLatest; }
    bool is_pending() const { return kind_ == Kind::kPending; }

    //! \brief The explicit number, or the earliest block number for kEarliest
    std::optional<BlockNum> as_number() const {
        if (kind_ == Kind::kNumber) return number_;
        if (kind_ == Kind::kEarliest) return kEarliestBlockNum;
        return std::nullopt;
    }

    std::string to_string() const;

    friend bool operator==(const BlockNumberOrTag&, const BlockNumberOrTag&) = default;

  private:
    explicit BlockNumberOrTag(Kind kind) noexcept : kind_{kind} {}

    Kind kind_;
    BlockNum number_{0};
};

//! \brief Block hash, optionally qualified by whether the block must be on the canonical chain
struct BlockHashId {
    Hash hash;
    std::optional<bool> require_canonical{std::nullopt};

    friend bool operator==(const BlockHashId&, const BlockHashId&) = default;
};

class BlockId {
  public:
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    BlockId(BlockHashId hash_id) noexcept : value_{hash_id} {}
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    BlockId(BlockNumberOrTag number_or_tag) noexcept : value_{number_or_tag} {}
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    BlockId(const Hash& hash) noexcept : value_{BlockHashId{hash}} {}
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    BlockId(BlockNum block_num) noexcept : value_{BlockNumberOrTag{block_num}} {}

    static BlockId latest() { return BlockNumberOrTag::latest(); }
    static BlockId pending() { return BlockNumberOrTag::pending(); }

    bool is_hash() const { return std::holds_alternative<BlockHashId>(value_); }
    const BlockHashId& hash_id() const { return std::get<BlockHashId>(value_); }

    bool is_number_or_tag() const { return std::holds_alternative<BlockNumberOrTag>(value_); }
    const BlockNumberOrTag& number_or_tag() const { return std::get<BlockNumberOrTag>(value_); }

    bool is_pending() const { return is_number_or_tag() && number_or_tag().is_pending(); }

    std::string to_string() const;

    friend bool operator==(const BlockId&, const BlockId&) = default;

  private:
    std::variant<BlockHashId, BlockNumberOrTag> value_;
};

std::ostream& operator<<(std::ostream& out, const BlockHashOrNumber& id);
std::ostream& operator<<(std::ostream& out, const BlockNumberOrTag& id);
std::ostream& operator<<(std::ostream& out, const BlockId& id);

}  // namespace strata
