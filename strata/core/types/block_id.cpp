// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_id.hpp"

#include <magic_enum.hpp>

#include <strata/core/common/util.hpp>

namespace strata {

std::string BlockHashOrNumber::to_string() const {
    return is_hash() ? to_hex(hash()) : std::to_string(number());
}

std::string BlockNumberOrTag::to_string() const {
    switch (kind_) {
        case Kind::kLatest:
            return "latest";
        case Kind::kFinalized:
            return "finalized";
        case Kind::kSafe:
            return "safe";
        case Kind::kEarliest:
            return "earliest";
        case Kind::kPending:
            return "pending";
        case Kind::kNumber:
            return std::to_string(number_);
    }
    return std::string{magic_enum::enum_name(kind_)};
}

std::string BlockId::to_string() const {
    if (is_hash()) {
        const auto& id = hash_id();
        std::string out{to_hex(id.hash)};
        if (id.require_canonical) {
            out += *id.require_canonical ? " (canonical)" : " (any)";
        }
        return out;
    }
    return number_or_tag().to_string();
}

std::ostream& operator<<(std::ostream& out, const BlockHashOrNumber& id) {
    out << id.to_string();
    return out;
}

std::ostream& operator<<(std::ostream& out, const BlockNumberOrTag& id) {
    out << id.to_string();
    return out;
}

std::ostream& operator<<(std::ostream& out, const BlockId& id) {
    out << id.to_string();
    return out;
}

}  // namespace strata
