// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

#include <strata/core/common/util.hpp>

namespace strata::provider {

ProviderError::ProviderError(ProviderErrorCode code, const std::string& message)
    : std::runtime_error{message.empty() ? "Provider error : " + std::string{magic_enum::enum_name(code)}
                                         : std::string{magic_enum::enum_name(code)} + " : " + message},
      code_{code} {}

ProviderError header_not_found(const BlockHashOrNumber& id) {
    return ProviderError{ProviderErrorCode::kHeaderNotFound, "block " + id.to_string()};
}

ProviderError header_not_found(const BlockId& id) {
    return ProviderError{ProviderErrorCode::kHeaderNotFound, "block " + id.to_string()};
}

ProviderError block_body_indices_not_found(BlockNum block_num) {
    return ProviderError{ProviderErrorCode::kBlockBodyIndicesNotFound, "block " + std::to_string(block_num)};
}

ProviderError state_for_hash_not_found(const Hash& block_hash) {
    return ProviderError{ProviderErrorCode::kStateForHashNotFound, "block " + to_hex(block_hash)};
}

ProviderError state_for_number_not_found(BlockNum block_num) {
    return ProviderError{ProviderErrorCode::kStateForNumberNotFound, "block " + std::to_string(block_num)};
}

ProviderError finalized_block_not_found() {
    return ProviderError{ProviderErrorCode::kFinalizedBlockNotFound};
}

ProviderError safe_block_not_found() {
    return ProviderError{ProviderErrorCode::kSafeBlockNotFound};
}

}  // namespace strata::provider
