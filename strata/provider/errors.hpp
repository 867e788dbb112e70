// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <strata/core/common/base.hpp>
#include <strata/core/types/block_id.hpp>
#include <strata/core/types/hash.hpp>

namespace strata::provider {

enum class ProviderErrorCode : uint8_t {
    kHeaderNotFound,
    kBlockBodyIndicesNotFound,
    kStateForHashNotFound,
    kStateForNumberNotFound,
    kFinalizedBlockNotFound,
    kSafeBlockNotFound,
};

//! \brief Data that should exist is missing from both the in-memory overlay and the durable store
//! \remarks Plain absence of a queried item is reported as an empty result, never with this exception
class ProviderError : public std::runtime_error {
  public:
    explicit ProviderError(ProviderErrorCode code, const std::string& message = "");

    ProviderErrorCode code() const noexcept { return code_; }

  private:
    ProviderErrorCode code_;
};

ProviderError header_not_found(const BlockHashOrNumber& id);
ProviderError header_not_found(const BlockId& id);
ProviderError block_body_indices_not_found(BlockNum block_num);
ProviderError state_for_hash_not_found(const Hash& block_hash);
ProviderError state_for_number_not_found(BlockNum block_num);
ProviderError finalized_block_not_found();
ProviderError safe_block_not_found();

}  // namespace strata::provider
