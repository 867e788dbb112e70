// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace strata::provider {

//! \brief Consistency of queries reading the in-memory overlay in several steps (range merges, tx-number walks)
enum class ReadConsistency : uint8_t {
    //! Each step reads the latest published overlay, so a concurrent chain update may be observed mid-query
    kPerStep,
    //! The whole query is served by the overlay snapshot captured when it starts
    kSnapshot,
};

struct ProviderSettings {
    ReadConsistency read_consistency{ReadConsistency::kPerStep};
};

}  // namespace strata::provider
