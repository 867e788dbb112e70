// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <string>

#include <evmc/hex.hpp>

#include <strata/core/common/util.hpp>

namespace strata {

inline constexpr const char* kTerminalTotalDifficulty{"terminalTotalDifficulty"};

static inline void member_to_json(nlohmann::json& json, const std::string& key, const std::optional<uint64_t>& source) {
    if (source) {
        json[key] = source.value();
    }
}

static inline void read_json_config_member(const nlohmann::json& json, const std::string& key,
                                           std::optional<uint64_t>& target) {
    if (json.contains(key)) {
        target = json[key].get<uint64_t>();
    }
}

nlohmann::json ChainConfig::to_json() const {
    nlohmann::json ret;

    ret["chainId"] = chain_id;

    member_to_json(ret, "homesteadBlock", homestead_block);
    member_to_json(ret, "daoForkBlock", dao_block);
    member_to_json(ret, "eip150Block", tangerine_whistle_block);
    member_to_json(ret, "eip155Block", spurious_dragon_block);
    member_to_json(ret, "byzantiumBlock", byzantium_block);
    member_to_json(ret, "constantinopleBlock", constantinople_block);
    member_to_json(ret, "petersburgBlock", petersburg_block);
    member_to_json(ret, "istanbulBlock", istanbul_block);
    member_to_json(ret, "muirGlacierBlock", muir_glacier_block);
    member_to_json(ret, "berlinBlock", berlin_block);
    member_to_json(ret, "londonBlock", london_block);
    member_to_json(ret, "arrowGlacierBlock", arrow_glacier_block);
    member_to_json(ret, "grayGlacierBlock", gray_glacier_block);

    if (terminal_total_difficulty) {
        ret[kTerminalTotalDifficulty] = intx::to_string(*terminal_total_difficulty);
    }

    member_to_json(ret, "mergeNetsplitBlock", merge_netsplit_block);
    member_to_json(ret, "shanghaiTime", shanghai_time);
    member_to_json(ret, "cancunTime", cancun_time);
    member_to_json(ret, "pragueTime", prague_time);

    if (genesis_hash.has_value()) {
        ret["genesisBlockHash"] = to_hex(*genesis_hash, /*with_prefix=*/true);
    }

    return ret;
}

std::optional<ChainConfig> ChainConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.contains("chainId") || !json["chainId"].is_number()) {
        return std::nullopt;
    }

    // Malformed members (wrong JSON type, unparsable numbers) surface as exceptions from nlohmann or intx
    try {
        ChainConfig config{};
        config.chain_id = json["chainId"].get<uint64_t>();

        read_json_config_member(json, "homesteadBlock", config.homestead_block);
        read_json_config_member(json, "daoForkBlock", config.dao_block);
        read_json_config_member(json, "eip150Block", config.tangerine_whistle_block);
        read_json_config_member(json, "eip155Block", config.spurious_dragon_block);
        read_json_config_member(json, "byzantiumBlock", config.byzantium_block);
        read_json_config_member(json, "constantinopleBlock", config.constantinople_block);
        read_json_config_member(json, "petersburgBlock", config.petersburg_block);
        read_json_config_member(json, "istanbulBlock", config.istanbul_block);
        read_json_config_member(json, "muirGlacierBlock", config.muir_glacier_block);
        read_json_config_member(json, "berlinBlock", config.berlin_block);
        read_json_config_member(json, "londonBlock", config.london_block);
        read_json_config_member(json, "arrowGlacierBlock", config.arrow_glacier_block);
        read_json_config_member(json, "grayGlacierBlock", config.gray_glacier_block);

        if (json.contains(kTerminalTotalDifficulty)) {
            const auto& ttd{json[kTerminalTotalDifficulty]};
            if (ttd.is_string()) {
                config.terminal_total_difficulty = intx::from_string<intx::uint256>(ttd.get<std::string>());
            } else if (ttd.is_number_unsigned()) {
                config.terminal_total_difficulty = intx::uint256{ttd.get<uint64_t>()};
            } else {
                return std::nullopt;
            }
        }

        read_json_config_member(json, "mergeNetsplitBlock", config.merge_netsplit_block);
        read_json_config_member(json, "shanghaiTime", config.shanghai_time);
        read_json_config_member(json, "cancunTime", config.cancun_time);
        read_json_config_member(json, "pragueTime", config.prague_time);

        if (json.contains("genesisBlockHash")) {
            config.genesis_hash = evmc::from_hex<evmc::bytes32>(json["genesisBlockHash"].get<std::string>());
            if (!config.genesis_hash) {
                return std::nullopt;
            }
        }

        return config;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool ChainConfig::withdrawals_activated(BlockTime block_time) const noexcept {
    return shanghai_time && block_time >= shanghai_time;
}

bool ChainConfig::is_london(BlockNum block_num) const noexcept {
    return london_block && block_num >= london_block;
}

bool ChainConfig::is_prague(BlockTime block_time) const noexcept {
    return prague_time && block_time >= prague_time;
}

bool ChainConfig::is_merged(BlockNum block_num) const noexcept {
    return merge_netsplit_block && block_num >= merge_netsplit_block;
}

evmc_revision ChainConfig::revision(BlockNum block_num, BlockTime block_time) const noexcept {
    if (prague_time && block_time >= prague_time) return EVMC_PRAGUE;
    if (cancun_time && block_time >= cancun_time) return EVMC_CANCUN;
    if (shanghai_time && block_time >= shanghai_time) return EVMC_SHANGHAI;

    if (merge_netsplit_block && block_num >= merge_netsplit_block) return EVMC_PARIS;
    if (london_block && block_num >= london_block) return EVMC_LONDON;
    if (berlin_block && block_num >= berlin_block) return EVMC_BERLIN;
    if (istanbul_block && block_num >= istanbul_block) return EVMC_ISTANBUL;
    if (petersburg_block && block_num >= petersburg_block) return EVMC_PETERSBURG;
    if (constantinople_block && block_num >= constantinople_block) return EVMC_CONSTANTINOPLE;
    if (byzantium_block && block_num >= byzantium_block) return EVMC_BYZANTIUM;
    if (spurious_dragon_block && block_num >= spurious_dragon_block) return EVMC_SPURIOUS_DRAGON;
    if (tangerine_whistle_block && block_num >= tangerine_whistle_block) return EVMC_TANGERINE_WHISTLE;
    if (homestead_block && block_num >= homestead_block) return EVMC_HOMESTEAD;

    return EVMC_FRONTIER;
}

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj) { return out << obj.to_json(); }

const ChainConfig kMainnetConfig{
    .chain_id = 1,
    .genesis_hash = kMainnetGenesisHash,
    .homestead_block = 1'150'000,
    .dao_block = 1'920'000,
    .tangerine_whistle_block = 2'463'000,
    .spurious_dragon_block = 2'675'000,
    .byzantium_block = 4'370'000,
    .constantinople_block = 7'280'000,
    .petersburg_block = 7'280'000,
    .istanbul_block = 9'069'000,
    .muir_glacier_block = 9'200'000,
    .berlin_block = 12'244'000,
    .london_block = 12'965'000,
    .arrow_glacier_block = 13'773'000,
    .gray_glacier_block = 15'050'000,
    .terminal_total_difficulty = intx::from_string<intx::uint256>("58750000000000000000000"),
    .merge_netsplit_block = 15'537'394,
    .shanghai_time = 1681338455,
    .cancun_time = 1710338135,
    .prague_time = 1746612311,
};

const ChainConfig kSepoliaConfig{
    .chain_id = 11155111,
    .genesis_hash = kSepoliaGenesisHash,
    .homestead_block = 0,
    .tangerine_whistle_block = 0,
    .spurious_dragon_block = 0,
    .byzantium_block = 0,
    .constantinople_block = 0,
    .petersburg_block = 0,
    .istanbul_block = 0,
    .muir_glacier_block = 0,
    .berlin_block = 0,
    .london_block = 0,
    .terminal_total_difficulty = 17000000000000000,
    .merge_netsplit_block = 1'735'371,
    .shanghai_time = 1677557088,
    .cancun_time = 1706655072,
    .prague_time = 1741159776,
};

}  // namespace strata
