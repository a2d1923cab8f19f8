/// @file config.hpp
/// @brief Engine configuration: search weights, HNSW, compaction, logging.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace marksync {

/// Weights of the fused hybrid score. Normalised to sum to 1.
struct SearchWeights {
    double lexical{0.5};
    double vector{0.35};
    double recency{0.15};

    auto operator==(const SearchWeights&) const -> bool = default;
};

/// Parameters of the layered proximity graph.
struct HnswParams {
    std::size_t max_neighbors{16};     ///< M: links per node on upper layers (2M on layer 0).
    std::size_t ef_construction{100};  ///< Candidate list size while inserting.
    std::size_t ef_search{64};         ///< Candidate list size while querying.
    std::uint64_t seed{0x6d61726b};    ///< Seed of the level generator.

    auto operator==(const HnswParams&) const -> bool = default;
};

/// When the delta log folds stable operations into a checkpoint.
struct CompactionPolicy {
    std::size_t max_log_ops{4096};              ///< Compact once the log holds this many ops.
    std::size_t checkpoint_interval_ops{1024};  ///< ...or this many were appended since the last checkpoint.

    auto operator==(const CompactionPolicy&) const -> bool = default;
};

/// Everything tunable about one engine instance.
struct EngineConfig {
    SearchWeights weights{};
    HnswParams hnsw{};
    CompactionPolicy compaction{};
    std::int64_t recency_half_life_ms{std::int64_t{30} * 24 * 60 * 60 * 1000};
    std::size_t embedding_dimension{0};  ///< 0 = fixed by the first embedding indexed.
    std::string log_level{"info"};

    auto operator==(const EngineConfig&) const -> bool = default;
};

/// Check ranges and normalise the search weights.
/// @throws Exception{invalid_config} on negative or all-zero weights,
///   zero HNSW sizes, a non-positive half-life or an unknown log level.
auto validate(EngineConfig config) -> EngineConfig;

/// Parse a JSON document into a validated configuration.
/// Missing keys keep their defaults.
/// @throws Exception{invalid_config} on malformed JSON or invalid values.
auto load_config(std::string_view json_text) -> EngineConfig;

/// Read and parse a JSON configuration file.
/// @throws Exception{invalid_config} if the file cannot be read or parsed.
auto load_config_file(const std::filesystem::path& path) -> EngineConfig;

/// Serialise a configuration to JSON text.
auto dump_config(const EngineConfig& config) -> std::string;

/// Set the spdlog level from "trace", "debug", "info", "warn", "error",
/// "critical" or "off".
/// @throws Exception{invalid_config} for any other string.
void set_log_level(std::string_view level);

}  // namespace marksync
