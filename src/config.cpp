#include <marksync/config.hpp>

#include <marksync/error.hpp>
#include <marksync/json.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace marksync {

namespace {

auto invalid(std::string message) -> Exception {
    return Exception{ErrorKind::invalid_config, std::move(message)};
}

auto parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum> {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

}  // anonymous namespace

auto validate(EngineConfig config) -> EngineConfig {
    auto& w = config.weights;
    if (w.lexical < 0.0 || w.vector < 0.0 || w.recency < 0.0) {
        throw invalid("search weights must be non-negative");
    }
    const auto sum = w.lexical + w.vector + w.recency;
    if (sum <= 0.0) throw invalid("search weights must not all be zero");
    w.lexical /= sum;
    w.vector /= sum;
    w.recency /= sum;

    if (config.hnsw.max_neighbors < 2) throw invalid("hnsw.max_neighbors must be at least 2");
    if (config.hnsw.ef_construction == 0) throw invalid("hnsw.ef_construction must be positive");
    if (config.hnsw.ef_search == 0) throw invalid("hnsw.ef_search must be positive");
    if (config.compaction.max_log_ops == 0 || config.compaction.checkpoint_interval_ops == 0) {
        throw invalid("compaction thresholds must be positive");
    }
    if (config.recency_half_life_ms <= 0) throw invalid("recency_half_life_ms must be positive");
    if (!parse_level(config.log_level)) throw invalid("unknown log level '" + config.log_level + "'");
    return config;
}

auto load_config_json(const nlohmann::json& j) -> EngineConfig {
    if (!j.is_object()) throw invalid("configuration must be a JSON object");
    try {
        return validate(j.get<EngineConfig>());
    } catch (const nlohmann::json::exception& e) {
        throw invalid(e.what());
    }
}

auto load_config(std::string_view json_text) -> EngineConfig {
    auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded()) throw invalid("malformed JSON");
    return load_config_json(j);
}

auto load_config_file(const std::filesystem::path& path) -> EngineConfig {
    auto in = std::ifstream{path};
    if (!in) throw invalid("cannot read " + path.string());
    auto text = std::stringstream{};
    text << in.rdbuf();
    SPDLOG_DEBUG("loading configuration from {}", path.string());
    return load_config(text.str());
}

auto dump_config(const EngineConfig& config) -> std::string {
    return nlohmann::json(config).dump(2);
}

void set_log_level(std::string_view level) {
    auto parsed = parse_level(level);
    if (!parsed) throw invalid("unknown log level '" + std::string{level} + "'");
    spdlog::set_level(*parsed);
}

}  // namespace marksync
