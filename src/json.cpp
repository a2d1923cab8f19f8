#include <marksync/json.hpp>

#include <marksync/error.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marksync {

namespace {

auto base64_encode(const Bytes& data) -> std::string {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    auto result = std::string{};
    auto n = data.size();
    result.reserve(((n + 2) / 3) * 4);
    for (std::size_t i = 0; i < n; i += 3) {
        auto b0 = static_cast<unsigned char>(data[i]);
        auto b1 = (i + 1 < n) ? static_cast<unsigned char>(data[i + 1]) : 0u;
        auto b2 = (i + 2 < n) ? static_cast<unsigned char>(data[i + 2]) : 0u;
        result.push_back(table[b0 >> 2]);
        result.push_back(table[((b0 & 0x03) << 4) | (b1 >> 4)]);
        result.push_back((i + 1 < n) ? table[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=');
        result.push_back((i + 2 < n) ? table[b2 & 0x3F] : '=');
    }
    return result;
}

auto base64_decode(std::string_view encoded) -> Bytes {
    static const auto decode_table = [] {
        auto t = std::array<unsigned char, 256>{};
        constexpr std::string_view chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (unsigned char i = 0; i < chars.size(); ++i) {
            t[static_cast<unsigned char>(chars[i])] = i;
        }
        return t;
    }();
    auto result = Bytes{};
    result.reserve((encoded.size() / 4) * 3);
    for (std::size_t i = 0; i + 3 < encoded.size(); i += 4) {
        auto a = decode_table[static_cast<unsigned char>(encoded[i])];
        auto b = decode_table[static_cast<unsigned char>(encoded[i + 1])];
        auto c = decode_table[static_cast<unsigned char>(encoded[i + 2])];
        auto d = decode_table[static_cast<unsigned char>(encoded[i + 3])];
        result.push_back(std::byte((a << 2) | (b >> 4)));
        if (encoded[i + 2] != '=') result.push_back(std::byte(((b & 0x0F) << 4) | (c >> 2)));
        if (encoded[i + 3] != '=') result.push_back(std::byte(((c & 0x03) << 6) | d));
    }
    return result;
}

auto bad(std::string what) -> Exception {
    return Exception{ErrorKind::decoding_error, std::move(what)};
}

}  // anonymous namespace

// -- Values -------------------------------------------------------------------

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const ValueMap& m) {
            j = nlohmann::json::object();
            for (const auto& [key, value] : m) j[key] = value;
        },
    }, v.inner);
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Value{Null{}};
            return;
        case nlohmann::json::value_t::boolean:
            v = Value{j.get<bool>()};
            return;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
            v = Value{j.get<std::int64_t>()};
            return;
        case nlohmann::json::value_t::number_float:
            v = Value{j.get<double>()};
            return;
        case nlohmann::json::value_t::string:
            v = Value{j.get<std::string>()};
            return;
        case nlohmann::json::value_t::object: {
            auto map = ValueMap{};
            for (const auto& [key, value] : j.items()) map.emplace(key, value.get<Value>());
            v = Value{std::move(map)};
            return;
        }
        default:
            throw bad(std::string{"unsupported JSON type for a metadata value: "} + j.type_name());
    }
}

// -- Identity and causality ---------------------------------------------------

void to_json(nlohmann::json& j, const ReplicaId& id) { j = to_hex(id); }

void from_json(const nlohmann::json& j, ReplicaId& id) {
    auto parsed = parse_replica_id(j.get<std::string>());
    if (!parsed) throw bad("invalid replica id");
    id = *parsed;
}

void to_json(nlohmann::json& j, const Identifier& id) { j = to_string(id); }

void from_json(const nlohmann::json& j, Identifier& id) {
    auto parsed = parse_identifier(j.get<std::string>());
    if (!parsed) throw bad("invalid identifier");
    id = *parsed;
}

void to_json(nlohmann::json& j, const OpId& id) {
    j = nlohmann::json{{"counter", id.counter}, {"replica", id.replica}};
}

void from_json(const nlohmann::json& j, OpId& id) {
    id.counter = j.at("counter").get<std::uint64_t>();
    id.replica = j.at("replica").get<ReplicaId>();
}

void to_json(nlohmann::json& j, const HybridTimestamp& ts) {
    j = nlohmann::json{{"physical_ms", ts.physical_ms}, {"logical", ts.logical}, {"replica", ts.replica}};
}

void from_json(const nlohmann::json& j, HybridTimestamp& ts) {
    ts.physical_ms = j.at("physical_ms").get<std::int64_t>();
    ts.logical = j.at("logical").get<std::uint64_t>();
    ts.replica = j.at("replica").get<ReplicaId>();
}

void to_json(nlohmann::json& j, const VersionSummary& summary) {
    j = nlohmann::json::object();
    for (const auto& [replica, counter] : summary.entries()) j[to_hex(replica)] = counter;
}

void from_json(const nlohmann::json& j, VersionSummary& summary) {
    summary = VersionSummary{};
    for (const auto& [key, value] : j.items()) {
        auto replica = parse_replica_id(key);
        if (!replica) throw bad("invalid replica id in summary");
        summary.advance(*replica, value.get<std::uint64_t>());
    }
}

// -- Operations and documents -------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"id", op.id},
        {"timestamp", op.timestamp},
        {"document", op.document},
        {"kind", mutation_name(op.mutation)},
        {"deps", op.deps},
    };
    std::visit(overload{
        [&](const SetUrl& m) { j["url"] = m.url; },
        [&](const SetTitle& m) {
            j["title"] = m.title ? nlohmann::json(*m.title) : nlohmann::json(nullptr);
        },
        [&](const AddTag& m) { j["tag"] = m.tag; },
        [&](const RemoveTag& m) {
            j["tag"] = m.tag;
            j["observed"] = m.observed;
        },
        [&](const SetMetadataField& m) {
            j["key"] = m.key;
            j["value"] = m.value;
        },
        [&](const SetDeleted& m) { j["deleted"] = m.deleted; },
        [&](const SetEmbedding& m) {
            j["embedding"] = m.embedding ? nlohmann::json(*m.embedding) : nlohmann::json(nullptr);
        },
        [&](const OpaqueMutation& m) {
            j["tag_byte"] = m.kind;
            j["payload"] = base64_encode(m.payload);
        },
    }, op.mutation);
}

void from_json(const nlohmann::json& j, Operation& op) {
    op.id = j.at("id").get<OpId>();
    op.timestamp = j.at("timestamp").get<HybridTimestamp>();
    op.document = j.at("document").get<Identifier>();
    op.deps = j.at("deps").get<std::vector<OpId>>();

    const auto kind = j.at("kind").get<std::string>();
    if (kind == to_string_view(MutationKind::set_url)) {
        op.mutation = SetUrl{j.at("url").get<std::string>()};
    } else if (kind == to_string_view(MutationKind::set_title)) {
        const auto& t = j.at("title");
        op.mutation = SetTitle{t.is_null() ? std::nullopt : std::optional{t.get<std::string>()}};
    } else if (kind == to_string_view(MutationKind::add_tag)) {
        op.mutation = AddTag{j.at("tag").get<std::string>()};
    } else if (kind == to_string_view(MutationKind::remove_tag)) {
        op.mutation = RemoveTag{j.at("tag").get<std::string>(),
                                j.at("observed").get<std::vector<OpId>>()};
    } else if (kind == to_string_view(MutationKind::set_metadata)) {
        op.mutation = SetMetadataField{j.at("key").get<std::string>(), j.at("value").get<Value>()};
    } else if (kind == to_string_view(MutationKind::set_deleted)) {
        op.mutation = SetDeleted{j.at("deleted").get<bool>()};
    } else if (kind == to_string_view(MutationKind::set_embedding)) {
        const auto& e = j.at("embedding");
        op.mutation = SetEmbedding{e.is_null() ? std::nullopt : std::optional{e.get<Vector>()}};
    } else if (kind == "opaque") {
        op.mutation = OpaqueMutation{j.at("tag_byte").get<std::uint8_t>(),
                                     base64_decode(j.at("payload").get<std::string>())};
    } else {
        throw bad("unknown operation kind '" + kind + "'");
    }
}

void to_json(nlohmann::json& j, const BookmarkDocument& doc) {
    auto metadata = nlohmann::json::object();
    for (const auto& [key, reg] : doc.metadata_map().entries()) {
        if (!reg.value().is_null()) metadata[key] = reg.value();
    }
    j = nlohmann::json{
        {"id", doc.id()},
        {"url", doc.url()},
        {"title", doc.title() ? nlohmann::json(*doc.title()) : nlohmann::json(nullptr)},
        {"tags", doc.tags()},
        {"metadata", std::move(metadata)},
        {"deleted", doc.deleted()},
        {"updated_at", doc.updated_at()},
    };
    if (doc.embedding()) j["embedding_dimension"] = doc.embedding()->size();
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const SearchWeights& w) {
    j = nlohmann::json{{"lexical", w.lexical}, {"vector", w.vector}, {"recency", w.recency}};
}

void from_json(const nlohmann::json& j, SearchWeights& w) {
    const auto defaults = SearchWeights{};
    w.lexical = j.value("lexical", defaults.lexical);
    w.vector = j.value("vector", defaults.vector);
    w.recency = j.value("recency", defaults.recency);
}

void to_json(nlohmann::json& j, const HnswParams& p) {
    j = nlohmann::json{
        {"max_neighbors", p.max_neighbors},
        {"ef_construction", p.ef_construction},
        {"ef_search", p.ef_search},
        {"seed", p.seed},
    };
}

void from_json(const nlohmann::json& j, HnswParams& p) {
    const auto defaults = HnswParams{};
    p.max_neighbors = j.value("max_neighbors", defaults.max_neighbors);
    p.ef_construction = j.value("ef_construction", defaults.ef_construction);
    p.ef_search = j.value("ef_search", defaults.ef_search);
    p.seed = j.value("seed", defaults.seed);
}

void to_json(nlohmann::json& j, const CompactionPolicy& p) {
    j = nlohmann::json{
        {"max_log_ops", p.max_log_ops},
        {"checkpoint_interval_ops", p.checkpoint_interval_ops},
    };
}

void from_json(const nlohmann::json& j, CompactionPolicy& p) {
    const auto defaults = CompactionPolicy{};
    p.max_log_ops = j.value("max_log_ops", defaults.max_log_ops);
    p.checkpoint_interval_ops = j.value("checkpoint_interval_ops", defaults.checkpoint_interval_ops);
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"weights", c.weights},
        {"hnsw", c.hnsw},
        {"compaction", c.compaction},
        {"recency_half_life_ms", c.recency_half_life_ms},
        {"embedding_dimension", c.embedding_dimension},
        {"log_level", c.log_level},
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    const auto defaults = EngineConfig{};
    c.weights = j.value("weights", defaults.weights);
    c.hnsw = j.value("hnsw", defaults.hnsw);
    c.compaction = j.value("compaction", defaults.compaction);
    c.recency_half_life_ms = j.value("recency_half_life_ms", defaults.recency_half_life_ms);
    c.embedding_dimension = j.value("embedding_dimension", defaults.embedding_dimension);
    c.log_level = j.value("log_level", defaults.log_level);
}

// -- Export -------------------------------------------------------------------

auto export_json(const ReplicaStore& store) -> nlohmann::json {
    auto result = nlohmann::json::array();
    for (const auto& doc : store.list_active()) result.push_back(nlohmann::json(doc));
    return result;
}

}  // namespace marksync
