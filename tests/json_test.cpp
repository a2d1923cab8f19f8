// json_test.cpp: nlohmann/json interoperability for values, operations,
// documents and configuration.

#include <marksync/json.hpp>
#include <marksync/replica_store.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace marksync;
using json = nlohmann::json;

namespace {

auto replica(std::uint8_t tag) -> ReplicaId {
    const std::uint8_t raw[16] = {tag};
    return ReplicaId{raw};
}

auto sample_op(Mutation mutation) -> Operation {
    return Operation{
        .id = OpId{7, replica(1)},
        .timestamp = HybridTimestamp{.physical_ms = 1'700'000'000'000, .logical = 2, .replica = replica(1)},
        .document = Identifier::generate(),
        .mutation = std::move(mutation),
        .deps = {OpId{6, replica(1)}, OpId{3, replica(2)}},
    };
}

auto round_trip(const Operation& op) -> Operation {
    return json::parse(json(op).dump()).get<Operation>();
}

}  // namespace

// -- Values -------------------------------------------------------------------

TEST(JsonValue, scalars_to_json) {
    EXPECT_TRUE(json(Value{}).is_null());
    EXPECT_EQ(json(Value{true}), true);
    EXPECT_EQ(json(Value{42}), 42);
    EXPECT_EQ(json(Value{2.5}), 2.5);
    EXPECT_EQ(json(Value{"hi"}), "hi");
}

TEST(JsonValue, nested_map_round_trip) {
    const auto value = Value{ValueMap{
        {"stars", Value{5}},
        {"ratio", Value{0.25}},
        {"read", Value{false}},
        {"author", Value{ValueMap{{"name", Value{"ada"}}, {"born", Value{}}}}},
    }};
    const auto j = json(value);
    EXPECT_EQ(j["author"]["name"], "ada");
    EXPECT_EQ(j.get<Value>(), value);
}

TEST(JsonValue, integers_stay_integers) {
    EXPECT_TRUE(json::parse("12").get<Value>().is<std::int64_t>());
    EXPECT_TRUE(json::parse("12.0").get<Value>().is<double>());
}

TEST(JsonValue, arrays_are_rejected) {
    try {
        (void)json::parse("[1, 2]").get<Value>();
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::decoding_error);
    }
}

// -- Ids and clocks -----------------------------------------------------------

TEST(JsonIds, replica_id_is_hex) {
    const auto r = replica(0xab);
    const auto j = json(r);
    EXPECT_EQ(j, to_hex(r));
    EXPECT_EQ(j.get<ReplicaId>(), r);
}

TEST(JsonIds, identifier_is_canonical_uuid) {
    const auto id = Identifier::generate();
    const auto j = json(id);
    EXPECT_EQ(j.get<std::string>().size(), 36u);
    EXPECT_EQ(j.get<Identifier>(), id);
}

TEST(JsonIds, bad_ids_throw_decoding_error) {
    EXPECT_THROW((void)json("not-an-id").get<Identifier>(), Exception);
    EXPECT_THROW((void)json("zz").get<ReplicaId>(), Exception);
    EXPECT_THROW((void)json::parse(R"({"xyz": 1})").get<VersionSummary>(), Exception);
}

TEST(JsonIds, summary_maps_replica_to_counter) {
    auto summary = VersionSummary{};
    summary.advance(replica(1), 4);
    summary.advance(replica(2), 9);
    const auto j = json(summary);
    EXPECT_EQ(j[to_hex(replica(2))], 9);
    EXPECT_EQ(j.get<VersionSummary>(), summary);
}

TEST(JsonIds, timestamp_fields) {
    const auto ts = HybridTimestamp{.physical_ms = 1000, .logical = 3, .replica = replica(5)};
    const auto j = json(ts);
    EXPECT_EQ(j["physical_ms"], 1000);
    EXPECT_EQ(j["logical"], 3);
    EXPECT_EQ(j.get<HybridTimestamp>(), ts);
}

// -- Operations ---------------------------------------------------------------

TEST(JsonOperation, every_kind_round_trips) {
    const auto mutations = std::vector<Mutation>{
        SetUrl{"https://a.example"},
        SetTitle{"A"},
        SetTitle{std::nullopt},
        AddTag{"rust"},
        RemoveTag{"rust", {OpId{2, replica(3)}}},
        SetMetadataField{"stars", Value{4}},
        SetDeleted{true},
        SetEmbedding{Vector{0.5f, -1.0f}},
        SetEmbedding{std::nullopt},
    };
    for (const auto& m : mutations) {
        const auto op = sample_op(m);
        EXPECT_EQ(round_trip(op), op) << mutation_name(m);
    }
}

TEST(JsonOperation, kind_is_named) {
    const auto j = json(sample_op(AddTag{"x"}));
    EXPECT_EQ(j["kind"], "add_tag");
    EXPECT_EQ(j["tag"], "x");
    EXPECT_EQ(j["deps"].size(), 2u);
}

TEST(JsonOperation, opaque_payload_is_base64) {
    const auto op = sample_op(OpaqueMutation{
        .kind = 200,
        .payload = {std::byte{'m'}, std::byte{'a'}, std::byte{'r'}, std::byte{'k'}},
    });
    const auto j = json(op);
    EXPECT_EQ(j["kind"], "opaque");
    EXPECT_EQ(j["tag_byte"], 200);
    EXPECT_EQ(j["payload"], "bWFyaw==");
    EXPECT_EQ(round_trip(op), op);
}

TEST(JsonOperation, unknown_kind_throws) {
    auto j = json(sample_op(SetDeleted{false}));
    j["kind"] = "set_colour";
    try {
        (void)j.get<Operation>();
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::decoding_error);
    }
}

// -- Documents and export -----------------------------------------------------

TEST(JsonDocument, view_of_current_state) {
    auto store = ReplicaStore{replica(1)};
    const auto id = store.create({
        .url = "https://a.example",
        .tags = {"b", "a"},
        .metadata = {{"stars", Value{3}}},
        .embedding = Vector{1.0f, 0.0f, 0.0f},
    });
    ASSERT_FALSE(store.set_metadata(id, "gone", Value{}));

    const auto j = json(*store.get(id));
    EXPECT_EQ(j["id"], to_string(id));
    EXPECT_EQ(j["url"], "https://a.example");
    EXPECT_TRUE(j["title"].is_null());
    EXPECT_EQ(j["tags"], json::array({"a", "b"}));
    EXPECT_EQ(j["metadata"], json::parse(R"({"stars": 3})"));
    EXPECT_EQ(j["deleted"], false);
    EXPECT_EQ(j["embedding_dimension"], 3);
    EXPECT_TRUE(j.contains("updated_at"));
}

TEST(JsonDocument, export_skips_tombstones) {
    auto store = ReplicaStore{};
    const auto keep = store.create({.url = "https://keep.example"});
    const auto drop = store.create({.url = "https://drop.example"});
    ASSERT_FALSE(store.remove(drop));

    const auto exported = export_json(store);
    ASSERT_TRUE(exported.is_array());
    ASSERT_EQ(exported.size(), 1u);
    EXPECT_EQ(exported[0]["id"], to_string(keep));
    EXPECT_FALSE(exported[0].contains("embedding_dimension"));
}

// -- Configuration ------------------------------------------------------------

TEST(JsonConfig, round_trip) {
    auto config = EngineConfig{};
    config.hnsw.max_neighbors = 8;
    config.compaction.max_log_ops = 100;
    config.recency_half_life_ms = 60'000;
    config.log_level = "debug";
    EXPECT_EQ(json(config).get<EngineConfig>(), config);
}

TEST(JsonConfig, missing_keys_keep_defaults) {
    const auto config = json::parse(R"({"hnsw": {"ef_search": 12}})").get<EngineConfig>();
    EXPECT_EQ(config.hnsw.ef_search, 12u);
    EXPECT_EQ(config.hnsw.max_neighbors, HnswParams{}.max_neighbors);
    EXPECT_EQ(config.weights, SearchWeights{});
    EXPECT_EQ(config.log_level, "info");
}

TEST(JsonConfig, load_config_json_validates) {
    const auto config = load_config_json(json::parse(
        R"({"weights": {"lexical": 2, "vector": 1, "recency": 1}})"));
    EXPECT_DOUBLE_EQ(config.weights.lexical, 0.5);
    EXPECT_DOUBLE_EQ(config.weights.vector, 0.25);
    EXPECT_THROW((void)load_config_json(json::parse(R"({"log_level": "loud"})")), Exception);
}
