#include <marksync/bookmark.hpp>

#include <gtest/gtest.h>

using namespace marksync;

namespace {

auto replica(std::uint8_t tag) -> ReplicaId {
    const std::uint8_t raw[16] = {tag};
    return ReplicaId{raw};
}

auto make_op(const Identifier& doc, std::uint64_t counter, std::uint8_t r,
             std::int64_t ms, Mutation m) -> Operation {
    return Operation{
        .id = OpId{counter, replica(r)},
        .timestamp = HybridTimestamp{.physical_ms = ms, .logical = 0, .replica = replica(r)},
        .document = doc,
        .mutation = std::move(m),
        .deps = {},
    };
}

}  // namespace

TEST(BookmarkDocument, new_document_is_empty) {
    const auto doc = BookmarkDocument{Identifier::generate()};
    EXPECT_EQ(doc.url(), "");
    EXPECT_FALSE(doc.title().has_value());
    EXPECT_TRUE(doc.tags().empty());
    EXPECT_FALSE(doc.deleted());
    EXPECT_FALSE(doc.embedding().has_value());
}

TEST(BookmarkDocument, apply_each_field) {
    const auto id = Identifier::generate();
    auto doc = BookmarkDocument{id};

    EXPECT_FALSE(doc.apply_operation(make_op(id, 1, 1, 10, SetUrl{"https://a.example"})));
    EXPECT_FALSE(doc.apply_operation(make_op(id, 2, 1, 11, SetTitle{"A"})));
    EXPECT_FALSE(doc.apply_operation(make_op(id, 3, 1, 12, AddTag{"news"})));
    EXPECT_FALSE(doc.apply_operation(make_op(id, 4, 1, 13, SetMetadataField{"stars", Value{5}})));
    EXPECT_FALSE(doc.apply_operation(make_op(id, 5, 1, 14, SetEmbedding{Vector{0.5f, 0.5f}})));

    EXPECT_EQ(doc.url(), "https://a.example");
    EXPECT_EQ(doc.title(), "A");
    EXPECT_TRUE(doc.has_tag("news"));
    EXPECT_EQ(doc.metadata("stars"), Value{5});
    EXPECT_EQ(doc.embedding(), (Vector{0.5f, 0.5f}));
    EXPECT_EQ(doc.updated_at().physical_ms, 14);
}

TEST(BookmarkDocument, remove_tag_with_observed_tags) {
    const auto id = Identifier::generate();
    auto doc = BookmarkDocument{id};
    doc.apply_operation(make_op(id, 1, 1, 10, AddTag{"news"}));
    const auto observed = doc.tag_set().live_tags("news");
    doc.apply_operation(make_op(id, 2, 1, 11, RemoveTag{"news", observed}));
    EXPECT_FALSE(doc.has_tag("news"));
}

TEST(BookmarkDocument, null_metadata_value_clears_key) {
    const auto id = Identifier::generate();
    auto doc = BookmarkDocument{id};
    doc.apply_operation(make_op(id, 1, 1, 10, SetMetadataField{"k", Value{"v"}}));
    doc.apply_operation(make_op(id, 2, 1, 11, SetMetadataField{"k", Value{}}));
    ASSERT_TRUE(doc.metadata("k").has_value());
    EXPECT_TRUE(doc.metadata("k")->is_null());
}

TEST(BookmarkDocument, delete_is_a_tombstone) {
    const auto id = Identifier::generate();
    auto doc = BookmarkDocument{id};
    doc.apply_operation(make_op(id, 1, 1, 10, SetUrl{"https://a.example"}));
    doc.apply_operation(make_op(id, 2, 1, 11, SetDeleted{true}));
    EXPECT_TRUE(doc.deleted());
    EXPECT_EQ(doc.url(), "https://a.example");
}

TEST(BookmarkDocument, unknown_mutation_is_kept_as_opaque_metadata) {
    const auto id = Identifier::generate();
    auto doc = BookmarkDocument{id};
    const auto err = doc.apply_operation(make_op(id, 1, 1, 10,
        OpaqueMutation{.kind = 200, .payload = {std::byte{0xab}, std::byte{0x01}}}));

    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::unknown_field);

    const auto kept = doc.metadata(opaque_metadata_key(200));
    ASSERT_TRUE(kept.has_value());
    const auto* entry = kept->get_if<ValueMap>();
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->at("kind"), Value{200});
    EXPECT_EQ(entry->at("payload"), Value{"ab01"});
}

TEST(BookmarkDocument, operation_for_other_document_throws) {
    auto doc = BookmarkDocument{Identifier::generate()};
    EXPECT_THROW(doc.apply_operation(make_op(Identifier::generate(), 1, 1, 1, SetUrl{"x"})),
                 FatalMismatch);
}

TEST(BookmarkDocument, merge_with_other_id_throws) {
    auto a = BookmarkDocument{Identifier::generate()};
    const auto b = BookmarkDocument{Identifier::generate()};
    EXPECT_THROW(a.merge(b), FatalMismatch);
}

TEST(BookmarkDocument, concurrent_title_edits_converge) {
    const auto id = Identifier::generate();
    auto a = BookmarkDocument{id};
    auto b = BookmarkDocument{id};
    a.apply_operation(make_op(id, 1, 1, 100, SetTitle{"from A"}));
    b.apply_operation(make_op(id, 1, 2, 200, SetTitle{"from B"}));

    EXPECT_EQ(merged(a, b), merged(b, a));
    EXPECT_EQ(merged(a, b).title(), "from B");
}

TEST(BookmarkDocument, merge_matches_applying_all_operations) {
    const auto id = Identifier::generate();
    const auto ops = std::vector<Operation>{
        make_op(id, 1, 1, 10, SetUrl{"https://one.example"}),
        make_op(id, 1, 2, 12, AddTag{"x"}),
        make_op(id, 2, 1, 15, SetTitle{"One"}),
        make_op(id, 2, 2, 11, SetUrl{"https://two.example"}),
    };

    auto a = BookmarkDocument{id};
    auto b = BookmarkDocument{id};
    auto all = BookmarkDocument{id};
    for (const auto& op : ops) {
        (op.id.replica == replica(1) ? a : b).apply_operation(op);
        all.apply_operation(op);
    }

    EXPECT_EQ(merged(a, b), all);
    EXPECT_EQ(all.url(), "https://one.example");
}
