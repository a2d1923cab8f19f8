#include <marksync/op.hpp>

namespace marksync {

auto mutation_tag(const Mutation& m) -> std::uint8_t {
    return std::visit(overload{
        [](const SetUrl&)           { return static_cast<std::uint8_t>(MutationKind::set_url); },
        [](const SetTitle&)         { return static_cast<std::uint8_t>(MutationKind::set_title); },
        [](const AddTag&)           { return static_cast<std::uint8_t>(MutationKind::add_tag); },
        [](const RemoveTag&)        { return static_cast<std::uint8_t>(MutationKind::remove_tag); },
        [](const SetMetadataField&) { return static_cast<std::uint8_t>(MutationKind::set_metadata); },
        [](const SetDeleted&)       { return static_cast<std::uint8_t>(MutationKind::set_deleted); },
        [](const SetEmbedding&)     { return static_cast<std::uint8_t>(MutationKind::set_embedding); },
        [](const OpaqueMutation& o) { return o.kind; },
    }, m);
}

auto mutation_name(const Mutation& m) -> std::string_view {
    if (std::holds_alternative<OpaqueMutation>(m)) return "opaque";
    return to_string_view(static_cast<MutationKind>(mutation_tag(m)));
}

}  // namespace marksync
