#include <marksync/value.hpp>

#include <algorithm>
#include <type_traits>

namespace marksync {

auto Value::type_name() const -> std::string_view {
    return std::visit(overload{
        [](Null) -> std::string_view { return "null"; },
        [](bool) -> std::string_view { return "bool"; },
        [](std::int64_t) -> std::string_view { return "int"; },
        [](double) -> std::string_view { return "double"; },
        [](const std::string&) -> std::string_view { return "string"; },
        [](const ValueMap&) -> std::string_view { return "map"; },
    }, inner);
}

auto operator==(const Value& a, const Value& b) -> bool {
    return a.inner == b.inner;
}

// Orders by alternative index first, then by content. Only used to break
// ties between registers that carry identical timestamps.
auto operator<(const Value& a, const Value& b) -> bool {
    if (a.inner.index() != b.inner.index()) return a.inner.index() < b.inner.index();
    return std::visit([&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.inner);
        if constexpr (std::is_same_v<T, Null>) {
            return false;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                [](const auto& x, const auto& y) {
                    if (x.first != y.first) return x.first < y.first;
                    return x.second < y.second;
                });
        } else {
            return lhs < rhs;
        }
    }, a.inner);
}

}  // namespace marksync
