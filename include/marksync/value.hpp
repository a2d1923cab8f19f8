/// @file value.hpp
/// @brief Metadata values (Null, Value, ValueMap) and embedding vectors.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace marksync {

/// Represents a JSON-style null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A dense embedding vector of fixed dimensionality.
using Vector = std::vector<float>;

/// Opaque byte payloads (forward-compatible wire data).
using Bytes = std::vector<std::byte>;

struct Value;

/// A nested metadata object, ordered by key.
using ValueMap = std::map<std::string, Value>;

/// A closed metadata value: null, bool, integer, double, string or nested map.
///
/// Metadata written by newer clients is stored as-is; keys this version
/// does not understand survive merges and re-encoding untouched.
struct Value {
    using Variant = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        std::string,
        ValueMap
    >;

    Variant inner;

    Value() : inner{Null{}} {}
    Value(Null) : inner{Null{}} {}
    Value(bool b) : inner{b} {}
    Value(int i) : inner{std::int64_t{i}} {}
    Value(std::int64_t i) : inner{i} {}
    Value(double d) : inner{d} {}
    Value(std::string s) : inner{std::move(s)} {}
    Value(std::string_view s) : inner{std::string{s}} {}
    Value(const char* s) : inner{std::string{s}} {}
    Value(ValueMap m) : inner{std::move(m)} {}

    template <typename T>
    auto is() const -> bool { return std::holds_alternative<T>(inner); }

    template <typename T>
    auto get_if() const -> const T* { return std::get_if<T>(&inner); }

    auto is_null() const -> bool { return is<Null>(); }

    /// Name of the held alternative ("null", "bool", "int", "double", "string", "map").
    auto type_name() const -> std::string_view;

    friend auto operator==(const Value& a, const Value& b) -> bool;
    friend auto operator<(const Value& a, const Value& b) -> bool;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { ... },
///     [](auto&&) { ... },
/// }, value.inner);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Extract a typed value, or nullopt on type mismatch.
template <typename T>
auto get_value(const Value& v) -> std::optional<T> {
    if (const auto* t = v.get_if<T>()) return *t;
    return std::nullopt;
}

/// Extract a typed value from an optional<Value>.
template <typename T>
auto get_value(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_value<T>(*v);
}

}  // namespace marksync
