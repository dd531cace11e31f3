/// @file value.hpp
/// @brief Attribute values: ScalarValue, Attrs, and visitor helpers.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace folio_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A closed set of primitive values stored in node and mark attributes.
///
/// Alternatives: Null, bool, int64_t, double, string.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string
>;

/// Attribute map of a node or mark, ordered by name.
using Attrs = std::map<std::string, ScalarValue, std::less<>>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const ReplaceStep& s) { ... },
///     [](const auto&) { ... },
/// }, step);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed scalar extraction helpers ------------------------------------------

/// Extract a typed scalar, or nullopt on type mismatch.
/// @code
/// auto level = get_scalar<std::int64_t>(value);
/// @endcode
template <typename T>
auto get_scalar(const ScalarValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed attribute by name, or nullopt when absent or mistyped.
template <typename T>
auto get_attr(const Attrs& attrs, std::string_view name) -> std::optional<T> {
    auto it = attrs.find(name);
    if (it == attrs.end()) return std::nullopt;
    return get_scalar<T>(it->second);
}

/// Render a scalar for diagnostics (strings are quoted).
auto to_string(const ScalarValue& v) -> std::string;

}  // namespace folio_cpp
