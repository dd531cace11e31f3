/// @file mark.hpp
/// @brief Mark and MarkSet: inline annotations such as emphasis or links.

#pragma once

#include <folio-cpp/value.hpp>

#include <string>
#include <vector>

namespace folio_cpp {

class MarkType;
struct Mark;

/// A set of marks, kept sorted by mark-type rank.
using MarkSet = std::vector<Mark>;

/// A piece of information attached to inline content (emphasis, code
/// font, a link target, ...). Marks are plain values: a type and the
/// attributes filled in for it.
///
/// Create marks with Schema::mark() or MarkType::create().
struct Mark {
    const MarkType* type{nullptr};  ///< The mark type; owned by the Schema.
    Attrs attrs;                    ///< Attribute values for this mark.

    /// Return a set containing this mark, placed by rank. Marks this one
    /// excludes are dropped; if a mark in the set excludes this one, the
    /// set is returned unchanged.
    auto add_to_set(const MarkSet& set) const -> MarkSet;

    /// Return the set without this mark.
    auto remove_from_set(const MarkSet& set) const -> MarkSet;

    /// Whether an equal mark is in the set.
    auto is_in_set(const MarkSet& set) const -> bool;

    /// Same type and equal attributes.
    auto eq(const Mark& other) const -> bool { return type == other.type && attrs == other.attrs; }

    /// Debug rendering, e.g. `link(href="x")`.
    auto to_string() const -> std::string;

    auto operator==(const Mark& other) const -> bool { return eq(other); }

    /// Whether two sets contain the same marks in the same order.
    static auto same_set(const MarkSet& a, const MarkSet& b) -> bool;

    /// Sort an unordered collection of marks into a proper set.
    static auto set_from(MarkSet marks) -> MarkSet;
};

}  // namespace folio_cpp
