/// @file decoration.hpp
/// @brief Decoration and DecorationSet: visual annotations anchored to positions.

#pragma once

#include <folio-cpp/mapping.hpp>
#include <folio-cpp/node.hpp>

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio_cpp {

/// The kinds of decoration.
enum class DecorationKind : std::uint8_t {
    widget,        ///< A zero-width element at a position.
    inline_range,  ///< Attributes on the inline content of a range.
    node,          ///< Attributes on a single node.
    span,          ///< A wrapper element around a range of content.
};

/// Attributes a decoration contributes (class, style, ...).
using DecorationAttrs = std::map<std::string, std::string, std::less<>>;

/// Host callback that renders a widget. Opaque to the engine.
using WidgetRenderer = std::function<std::any()>;

/// Options shared by all decoration kinds.
struct DecorationSpec {
    std::string key;               ///< Identity used by remove and equality; empty for none.
    int side{0};                   ///< Widgets: < 0 sticks to content before the position.
    bool inclusive_start{false};   ///< Inline: grow when content is inserted at the start.
    bool inclusive_end{false};     ///< Inline: grow when content is inserted at the end.
    std::any data;                 ///< Extra data for the decoration's owner.
};

/// An immutable annotation. Decorations refer to positions only, never
/// to nodes.
class Decoration {
public:
    static auto widget(std::size_t pos, WidgetRenderer renderer, DecorationSpec spec = {}) -> Decoration;

    /// Throws invalid_position when `from` > `to`.
    static auto inline_range(std::size_t from, std::size_t to, DecorationAttrs attrs,
                             DecorationSpec spec = {}) -> Decoration;

    /// Throws invalid_position when `from` >= `to`.
    static auto node(std::size_t from, std::size_t to, DecorationAttrs attrs,
                     DecorationSpec spec = {}) -> Decoration;

    /// Wrap [from, to] in a `tag` element carrying `attrs`. Maps like an
    /// inline decoration. Throws invalid_position when `from` > `to`.
    static auto span(std::size_t from, std::size_t to, std::string tag, DecorationAttrs attrs = {},
                     DecorationSpec spec = {}) -> Decoration;

    auto kind() const -> DecorationKind { return kind_; }
    auto from() const -> std::size_t { return from_; }
    auto to() const -> std::size_t { return to_; }
    auto attrs() const -> const DecorationAttrs& { return attrs_; }
    /// Wrapper element name; empty unless a span.
    auto tag() const -> const std::string& { return tag_; }
    auto renderer() const -> const WidgetRenderer& { return renderer_; }
    auto spec() const -> const DecorationSpec& { return spec_; }

    /// Map through a change; nullopt when the decoration does not survive.
    auto map(const Mappable& mapping) const -> std::optional<Decoration>;

    /// Same kind, range, attributes, tag and key.
    auto eq(const Decoration& other) const -> bool;

    auto to_string() const -> std::string;

private:
    Decoration(DecorationKind kind, std::size_t from, std::size_t to, DecorationAttrs attrs,
               WidgetRenderer renderer, DecorationSpec spec);

    auto moved(std::size_t from, std::size_t to) const -> Decoration;

    DecorationKind kind_;
    std::size_t from_;
    std::size_t to_;
    DecorationAttrs attrs_;
    std::string tag_;
    WidgetRenderer renderer_;
    DecorationSpec spec_;
};

/// An immutable collection of decorations, ordered by start position
/// and, for widgets at the same position, by side.
class DecorationSet {
public:
    DecorationSet() = default;

    /// Build a set for `doc`; throws invalid_position for decorations
    /// outside the document.
    static auto create(const NodePtr& doc, std::vector<Decoration> decorations) -> DecorationSet;
    static auto empty_set() -> DecorationSet { return {}; }

    /// Concatenate several sets into one.
    static auto merge(const std::vector<DecorationSet>& sets) -> DecorationSet;

    auto empty() const -> bool { return decorations_.empty(); }
    auto size() const -> std::size_t { return decorations_.size(); }
    auto decorations() const -> const std::vector<Decoration>& { return decorations_; }

    /// Decorations touching [start, end]; all of them by default.
    auto find(std::optional<std::size_t> start = std::nullopt,
              std::optional<std::size_t> end = std::nullopt,
              const std::function<bool(const Decoration&)>& predicate = {}) const
        -> std::vector<Decoration>;

    /// Decorations whose range contains `pos`.
    auto find_at(std::size_t pos) const -> std::vector<Decoration>;
    auto find_widgets_at(std::size_t pos) const -> std::vector<Decoration>;
    /// Inline decorations overlapping (from, to).
    auto find_inline_in(std::size_t from, std::size_t to) const -> std::vector<Decoration>;
    /// Span decorations overlapping (from, to).
    auto find_spans_in(std::size_t from, std::size_t to) const -> std::vector<Decoration>;
    /// The node decorations of the node starting at `pos`.
    auto find_node_at(std::size_t pos) const -> std::vector<Decoration>;

    /// Map every decoration, dropping those that do not survive.
    auto map(const Mappable& mapping) const -> DecorationSet;

    auto add(const NodePtr& doc, std::vector<Decoration> decorations) const -> DecorationSet;
    auto remove(const std::vector<Decoration>& decorations) const -> DecorationSet;
    auto remove_key(std::string_view key) const -> DecorationSet;

private:
    explicit DecorationSet(std::vector<Decoration> sorted);

    static void sort(std::vector<Decoration>& decorations);

    std::vector<Decoration> decorations_;
};

}  // namespace folio_cpp
