/// @file selection.hpp
/// @brief Selection: text, node and all-document selections, plus bookmarks.

#pragma once

#include <folio-cpp/mapping.hpp>
#include <folio-cpp/node.hpp>
#include <folio-cpp/resolved_pos.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace folio_cpp {

class TransactionBuilder;

/// The kinds of selection.
enum class SelectionKind : std::uint8_t {
    text,  ///< A range of inline content; a cursor when empty.
    node,  ///< A single selected node.
    all,   ///< The whole document.
};

constexpr auto to_string_view(SelectionKind kind) noexcept -> std::string_view {
    switch (kind) {
        case SelectionKind::text: return "text";
        case SelectionKind::node: return "node";
        case SelectionKind::all:  return "all";
    }
    return "unknown";
}

class Selection;

/// A selection reduced to positions, so it can be mapped without
/// access to a document and resolved again later.
struct SelectionBookmark {
    SelectionKind kind{SelectionKind::text};
    std::size_t anchor{0};
    std::size_t head{0};

    auto map(const Mappable& mapping) const -> SelectionBookmark;
    auto resolve(const NodePtr& doc) const -> Selection;

    auto operator==(const SelectionBookmark&) const -> bool = default;
};

/// A selection in a document: an anchor and a head, plus its kind.
///
/// Selections are values bound to one document; map() carries them to
/// the next.
class Selection {
public:
    // -- Construction ---------------------------------------------------------

    /// A text selection. Without a head the selection is a cursor.
    static auto text(const ResolvedPos& anchor, std::optional<ResolvedPos> head = std::nullopt) -> Selection;
    static auto text(const NodePtr& doc, std::size_t anchor,
                     std::optional<std::size_t> head = std::nullopt) -> Selection;

    /// A text selection between two positions, moving ends that do not
    /// point into inline content to the nearest valid position.
    static auto between(const ResolvedPos& anchor, const ResolvedPos& head, int bias = 0) -> Selection;

    /// Select the node after `pos`; throws invalid_selection when there is none.
    static auto node(const ResolvedPos& pos) -> Selection;
    static auto node(const NodePtr& doc, std::size_t pos) -> Selection;

    static auto all(const NodePtr& doc) -> Selection;

    /// The nearest valid selection to a position, searching in `bias`
    /// direction first.
    static auto near(const ResolvedPos& pos, int bias = 1) -> Selection;

    /// The first valid selection starting at `pos` in direction `dir`.
    static auto find_from(const ResolvedPos& pos, int dir, bool text_only = false) -> std::optional<Selection>;

    static auto at_start(const NodePtr& doc) -> Selection;
    static auto at_end(const NodePtr& doc) -> Selection;

    /// Whether a node may be the target of a node selection.
    static auto is_selectable(const Node& node) -> bool;

    // -- Queries --------------------------------------------------------------

    auto kind() const -> SelectionKind { return kind_; }
    auto is_text() const -> bool { return kind_ == SelectionKind::text; }
    auto is_node() const -> bool { return kind_ == SelectionKind::node; }
    auto is_all() const -> bool { return kind_ == SelectionKind::all; }

    auto anchor() const -> std::size_t { return anchor_.pos(); }
    auto head() const -> std::size_t { return head_.pos(); }
    auto from() const -> std::size_t { return resolved_from().pos(); }
    auto to() const -> std::size_t { return resolved_to().pos(); }
    auto empty() const -> bool { return from() == to(); }

    auto resolved_anchor() const -> const ResolvedPos& { return anchor_; }
    auto resolved_head() const -> const ResolvedPos& { return head_; }
    auto resolved_from() const -> const ResolvedPos&;
    auto resolved_to() const -> const ResolvedPos&;

    /// The document the selection points into.
    auto doc() const -> const NodePtr& { return anchor_.doc(); }

    /// The selected node of a node selection, or nullptr.
    auto selected_node() const -> const NodePtr& { return node_; }

    /// The cursor position of an empty text selection, or nullptr.
    auto cursor() const -> const ResolvedPos*;

    /// The selected content.
    auto content() const -> Slice;

    // -- Mapping --------------------------------------------------------------

    /// Map the selection into `doc` through `mapping`.
    auto map(const NodePtr& doc, const Mappable& mapping) const -> Selection;

    auto get_bookmark() const -> SelectionBookmark;

    // -- Editing --------------------------------------------------------------

    /// Replace the selection with a slice, moving the selection to the
    /// end of the inserted content.
    void replace(TransactionBuilder& tr, const Slice& content = Slice::empty()) const;

    /// Replace the selection with a node.
    void replace_with(TransactionBuilder& tr, const NodePtr& node) const;

    auto eq(const Selection& other) const -> bool;
    auto operator==(const Selection& other) const -> bool { return eq(other); }

    auto to_string() const -> std::string;

private:
    Selection(SelectionKind kind, ResolvedPos anchor, ResolvedPos head, NodePtr node = nullptr);

    SelectionKind kind_;
    ResolvedPos anchor_;
    ResolvedPos head_;
    NodePtr node_;
};

}  // namespace folio_cpp
