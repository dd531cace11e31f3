/// @file node.hpp
/// @brief The immutable document tree: Node, Fragment, and Slice.
///
/// Positions are counted in tokens: entering or leaving a non-leaf node
/// is one token, a leaf node is one token, and text counts its UTF-8
/// bytes.

#pragma once

#include <folio-cpp/mark.hpp>
#include <folio-cpp/schema.hpp>
#include <folio-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio_cpp {

class ResolvedPos;
class Slice;

/// Callback for Node::nodes_between(). Return false to skip a node's
/// children.
using NodeVisitor = std::function<bool(const NodePtr& node, std::size_t pos,
                                       const Node* parent, std::size_t index)>;

/// A child index and the offset at which that child starts.
struct IndexInfo {
    std::size_t index;   ///< Child index.
    std::size_t offset;  ///< Position of the child's start within the parent content.
};

/// A child found at a position, with its index and start offset.
struct ChildInfo {
    NodePtr node;         ///< nullptr when there is no such child.
    std::size_t index;
    std::size_t offset;
};

// -- Fragment -----------------------------------------------------------------

/// An immutable sequence of child nodes.
class Fragment {
public:
    Fragment() = default;

    /// Wrap an array without joining adjacent text nodes.
    explicit Fragment(std::vector<NodePtr> content);

    /// Build a fragment, joining adjacent text nodes with equal marks.
    static auto from_array(std::vector<NodePtr> nodes) -> Fragment;

    /// A fragment holding a single node, or empty for nullptr.
    static auto from(NodePtr node) -> Fragment;

    /// Total token size of the content.
    auto size() const -> std::size_t { return size_; }
    auto child_count() const -> std::size_t { return content_.size(); }
    auto children() const -> const std::vector<NodePtr>& { return content_; }

    /// The child at `index`; throws invalid_position when out of range.
    auto child(std::size_t index) const -> const NodePtr&;
    /// The child at `index`, or nullptr.
    auto maybe_child(std::size_t index) const -> NodePtr;
    auto first_child() const -> NodePtr;
    auto last_child() const -> NodePtr;

    void nodes_between(std::size_t from, std::size_t to, const NodeVisitor& f,
                       std::size_t node_start = 0, const Node* parent = nullptr) const;
    void descendants(const NodeVisitor& f) const;

    auto text_between(std::size_t from, std::size_t to,
                      std::string_view block_separator = {},
                      std::string_view leaf_text = {}) const -> std::string;

    /// Concatenate, joining text at the seam when the marks match.
    auto append(const Fragment& other) const -> Fragment;

    /// The content between two positions.
    auto cut(std::size_t from, std::size_t to) const -> Fragment;
    auto cut(std::size_t from) const -> Fragment { return cut(from, size_); }

    auto cut_by_index(std::size_t from, std::size_t to) const -> Fragment;
    auto replace_child(std::size_t index, NodePtr node) const -> Fragment;
    auto add_to_start(NodePtr node) const -> Fragment;
    auto add_to_end(NodePtr node) const -> Fragment;

    /// Find the child at `pos`. With `round` > 0 a position inside a
    /// child resolves to the index after it.
    auto find_index(std::size_t pos, int round = -1) const -> IndexInfo;

    auto eq(const Fragment& other) const -> bool;

    /// Debug rendering, e.g. `<paragraph("hi")>`.
    auto to_string() const -> std::string;
    auto to_string_inner() const -> std::string;

private:
    std::vector<NodePtr> content_;
    std::size_t size_{0};
};

// -- Slice --------------------------------------------------------------------

/// A piece cut out of a document: a fragment plus the depth to which
/// each side is open.
class Slice {
public:
    Slice() = default;
    Slice(Fragment content, std::size_t open_start, std::size_t open_end);

    static auto empty() -> Slice { return {}; }

    /// Slice with the maximum open depth on both sides.
    static auto max_open(const Fragment& fragment, bool open_isolating = true) -> Slice;

    auto content() const -> const Fragment& { return content_; }
    auto open_start() const -> std::size_t { return open_start_; }
    auto open_end() const -> std::size_t { return open_end_; }

    /// Size this slice adds when inserted.
    auto size() const -> std::size_t { return content_.size() - open_start_ - open_end_; }

    /// Insert content at a position inside the slice; nullopt when the
    /// result would be invalid.
    auto insert_at(std::size_t pos, const Fragment& fragment) const -> std::optional<Slice>;

    /// Remove a flat range; throws invalid_content when not flat.
    auto remove_between(std::size_t from, std::size_t to) const -> Slice;

    auto eq(const Slice& other) const -> bool;
    auto to_string() const -> std::string;

private:
    Fragment content_;
    std::size_t open_start_{0};
    std::size_t open_end_{0};
};

// -- Node ---------------------------------------------------------------------

/// An immutable node in a document tree.
///
/// Always handled through NodePtr. Text nodes carry a non-empty string
/// and no children. A Node keeps a pointer to its NodeType, so the
/// Schema must outlive it.
class Node : public std::enable_shared_from_this<Node> {
public:
    Node(const NodeType& type, Attrs attrs, Fragment content, MarkSet marks);
    Node(const NodeType& type, Attrs attrs, std::string text, MarkSet marks);

    auto type() const -> const NodeType& { return *type_; }
    auto attrs() const -> const Attrs& { return attrs_; }
    auto content() const -> const Fragment& { return content_; }
    auto marks() const -> const MarkSet& { return marks_; }
    /// The text of a text node; empty otherwise.
    auto text() const -> const std::string& { return text_; }

    auto is_text() const -> bool { return type_->is_text(); }
    auto is_block() const -> bool { return type_->is_block(); }
    auto is_inline() const -> bool { return type_->is_inline(); }
    auto is_textblock() const -> bool { return type_->is_textblock(); }
    auto inline_content() const -> bool { return type_->inline_content(); }
    auto is_leaf() const -> bool { return type_->is_leaf(); }
    auto is_atom() const -> bool { return type_->is_atom(); }

    /// Token size: text length, 1 for leaves, content size + 2 otherwise.
    auto node_size() const -> std::size_t;

    auto child_count() const -> std::size_t { return content_.child_count(); }
    auto child(std::size_t index) const -> const NodePtr& { return content_.child(index); }
    auto maybe_child(std::size_t index) const -> NodePtr { return content_.maybe_child(index); }
    auto first_child() const -> NodePtr { return content_.first_child(); }
    auto last_child() const -> NodePtr { return content_.last_child(); }

    void nodes_between(std::size_t from, std::size_t to, const NodeVisitor& f,
                       std::size_t start_pos = 0) const;
    void descendants(const NodeVisitor& f) const;

    /// Concatenated text of all descendant text nodes.
    auto text_content() const -> std::string;
    auto text_between(std::size_t from, std::size_t to,
                      std::string_view block_separator = {},
                      std::string_view leaf_text = {}) const -> std::string;

    auto same_markup(const Node& other) const -> bool;
    auto has_markup(const NodeType& type, const Attrs& attrs, const MarkSet& marks) const -> bool;

    /// Structural equality.
    auto eq(const Node& other) const -> bool;

    /// Same markup, new content.
    auto copy(Fragment content) const -> NodePtr;
    /// Same node, new marks.
    auto mark(MarkSet marks) const -> NodePtr;
    /// A text node with the same marks and different text.
    auto with_text(std::string text) const -> NodePtr;

    /// Keep only the content between two positions.
    auto cut(std::size_t from, std::size_t to) const -> NodePtr;
    auto cut(std::size_t from) const -> NodePtr;

    /// Cut out a slice; with `include_parents` the slice is open to the
    /// document root.
    auto slice(std::size_t from, std::size_t to, bool include_parents = false) const -> Slice;

    /// Replace a range with a slice. Throws invalid_content when the
    /// slice does not fit.
    auto replace(std::size_t from, std::size_t to, const Slice& slice) const -> NodePtr;

    /// The node directly after `pos`, or nullptr.
    auto node_at(std::size_t pos) const -> NodePtr;
    auto child_after(std::size_t pos) const -> ChildInfo;
    auto child_before(std::size_t pos) const -> ChildInfo;

    /// Resolve a position; throws invalid_position when out of range.
    auto resolve(std::size_t pos) const -> ResolvedPos;

    auto range_has_mark(std::size_t from, std::size_t to, const MarkType& type) const -> bool;

    /// Whether replacing children [from, to) with children [start, end)
    /// of `replacement` gives valid content.
    auto can_replace(std::size_t from, std::size_t to, const Fragment& replacement,
                     std::size_t start, std::size_t end) const -> bool;
    auto can_replace(std::size_t from, std::size_t to, const Fragment& replacement = Fragment{}) const -> bool;
    auto can_replace_with(std::size_t from, std::size_t to, const NodeType& type,
                          const MarkSet& marks = {}) const -> bool;
    auto can_append(const Node& other) const -> bool;

    /// Validate the whole subtree; throws invalid_content.
    void check() const;

    /// Debug rendering, e.g. `doc(paragraph(em("hi")))`.
    auto to_string() const -> std::string;

private:
    const NodeType* type_;
    Attrs attrs_;
    Fragment content_;
    MarkSet marks_;
    std::string text_;
};

}  // namespace folio_cpp
