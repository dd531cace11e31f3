/// @file schema.hpp
/// @brief Document schema: node types, mark types, and content rules.

#pragma once

#include <folio-cpp/mark.hpp>
#include <folio-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace folio_cpp {

class Fragment;
class Node;
class NodeType;
class Schema;

/// Shared handle to an immutable node.
using NodePtr = std::shared_ptr<const Node>;

// -- Specs --------------------------------------------------------------------

/// Describes one attribute of a node or mark type.
struct AttributeSpec {
    /// Default value. An attribute without a default is required.
    std::optional<ScalarValue> default_value;
};

using AttributeSpecs = std::map<std::string, AttributeSpec, std::less<>>;

/// Describes a node type.
struct NodeSpec {
    std::string content;               ///< Content expression, e.g. "block+". Empty for leaves.
    std::optional<std::string> marks;  ///< "_" for all, "" for none, or mark names and groups.
    std::string group;                 ///< Space-separated group names.
    bool inline_node{false};           ///< Inline rather than block.
    bool atom{false};                  ///< Treated as a single unit even with content.
    bool selectable{true};             ///< May be the target of a node selection.
    bool code{false};                  ///< Contains code.
    bool defining{false};              ///< Kept when its content is replaced.
    bool isolating{false};             ///< Edits never cross its boundary.
    AttributeSpecs attrs;              ///< Attributes of the type.
};

/// Describes a mark type.
struct MarkSpec {
    AttributeSpecs attrs;                ///< Attributes of the type.
    bool inclusive{true};                ///< Active at its end position.
    std::optional<std::string> excludes; ///< Excluded marks; unset means the type itself.
    std::string group;                   ///< Space-separated group names.
};

/// Describes a whole schema. Order matters: mark rank follows the order
/// of `marks`.
struct SchemaSpec {
    std::vector<std::pair<std::string, NodeSpec>> nodes;
    std::vector<std::pair<std::string, MarkSpec>> marks;
    std::string top_node{"doc"};
};

// -- ContentMatch -------------------------------------------------------------

/// A simplified content-expression matcher.
///
/// Understands sequences of type or group names with an optional `+`,
/// `*` or `?` quantifier ("paragraph block*", "inline*", "text*"). It
/// checks which types are allowed and how many children there must be,
/// but not their order.
class ContentMatch {
public:
    ContentMatch(std::string_view expr, const Schema& schema);

    auto allows_type(const NodeType& type) const -> bool;
    auto valid_content(const Fragment& fragment) const -> bool;
    auto valid_end() const -> bool { return min_count_ == 0; }
    auto empty() const -> bool { return empty_; }
    auto min_count() const -> std::size_t { return min_count_; }
    auto max_count() const -> std::optional<std::size_t> { return max_count_; }

    /// Wrapper types (at most one level) that would let `type` appear
    /// here; an empty vector means it fits directly.
    auto find_wrapping(const NodeType& type) const
        -> std::optional<std::vector<const NodeType*>>;

    /// The first allowed non-text type without required attributes.
    auto default_type() const -> const NodeType*;

    /// Whether both matchers allow some common type.
    auto compatible(const ContentMatch& other) const -> bool;

    /// Whether the first allowed type is inline.
    auto inline_content() const -> bool;

private:
    std::vector<const NodeType*> candidates_;  ///< allowed types, in expression order
    std::size_t min_count_{0};
    std::optional<std::size_t> max_count_;  ///< nullopt = unbounded
    bool empty_{true};
};

// -- NodeType -----------------------------------------------------------------

/// A node type, allocated once per Schema.
class NodeType {
public:
    NodeType(std::string name, const Schema& schema, NodeSpec spec);

    NodeType(const NodeType&) = delete;
    auto operator=(const NodeType&) -> NodeType& = delete;

    auto name() const -> const std::string& { return name_; }
    auto schema() const -> const Schema& { return *schema_; }
    auto spec() const -> const NodeSpec& { return spec_; }
    auto groups() const -> const std::vector<std::string>& { return groups_; }

    auto is_block() const -> bool { return is_block_; }
    auto is_inline() const -> bool { return !is_block_; }
    auto is_text() const -> bool { return is_text_; }
    auto inline_content() const -> bool { return inline_content_; }
    auto is_textblock() const -> bool { return is_block_ && inline_content_; }
    auto is_leaf() const -> bool { return spec_.content.empty(); }
    auto is_atom() const -> bool { return is_leaf() || spec_.atom; }

    auto is_in_group(std::string_view group) const -> bool;
    auto has_required_attrs() const -> bool;

    /// Whether this type allows some of the same content as `other`.
    auto compatible_content(const NodeType& other) const -> bool;

    /// Fill in defaults; throws invalid_content when a required
    /// attribute is missing. Undeclared attributes are dropped.
    auto compute_attrs(const Attrs& attrs) const -> Attrs;

    /// Create a node without checking its content.
    auto create(const Attrs& attrs, Fragment content, MarkSet marks) const -> NodePtr;

    /// Create a node, throwing invalid_content if the content is invalid.
    auto create_checked(const Attrs& attrs, Fragment content, MarkSet marks) const -> NodePtr;

    /// Create a node, filling in required children when `content` is
    /// empty. Returns nullptr when no valid node can be built.
    auto create_and_fill(const Attrs& attrs, Fragment content, MarkSet marks) const -> NodePtr;

    auto valid_content(const Fragment& content) const -> bool;
    void check_content(const Fragment& content) const;

    auto content_match() const -> const ContentMatch&;

    auto allows_mark_type(const MarkType& type) const -> bool;
    auto allows_marks(const MarkSet& marks) const -> bool;
    auto allowed_marks(const MarkSet& marks) const -> MarkSet;

private:
    friend class Schema;

    std::string name_;
    const Schema* schema_;
    NodeSpec spec_;
    std::vector<std::string> groups_;
    bool is_block_;
    bool is_text_;
    bool inline_content_{false};
    std::optional<ContentMatch> content_match_;
    std::optional<std::vector<const MarkType*>> mark_set_;  ///< nullopt = all marks
};

// -- MarkType -----------------------------------------------------------------

/// A mark type, allocated once per Schema.
class MarkType {
public:
    MarkType(std::string name, std::size_t rank, const Schema& schema, MarkSpec spec);

    MarkType(const MarkType&) = delete;
    auto operator=(const MarkType&) -> MarkType& = delete;

    auto name() const -> const std::string& { return name_; }
    auto rank() const -> std::size_t { return rank_; }
    auto schema() const -> const Schema& { return *schema_; }
    auto spec() const -> const MarkSpec& { return spec_; }

    auto create(const Attrs& attrs = {}) const -> Mark;

    /// Remove every mark of this type from the set.
    auto remove_from_set(const MarkSet& set) const -> MarkSet;

    /// The mark of this type in the set, or nullptr.
    auto is_in_set(const MarkSet& set) const -> const Mark*;

    auto excludes(const MarkType& other) const -> bool;
    auto is_in_group(std::string_view group) const -> bool;

private:
    friend class Schema;

    std::string name_;
    std::size_t rank_;
    const Schema* schema_;
    MarkSpec spec_;
    std::vector<const MarkType*> excluded_;
};

// -- Schema -------------------------------------------------------------------

/// The set of node and mark types a document may contain.
///
/// Types refer back to the schema by address, so a Schema never moves:
/// create it with Schema::create() and keep the shared_ptr alive for as
/// long as documents built from it are in use.
///
/// @code
/// auto schema = Schema::create(SchemaSpec{
///     .nodes = {{"doc", {.content = "block+"}},
///               {"paragraph", {.content = "inline*", .group = "block"}},
///               {"text", {.group = "inline", .inline_node = true}}},
///     .marks = {{"em", {}}},
/// });
/// auto doc = schema->node("doc", {}, {schema->node("paragraph", {}, {schema->text("hi")})});
/// @endcode
class Schema : public std::enable_shared_from_this<Schema> {
public:
    /// Compile a schema; throws invalid_schema on a malformed spec.
    static auto create(SchemaSpec spec) -> std::shared_ptr<const Schema>;

    explicit Schema(SchemaSpec spec);

    Schema(const Schema&) = delete;
    auto operator=(const Schema&) -> Schema& = delete;

    auto spec() const -> const SchemaSpec& { return spec_; }

    /// Look up a node type; throws invalid_schema when unknown.
    auto node_type(std::string_view name) const -> const NodeType&;
    auto find_node_type(std::string_view name) const -> const NodeType*;

    /// Look up a mark type; throws invalid_schema when unknown.
    auto mark_type(std::string_view name) const -> const MarkType&;
    auto find_mark_type(std::string_view name) const -> const MarkType*;

    auto top_node_type() const -> const NodeType& { return *top_node_type_; }
    auto text_type() const -> const NodeType& { return *text_type_; }

    /// All node types in spec order.
    auto node_types() const -> std::vector<const NodeType*>;
    /// All mark types in rank order.
    auto mark_types() const -> std::vector<const MarkType*>;

    /// Create a node with checked content.
    auto node(std::string_view type, const Attrs& attrs = {},
              std::vector<NodePtr> content = {}, MarkSet marks = {}) const -> NodePtr;

    /// Create a text node; throws invalid_content for empty text.
    auto text(std::string_view text, MarkSet marks = {}) const -> NodePtr;

    /// Create a mark.
    auto mark(std::string_view type, const Attrs& attrs = {}) const -> Mark;

private:
    auto gather_marks(std::string_view names) const -> std::vector<const MarkType*>;

    SchemaSpec spec_;
    std::vector<std::unique_ptr<NodeType>> nodes_;
    std::vector<std::unique_ptr<MarkType>> marks_;
    const NodeType* top_node_type_{nullptr};
    const NodeType* text_type_{nullptr};
};

}  // namespace folio_cpp
