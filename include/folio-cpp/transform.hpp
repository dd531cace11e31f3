/// @file transform.hpp
/// @brief Transform: accumulates steps against a document.

#pragma once

#include <folio-cpp/mapping.hpp>
#include <folio-cpp/node.hpp>
#include <folio-cpp/step.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace folio_cpp {

/// Replacement type for one level of a split.
struct SplitType {
    const NodeType* type;
    Attrs attrs;
};

/// Builds a sequence of steps, tracking the intermediate documents and
/// the mapping from the starting document to the current one.
///
/// Every helper goes through step(), which throws Exception{step_failed}
/// when a step cannot be applied. maybe_step() reports failure instead.
///
/// @code
/// auto tr = Transform{doc};
/// tr.insert_text("hello", 1);
/// tr.add_mark(1, 6, schema->mark("em"));
/// auto result = tr.doc();
/// @endcode
class Transform {
public:
    explicit Transform(NodePtr doc);
    virtual ~Transform() = default;

    Transform(const Transform&) = default;
    auto operator=(const Transform&) -> Transform& = default;
    Transform(Transform&&) noexcept = default;
    auto operator=(Transform&&) noexcept -> Transform& = default;

    // -- State ----------------------------------------------------------------

    /// The current document.
    auto doc() const -> const NodePtr& { return doc_; }
    /// The starting document.
    auto before() const -> const NodePtr& { return docs_.empty() ? doc_ : docs_.front(); }
    auto steps() const -> const std::vector<Step>& { return steps_; }
    /// The document before each step.
    auto docs() const -> const std::vector<NodePtr>& { return docs_; }
    auto mapping() const -> const Mapping& { return mapping_; }
    auto doc_changed() const -> bool { return !steps_.empty(); }

    // -- Steps ----------------------------------------------------------------

    /// Apply a step; throws Exception{step_failed} on failure.
    void step(const Step& step);
    /// Apply a step if it can be applied.
    auto maybe_step(const Step& step) -> StepResult;

    // -- Content --------------------------------------------------------------

    /// Replace a range with a slice, fitted by replace_step(). Does
    /// nothing when the slice cannot be made to fit.
    void replace(std::size_t from, std::size_t to, const Slice& slice = Slice::empty());
    void replace_with(std::size_t from, std::size_t to, const Fragment& content);
    void replace_with(std::size_t from, std::size_t to, const NodePtr& node);
    void delete_range(std::size_t from, std::size_t to);
    void insert(std::size_t pos, const Fragment& content);
    void insert(std::size_t pos, const NodePtr& node);

    /// Insert text, inheriting the marks at `from`. An empty string
    /// deletes the range.
    void insert_text(std::string_view text, std::size_t from, std::optional<std::size_t> to = std::nullopt);

    // -- Marks ----------------------------------------------------------------

    void add_mark(std::size_t from, std::size_t to, const Mark& mark);
    void remove_mark(std::size_t from, std::size_t to, const Mark& mark);
    /// Remove every mark of a type.
    void remove_mark(std::size_t from, std::size_t to, const MarkType& type);
    /// Remove all marks.
    void remove_marks(std::size_t from, std::size_t to);

    // -- Structure ------------------------------------------------------------

    /// Change the type, attributes or marks of the node at `pos`.
    /// nullptr keeps the type; nullopt keeps the attributes or marks.
    void set_node_markup(std::size_t pos, const NodeType* type,
                         std::optional<Attrs> attrs = std::nullopt,
                         std::optional<MarkSet> marks = std::nullopt);
    void set_node_attribute(std::size_t pos, std::string_view attr, ScalarValue value);
    void set_doc_attribute(std::string_view attr, ScalarValue value);

    /// Turn every textblock in [from, to) into `type`.
    void set_block_type(std::size_t from, std::size_t to, const NodeType& type, const Attrs& attrs = {});

    /// Split the node at `pos`, `depth` levels deep.
    void split(std::size_t pos, std::size_t depth = 1, const std::vector<std::optional<SplitType>>& types_after = {});

    /// Join the blocks around `pos`.
    void join(std::size_t pos, std::size_t depth = 1);

protected:
    virtual void add_step(const Step& step, NodePtr doc);

private:
    void remove_matching_marks(std::size_t from, std::size_t to,
                               const std::function<MarkSet(const MarkSet&)>& to_remove);

    NodePtr doc_;
    std::vector<Step> steps_;
    std::vector<NodePtr> docs_;
    Mapping mapping_;
};

// -- Structure queries --------------------------------------------------------

/// A step that replaces [from, to) with `slice`, adjusting the slice so
/// that the result is valid: wrapping loose inline content in a
/// textblock, opening closed blocks dropped into text, or closing open
/// sides. nullopt when the replacement is a no-op or nothing fits.
auto replace_step(const Node& doc, std::size_t from, std::size_t to,
                  const Slice& slice = Slice::empty()) -> std::optional<Step>;

/// Whether splitting at `pos` gives valid content.
auto can_split(const Node& doc, std::size_t pos, std::size_t depth = 1,
               const std::vector<std::optional<SplitType>>& types_after = {}) -> bool;

/// Whether the nodes on both sides of `pos` can be joined.
auto can_join(const Node& doc, std::size_t pos) -> bool;

/// Find a position at or around `pos` where two blocks can be joined,
/// searching in direction `dir`.
auto join_point(const Node& doc, std::size_t pos, int dir = -1) -> std::optional<std::size_t>;

/// Find a position at or near `pos` where a node of `type` fits.
auto insert_point(const Node& doc, std::size_t pos, const NodeType& type) -> std::optional<std::size_t>;

}  // namespace folio_cpp
