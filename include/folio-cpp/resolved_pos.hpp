/// @file resolved_pos.hpp
/// @brief ResolvedPos: a document position with its ancestry.

#pragma once

#include <folio-cpp/mark.hpp>
#include <folio-cpp/node.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace folio_cpp {

/// A position resolved against a document, exposing the path of
/// ancestors from the root down to the innermost parent.
///
/// Depth 0 is the document. Parameterless accessors refer to the
/// innermost depth.
class ResolvedPos {
public:
    /// One level of the path.
    struct PathEntry {
        NodePtr node;        ///< The node at this depth.
        std::size_t index;   ///< Child index within `node`.
        std::size_t offset;  ///< Absolute position where that child starts.
    };

    /// Resolve `pos` in `doc`; throws invalid_position when out of range.
    static auto resolve(const NodePtr& doc, std::size_t pos) -> ResolvedPos;

    auto pos() const -> std::size_t { return pos_; }
    auto depth() const -> std::size_t { return path_.size() - 1; }
    auto parent_offset() const -> std::size_t { return parent_offset_; }
    auto doc() const -> const NodePtr& { return path_.front().node; }

    auto node(std::size_t depth) const -> const NodePtr&;
    auto parent() const -> const NodePtr& { return path_.back().node; }
    auto index(std::size_t depth) const -> std::size_t;
    auto index() const -> std::size_t { return path_.back().index; }
    auto index_after(std::size_t depth) const -> std::size_t;
    auto index_after() const -> std::size_t { return index_after(depth()); }

    /// Start of the content of the ancestor at `depth`.
    auto start(std::size_t depth) const -> std::size_t;
    auto start() const -> std::size_t { return start(depth()); }
    /// End of the content of the ancestor at `depth`.
    auto end(std::size_t depth) const -> std::size_t;
    auto end() const -> std::size_t { return end(depth()); }
    /// Position before the ancestor at `depth`; throws at depth 0.
    auto before(std::size_t depth) const -> std::size_t;
    auto before() const -> std::size_t { return before(depth()); }
    /// Position after the ancestor at `depth`; throws at depth 0.
    auto after(std::size_t depth) const -> std::size_t;
    auto after() const -> std::size_t { return after(depth()); }

    /// Offset into the text node the position points into, or 0.
    auto text_offset() const -> std::size_t { return pos_ - path_.back().offset; }

    auto node_after() const -> NodePtr;
    auto node_before() const -> NodePtr;

    auto pos_at_index(std::size_t index, std::size_t depth) const -> std::size_t;
    auto pos_at_index(std::size_t index) const -> std::size_t { return pos_at_index(index, depth()); }

    /// Marks active at this position; non-inclusive marks end here.
    auto marks() const -> MarkSet;

    /// Marks to keep when deleting up to `end`; nullopt when the
    /// position is not followed by inline content.
    auto marks_across(const ResolvedPos& end) const -> std::optional<MarkSet>;

    /// Deepest depth whose content contains both positions.
    auto shared_depth(std::size_t pos) const -> std::size_t;
    auto same_parent(const ResolvedPos& other) const -> bool;

    auto to_string() const -> std::string;

private:
    ResolvedPos(std::size_t pos, std::vector<PathEntry> path, std::size_t parent_offset);

    std::size_t pos_;
    std::vector<PathEntry> path_;
    std::size_t parent_offset_;
};

}  // namespace folio_cpp
