#include <folio-cpp/resolved_pos.hpp>
#include <folio-cpp/error.hpp>

namespace folio_cpp {

ResolvedPos::ResolvedPos(std::size_t pos, std::vector<PathEntry> path, std::size_t parent_offset)
    : pos_{pos}, path_{std::move(path)}, parent_offset_{parent_offset} {}

auto ResolvedPos::resolve(const NodePtr& doc, std::size_t pos) -> ResolvedPos {
    if (pos > doc->content().size()) {
        throw Exception{ErrorKind::invalid_position,
                        "Position " + std::to_string(pos) + " out of range"};
    }
    auto path = std::vector<PathEntry>{};
    auto start = std::size_t{0};
    auto parent_offset = pos;
    for (auto node = doc;;) {
        auto [index, offset] = node->content().find_index(parent_offset);
        auto rem = parent_offset - offset;
        path.push_back({node, index, start + offset});
        if (!rem) break;
        node = node->child(index);
        if (node->is_text()) break;
        parent_offset = rem - 1;
        start += offset + 1;
    }
    return ResolvedPos{pos, std::move(path), parent_offset};
}

auto ResolvedPos::node(std::size_t depth) const -> const NodePtr& {
    if (depth >= path_.size()) {
        throw Exception{ErrorKind::invalid_position, "Depth " + std::to_string(depth) + " out of range"};
    }
    return path_[depth].node;
}

auto ResolvedPos::index(std::size_t depth) const -> std::size_t {
    if (depth >= path_.size()) {
        throw Exception{ErrorKind::invalid_position, "Depth " + std::to_string(depth) + " out of range"};
    }
    return path_[depth].index;
}

auto ResolvedPos::index_after(std::size_t depth) const -> std::size_t {
    return index(depth) + (depth == this->depth() && !text_offset() ? 0 : 1);
}

auto ResolvedPos::start(std::size_t depth) const -> std::size_t {
    return depth == 0 ? 0 : path_.at(depth - 1).offset + 1;
}

auto ResolvedPos::end(std::size_t depth) const -> std::size_t {
    return start(depth) + node(depth)->content().size();
}

auto ResolvedPos::before(std::size_t depth) const -> std::size_t {
    if (depth == 0) {
        throw Exception{ErrorKind::invalid_position, "There is no position before the top-level node"};
    }
    return depth == this->depth() + 1 ? pos_ : path_.at(depth - 1).offset;
}

auto ResolvedPos::after(std::size_t depth) const -> std::size_t {
    if (depth == 0) {
        throw Exception{ErrorKind::invalid_position, "There is no position after the top-level node"};
    }
    return depth == this->depth() + 1 ? pos_
                                      : path_.at(depth - 1).offset + node(depth)->node_size();
}

auto ResolvedPos::node_after() const -> NodePtr {
    const auto& parent = this->parent();
    auto idx = index();
    if (idx == parent->child_count()) return nullptr;
    auto d_off = text_offset();
    const auto& child = parent->child(idx);
    return d_off ? child->cut(d_off) : child;
}

auto ResolvedPos::node_before() const -> NodePtr {
    auto idx = index();
    auto d_off = text_offset();
    if (d_off) return parent()->child(idx)->cut(0, d_off);
    return idx == 0 ? nullptr : parent()->child(idx - 1);
}

auto ResolvedPos::pos_at_index(std::size_t index, std::size_t depth) const -> std::size_t {
    const auto& node = this->node(depth);
    auto pos = depth == 0 ? 0 : path_[depth - 1].offset + 1;
    for (std::size_t i = 0; i < index; ++i) pos += node->child(i)->node_size();
    return pos;
}

namespace {

/// Drop non-inclusive marks that do not continue into `next`.
auto drop_non_inclusive(MarkSet marks, const NodePtr& next) -> MarkSet {
    for (std::size_t i = 0; i < marks.size();) {
        if (!marks[i].type->spec().inclusive && (!next || !marks[i].is_in_set(next->marks()))) {
            marks = marks[i].remove_from_set(marks);
        } else {
            ++i;
        }
    }
    return marks;
}

}  // namespace

auto ResolvedPos::marks() const -> MarkSet {
    const auto& parent = this->parent();
    auto idx = index();
    if (parent->content().size() == 0) return {};
    if (text_offset()) return parent->child(idx)->marks();

    auto main = idx > 0 ? parent->maybe_child(idx - 1) : nullptr;
    auto other = parent->maybe_child(idx);
    if (!main) std::swap(main, other);
    return drop_non_inclusive(main->marks(), other);
}

auto ResolvedPos::marks_across(const ResolvedPos& end) const -> std::optional<MarkSet> {
    auto after = parent()->maybe_child(index());
    if (!after || !after->is_inline()) return std::nullopt;
    return drop_non_inclusive(after->marks(), end.parent()->maybe_child(end.index()));
}

auto ResolvedPos::shared_depth(std::size_t pos) const -> std::size_t {
    for (auto depth = this->depth(); depth > 0; --depth) {
        if (start(depth) <= pos && end(depth) >= pos) return depth;
    }
    return 0;
}

auto ResolvedPos::same_parent(const ResolvedPos& other) const -> bool {
    return pos_ - parent_offset_ == other.pos_ - other.parent_offset_;
}

auto ResolvedPos::to_string() const -> std::string {
    auto out = std::string{};
    for (std::size_t i = 1; i <= depth(); ++i) {
        if (!out.empty()) out += '/';
        out += node(i)->type().name() + "_" + std::to_string(index(i - 1));
    }
    return out + ":" + std::to_string(parent_offset_);
}

}  // namespace folio_cpp
