#include <folio-cpp/transform.hpp>
#include <folio-cpp/error.hpp>
#include <folio-cpp/resolved_pos.hpp>

#include <algorithm>
#include <string>

namespace folio_cpp {

namespace {

void check_range(std::size_t from, std::size_t to) {
    if (from > to) {
        throw Exception{ErrorKind::invalid_position,
                        "Inverted range " + std::to_string(from) + "-" + std::to_string(to)};
    }
}

}  // namespace

Transform::Transform(NodePtr doc) : doc_{std::move(doc)} {
    if (!doc_) throw Exception{ErrorKind::invalid_operation, "Transform needs a document"};
}

// -- Steps --------------------------------------------------------------------

void Transform::step(const Step& step) {
    auto result = maybe_step(step);
    if (result.failed) throw Exception{ErrorKind::step_failed, *result.failed};
}

auto Transform::maybe_step(const Step& step) -> StepResult {
    auto result = apply_step(step, *doc_);
    if (!result.failed) add_step(step, result.doc);
    return result;
}

void Transform::add_step(const Step& step, NodePtr doc) {
    docs_.push_back(doc_);
    steps_.push_back(step);
    mapping_.append_map(step_map(step));
    doc_ = std::move(doc);
}

// -- Content ------------------------------------------------------------------

void Transform::replace(std::size_t from, std::size_t to, const Slice& slice) {
    check_range(from, to);
    if (auto fitted = replace_step(*doc_, from, to, slice)) step(*fitted);
}

void Transform::replace_with(std::size_t from, std::size_t to, const Fragment& content) {
    replace(from, to, Slice{content, 0, 0});
}

void Transform::replace_with(std::size_t from, std::size_t to, const NodePtr& node) {
    replace_with(from, to, Fragment::from(node));
}

void Transform::delete_range(std::size_t from, std::size_t to) {
    replace(from, to);
}

void Transform::insert(std::size_t pos, const Fragment& content) {
    replace_with(pos, pos, content);
}

void Transform::insert(std::size_t pos, const NodePtr& node) {
    replace_with(pos, pos, node);
}

void Transform::insert_text(std::string_view text, std::size_t from, std::optional<std::size_t> to) {
    auto end = to.value_or(from);
    check_range(from, end);
    if (text.empty()) {
        delete_range(from, end);
        return;
    }
    auto rfrom = doc_->resolve(from);
    auto marks = from == end ? rfrom.marks() : rfrom.marks_across(doc_->resolve(end)).value_or(MarkSet{});
    const auto& schema = doc_->type().schema();
    replace_with(from, end, schema.text(text, std::move(marks)));
}

// -- Marks --------------------------------------------------------------------

void Transform::add_mark(std::size_t from, std::size_t to, const Mark& mark) {
    auto removed = std::vector<RemoveMarkStep>{};
    auto added = std::vector<AddMarkStep>{};
    doc_->nodes_between(from, to, [&](const NodePtr& node, std::size_t pos, const Node* parent, std::size_t) {
        if (!node->is_inline()) return true;
        const auto& marks = node->marks();
        if (!mark.is_in_set(marks) && parent && parent->type().allows_mark_type(*mark.type)) {
            auto start = std::max(pos, from);
            auto end = std::min(pos + node->node_size(), to);
            auto new_set = mark.add_to_set(marks);
            for (const auto& m : marks) {
                if (m.is_in_set(new_set)) continue;
                if (!removed.empty() && removed.back().to == start && removed.back().mark.eq(m)) {
                    removed.back().to = end;
                } else {
                    removed.push_back(RemoveMarkStep{start, end, m});
                }
            }
            if (!added.empty() && added.back().to == start) {
                added.back().to = end;
            } else {
                added.push_back(AddMarkStep{start, end, mark});
            }
        }
        return true;
    });
    for (const auto& s : removed) step(s);
    for (const auto& s : added) step(s);
}

void Transform::remove_matching_marks(std::size_t from, std::size_t to,
                                      const std::function<MarkSet(const MarkSet&)>& to_remove) {
    struct Matched {
        Mark style;
        std::size_t from;
        std::size_t to;
        std::size_t step;
    };
    auto matched = std::vector<Matched>{};
    auto counter = std::size_t{0};
    doc_->nodes_between(from, to, [&](const NodePtr& node, std::size_t pos, const Node*, std::size_t) {
        if (!node->is_inline()) return true;
        ++counter;
        auto remove = to_remove(node->marks());
        if (remove.empty()) return true;
        auto end = std::min(pos + node->node_size(), to);
        for (const auto& style : remove) {
            Matched* found = nullptr;
            for (auto& m : matched) {
                if (m.step == counter - 1 && style.eq(m.style)) found = &m;
            }
            if (found) {
                found->to = end;
                found->step = counter;
            } else {
                matched.push_back(Matched{style, std::max(pos, from), end, counter});
            }
        }
        return true;
    });
    for (const auto& m : matched) step(RemoveMarkStep{m.from, m.to, m.style});
}

void Transform::remove_mark(std::size_t from, std::size_t to, const Mark& mark) {
    remove_matching_marks(from, to, [&](const MarkSet& set) {
        return mark.is_in_set(set) ? MarkSet{mark} : MarkSet{};
    });
}

void Transform::remove_mark(std::size_t from, std::size_t to, const MarkType& type) {
    remove_matching_marks(from, to, [&](const MarkSet& set) {
        auto found = MarkSet{};
        for (const auto& m : set) {
            if (m.type == &type) found.push_back(m);
        }
        return found;
    });
}

void Transform::remove_marks(std::size_t from, std::size_t to) {
    remove_matching_marks(from, to, [](const MarkSet& set) { return set; });
}

// -- Structure ----------------------------------------------------------------

void Transform::set_node_markup(std::size_t pos, const NodeType* type, std::optional<Attrs> attrs,
                                std::optional<MarkSet> marks) {
    auto node = pos < doc_->content().size() ? doc_->node_at(pos) : nullptr;
    if (!node) throw Exception{ErrorKind::invalid_position, "No node at given position"};
    if (!type) type = &node->type();
    auto new_node = type->create(attrs.value_or(node->attrs()), Fragment{},
                                 marks.value_or(node->marks()));
    if (node->is_leaf()) {
        replace_with(pos, pos + node->node_size(), new_node);
        return;
    }
    if (!type->valid_content(node->content())) {
        throw Exception{ErrorKind::invalid_content, "Invalid content for node type " + type->name()};
    }
    step(ReplaceAroundStep{pos, pos + node->node_size(), pos + 1, pos + node->node_size() - 1,
                           Slice{Fragment::from(new_node), 0, 0}, 1, true});
}

void Transform::set_node_attribute(std::size_t pos, std::string_view attr, ScalarValue value) {
    step(AttrStep{pos, std::string{attr}, std::move(value)});
}

void Transform::set_doc_attribute(std::string_view attr, ScalarValue value) {
    step(DocAttrStep{std::string{attr}, std::move(value)});
}

void Transform::set_block_type(std::size_t from, std::size_t to, const NodeType& type, const Attrs& attrs) {
    if (!type.is_textblock()) {
        throw Exception{ErrorKind::invalid_schema, "Type given to set_block_type should be a textblock"};
    }
    auto map_from = steps_.size();
    auto start_doc = doc_;
    auto computed = type.compute_attrs(attrs);
    start_doc->nodes_between(from, to, [&](const NodePtr& node, std::size_t pos, const Node*, std::size_t) {
        if (!node->is_textblock()) return true;
        if (node->has_markup(type, computed, node->marks()) || !type.valid_content(node->content())) {
            return false;
        }
        auto mapping = mapping_.slice(map_from);
        auto rpos = doc_->resolve(mapping.map(pos));
        auto index = rpos.index();
        if (!rpos.parent()->can_replace_with(index, index + 1, type)) return false;
        auto start = mapping.map(pos, 1);
        auto end = mapping.map(pos + node->node_size(), 1);
        step(ReplaceAroundStep{start, end, start + 1, end - 1,
                               Slice{Fragment::from(type.create(computed, Fragment{}, node->marks())), 0, 0},
                               1, true});
        return false;
    });
}

void Transform::split(std::size_t pos, std::size_t depth,
                      const std::vector<std::optional<SplitType>>& types_after) {
    auto rpos = doc_->resolve(pos);
    auto before = Fragment{};
    auto after = Fragment{};
    for (std::size_t level = 0; level < depth; ++level) {
        auto d = rpos.depth() - level;
        const auto& node = rpos.node(d);
        before = Fragment::from(node->copy(before));
        auto i = depth - 1 - level;
        const auto* type_after = i < types_after.size() && types_after[i] ? &*types_after[i] : nullptr;
        after = Fragment::from(type_after ? type_after->type->create(type_after->attrs, after, {})
                                          : node->copy(after));
    }
    step(ReplaceStep{pos, pos, Slice{before.append(after), depth, depth}, true});
}

void Transform::join(std::size_t pos, std::size_t depth) {
    if (depth > pos) throw Exception{ErrorKind::invalid_position, "Join depth exceeds position"};
    step(ReplaceStep{pos - depth, pos + depth, Slice::empty(), true});
}

// -- Structure queries --------------------------------------------------------

namespace {

auto joinable(const NodePtr& a, const NodePtr& b) -> bool {
    return a && b && !a->is_leaf() && a->can_append(*b);
}

}  // namespace

auto replace_step(const Node& doc, std::size_t from, std::size_t to, const Slice& slice) -> std::optional<Step> {
    check_range(from, to);
    if (from == to && slice.size() == 0) return std::nullopt;
    auto rfrom = doc.resolve(from);
    auto fits = [&](const Slice& candidate) -> std::optional<Step> {
        auto step = Step{ReplaceStep{from, to, candidate}};
        if (apply_step(step, doc).failed) return std::nullopt;
        return step;
    };

    if (auto step = fits(slice)) return step;

    const auto& parent = rfrom.parent();
    if (slice.open_start() == 0 && slice.open_end() == 0 && !parent->type().inline_content()) {
        auto first = slice.content().first_child();
        const auto* block = parent->type().content_match().default_type();
        if (first && first->is_inline() && block && block->is_textblock()) {
            if (auto wrapped = block->create_and_fill({}, slice.content(), {})) {
                if (auto step = fits(Slice{Fragment::from(wrapped), 0, 0})) return step;
            }
        }
    }

    if (parent->is_textblock()) {
        if (auto step = fits(Slice::max_open(slice.content()))) return step;
    }

    for (auto open_start = slice.open_start() + 1; open_start-- > 0;) {
        for (auto open_end = slice.open_end() + 1; open_end-- > 0;) {
            if (open_start == slice.open_start() && open_end == slice.open_end()) continue;
            if (auto step = fits(Slice{slice.content(), open_start, open_end})) return step;
        }
    }
    return std::nullopt;
}

auto can_split(const Node& doc, std::size_t pos, std::size_t depth,
               const std::vector<std::optional<SplitType>>& types_after) -> bool {
    auto rpos = doc.resolve(pos);
    if (depth > rpos.depth()) return false;
    auto base = rpos.depth() - depth;
    auto type_after = [&](std::size_t i) -> const SplitType* {
        return i < types_after.size() && types_after[i] ? &*types_after[i] : nullptr;
    };

    const auto& parent = rpos.parent();
    const auto* inner = types_after.empty() ? nullptr : type_after(types_after.size() - 1);
    const auto& inner_type = inner ? *inner->type : parent->type();
    if (parent->type().spec().isolating
        || !parent->can_replace(rpos.index(), parent->child_count())
        || !inner_type.valid_content(parent->content().cut_by_index(rpos.index(), parent->child_count()))) {
        return false;
    }
    for (auto d = rpos.depth() - 1, i = depth; d > base; --d, --i) {
        // i - 2 is the types_after slot for this level
        const auto& node = rpos.node(d);
        auto index = rpos.index(d);
        if (node->type().spec().isolating) return false;
        auto rest = node->content().cut_by_index(index, node->child_count());
        if (const auto* override_child = type_after(i - 1)) {
            rest = rest.replace_child(0, override_child->type->create(override_child->attrs, Fragment{}, {}));
        }
        const auto* after = type_after(i - 2);
        const auto& after_type = after ? *after->type : node->type();
        if (!node->can_replace(index + 1, node->child_count()) || !after_type.valid_content(rest)) {
            return false;
        }
    }
    auto index = rpos.index_after(base);
    const auto* base_type = type_after(0);
    return rpos.node(base)->can_replace_with(index, index,
                                             base_type ? *base_type->type : rpos.node(base + 1)->type());
}

auto can_join(const Node& doc, std::size_t pos) -> bool {
    auto rpos = doc.resolve(pos);
    auto index = rpos.index();
    return joinable(rpos.node_before(), rpos.node_after())
        && rpos.parent()->can_replace(index, index + 1);
}

auto join_point(const Node& doc, std::size_t pos, int dir) -> std::optional<std::size_t> {
    auto rpos = doc.resolve(pos);
    for (auto d = rpos.depth();; --d) {
        NodePtr before;
        NodePtr after;
        auto index = rpos.index(d);
        if (d == rpos.depth()) {
            before = rpos.node_before();
            after = rpos.node_after();
        } else if (dir > 0) {
            before = rpos.node(d + 1);
            ++index;
            after = rpos.node(d)->maybe_child(index);
        } else {
            before = index > 0 ? rpos.node(d)->maybe_child(index - 1) : nullptr;
            after = rpos.node(d + 1);
        }
        if (before && !before->is_textblock() && joinable(before, after)
            && rpos.node(d)->can_replace(index, index + 1)) {
            return pos;
        }
        if (d == 0) break;
        pos = dir < 0 ? rpos.before(d) : rpos.after(d);
    }
    return std::nullopt;
}

auto insert_point(const Node& doc, std::size_t pos, const NodeType& type) -> std::optional<std::size_t> {
    auto rpos = doc.resolve(pos);
    if (rpos.parent()->can_replace_with(rpos.index(), rpos.index(), type)) return pos;
    if (rpos.parent_offset() == 0) {
        for (auto d = rpos.depth(); d-- > 0;) {
            auto index = rpos.index(d);
            if (rpos.node(d)->can_replace_with(index, index, type)) return rpos.before(d + 1);
            if (index > 0) return std::nullopt;
        }
    }
    if (rpos.parent_offset() == rpos.parent()->content().size()) {
        for (auto d = rpos.depth(); d-- > 0;) {
            auto index = rpos.index_after(d);
            if (rpos.node(d)->can_replace_with(index, index, type)) return rpos.after(d + 1);
            if (index < rpos.node(d)->child_count()) return std::nullopt;
        }
    }
    return std::nullopt;
}

}  // namespace folio_cpp
