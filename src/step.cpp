#include <folio-cpp/step.hpp>
#include <folio-cpp/error.hpp>
#include <folio-cpp/resolved_pos.hpp>

#include <algorithm>
#include <functional>
#include <string>

namespace folio_cpp {

namespace {

/// Whether a structure-preserving replace over [from, to) would touch
/// actual content rather than just node boundaries.
auto content_between(const Node& doc, std::size_t from, std::size_t to) -> bool {
    auto rfrom = doc.resolve(from);
    auto dist = to - from;
    auto depth = rfrom.depth();
    while (dist > 0 && depth > 0 && rfrom.index_after(depth) == rfrom.node(depth)->child_count()) {
        --depth;
        --dist;
    }
    if (dist > 0) {
        auto next = rfrom.node(depth)->maybe_child(rfrom.index_after(depth));
        while (dist > 0) {
            if (!next || next->is_leaf()) return true;
            next = next->first_child();
            --dist;
        }
    }
    return false;
}

using InlineMapper = std::function<NodePtr(const NodePtr& node, const Node& parent)>;

auto map_fragment(const Fragment& fragment, const InlineMapper& f, const Node& parent) -> Fragment {
    auto mapped = std::vector<NodePtr>{};
    for (const auto& original : fragment.children()) {
        auto child = original;
        if (child->content().size() > 0) child = child->copy(map_fragment(child->content(), f, *child));
        if (child->is_inline()) child = f(child, parent);
        mapped.push_back(std::move(child));
    }
    return Fragment::from_array(std::move(mapped));
}

auto apply_mark_change(const Node& doc, std::size_t from, std::size_t to, const InlineMapper& f)
    -> StepResult {
    auto old_slice = doc.slice(from, to);
    auto rfrom = doc.resolve(from);
    const auto& parent = rfrom.node(rfrom.shared_depth(to));
    auto slice = Slice{map_fragment(old_slice.content(), f, *parent),
                       old_slice.open_start(), old_slice.open_end()};
    return StepResult::from_replace(doc, from, to, slice);
}

/// Shared mapping rule of mark steps.
auto map_mark_range(std::size_t from, std::size_t to, const Mappable& mapping)
    -> std::optional<std::pair<std::size_t, std::size_t>> {
    auto rfrom = mapping.map_result(from, 1);
    auto rto = mapping.map_result(to, -1);
    if ((rfrom.deleted() && rto.deleted()) || rfrom.pos >= rto.pos) return std::nullopt;
    return std::pair{rfrom.pos, rto.pos};
}

// -- apply --------------------------------------------------------------------

auto apply(const ReplaceStep& s, const Node& doc) -> StepResult {
    if (s.structure && content_between(doc, s.from, s.to)) {
        return StepResult::fail("Structure replace would overwrite content");
    }
    return StepResult::from_replace(doc, s.from, s.to, s.slice);
}

auto apply(const ReplaceAroundStep& s, const Node& doc) -> StepResult {
    if (s.structure && (content_between(doc, s.from, s.gap_from) || content_between(doc, s.gap_to, s.to))) {
        return StepResult::fail("Structure gap-replace would overwrite content");
    }
    auto gap = doc.slice(s.gap_from, s.gap_to);
    if (gap.open_start() || gap.open_end()) return StepResult::fail("Gap is not a flat range");
    auto inserted = s.slice.insert_at(s.insert, gap.content());
    if (!inserted) return StepResult::fail("Content does not fit in gap");
    return StepResult::from_replace(doc, s.from, s.to, *inserted);
}

auto apply(const AddMarkStep& s, const Node& doc) -> StepResult {
    return apply_mark_change(doc, s.from, s.to, [&](const NodePtr& node, const Node& parent) {
        if (!node->is_atom() || !parent.type().allows_mark_type(*s.mark.type)) return node;
        return node->mark(s.mark.add_to_set(node->marks()));
    });
}

auto apply(const RemoveMarkStep& s, const Node& doc) -> StepResult {
    return apply_mark_change(doc, s.from, s.to, [&](const NodePtr& node, const Node&) {
        return node->mark(s.mark.remove_from_set(node->marks()));
    });
}

auto apply(const AttrStep& s, const Node& doc) -> StepResult {
    if (s.pos >= doc.content().size()) return StepResult::fail("No node at attribute step's position");
    auto node = doc.node_at(s.pos);
    if (!node) return StepResult::fail("No node at attribute step's position");
    if (node->is_text()) return StepResult::fail("Text nodes have no attributes");
    auto attrs = node->attrs();
    attrs.insert_or_assign(s.attr, s.value);
    auto updated = node->type().create(attrs, Fragment{}, node->marks());
    return StepResult::from_replace(doc, s.pos, s.pos + 1,
                                    Slice{Fragment::from(updated), 0, node->is_leaf() ? 0U : 1U});
}

auto apply(const DocAttrStep& s, const Node& doc) -> StepResult {
    auto attrs = doc.attrs();
    attrs.insert_or_assign(s.attr, s.value);
    return StepResult::ok(doc.type().create(attrs, doc.content(), doc.marks()));
}

// -- invert -------------------------------------------------------------------

auto invert(const ReplaceStep& s, const Node& doc) -> Step {
    return ReplaceStep{s.from, s.from + s.slice.size(), doc.slice(s.from, s.to)};
}

auto invert(const ReplaceAroundStep& s, const Node& doc) -> Step {
    auto gap = s.gap_to - s.gap_from;
    return ReplaceAroundStep{
        s.from, s.from + s.slice.size() + gap,
        s.from + s.insert, s.from + s.insert + gap,
        doc.slice(s.from, s.to).remove_between(s.gap_from - s.from, s.gap_to - s.from),
        s.gap_from - s.from, s.structure};
}

auto invert(const AddMarkStep& s, const Node&) -> Step {
    return RemoveMarkStep{s.from, s.to, s.mark};
}

auto invert(const RemoveMarkStep& s, const Node&) -> Step {
    return AddMarkStep{s.from, s.to, s.mark};
}

auto invert(const AttrStep& s, const Node& doc) -> Step {
    auto node = doc.node_at(s.pos);
    auto old = node ? node->attrs().find(s.attr) : Attrs::const_iterator{};
    auto value = node && old != node->attrs().end() ? old->second : ScalarValue{Null{}};
    return AttrStep{s.pos, s.attr, value};
}

auto invert(const DocAttrStep& s, const Node& doc) -> Step {
    auto old = doc.attrs().find(s.attr);
    return DocAttrStep{s.attr, old != doc.attrs().end() ? old->second : ScalarValue{Null{}}};
}

// -- map ----------------------------------------------------------------------

auto map(const ReplaceStep& s, const Mappable& mapping) -> std::optional<Step> {
    auto from = mapping.map_result(s.from, 1);
    auto to = mapping.map_result(s.to, -1);
    if (from.deleted_across() && to.deleted_across()) return std::nullopt;
    return ReplaceStep{from.pos, std::max(from.pos, to.pos), s.slice, s.structure};
}

auto map(const ReplaceAroundStep& s, const Mappable& mapping) -> std::optional<Step> {
    auto from = mapping.map_result(s.from, 1);
    auto to = mapping.map_result(s.to, -1);
    auto gap_from = s.from == s.gap_from ? from.pos : mapping.map(s.gap_from, -1);
    auto gap_to = s.to == s.gap_to ? to.pos : mapping.map(s.gap_to, 1);
    if ((from.deleted_across() && to.deleted_across()) || gap_from < from.pos || gap_to > to.pos) {
        return std::nullopt;
    }
    return ReplaceAroundStep{from.pos, to.pos, gap_from, gap_to, s.slice, s.insert, s.structure};
}

auto map(const AddMarkStep& s, const Mappable& mapping) -> std::optional<Step> {
    auto range = map_mark_range(s.from, s.to, mapping);
    if (!range) return std::nullopt;
    return AddMarkStep{range->first, range->second, s.mark};
}

auto map(const RemoveMarkStep& s, const Mappable& mapping) -> std::optional<Step> {
    auto range = map_mark_range(s.from, s.to, mapping);
    if (!range) return std::nullopt;
    return RemoveMarkStep{range->first, range->second, s.mark};
}

auto map(const AttrStep& s, const Mappable& mapping) -> std::optional<Step> {
    auto pos = mapping.map_result(s.pos, 1);
    if (pos.deleted_after()) return std::nullopt;
    return AttrStep{pos.pos, s.attr, s.value};
}

auto map(const DocAttrStep& s, const Mappable&) -> std::optional<Step> {
    return s;
}

// -- merge --------------------------------------------------------------------

auto merge(const ReplaceStep& a, const ReplaceStep& b) -> std::optional<Step> {
    if (a.structure || b.structure) return std::nullopt;
    auto joined_size = a.slice.size() + b.slice.size();
    if (a.from + a.slice.size() == b.from && !a.slice.open_end() && !b.slice.open_start()) {
        auto slice = joined_size == 0 ? Slice::empty()
            : Slice{a.slice.content().append(b.slice.content()), a.slice.open_start(), b.slice.open_end()};
        return ReplaceStep{a.from, a.to + (b.to - b.from), slice};
    }
    if (b.to == a.from && !a.slice.open_start() && !b.slice.open_end()) {
        auto slice = joined_size == 0 ? Slice::empty()
            : Slice{b.slice.content().append(a.slice.content()), b.slice.open_start(), a.slice.open_end()};
        return ReplaceStep{b.from, a.to, slice};
    }
    return std::nullopt;
}

template <typename MarkStep>
auto merge_mark(const MarkStep& a, const MarkStep& b) -> std::optional<Step> {
    if (b.mark.eq(a.mark) && a.from <= b.to && a.to >= b.from) {
        return MarkStep{std::min(a.from, b.from), std::max(a.to, b.to), a.mark};
    }
    return std::nullopt;
}

}  // namespace

auto StepResult::from_replace(const Node& doc, std::size_t from, std::size_t to,
                              const Slice& slice) -> StepResult {
    try {
        return ok(doc.replace(from, to, slice));
    } catch (const Exception& e) {
        if (e.kind() == ErrorKind::invalid_content) return fail(e.what());
        throw;
    }
}

void check_step(const Step& step) {
    auto inverted = [](std::size_t from, std::size_t to) {
        if (from > to) {
            throw Exception{ErrorKind::invalid_position,
                            "Inverted step range " + std::to_string(from) + "-" + std::to_string(to)};
        }
    };
    std::visit(overload{
        [&](const ReplaceStep& s) { inverted(s.from, s.to); },
        [&](const ReplaceAroundStep& s) {
            inverted(s.from, s.gap_from);
            inverted(s.gap_from, s.gap_to);
            inverted(s.gap_to, s.to);
            if (s.insert > s.slice.size()) {
                throw Exception{ErrorKind::invalid_position,
                                "Gap insert position " + std::to_string(s.insert) + " outside of slice"};
            }
        },
        [&](const AddMarkStep& s) { inverted(s.from, s.to); },
        [&](const RemoveMarkStep& s) { inverted(s.from, s.to); },
        [](const auto&) {},
    }, step);
}

auto apply_step(const Step& step, const Node& doc) -> StepResult {
    check_step(step);
    return std::visit([&](const auto& s) { return apply(s, doc); }, step);
}

auto step_map(const Step& step) -> StepMap {
    check_step(step);
    return std::visit(overload{
        [](const ReplaceStep& s) {
            return StepMap{{s.from, s.to - s.from, s.slice.size()}};
        },
        [](const ReplaceAroundStep& s) {
            return StepMap{{s.from, s.gap_from - s.from, s.insert},
                           {s.gap_to, s.to - s.gap_to, s.slice.size() - s.insert}};
        },
        [](const auto&) { return StepMap::empty(); },
    }, step);
}

auto invert_step(const Step& step, const Node& doc) -> Step {
    return std::visit([&](const auto& s) { return invert(s, doc); }, step);
}

auto map_step(const Step& step, const Mappable& mapping) -> std::optional<Step> {
    return std::visit([&](const auto& s) { return map(s, mapping); }, step);
}

auto merge_steps(const Step& step, const Step& other) -> std::optional<Step> {
    return std::visit(overload{
        [](const ReplaceStep& a, const ReplaceStep& b) { return merge(a, b); },
        [](const AddMarkStep& a, const AddMarkStep& b) { return merge_mark(a, b); },
        [](const RemoveMarkStep& a, const RemoveMarkStep& b) { return merge_mark(a, b); },
        [](const auto&, const auto&) -> std::optional<Step> { return std::nullopt; },
    }, step, other);
}

auto step_type_name(const Step& step) -> std::string_view {
    return std::visit(overload{
        [](const ReplaceStep&) -> std::string_view { return "replace"; },
        [](const ReplaceAroundStep&) -> std::string_view { return "replaceAround"; },
        [](const AddMarkStep&) -> std::string_view { return "addMark"; },
        [](const RemoveMarkStep&) -> std::string_view { return "removeMark"; },
        [](const AttrStep&) -> std::string_view { return "attr"; },
        [](const DocAttrStep&) -> std::string_view { return "docAttr"; },
    }, step);
}

}  // namespace folio_cpp
