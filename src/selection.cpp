#include <folio-cpp/selection.hpp>
#include <folio-cpp/error.hpp>
#include <folio-cpp/transaction.hpp>

#include <algorithm>
#include <cstdint>

namespace folio_cpp {

namespace {

auto find_selection_in(const NodePtr& doc, const NodePtr& node, std::int64_t pos, std::int64_t index,
                       int dir, bool text_only) -> std::optional<Selection> {
    if (node->inline_content()) return Selection::text(doc, static_cast<std::size_t>(pos));
    auto count = static_cast<std::int64_t>(node->child_count());
    for (auto i = index - (dir > 0 ? 0 : 1); dir > 0 ? i < count : i >= 0; i += dir) {
        const auto& child = node->child(static_cast<std::size_t>(i));
        auto size = static_cast<std::int64_t>(child->node_size());
        if (!child->is_atom()) {
            auto inner = find_selection_in(doc, child, pos + dir,
                                           dir < 0 ? static_cast<std::int64_t>(child->child_count()) : 0,
                                           dir, text_only);
            if (inner) return inner;
        } else if (!text_only && Selection::is_selectable(*child)) {
            return Selection::node(doc, static_cast<std::size_t>(pos - (dir < 0 ? size : 0)));
        }
        pos += size * dir;
    }
    return std::nullopt;
}

/// Move the selection to the end of what the last step inserted.
void selection_to_insertion_end(TransactionBuilder& tr, std::size_t start_len, int bias) {
    const auto& steps = tr.steps();
    if (steps.size() <= start_len) return;
    const auto& last = steps.back();
    if (!std::holds_alternative<ReplaceStep>(last) && !std::holds_alternative<ReplaceAroundStep>(last)) return;
    auto end = std::optional<std::size_t>{};
    tr.mapping().maps().back().for_each([&](std::size_t, std::size_t, std::size_t, std::size_t new_to) {
        if (!end) end = new_to;
    });
    if (!end) return;
    tr.set_selection(Selection::near(tr.doc()->resolve(*end), bias));
}

}  // namespace

// -- SelectionBookmark --------------------------------------------------------

auto SelectionBookmark::map(const Mappable& mapping) const -> SelectionBookmark {
    switch (kind) {
        case SelectionKind::text:
            return {SelectionKind::text, mapping.map(anchor), mapping.map(head)};
        case SelectionKind::node: {
            auto result = mapping.map_result(anchor);
            if (result.deleted()) return {SelectionKind::text, result.pos, result.pos};
            return {SelectionKind::node, result.pos, result.pos};
        }
        case SelectionKind::all:
            return *this;
    }
    return *this;
}

auto SelectionBookmark::resolve(const NodePtr& doc) const -> Selection {
    switch (kind) {
        case SelectionKind::node: {
            auto pos = doc->resolve(anchor);
            auto node = pos.node_after();
            if (node && Selection::is_selectable(*node)) return Selection::node(pos);
            return Selection::near(pos);
        }
        case SelectionKind::all:
            return Selection::all(doc);
        case SelectionKind::text:
            break;
    }
    return Selection::between(doc->resolve(anchor), doc->resolve(head));
}

// -- Selection ----------------------------------------------------------------

Selection::Selection(SelectionKind kind, ResolvedPos anchor, ResolvedPos head, NodePtr node)
    : kind_{kind}, anchor_{std::move(anchor)}, head_{std::move(head)}, node_{std::move(node)} {}

auto Selection::text(const ResolvedPos& anchor, std::optional<ResolvedPos> head) -> Selection {
    return Selection{SelectionKind::text, anchor, head.value_or(anchor)};
}

auto Selection::text(const NodePtr& doc, std::size_t anchor, std::optional<std::size_t> head) -> Selection {
    auto ranchor = doc->resolve(anchor);
    return text(ranchor, head ? doc->resolve(*head) : ranchor);
}

auto Selection::between(const ResolvedPos& anchor_in, const ResolvedPos& head_in, int bias) -> Selection {
    auto anchor = anchor_in;
    auto head = head_in;
    auto d_pos = static_cast<std::int64_t>(anchor.pos()) - static_cast<std::int64_t>(head.pos());
    if (!bias || d_pos) bias = d_pos >= 0 ? 1 : -1;
    if (!head.parent()->inline_content()) {
        auto found = find_from(head, bias, true);
        if (!found) found = find_from(head, -bias, true);
        if (!found) return near(head, bias);
        head = found->resolved_head();
    }
    if (!anchor.parent()->inline_content()) {
        if (d_pos == 0) {
            anchor = head;
        } else {
            auto found = find_from(anchor, -bias, true);
            if (!found) found = find_from(anchor, bias, true);
            if (found) anchor = found->resolved_anchor();
            if ((anchor.pos() < head.pos()) != (d_pos < 0)) anchor = head;
        }
    }
    return text(anchor, head);
}

auto Selection::node(const ResolvedPos& pos) -> Selection {
    auto node = pos.node_after();
    if (!node) throw Exception{ErrorKind::invalid_selection, "No node after position " + std::to_string(pos.pos())};
    auto end = pos.doc()->resolve(pos.pos() + node->node_size());
    return Selection{SelectionKind::node, pos, std::move(end), std::move(node)};
}

auto Selection::node(const NodePtr& doc, std::size_t pos) -> Selection {
    return node(doc->resolve(pos));
}

auto Selection::all(const NodePtr& doc) -> Selection {
    return Selection{SelectionKind::all, doc->resolve(0), doc->resolve(doc->content().size())};
}

auto Selection::near(const ResolvedPos& pos, int bias) -> Selection {
    if (auto found = find_from(pos, bias)) return *found;
    if (auto found = find_from(pos, -bias)) return *found;
    return all(pos.doc());
}

auto Selection::find_from(const ResolvedPos& pos, int dir, bool text_only) -> std::optional<Selection> {
    const auto& doc = pos.doc();
    if (pos.parent()->inline_content()) return text(pos);
    auto inner = find_selection_in(doc, pos.parent(), static_cast<std::int64_t>(pos.pos()),
                                   static_cast<std::int64_t>(pos.index()), dir, text_only);
    if (inner) return inner;
    for (auto depth = pos.depth(); depth-- > 0;) {
        auto found = dir < 0
            ? find_selection_in(doc, pos.node(depth), static_cast<std::int64_t>(pos.before(depth + 1)),
                                static_cast<std::int64_t>(pos.index(depth)), dir, text_only)
            : find_selection_in(doc, pos.node(depth), static_cast<std::int64_t>(pos.after(depth + 1)),
                                static_cast<std::int64_t>(pos.index(depth)) + 1, dir, text_only);
        if (found) return found;
    }
    return std::nullopt;
}

auto Selection::at_start(const NodePtr& doc) -> Selection {
    auto found = find_selection_in(doc, doc, 0, 0, 1, false);
    return found ? *found : all(doc);
}

auto Selection::at_end(const NodePtr& doc) -> Selection {
    auto found = find_selection_in(doc, doc, static_cast<std::int64_t>(doc->content().size()),
                                   static_cast<std::int64_t>(doc->child_count()), -1, false);
    return found ? *found : all(doc);
}

auto Selection::is_selectable(const Node& node) -> bool {
    return !node.is_text() && node.type().spec().selectable;
}

auto Selection::resolved_from() const -> const ResolvedPos& {
    return anchor_.pos() <= head_.pos() ? anchor_ : head_;
}

auto Selection::resolved_to() const -> const ResolvedPos& {
    return anchor_.pos() <= head_.pos() ? head_ : anchor_;
}

auto Selection::cursor() const -> const ResolvedPos* {
    return kind_ == SelectionKind::text && anchor_.pos() == head_.pos() ? &head_ : nullptr;
}

auto Selection::content() const -> Slice {
    return doc()->slice(from(), to(), true);
}

auto Selection::map(const NodePtr& doc, const Mappable& mapping) const -> Selection {
    switch (kind_) {
        case SelectionKind::text: {
            auto head = doc->resolve(mapping.map(head_.pos()));
            if (!head.parent()->inline_content()) return near(head);
            auto anchor = doc->resolve(mapping.map(anchor_.pos()));
            return text(anchor.parent()->inline_content() ? anchor : head, head);
        }
        case SelectionKind::node: {
            auto result = mapping.map_result(anchor_.pos());
            auto pos = doc->resolve(result.pos);
            if (result.deleted() || !pos.node_after()) return near(pos);
            return node(pos);
        }
        case SelectionKind::all:
            break;
    }
    return all(doc);
}

auto Selection::get_bookmark() const -> SelectionBookmark {
    return SelectionBookmark{kind_, anchor_.pos(), head_.pos()};
}

void Selection::replace(TransactionBuilder& tr, const Slice& content) const {
    if (kind_ == SelectionKind::all && content.content().size() == 0) {
        auto filled = tr.doc()->type().create_and_fill({}, Fragment{}, {});
        tr.replace_with(0, tr.doc()->content().size(), filled ? filled->content() : Fragment{});
        auto sel = at_start(tr.doc());
        if (!sel.eq(tr.selection())) tr.set_selection(sel);
        return;
    }

    auto last_node = content.content().last_child();
    NodePtr last_parent;
    for (std::size_t i = 0; i < content.open_end() && last_node; ++i) {
        last_parent = last_node;
        last_node = last_node->last_child();
    }
    auto map_from = tr.steps().size();
    tr.replace(from(), to(), content);
    auto inline_end = last_node ? last_node->is_inline() : last_parent && last_parent->is_textblock();
    selection_to_insertion_end(tr, map_from, inline_end ? -1 : 1);
}

void Selection::replace_with(TransactionBuilder& tr, const NodePtr& node) const {
    auto map_from = tr.steps().size();
    tr.replace_with(from(), to(), node);
    selection_to_insertion_end(tr, map_from, node->is_inline() ? -1 : 1);
}

auto Selection::eq(const Selection& other) const -> bool {
    if (kind_ != other.kind_) return false;
    if (kind_ == SelectionKind::all) return true;
    if (kind_ == SelectionKind::node) return anchor_.pos() == other.anchor_.pos();
    return anchor_.pos() == other.anchor_.pos() && head_.pos() == other.head_.pos();
}

auto Selection::to_string() const -> std::string {
    switch (kind_) {
        case SelectionKind::node: return "node(" + std::to_string(anchor()) + ")";
        case SelectionKind::all:  return "all";
        case SelectionKind::text: break;
    }
    return "text(" + std::to_string(anchor()) + "-" + std::to_string(head()) + ")";
}

}  // namespace folio_cpp
