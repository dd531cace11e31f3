#include <folio-cpp/decoration.hpp>
#include <folio-cpp/error.hpp>

#include <algorithm>

namespace folio_cpp {

// -- Decoration ---------------------------------------------------------------

Decoration::Decoration(DecorationKind kind, std::size_t from, std::size_t to, DecorationAttrs attrs,
                       WidgetRenderer renderer, DecorationSpec spec)
    : kind_{kind}, from_{from}, to_{to}, attrs_{std::move(attrs)},
      renderer_{std::move(renderer)}, spec_{std::move(spec)} {}

auto Decoration::widget(std::size_t pos, WidgetRenderer renderer, DecorationSpec spec) -> Decoration {
    return Decoration{DecorationKind::widget, pos, pos, {}, std::move(renderer), std::move(spec)};
}

auto Decoration::inline_range(std::size_t from, std::size_t to, DecorationAttrs attrs,
                              DecorationSpec spec) -> Decoration {
    if (from > to) {
        throw Exception{ErrorKind::invalid_position,
                        "Inline decoration range " + std::to_string(from) + "-" + std::to_string(to) + " is inverted"};
    }
    return Decoration{DecorationKind::inline_range, from, to, std::move(attrs), {}, std::move(spec)};
}

auto Decoration::node(std::size_t from, std::size_t to, DecorationAttrs attrs,
                      DecorationSpec spec) -> Decoration {
    if (from >= to) {
        throw Exception{ErrorKind::invalid_position,
                        "Node decoration range " + std::to_string(from) + "-" + std::to_string(to) + " is empty"};
    }
    return Decoration{DecorationKind::node, from, to, std::move(attrs), {}, std::move(spec)};
}

auto Decoration::span(std::size_t from, std::size_t to, std::string tag, DecorationAttrs attrs,
                      DecorationSpec spec) -> Decoration {
    if (from > to) {
        throw Exception{ErrorKind::invalid_position,
                        "Span decoration range " + std::to_string(from) + "-" + std::to_string(to) + " is inverted"};
    }
    auto d = Decoration{DecorationKind::span, from, to, std::move(attrs), {}, std::move(spec)};
    d.tag_ = std::move(tag);
    return d;
}

auto Decoration::moved(std::size_t from, std::size_t to) const -> Decoration {
    auto copy = *this;
    copy.from_ = from;
    copy.to_ = to;
    return copy;
}

auto Decoration::map(const Mappable& mapping) const -> std::optional<Decoration> {
    switch (kind_) {
        case DecorationKind::widget: {
            auto result = mapping.map_result(from_, spec_.side < 0 ? -1 : 1);
            if (result.deleted()) return std::nullopt;
            return moved(result.pos, result.pos);
        }
        case DecorationKind::inline_range:
        case DecorationKind::span: {
            auto from = mapping.map(from_, spec_.inclusive_start ? -1 : 1);
            auto to = mapping.map(to_, spec_.inclusive_end ? 1 : -1);
            if (from >= to) return std::nullopt;
            return moved(from, to);
        }
        case DecorationKind::node: {
            auto from = mapping.map_result(from_, 1);
            if (from.deleted()) return std::nullopt;
            auto to = mapping.map_result(to_, -1);
            if (to.deleted() || to.pos <= from.pos) return std::nullopt;
            return moved(from.pos, to.pos);
        }
    }
    return std::nullopt;
}

auto Decoration::eq(const Decoration& other) const -> bool {
    return kind_ == other.kind_ && from_ == other.from_ && to_ == other.to_
        && attrs_ == other.attrs_ && tag_ == other.tag_ && spec_.key == other.spec_.key && spec_.side == other.spec_.side;
}

auto Decoration::to_string() const -> std::string {
    auto name = kind_ == DecorationKind::widget ? "widget"
              : kind_ == DecorationKind::node   ? "node"
              : kind_ == DecorationKind::span   ? "span"
                                                : "inline";
    return std::string{name} + "(" + std::to_string(from_) + "," + std::to_string(to_) + ")";
}

// -- DecorationSet ------------------------------------------------------------

DecorationSet::DecorationSet(std::vector<Decoration> sorted) : decorations_{std::move(sorted)} {}

void DecorationSet::sort(std::vector<Decoration>& decorations) {
    std::ranges::stable_sort(decorations, [](const Decoration& a, const Decoration& b) {
        if (a.from() != b.from()) return a.from() < b.from();
        auto a_widget = a.kind() == DecorationKind::widget;
        auto b_widget = b.kind() == DecorationKind::widget;
        if (a_widget && b_widget) return a.spec().side < b.spec().side;
        return a_widget && !b_widget;
    });
}

auto DecorationSet::create(const NodePtr& doc, std::vector<Decoration> decorations) -> DecorationSet {
    auto size = doc->content().size();
    for (const auto& d : decorations) {
        if (d.to() > size) {
            throw Exception{ErrorKind::invalid_position,
                            "Decoration " + d.to_string() + " outside of document of size " + std::to_string(size)};
        }
    }
    sort(decorations);
    return DecorationSet{std::move(decorations)};
}

auto DecorationSet::merge(const std::vector<DecorationSet>& sets) -> DecorationSet {
    auto all = std::vector<Decoration>{};
    for (const auto& set : sets) {
        all.insert(all.end(), set.decorations_.begin(), set.decorations_.end());
    }
    sort(all);
    return DecorationSet{std::move(all)};
}

auto DecorationSet::find(std::optional<std::size_t> start, std::optional<std::size_t> end,
                         const std::function<bool(const Decoration&)>& predicate) const
    -> std::vector<Decoration> {
    auto result = std::vector<Decoration>{};
    auto lo = start.value_or(0);
    for (const auto& d : decorations_) {
        if (end && d.from() > *end) break;
        if (d.to() < lo) continue;
        if (!predicate || predicate(d)) result.push_back(d);
    }
    return result;
}

auto DecorationSet::find_at(std::size_t pos) const -> std::vector<Decoration> {
    return find(pos, pos);
}

auto DecorationSet::find_widgets_at(std::size_t pos) const -> std::vector<Decoration> {
    return find(pos, pos, [pos](const Decoration& d) {
        return d.kind() == DecorationKind::widget && d.from() == pos;
    });
}

auto DecorationSet::find_inline_in(std::size_t from, std::size_t to) const -> std::vector<Decoration> {
    return find(from, to, [from, to](const Decoration& d) {
        return d.kind() == DecorationKind::inline_range && d.from() < to && d.to() > from;
    });
}

auto DecorationSet::find_spans_in(std::size_t from, std::size_t to) const -> std::vector<Decoration> {
    return find(from, to, [from, to](const Decoration& d) {
        return d.kind() == DecorationKind::span && d.from() < to && d.to() > from;
    });
}

auto DecorationSet::find_node_at(std::size_t pos) const -> std::vector<Decoration> {
    return find(pos, pos, [pos](const Decoration& d) {
        return d.kind() == DecorationKind::node && d.from() == pos;
    });
}

auto DecorationSet::map(const Mappable& mapping) const -> DecorationSet {
    auto mapped = std::vector<Decoration>{};
    mapped.reserve(decorations_.size());
    for (const auto& d : decorations_) {
        if (auto m = d.map(mapping)) mapped.push_back(std::move(*m));
    }
    sort(mapped);
    return DecorationSet{std::move(mapped)};
}

auto DecorationSet::add(const NodePtr& doc, std::vector<Decoration> decorations) const -> DecorationSet {
    auto all = decorations_;
    all.insert(all.end(), std::make_move_iterator(decorations.begin()),
               std::make_move_iterator(decorations.end()));
    return create(doc, std::move(all));
}

auto DecorationSet::remove(const std::vector<Decoration>& decorations) const -> DecorationSet {
    auto kept = std::vector<Decoration>{};
    for (const auto& d : decorations_) {
        auto drop = std::ranges::any_of(decorations, [&](const Decoration& r) { return r.eq(d); });
        if (!drop) kept.push_back(d);
    }
    return DecorationSet{std::move(kept)};
}

auto DecorationSet::remove_key(std::string_view key) const -> DecorationSet {
    auto kept = std::vector<Decoration>{};
    for (const auto& d : decorations_) {
        if (d.spec().key != key) kept.push_back(d);
    }
    return DecorationSet{std::move(kept)};
}

}  // namespace folio_cpp
