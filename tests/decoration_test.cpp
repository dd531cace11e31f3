#include "test_schema.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace folio_cpp;
using namespace folio_cpp::test;

namespace {

auto widget(std::size_t pos, int side = 0, std::string key = {}) -> Decoration {
    return Decoration::widget(pos, [] { return std::any{std::string{"w"}}; },
                              DecorationSpec{.key = std::move(key), .side = side});
}

auto highlight(std::size_t from, std::size_t to, DecorationSpec spec = {}) -> Decoration {
    return Decoration::inline_range(from, to, {{"class", "hl"}}, std::move(spec));
}

auto positions(const std::vector<Decoration>& decorations) -> std::string {
    auto out = std::string{};
    for (const auto& d : decorations) {
        if (!out.empty()) out += ' ';
        out += d.to_string();
    }
    return out;
}

}  // namespace

// -- Decoration ---------------------------------------------------------------

TEST(Decoration, construction) {
    auto w = widget(3, -1, "cursor");
    EXPECT_EQ(w.kind(), DecorationKind::widget);
    EXPECT_EQ(w.from(), 3u);
    EXPECT_EQ(w.to(), 3u);
    EXPECT_EQ(w.spec().key, "cursor");
    ASSERT_TRUE(w.renderer());
    EXPECT_EQ(std::any_cast<std::string>(w.renderer()()), "w");
    EXPECT_EQ(w.to_string(), "widget(3,3)");

    auto n = Decoration::node(0, 3, {{"class", "selected"}});
    EXPECT_EQ(n.kind(), DecorationKind::node);
    EXPECT_EQ(n.attrs().at("class"), "selected");
    EXPECT_EQ(n.to_string(), "node(0,3)");

    EXPECT_EQ(highlight(2, 2).to_string(), "inline(2,2)");

    auto s = Decoration::span(1, 4, "a", {{"href", "#top"}}, {.key = "link"});
    EXPECT_EQ(s.kind(), DecorationKind::span);
    EXPECT_EQ(s.tag(), "a");
    EXPECT_EQ(s.to_string(), "span(1,4)");
    EXPECT_TRUE(highlight(1, 4).tag().empty());
}

TEST(Decoration, invalid_ranges) {
    try {
        highlight(4, 2);
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_position);
    }
    EXPECT_THROW(Decoration::node(3, 3, {}), Exception);
    EXPECT_THROW(Decoration::span(5, 1, "mark"), Exception);
}

TEST(Decoration, equality_uses_range_attrs_and_key) {
    EXPECT_TRUE(highlight(1, 3).eq(highlight(1, 3)));
    EXPECT_FALSE(highlight(1, 3).eq(highlight(1, 4)));
    EXPECT_FALSE(highlight(1, 3).eq(Decoration::inline_range(1, 3, {{"class", "other"}})));
    EXPECT_FALSE(widget(2, 0, "a").eq(widget(2, 0, "b")));
    EXPECT_FALSE(widget(2).eq(Decoration::inline_range(2, 2, {})));
    EXPECT_FALSE(Decoration::span(1, 3, "mark").eq(Decoration::span(1, 3, "em")));
    EXPECT_FALSE(Decoration::span(1, 3, "mark", {{"class", "hl"}}).eq(highlight(1, 3)));
}

// -- Mapping ------------------------------------------------------------------

TEST(DecorationMapping, widget_side_decides_insert_behavior) {
    auto tr = Transform{doc({p("abcdef")})};
    tr.insert_text("XY", 3);
    EXPECT_EQ(widget(3).map(tr.mapping())->from(), 5u);
    EXPECT_EQ(widget(3, -1).map(tr.mapping())->from(), 3u);
    EXPECT_EQ(widget(2).map(tr.mapping())->from(), 2u);
}

TEST(DecorationMapping, widget_dropped_when_its_side_is_deleted) {
    auto tr = Transform{doc({p("abcdef")})};
    tr.delete_range(2, 4);
    EXPECT_FALSE(widget(3).map(tr.mapping()).has_value());
    EXPECT_FALSE(widget(2, 1).map(tr.mapping()).has_value());
    ASSERT_TRUE(widget(2, -1).map(tr.mapping()).has_value());
    EXPECT_EQ(widget(4).map(tr.mapping())->from(), 2u);
}

TEST(DecorationMapping, inline_inclusive_flags) {
    auto at_start = Transform{doc({p("abcdef")})};
    at_start.insert_text("XY", 2);
    EXPECT_EQ(highlight(2, 5).map(at_start.mapping())->to_string(), "inline(4,7)");
    EXPECT_EQ(highlight(2, 5, {.inclusive_start = true}).map(at_start.mapping())->to_string(), "inline(2,7)");

    auto at_end = Transform{doc({p("abcdef")})};
    at_end.insert_text("XY", 5);
    EXPECT_EQ(highlight(2, 5).map(at_end.mapping())->to_string(), "inline(2,5)");
    EXPECT_EQ(highlight(2, 5, {.inclusive_end = true}).map(at_end.mapping())->to_string(), "inline(2,7)");
}

TEST(DecorationMapping, inline_dropped_when_collapsed) {
    auto tr = Transform{doc({p("abcdef")})};
    tr.delete_range(1, 6);
    EXPECT_FALSE(highlight(2, 4).map(tr.mapping()).has_value());
    EXPECT_FALSE(highlight(3, 3).map(tr.mapping()).has_value());
}

TEST(DecorationMapping, inline_truncated_by_overlapping_delete) {
    auto map = StepMap{{3, 4, 0}};
    auto cut = highlight(5, 10).map(map);
    ASSERT_TRUE(cut.has_value());
    EXPECT_EQ(cut->from(), 3u);
    EXPECT_EQ(cut->to(), 6u);
    EXPECT_FALSE(highlight(4, 6).map(map).has_value());
    EXPECT_EQ(highlight(1, 3).map(map)->to_string(), "inline(1,3)");
}

TEST(DecorationMapping, span_maps_like_inline) {
    auto mark = Decoration::span(2, 5, "mark", {{"class", "hl"}});
    auto tr = Transform{doc({p("abcdef")})};
    tr.insert_text("XY", 2);
    auto mapped = mark.map(tr.mapping());
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->to_string(), "span(4,7)");
    EXPECT_EQ(mapped->tag(), "mark");
    EXPECT_EQ(mapped->attrs().at("class"), "hl");

    auto gone = Transform{doc({p("abcdef")})};
    gone.delete_range(1, 6);
    EXPECT_FALSE(mark.map(gone.mapping()).has_value());
}

TEST(DecorationMapping, node_decoration_follows_its_node) {
    auto d = doc({p("a"), p("b")});
    auto deco = Decoration::node(3, 6, {{"class", "x"}});

    auto before = Transform{d};
    before.delete_range(0, 3);
    EXPECT_EQ(deco.map(before.mapping())->to_string(), "node(0,3)");

    auto inside = Transform{d};
    inside.insert_text("c", 5);
    EXPECT_EQ(deco.map(inside.mapping())->to_string(), "node(3,7)");

    auto removed = Transform{d};
    removed.delete_range(3, 6);
    EXPECT_FALSE(deco.map(removed.mapping()).has_value());
}

// -- DecorationSet ------------------------------------------------------------

TEST(DecorationSet, create_sorts_and_validates) {
    auto d = doc({p("hello")});
    auto set = DecorationSet::create(d, {highlight(1, 3), widget(1, 1), widget(1, -1), widget(0)});
    EXPECT_EQ(positions(set.decorations()), "widget(0,0) widget(1,1) widget(1,1) inline(1,3)");
    EXPECT_EQ(set.decorations()[1].spec().side, -1);
    EXPECT_EQ(set.size(), 4u);

    EXPECT_THROW(DecorationSet::create(d, {highlight(1, 9)}), Exception);
    EXPECT_TRUE(DecorationSet::empty_set().empty());
}

TEST(DecorationSet, queries) {
    auto d = doc({p("hello"), p("world")});
    auto set = DecorationSet::create(d, {
        widget(3),
        highlight(2, 5),
        highlight(9, 12),
        Decoration::node(7, 14, {{"class", "second"}}),
    });

    EXPECT_EQ(set.find().size(), 4u);
    EXPECT_EQ(positions(set.find(0, 6)), "inline(2,5) widget(3,3)");
    EXPECT_EQ(positions(set.find_at(3)), "inline(2,5) widget(3,3)");
    EXPECT_EQ(positions(set.find_widgets_at(3)), "widget(3,3)");
    EXPECT_TRUE(set.find_widgets_at(2).empty());
    EXPECT_EQ(positions(set.find_inline_in(4, 10)), "inline(2,5) inline(9,12)");
    EXPECT_TRUE(set.find_inline_in(5, 9).empty());
    EXPECT_EQ(positions(set.find_node_at(7)), "node(7,14)");
    EXPECT_TRUE(set.find_node_at(8).empty());

    auto spans = DecorationSet::create(d, {Decoration::span(2, 5, "mark"), highlight(2, 5)});
    EXPECT_EQ(positions(spans.find_spans_in(4, 10)), "span(2,5)");
    EXPECT_TRUE(spans.find_spans_in(5, 9).empty());

    auto only_nodes = set.find(std::nullopt, std::nullopt, [](const Decoration& deco) {
        return deco.kind() == DecorationKind::node;
    });
    EXPECT_EQ(only_nodes.size(), 1u);
}

TEST(DecorationSet, map_drops_lost_decorations) {
    auto d = doc({p("hello"), p("world")});
    auto set = DecorationSet::create(d, {widget(3), highlight(8, 10), Decoration::node(7, 14, {})});
    auto tr = Transform{d};
    tr.delete_range(7, 14);
    auto mapped = set.map(tr.mapping());
    EXPECT_EQ(positions(mapped.decorations()), "widget(3,3)");
}

TEST(DecorationSet, merge_add_and_remove) {
    auto d = doc({p("hello")});
    auto a = DecorationSet::create(d, {highlight(3, 5)});
    auto b = DecorationSet::create(d, {widget(1, 0, "cursor")});
    auto merged = DecorationSet::merge({a, b});
    EXPECT_EQ(positions(merged.decorations()), "widget(1,1) inline(3,5)");

    auto added = merged.add(d, {highlight(1, 2, {.key = "search"}), highlight(4, 6, {.key = "search"})});
    EXPECT_EQ(added.size(), 4u);
    EXPECT_THROW(merged.add(d, {widget(20)}), Exception);

    EXPECT_EQ(positions(added.remove({highlight(3, 5)}).decorations()),
              "widget(1,1) inline(1,2) inline(4,6)");
    EXPECT_EQ(positions(added.remove_key("search").decorations()), "widget(1,1) inline(3,5)");
    EXPECT_EQ(merged.size(), 2u);
}
