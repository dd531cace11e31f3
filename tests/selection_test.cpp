#include "test_schema.hpp"

#include <gtest/gtest.h>

using namespace folio_cpp;
using namespace folio_cpp::test;

// -- Construction -------------------------------------------------------------

TEST(Selection, text_range_and_direction) {
    auto d = doc({p("hello"), p("world")});
    auto forward = Selection::text(d, 3, 5);
    auto backward = Selection::text(d, 5, 3);

    EXPECT_TRUE(forward.is_text());
    EXPECT_EQ(forward.from(), 3u);
    EXPECT_EQ(forward.to(), 5u);
    EXPECT_EQ(backward.anchor(), 5u);
    EXPECT_EQ(backward.head(), 3u);
    EXPECT_EQ(backward.from(), 3u);
    EXPECT_EQ(backward.to(), 5u);
    EXPECT_FALSE(forward.empty());
    EXPECT_EQ(forward.to_string(), "text(3-5)");
    EXPECT_EQ(forward.doc(), d);
}

TEST(Selection, cursor_only_for_empty_text_selection) {
    auto d = doc({p("hello")});
    auto cursor = Selection::text(d, 3);
    ASSERT_NE(cursor.cursor(), nullptr);
    EXPECT_EQ(cursor.cursor()->pos(), 3u);
    EXPECT_TRUE(cursor.empty());
    EXPECT_EQ(Selection::text(d, 2, 4).cursor(), nullptr);
    EXPECT_EQ(Selection::all(d).cursor(), nullptr);
}

TEST(Selection, content_is_an_open_slice) {
    auto d = doc({p("hello"), p("world")});
    auto content = Selection::text(d, 3, 5).content();
    EXPECT_TRUE(content.eq(Slice{Fragment::from(p("ll")), 1, 1})) << content.to_string();
}

TEST(Selection, node_selection) {
    auto d = doc({p("a"), hr(), p("b")});
    auto sel = Selection::node(d, 3);
    EXPECT_TRUE(sel.is_node());
    EXPECT_EQ(sel.from(), 3u);
    EXPECT_EQ(sel.to(), 4u);
    ASSERT_NE(sel.selected_node(), nullptr);
    EXPECT_EQ(sel.selected_node()->type().name(), "horizontal_rule");
    EXPECT_EQ(sel.to_string(), "node(3)");
}

TEST(Selection, node_selection_needs_a_node) {
    auto d = doc({p("a")});
    try {
        Selection::node(d, 3);
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_selection);
    }
}

TEST(Selection, all_covers_document) {
    auto d = doc({p("a"), hr()});
    auto sel = Selection::all(d);
    EXPECT_TRUE(sel.is_all());
    EXPECT_EQ(sel.from(), 0u);
    EXPECT_EQ(sel.to(), d->content().size());
    EXPECT_EQ(sel.to_string(), "all");
}

TEST(Selection, selectable_nodes) {
    EXPECT_TRUE(Selection::is_selectable(*hr()));
    EXPECT_TRUE(Selection::is_selectable(*img()));
    EXPECT_FALSE(Selection::is_selectable(*br()));
    EXPECT_FALSE(Selection::is_selectable(*t("x")));
}

// -- Searching ----------------------------------------------------------------

TEST(SelectionSearch, at_start_and_at_end) {
    auto d = doc({p("ab"), p("cd")});
    EXPECT_EQ(Selection::at_start(d).to_string(), "text(1-1)");
    EXPECT_EQ(Selection::at_end(d).to_string(), "text(7-7)");

    auto leading_rule = doc({hr(), p("a")});
    EXPECT_EQ(Selection::at_start(leading_rule).to_string(), "node(0)");
}

TEST(SelectionSearch, find_from_in_both_directions) {
    auto d = doc({p("a"), hr()});
    auto pos = d->resolve(3);

    auto backward = Selection::find_from(pos, -1);
    ASSERT_TRUE(backward.has_value());
    EXPECT_EQ(backward->to_string(), "text(2-2)");

    auto forward = Selection::find_from(pos, 1);
    ASSERT_TRUE(forward.has_value());
    EXPECT_EQ(forward->to_string(), "node(3)");

    EXPECT_FALSE(Selection::find_from(pos, 1, true).has_value());
}

TEST(SelectionSearch, near_prefers_bias_direction) {
    auto d = doc({p("a"), hr(), p("b")});
    EXPECT_EQ(Selection::near(d->resolve(3)).to_string(), "node(3)");
    EXPECT_EQ(Selection::near(d->resolve(3), -1).to_string(), "text(2-2)");
    EXPECT_EQ(Selection::near(d->resolve(4), 1).to_string(), "text(5-5)");
}

TEST(SelectionSearch, between_moves_ends_into_text) {
    auto d = doc({hr(), p("ab")});
    auto sel = Selection::between(d->resolve(0), d->resolve(0));
    EXPECT_EQ(sel.to_string(), "text(2-2)");

    auto range = Selection::between(d->resolve(0), d->resolve(3));
    EXPECT_EQ(range.head(), 3u);
    EXPECT_EQ(range.anchor(), 2u);
}

// -- Mapping ------------------------------------------------------------------

TEST(SelectionMapping, text_selection_follows_insertions) {
    auto d = doc({p("hello")});
    auto tr = Transform{d};
    tr.insert_text("XY", 1);
    auto mapped = Selection::text(d, 3, 5).map(tr.doc(), tr.mapping());
    EXPECT_EQ(mapped.to_string(), "text(5-7)");
    EXPECT_EQ(mapped.doc(), tr.doc());
}

TEST(SelectionMapping, deleted_node_selection_falls_back_to_near) {
    auto d = doc({p("a"), hr(), p("b")});
    auto tr = Transform{d};
    tr.delete_range(3, 4);
    auto mapped = Selection::node(d, 3).map(tr.doc(), tr.mapping());
    EXPECT_EQ(mapped.to_string(), "text(4-4)");
}

TEST(SelectionMapping, surviving_node_selection_stays_node) {
    auto d = doc({p("a"), hr()});
    auto tr = Transform{d};
    tr.insert_text("bc", 2);
    auto mapped = Selection::node(d, 3).map(tr.doc(), tr.mapping());
    EXPECT_EQ(mapped.to_string(), "node(5)");
}

TEST(SelectionMapping, all_stays_all) {
    auto d = doc({p("a")});
    auto tr = Transform{d};
    tr.insert_text("b", 2);
    auto mapped = Selection::all(d).map(tr.doc(), tr.mapping());
    EXPECT_TRUE(mapped.is_all());
    EXPECT_EQ(mapped.to(), 4u);
}

// -- Bookmarks ----------------------------------------------------------------

TEST(SelectionBookmark, map_and_resolve) {
    auto d = doc({p("hello")});
    auto bookmark = Selection::text(d, 2, 4).get_bookmark();
    EXPECT_EQ(bookmark, (SelectionBookmark{SelectionKind::text, 2, 4}));

    auto tr = Transform{d};
    tr.insert_text("__", 1);
    auto mapped = bookmark.map(tr.mapping());
    EXPECT_EQ(mapped, (SelectionBookmark{SelectionKind::text, 4, 6}));
    EXPECT_EQ(mapped.resolve(tr.doc()).to_string(), "text(4-6)");
}

TEST(SelectionBookmark, node_bookmark_degrades_when_deleted) {
    auto d = doc({p("a"), hr(), p("b")});
    auto bookmark = Selection::node(d, 3).get_bookmark();
    auto tr = Transform{d};
    tr.delete_range(3, 4);
    auto mapped = bookmark.map(tr.mapping());
    EXPECT_EQ(mapped.kind, SelectionKind::text);
    EXPECT_TRUE(mapped.resolve(tr.doc()).is_text());
}

TEST(SelectionBookmark, all_resolves_against_new_doc) {
    auto bookmark = Selection::all(doc({p("a")})).get_bookmark();
    auto other = doc({p("abc"), p("d")});
    auto sel = bookmark.resolve(other);
    EXPECT_TRUE(sel.is_all());
    EXPECT_EQ(sel.to(), other->content().size());
}

// -- Equality -----------------------------------------------------------------

TEST(Selection, equality) {
    auto d = doc({p("hello"), hr()});
    EXPECT_EQ(Selection::text(d, 1, 3), Selection::text(d, 1, 3));
    EXPECT_FALSE(Selection::text(d, 1, 3).eq(Selection::text(d, 3, 1)));
    EXPECT_EQ(Selection::node(d, 7), Selection::node(d, 7));
    EXPECT_FALSE(Selection::node(d, 7).eq(Selection::text(d, 7)));
    EXPECT_EQ(Selection::all(d), Selection::all(d));
}
