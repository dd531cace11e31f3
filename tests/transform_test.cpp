#include "test_schema.hpp"

#include <gtest/gtest.h>

#include <functional>

using namespace folio_cpp;
using namespace folio_cpp::test;

// -- Content ------------------------------------------------------------------

TEST(Transform, records_steps_docs_and_mapping) {
    auto d = doc({p("hello")});
    auto tr = Transform{d};
    tr.insert_text("X", 1);
    tr.insert_text("Y", 7);

    EXPECT_TRUE(tr.doc_changed());
    EXPECT_EQ(tr.steps().size(), 2u);
    EXPECT_EQ(tr.docs().front(), d);
    EXPECT_EQ(tr.before(), d);
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("XhelloY")})));
    EXPECT_EQ(tr.mapping().map(6), 8u);
}

TEST(Transform, null_document_is_rejected) {
    EXPECT_THROW(Transform{nullptr}, Exception);
}

TEST(Transform, insert_text_inherits_marks) {
    auto d = doc({p({t("ab", {em()})})});
    auto tr = Transform{d};
    tr.insert_text("c", 3);
    EXPECT_TRUE(same_doc(tr.doc(), doc({p({t("abc", {em()})})})));
}

TEST(Transform, insert_text_does_not_extend_links) {
    auto d = doc({p({t("ab", {link("x")})})});
    auto tr = Transform{d};
    tr.insert_text("c", 3);
    EXPECT_TRUE(same_doc(tr.doc(), doc({p({t("ab", {link("x")}), t("c")})})));
}

TEST(Transform, empty_text_deletes) {
    auto tr = Transform{doc({p("hello")})};
    tr.insert_text("", 2, 4);
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("hlo")})));
}

TEST(Transform, delete_range_joins_blocks) {
    auto tr = Transform{doc({p("hello"), p("world")})};
    tr.delete_range(3, 10);
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("herld")})));
}

TEST(Transform, inverted_ranges_throw_without_changing_the_doc) {
    auto d = doc({p("hello world")});
    auto tr = Transform{d};
    auto expect_invalid_position = [&](const std::function<void()>& fn) {
        try {
            fn();
            ADD_FAILURE() << "inverted range was accepted";
        } catch (const Exception& e) {
            EXPECT_EQ(e.kind(), ErrorKind::invalid_position) << e.what();
        }
    };
    expect_invalid_position([&] { tr.step(ReplaceStep{8, 3, Slice::empty()}); });
    expect_invalid_position([&] { static_cast<void>(tr.maybe_step(ReplaceStep{8, 3, Slice::empty()})); });
    expect_invalid_position([&] { tr.delete_range(8, 3); });
    expect_invalid_position([&] { tr.replace(8, 3, Slice{Fragment::from(t("X")), 0, 0}); });
    expect_invalid_position([&] { tr.insert_text("X", 8, 3); });
    expect_invalid_position([&] { tr.insert_text("", 8, 3); });
    expect_invalid_position([&] { static_cast<void>(replace_step(*d, 8, 3)); });
    EXPECT_FALSE(tr.doc_changed());
    EXPECT_TRUE(same_doc(tr.doc(), d));
}

TEST(Transform, step_failure_throws_step_failed) {
    auto tr = Transform{doc({p("hello")})};
    try {
        tr.step(ReplaceStep{2, 2, Slice{Fragment::from(p("x")), 0, 0}});
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::step_failed);
    }
    EXPECT_FALSE(tr.doc_changed());
}

TEST(Transform, maybe_step_reports_failure) {
    auto tr = Transform{doc({p("hello")})};
    auto result = tr.maybe_step(ReplaceStep{2, 2, Slice{Fragment::from(p("x")), 0, 0}});
    EXPECT_TRUE(result.failed.has_value());
    EXPECT_TRUE(tr.steps().empty());
}

// -- Fitting ------------------------------------------------------------------

TEST(ReplaceFit, noop_gives_no_step) {
    EXPECT_FALSE(replace_step(*doc({p("a")}), 1, 1).has_value());
}

TEST(ReplaceFit, wraps_inline_content_between_blocks) {
    auto d = doc({p("a"), p("b")});
    auto tr = Transform{d};
    tr.replace(3, 3, Slice{Fragment::from(t("new")), 0, 0});
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("a"), p("new"), p("b")})));
}

TEST(ReplaceFit, opens_closed_blocks_dropped_into_text) {
    auto d = doc({p("hello")});
    auto tr = Transform{d};
    tr.replace(3, 3, Slice{Fragment::from(p("XY")), 0, 0});
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("heXYllo")})));
}

TEST(ReplaceFit, inserts_block_at_block_boundary) {
    auto d = doc({p("a"), p("b")});
    auto tr = Transform{d};
    tr.insert(3, hr());
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("a"), hr(), p("b")})));
}

TEST(ReplaceFit, impossible_replace_does_nothing) {
    auto d = doc({code_block("abc")});
    auto tr = Transform{d};
    tr.replace(2, 2, Slice{Fragment::from(img()), 0, 0});
    EXPECT_FALSE(tr.doc_changed());
}

// -- Marks --------------------------------------------------------------------

TEST(TransformMarks, add_mark_over_mixed_content) {
    auto tr = Transform{doc({p({t("ab"), t("cd", {strong()})})})};
    tr.add_mark(2, 4, em());
    auto expected = doc({p({t("a"), t("b", {em()}), t("c", {em(), strong()}), t("d", {strong()})})});
    EXPECT_TRUE(same_doc(tr.doc(), expected)) << tr.doc()->to_string();
}

TEST(TransformMarks, add_mark_replaces_excluded_marks) {
    auto tr = Transform{doc({p({t("ab", {link("a")})})})};
    tr.add_mark(1, 3, link("b"));
    EXPECT_TRUE(same_doc(tr.doc(), doc({p({t("ab", {link("b")})})})));
}

TEST(TransformMarks, add_mark_spans_blocks) {
    auto tr = Transform{doc({p("ab"), p("cd")})};
    tr.add_mark(2, 6, em());
    EXPECT_TRUE(same_doc(tr.doc(), doc({p({t("a"), t("b", {em()})}), p({t("c", {em()}), t("d")})})));
}

TEST(TransformMarks, remove_mark_by_value_and_type) {
    auto d = doc({p({t("ab", {em(), strong()}), t("cd", {strong()})})});
    auto by_value = Transform{d};
    by_value.remove_mark(1, 5, strong());
    EXPECT_TRUE(same_doc(by_value.doc(), doc({p({t("ab", {em()}), t("cd")})})));

    auto by_type = Transform{d};
    by_type.remove_mark(1, 3, schema()->mark_type("em"));
    EXPECT_TRUE(same_doc(by_type.doc(), doc({p({t("abcd", {strong()})})})));

    auto all = Transform{d};
    all.remove_marks(1, 5);
    EXPECT_TRUE(same_doc(all.doc(), doc({p("abcd")})));
}

// -- Structure ----------------------------------------------------------------

TEST(TransformStructure, set_block_type_converts_textblocks) {
    auto tr = Transform{doc({p("a"), p("b"), hr()})};
    tr.set_block_type(0, 6, schema()->node_type("heading"), {{"level", std::int64_t{2}}});
    EXPECT_TRUE(same_doc(tr.doc(), doc({h(2, "a"), h(2, "b"), hr()})));
    EXPECT_EQ(tr.steps().size(), 2u);
}

TEST(TransformStructure, set_block_type_skips_incompatible_content) {
    auto tr = Transform{doc({p({t("a", {em()})})})};
    tr.set_block_type(0, 3, schema()->node_type("code_block"));
    EXPECT_FALSE(tr.doc_changed());
}

TEST(TransformStructure, set_block_type_requires_textblock) {
    auto tr = Transform{doc({p("a")})};
    EXPECT_THROW(tr.set_block_type(0, 3, schema()->node_type("blockquote")), Exception);
}

TEST(TransformStructure, set_node_markup_changes_type_and_attrs) {
    auto tr = Transform{doc({h(1, "a")})};
    tr.set_node_markup(0, nullptr, Attrs{{"level", std::int64_t{4}}});
    EXPECT_TRUE(same_doc(tr.doc(), doc({h(4, "a")})));
    tr.set_node_markup(0, &schema()->node_type("paragraph"), Attrs{});
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("a")})));
}

TEST(TransformStructure, set_node_markup_on_leaf) {
    auto tr = Transform{doc({p({img("a.png")})})};
    tr.set_node_markup(1, nullptr, Attrs{{"src", std::string{"b.png"}}});
    EXPECT_TRUE(same_doc(tr.doc(), doc({p({img("b.png")})})));
}

TEST(TransformStructure, set_node_attribute_and_doc_attribute) {
    auto tr = Transform{doc({h(1, "a")})};
    tr.set_node_attribute(0, "level", std::int64_t{5});
    tr.set_doc_attribute("lang", std::string{"fr"});
    EXPECT_EQ(get_attr<std::int64_t>(tr.doc()->child(0)->attrs(), "level"), 5);
    EXPECT_EQ(get_attr<std::string>(tr.doc()->attrs(), "lang"), "fr");
}

TEST(TransformStructure, split_and_join) {
    auto tr = Transform{doc({p("hello")})};
    tr.split(3);
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("he"), p("llo")})));
    tr.join(4);
    EXPECT_TRUE(same_doc(tr.doc(), doc({p("hello")})));
}

TEST(TransformStructure, split_with_a_new_type_after) {
    auto tr = Transform{doc({h(1, "title")})};
    tr.split(6, 1, {SplitType{&schema()->node_type("paragraph"), {}}});
    EXPECT_TRUE(same_doc(tr.doc(), doc({h(1, "title"), p()})));
}

TEST(TransformStructure, deep_split) {
    auto tr = Transform{doc({blockquote({p("ab")})})};
    tr.split(3, 2);
    EXPECT_TRUE(same_doc(tr.doc(), doc({blockquote({p("a")}), blockquote({p("b")})})));
}

// -- Queries ------------------------------------------------------------------

TEST(StructureQueries, can_split) {
    auto d = doc({p("hello"), blockquote({p("q")})});
    EXPECT_TRUE(can_split(*d, 3));
    EXPECT_TRUE(can_split(*d, 10, 2));
    EXPECT_FALSE(can_split(*d, 10, 3));
    EXPECT_FALSE(can_split(*d, 7));
}

TEST(StructureQueries, can_join) {
    auto d = doc({p("a"), p("b"), hr(), blockquote({p("c")})});
    EXPECT_TRUE(can_join(*d, 3));
    EXPECT_FALSE(can_join(*d, 6));
    EXPECT_FALSE(can_join(*d, 7));
}

TEST(StructureQueries, join_point_walks_outward) {
    auto d = doc({blockquote({p("a")}), blockquote({p("b")})});
    EXPECT_EQ(join_point(*d, 7), 5u);
    EXPECT_FALSE(join_point(*doc({p("a"), hr()}), 3).has_value());
}

TEST(StructureQueries, insert_point_moves_out_of_textblocks) {
    auto d = doc({p("ab"), p("cd")});
    const auto& rule = schema()->node_type("horizontal_rule");
    EXPECT_EQ(insert_point(*d, 4, rule), 4u);
    EXPECT_EQ(insert_point(*d, 1, rule), 0u);
    EXPECT_EQ(insert_point(*d, 3, rule), 4u);
    EXPECT_FALSE(insert_point(*d, 2, rule).has_value());
    EXPECT_EQ(insert_point(*d, 2, schema()->node_type("image")), 2u);
}
