#include "test_schema.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace folio_cpp;
using namespace folio_cpp::test;

namespace {

auto make_state(NodePtr d, HistoryOptions options = {}, std::vector<Plugin> extra = {}) -> EditorState {
    auto plugins = std::vector<Plugin>{history(options)};
    plugins.insert(plugins.end(), extra.begin(), extra.end());
    return EditorState::create({.doc = std::move(d), .plugins = std::move(plugins)});
}

auto type(const EditorState& state, std::string_view text, std::int64_t time) -> EditorState {
    auto tr = state.tr();
    tr.set_time(time);
    tr.insert_text(text);
    return state.apply(tr.build());
}

auto run(const EditorState& state, bool (*command)(const EditorState&, const Dispatch&)) -> EditorState {
    auto next = state;
    auto ran = command(state, [&](const Transaction& tr) { next = state.apply(tr); });
    EXPECT_TRUE(ran);
    return next;
}

}  // namespace

TEST(History, commands_need_the_plugin) {
    auto state = EditorState::create({.doc = doc({p("a")})});
    EXPECT_FALSE(undo(state));
    EXPECT_FALSE(redo(state));
    EXPECT_EQ(undo_depth(state), 0u);
    EXPECT_EQ(redo_depth(state), 0u);
}

TEST(History, nothing_to_undo_initially) {
    auto state = make_state(doc({p()}));
    ASSERT_NE(history_key().get_state(state), nullptr);
    EXPECT_FALSE(undo(state));
    EXPECT_FALSE(redo(state));
}

TEST(History, undo_and_redo_a_change) {
    auto state = type(make_state(doc({p()})), "a", 1000);
    EXPECT_EQ(undo_depth(state), 1u);

    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p()})));
    EXPECT_EQ(undo_depth(state), 0u);
    EXPECT_EQ(redo_depth(state), 1u);
    EXPECT_EQ(state.selection().to_string(), "text(1-1)");

    state = run(state, redo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("a")})));
    EXPECT_EQ(undo_depth(state), 1u);
    EXPECT_EQ(redo_depth(state), 0u);
}

TEST(History, check_without_dispatch_leaves_state_alone) {
    auto state = type(make_state(doc({p()})), "a", 1000);
    EXPECT_TRUE(undo(state));
    EXPECT_EQ(undo_depth(state), 1u);
}

TEST(History, adjacent_quick_changes_form_one_event) {
    auto state = make_state(doc({p()}));
    state = type(state, "a", 1000);
    state = type(state, "b", 1100);
    state = type(state, "c", 1200);
    EXPECT_EQ(undo_depth(state), 1u);

    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p()})));
}

TEST(History, delay_starts_new_event) {
    auto state = make_state(doc({p()}));
    state = type(state, "a", 1000);
    state = type(state, "b", 2000);
    EXPECT_EQ(undo_depth(state), 2u);

    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("a")})));
}

TEST(History, custom_group_delay) {
    auto state = make_state(doc({p()}), HistoryOptions{.new_group_delay = 5000});
    state = type(state, "a", 1000);
    state = type(state, "b", 4000);
    EXPECT_EQ(undo_depth(state), 1u);
}

TEST(History, distant_change_starts_new_event) {
    auto state = make_state(doc({p("hello")}));
    state = type(state, "a", 1000);
    auto tr = state.tr();
    tr.set_time(1100);
    tr.insert_text("z", 7);
    state = state.apply(tr.build());
    EXPECT_EQ(undo_depth(state), 2u);

    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("ahello")})));
}

TEST(History, close_history_splits_events) {
    auto state = make_state(doc({p()}));
    state = type(state, "a", 1000);
    auto tr = state.tr();
    tr.set_time(1100);
    close_history(tr);
    tr.insert_text("b");
    state = state.apply(tr.build());
    EXPECT_EQ(undo_depth(state), 2u);
}

TEST(History, untracked_changes_are_mapped_over) {
    auto state = make_state(doc({p()}));
    state = type(state, "a", 1000);

    auto tr = state.tr();
    tr.set_meta("addToHistory", false);
    tr.insert_text("X", 1);
    state = state.apply(tr.build());
    EXPECT_TRUE(same_doc(state.doc(), doc({p("Xa")})));
    EXPECT_EQ(undo_depth(state), 1u);

    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("X")})));
}

TEST(History, new_change_clears_redo) {
    auto state = make_state(doc({p()}));
    state = type(state, "a", 1000);
    state = run(state, undo);
    EXPECT_EQ(redo_depth(state), 1u);
    state = type(state, "b", 3000);
    EXPECT_EQ(redo_depth(state), 0u);
    EXPECT_FALSE(redo(state));
}

TEST(History, repeated_undo_redo_cycles) {
    auto state = make_state(doc({p()}));
    state = type(state, "a", 1000);
    state = type(state, "b", 3000);
    state = run(state, undo);
    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p()})));
    EXPECT_EQ(redo_depth(state), 2u);
    state = run(state, redo);
    state = run(state, redo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("ab")})));
    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("a")})));
}

TEST(History, depth_limits_events) {
    auto state = make_state(doc({p()}), HistoryOptions{.depth = 2});
    for (int i = 0; i < 23; ++i) {
        state = type(state, "x", 1000 + i * 1000);
    }
    EXPECT_EQ(undo_depth(state), 2u);
    state = run(state, undo);
    state = run(state, undo);
    EXPECT_FALSE(undo(state));
    EXPECT_EQ(state.doc()->text_content(), std::string(21, 'x'));
}

TEST(History, scroll_variants) {
    auto state = type(make_state(doc({p()})), "a", 1000);
    auto scrolled = run(state, undo);
    EXPECT_EQ(scrolled.scroll_to_selection(), state.scroll_to_selection() + 1);
    auto quiet = run(state, undo_no_scroll);
    EXPECT_EQ(quiet.scroll_to_selection(), state.scroll_to_selection());
    EXPECT_TRUE(same_doc(quiet.doc(), doc({p()})));

    auto redone = run(quiet, redo_no_scroll);
    EXPECT_EQ(redone.scroll_to_selection(), quiet.scroll_to_selection());
    EXPECT_TRUE(same_doc(redone.doc(), doc({p("a")})));
}

TEST(History, history_transactions_are_tagged) {
    auto state = type(make_state(doc({p()})), "a", 1000);
    auto captured = std::optional<Transaction>{};
    undo(state, [&](const Transaction& tr) { captured = tr; });
    ASSERT_TRUE(captured.has_value());
    EXPECT_TRUE(is_history_transaction(*captured));
    EXPECT_FALSE(is_history_transaction(state.tr().build()));
    const auto* meta = captured->meta<HistoryMeta>(history_key());
    ASSERT_NE(meta, nullptr);
    EXPECT_FALSE(meta->redo);
}

TEST(History, appended_transactions_join_the_event) {
    auto exclaim = Plugin{PluginSpec{
        .append_transaction = [](std::span<const Transaction> trs, const EditorState&,
                                 const EditorState& state) -> std::optional<Transaction> {
            for (const auto& tr : trs) {
                if (!tr.doc_changed() || is_history_transaction(tr) || tr.get_meta("appendedTransaction")) {
                    return std::nullopt;
                }
            }
            auto tr = state.tr();
            tr.insert_text("!", state.doc()->content().size() - 1);
            return tr.build();
        },
    }};
    auto d = doc({p("hi")});
    auto state = EditorState::create({.doc = d, .selection = Selection::text(d, 3),
                                      .plugins = {history(), exclaim}});
    state = type(state, "?", 1000);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("hi?!")})));
    EXPECT_EQ(undo_depth(state), 1u);

    state = run(state, undo);
    EXPECT_TRUE(same_doc(state.doc(), doc({p("hi")})));
}
