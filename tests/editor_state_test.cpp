#include "test_schema.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace folio_cpp;
using namespace folio_cpp::test;

namespace {

/// Counts the document-changing transactions a state has seen.
auto counter_plugin(const PluginKey<int>& key) -> Plugin {
    auto field = StateField<int>{
        .init = [](const EditorStateConfig&, const EditorState&) { return 0; },
        .apply = [](const Transaction& tr, const int& n, const EditorState&, const EditorState&) {
            return tr.doc_changed() ? n + 1 : n;
        },
        .to_json = [](const int& n) { return nlohmann::json(n); },
        .from_json = [](const EditorStateConfig&, const nlohmann::json& j, const EditorState&) {
            return j.get<int>();
        },
    };
    return Plugin{PluginSpec{.key = key, .state = field.erase()}};
}

/// Appends a "!" after every user change.
auto exclaim_plugin() -> Plugin {
    return Plugin{PluginSpec{
        .append_transaction = [](std::span<const Transaction> trs, const EditorState&,
                                 const EditorState& state) -> std::optional<Transaction> {
            auto changed = false;
            for (const auto& tr : trs) {
                if (tr.get_meta("appendedTransaction")) return std::nullopt;
                changed = changed || tr.doc_changed();
            }
            if (!changed) return std::nullopt;
            auto tr = state.tr();
            tr.insert_text("!", state.doc()->content().size() - 1);
            return tr.build();
        },
    }};
}

auto blocking_plugin() -> Plugin {
    return Plugin{PluginSpec{
        .filter_transaction = [](const Transaction& tr, const EditorState&) {
            return tr.get_meta("blocked") == nullptr;
        },
    }};
}

auto state_with(NodePtr d, std::vector<Plugin> plugins = {}) -> EditorState {
    return EditorState::create({.doc = std::move(d), .plugins = std::move(plugins)});
}

}  // namespace

// -- Creation -----------------------------------------------------------------

TEST(EditorState, create_from_schema_fills_document) {
    auto state = EditorState::create({.schema = schema()});
    EXPECT_TRUE(same_doc(state.doc(), doc({p()})));
    EXPECT_EQ(state.selection().to_string(), "text(1-1)");
    EXPECT_EQ(state.schema(), schema());
    EXPECT_FALSE(state.stored_marks().has_value());
    EXPECT_EQ(state.scroll_to_selection(), 0u);
}

TEST(EditorState, create_from_document_infers_schema) {
    auto d = doc({p("hello")});
    auto state = state_with(d);
    EXPECT_EQ(state.doc(), d);
    EXPECT_EQ(state.schema().get(), &d->type().schema());
}

TEST(EditorState, create_requires_schema_or_document) {
    try {
        EditorState::create({});
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_operation);
    }
}

TEST(EditorState, create_rejects_foreign_selection) {
    auto d = doc({p("hello")});
    auto other = doc({p("hello")});
    EXPECT_THROW(EditorState::create({.doc = d, .selection = Selection::text(other, 1)}), Exception);
}

TEST(EditorState, create_rejects_duplicate_plugin_keys) {
    auto key = PluginKey<int>{"count"};
    try {
        state_with(doc({p("a")}), {counter_plugin(key), counter_plugin(key)});
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_operation);
    }
}

// -- Applying -----------------------------------------------------------------

TEST(EditorState, apply_produces_a_new_state) {
    auto state = state_with(doc({p("hello")}));
    auto tr = state.tr();
    tr.insert_text("X");
    auto next = state.apply(tr.build());

    EXPECT_TRUE(same_doc(next.doc(), doc({p("Xhello")})));
    EXPECT_EQ(next.selection().to_string(), "text(2-2)");
    EXPECT_TRUE(same_doc(state.doc(), doc({p("hello")})));
}

TEST(EditorState, apply_rejects_mismatched_transaction) {
    auto state = state_with(doc({p("hello")}));
    auto other = state_with(doc({p("other")}));
    auto tr = other.tr();
    tr.insert_text("X");
    try {
        state.apply(tr.build());
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_operation);
    }
}

TEST(EditorState, stored_marks_survive_only_on_cursor) {
    auto state = state_with(doc({p("hello")}));
    auto tr = state.tr();
    tr.set_stored_marks(MarkSet{em()});
    auto with_marks = state.apply(tr.build());
    ASSERT_TRUE(with_marks.stored_marks().has_value());

    auto range = with_marks.tr();
    range.set_selection(Selection::text(range.doc(), 1, 3));
    range.set_stored_marks(MarkSet{em()});
    EXPECT_FALSE(with_marks.apply(range.build()).stored_marks().has_value());
}

TEST(EditorState, scroll_counter_increments) {
    auto state = state_with(doc({p("hello")}));
    auto tr = state.tr();
    tr.scroll_into_view();
    auto next = state.apply(tr.build());
    EXPECT_EQ(next.scroll_to_selection(), 1u);
    EXPECT_EQ(next.apply(next.tr().build()).scroll_to_selection(), 1u);
}

// -- Plugins ------------------------------------------------------------------

TEST(EditorStatePlugins, state_fields_follow_transactions) {
    auto key = PluginKey<int>{"count"};
    auto state = state_with(doc({p("hello")}), {counter_plugin(key)});
    ASSERT_NE(key.get_state(state), nullptr);
    EXPECT_EQ(*key.get_state(state), 0);

    auto tr = state.tr();
    tr.insert_text("a");
    state = state.apply(tr.build());
    state = state.apply(state.tr().build());
    EXPECT_EQ(*key.get_state(state), 1);

    ASSERT_NE(key.get(state), nullptr);
    EXPECT_EQ(key.get(state)->key(), key.key());
    EXPECT_EQ(*key.get(state)->get_state<int>(state), 1);
}

TEST(EditorStatePlugins, empty_transaction_keeps_doc_and_plugin_state) {
    auto key = PluginKey<int>{"count"};
    auto state = state_with(doc({p("hello")}), {counter_plugin(key)});
    auto tr = state.tr();
    tr.insert_text("a");
    state = state.apply(tr.build());
    ASSERT_EQ(*key.get_state(state), 1);

    auto next = state.apply(state.tr().build());
    EXPECT_EQ(next.doc(), state.doc());
    EXPECT_EQ(next.selection().to_string(), state.selection().to_string());
    EXPECT_EQ(*key.get_state(next), 1);
    EXPECT_FALSE(next.stored_marks().has_value());
}

TEST(EditorStatePlugins, missing_plugin_has_no_state) {
    auto key = PluginKey<int>{"absent"};
    auto state = state_with(doc({p("hello")}));
    EXPECT_EQ(key.get_state(state), nullptr);
    EXPECT_EQ(state.find_plugin(key.key()), nullptr);
    EXPECT_EQ(state.plugin_state(key), nullptr);
}

TEST(EditorStatePlugins, filtered_transaction_is_dropped) {
    auto state = state_with(doc({p("hello")}), {blocking_plugin()});
    auto tr = state.tr();
    tr.insert_text("X");
    tr.set_meta("blocked", true);
    auto result = state.apply_transaction(tr.build());
    EXPECT_TRUE(result.transactions.empty());
    EXPECT_EQ(result.state.doc(), state.doc());
}

TEST(EditorStatePlugins, appended_transactions_are_applied) {
    auto key = PluginKey<int>{"count"};
    auto d = doc({p("hi")});
    auto state = EditorState::create({.doc = d, .selection = Selection::text(d, 3),
                                      .plugins = {counter_plugin(key), exclaim_plugin()}});
    auto tr = state.tr();
    tr.insert_text("?");
    auto result = state.apply_transaction(tr.build());

    ASSERT_EQ(result.transactions.size(), 2u);
    EXPECT_EQ(result.transactions[1].meta<Transaction>("appendedTransaction")->doc(),
              result.transactions[0].doc());
    EXPECT_TRUE(same_doc(result.state.doc(), doc({p("hi?!")})));
    EXPECT_EQ(*key.get_state(result.state), 2);
}

TEST(EditorStatePlugins, append_respects_filters) {
    auto d = doc({p("hi")});
    auto blocker = Plugin{PluginSpec{
        .filter_transaction = [](const Transaction& tr, const EditorState&) {
            return !tr.doc()->text_content().ends_with("!");
        },
    }};
    auto state = EditorState::create({.doc = d, .selection = Selection::text(d, 3),
                                      .plugins = {exclaim_plugin(), blocker}});
    auto tr = state.tr();
    tr.insert_text("?");
    auto result = state.apply_transaction(tr.build());
    EXPECT_EQ(result.transactions.size(), 1u);
    EXPECT_TRUE(same_doc(result.state.doc(), doc({p("hi?")})));
}

TEST(EditorStatePlugins, reconfigure_keeps_existing_state) {
    auto kept = PluginKey<int>{"kept"};
    auto added = PluginKey<int>{"added"};
    auto state = state_with(doc({p("hello")}), {counter_plugin(kept)});
    auto tr = state.tr();
    tr.insert_text("a");
    state = state.apply(tr.build());

    auto next = state.reconfigure({counter_plugin(kept), counter_plugin(added)});
    EXPECT_EQ(*kept.get_state(next), 1);
    EXPECT_EQ(*added.get_state(next), 0);
    EXPECT_EQ(next.doc(), state.doc());
    EXPECT_EQ(next.plugins().size(), 2u);

    auto without = next.reconfigure({});
    EXPECT_EQ(kept.get_state(without), nullptr);
}

// -- JSON ---------------------------------------------------------------------

TEST(EditorStateJson, round_trip_with_plugin_fields) {
    auto key = PluginKey<int>{"count"};
    auto plugins = std::vector<Plugin>{counter_plugin(key)};
    auto d = doc({p("hello")});
    auto state = EditorState::create({.doc = d, .selection = Selection::text(d, 2, 4), .plugins = plugins});
    auto tr = state.tr();
    tr.insert_text("ab", 6);
    state = state.apply(tr.build());

    auto fields = PluginFields{{"count", key}};
    auto j = state.to_json(fields);
    EXPECT_EQ(j["doc"]["type"], "doc");
    EXPECT_EQ(j["selection"]["type"], "text");
    EXPECT_EQ(j["count"], 1);

    auto restored = EditorState::from_json({.schema = schema(), .plugins = plugins}, j, fields);
    EXPECT_TRUE(same_doc(restored.doc(), state.doc()));
    EXPECT_EQ(restored.selection().to_string(), state.selection().to_string());
    EXPECT_EQ(*key.get_state(restored), 1);

    auto fresh = EditorState::from_json({.schema = schema(), .plugins = plugins}, j);
    EXPECT_EQ(*key.get_state(fresh), 0);
}

TEST(EditorStateJson, stored_marks_are_serialized) {
    auto state = state_with(doc({p("hello")}));
    auto tr = state.tr();
    tr.set_stored_marks(MarkSet{strong()});
    state = state.apply(tr.build());
    auto j = state.to_json();
    ASSERT_TRUE(j.contains("storedMarks"));
    auto restored = EditorState::from_json({.schema = schema()}, j);
    ASSERT_TRUE(restored.stored_marks().has_value());
    EXPECT_TRUE(Mark::same_set(*restored.stored_marks(), MarkSet{strong()}));
}

TEST(EditorStateJson, reserved_field_names) {
    auto key = PluginKey<int>{"count"};
    auto state = state_with(doc({p("hello")}), {counter_plugin(key)});
    EXPECT_THROW(state.to_json(PluginFields{{"doc", key}}), Exception);
}

TEST(EditorStateJson, from_json_validates_input) {
    auto j = state_with(doc({p("hello")})).to_json();
    j.erase("selection");
    try {
        EditorState::from_json({.schema = schema()}, j);
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_json);
    }
    EXPECT_THROW(EditorState::from_json({}, j), Exception);
    EXPECT_THROW(EditorState::from_json({.schema = schema()}, nlohmann::json::array()), Exception);
}
