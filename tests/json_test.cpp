#include "test_schema.hpp"

#include <folio-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

using namespace folio_cpp;
using namespace folio_cpp::test;
using json = nlohmann::json;

namespace {

auto expect_invalid_json(const std::function<void()>& fn) -> void {
    try {
        fn();
        ADD_FAILURE() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_json) << e.what();
    }
}

}  // namespace

// -- Attribute values ---------------------------------------------------------

TEST(JsonScalar, to_json) {
    EXPECT_EQ(json(ScalarValue{Null{}}), json(nullptr));
    EXPECT_EQ(json(ScalarValue{true}), json(true));
    EXPECT_EQ(json(ScalarValue{std::int64_t{-3}}), json(-3));
    EXPECT_EQ(json(ScalarValue{2.5}), json(2.5));
    EXPECT_EQ(json(ScalarValue{std::string{"x"}}), json("x"));
}

TEST(JsonScalar, from_json) {
    EXPECT_EQ(json(nullptr).get<ScalarValue>(), ScalarValue{Null{}});
    EXPECT_EQ(json(false).get<ScalarValue>(), ScalarValue{false});
    EXPECT_EQ(json(-7).get<ScalarValue>(), ScalarValue{std::int64_t{-7}});
    EXPECT_EQ(json(7u).get<ScalarValue>(), ScalarValue{std::int64_t{7}});
    EXPECT_EQ(json(0.25).get<ScalarValue>(), ScalarValue{0.25});
    EXPECT_EQ(json("s").get<ScalarValue>(), ScalarValue{std::string{"s"}});
    expect_invalid_json([] { static_cast<void>(json::array().get<ScalarValue>()); });
    expect_invalid_json([] { static_cast<void>(json(std::uint64_t{1} << 63).get<ScalarValue>()); });
    EXPECT_EQ(json(std::uint64_t{9223372036854775807ULL}).get<ScalarValue>(),
              ScalarValue{std::int64_t{9223372036854775807LL}});
}

TEST(JsonScalar, attrs) {
    auto attrs = attrs_from_json(json{{"level", 2}, {"id", "h"}});
    EXPECT_EQ(get_attr<std::int64_t>(attrs, "level"), 2);
    EXPECT_EQ(get_attr<std::string>(attrs, "id"), "h");
    EXPECT_TRUE(attrs_from_json(nullptr).empty());
    expect_invalid_json([] { attrs_from_json(json::array({1})); });
}

// -- Nodes --------------------------------------------------------------------

TEST(JsonNode, serializes_structure) {
    auto d = doc({p({t("a"), t("b", {em()})}), h(2, "t"), hr()});
    auto expected = json::parse(R"({
        "type": "doc",
        "attrs": {"lang": null},
        "content": [
            {"type": "paragraph", "content": [
                {"type": "text", "text": "a"},
                {"type": "text", "text": "b", "marks": [{"type": "em"}]}
            ]},
            {"type": "heading", "attrs": {"level": 2}, "content": [{"type": "text", "text": "t"}]},
            {"type": "horizontal_rule"}
        ]
    })");
    EXPECT_EQ(json(*d), expected);
}

TEST(JsonNode, mark_attrs) {
    EXPECT_EQ(json(link("https://x")), (json{{"type", "link"}, {"attrs", {{"href", "https://x"}}}}));
    EXPECT_EQ(json(em()), (json{{"type", "em"}}));
}

TEST(JsonNode, round_trip) {
    auto d = doc({blockquote({p({t("q", {link("u"), strong()}), img("i.png"), br()})}),
                  code_block("x = 1"), p()});
    auto restored = node_from_json(*schema(), json(*d));
    EXPECT_TRUE(same_doc(restored, d)) << restored->to_string();
}

TEST(JsonNode, rejects_malformed_nodes) {
    const auto& s = *schema();
    expect_invalid_json([&] { node_from_json(s, json{{"type", "nope"}}); });
    expect_invalid_json([&] { node_from_json(s, json{{"content", json::array()}}); });
    expect_invalid_json([&] { node_from_json(s, json{{"type", "text"}, {"text", ""}}); });
    expect_invalid_json([&] { node_from_json(s, json{{"type", "text"}}); });
    expect_invalid_json([&] { node_from_json(s, json::array()); });
    expect_invalid_json([&] {
        node_from_json(s, json{{"type", "text"}, {"text", "a"}, {"marks", {{{"type", "bold"}}}}});
    });
    expect_invalid_json([&] { fragment_from_json(s, json{{"type", "paragraph"}}); });
}

TEST(JsonNode, invalid_content_is_reported) {
    auto j = json{{"type", "doc"}, {"content", {{{"type", "text"}, {"text", "loose"}}}}};
    try {
        node_from_json(*schema(), j);
        FAIL() << "expected an exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_content);
    }
}

// -- Fragments and slices -----------------------------------------------------

TEST(JsonSlice, empty_values_are_null) {
    EXPECT_TRUE(json(Fragment{}).is_null());
    EXPECT_TRUE(json(Slice::empty()).is_null());
    EXPECT_TRUE(fragment_from_json(*schema(), nullptr).child_count() == 0);
    EXPECT_TRUE(slice_from_json(*schema(), nullptr).eq(Slice::empty()));
}

TEST(JsonSlice, open_slice) {
    auto slice = doc({p("hello"), p("world")})->slice(3, 10);
    auto j = json(slice);
    EXPECT_EQ(j["openStart"], 1);
    EXPECT_EQ(j["openEnd"], 1);
    EXPECT_EQ(j["content"].size(), 2u);
    EXPECT_TRUE(slice_from_json(*schema(), j).eq(slice));

    auto closed = json(Slice{Fragment::from(hr()), 0, 0});
    EXPECT_FALSE(closed.contains("openStart"));
}

// -- Steps --------------------------------------------------------------------

TEST(JsonStep, replace_step) {
    auto step = Step{ReplaceStep{1, 1, Slice{Fragment::from(t("X")), 0, 0}}};
    auto j = json(step);
    EXPECT_EQ(j, json::parse(R"({"stepType": "replace", "from": 1, "to": 1,
                                 "slice": {"content": [{"type": "text", "text": "X"}]}})"));

    auto deletion = json(Step{ReplaceStep{1, 3, Slice::empty(), true}});
    EXPECT_FALSE(deletion.contains("slice"));
    EXPECT_EQ(deletion["structure"], true);
}

TEST(JsonStep, steps_from_a_transform_round_trip) {
    auto d = doc({p("hello"), h(1, "title")});
    auto tr = Transform{d};
    tr.insert_text("X", 2);
    tr.add_mark(1, 4, strong());
    tr.remove_mark(2, 3, strong());
    tr.set_block_type(0, 5, schema()->node_type("heading"), {{"level", std::int64_t{3}}});
    tr.set_node_attribute(8, "level", std::int64_t{2});
    tr.set_doc_attribute("lang", std::string{"en"});

    auto replay = d;
    for (const auto& step : tr.steps()) {
        auto j = json(step);
        auto restored = step_from_json(*schema(), j);
        EXPECT_EQ(step_type_name(restored), j["stepType"].get<std::string>());
        auto result = apply_step(restored, *replay);
        ASSERT_FALSE(result.failed.has_value()) << *result.failed;
        replay = result.doc;
    }
    EXPECT_TRUE(same_doc(replay, tr.doc())) << replay->to_string();
}

TEST(JsonStep, mark_and_attr_shapes) {
    EXPECT_EQ(json(Step{AddMarkStep{1, 3, em()}}),
              (json{{"stepType", "addMark"}, {"mark", {{"type", "em"}}}, {"from", 1}, {"to", 3}}));
    EXPECT_EQ(json(Step{AttrStep{0, "level", std::int64_t{4}}}),
              (json{{"stepType", "attr"}, {"pos", 0}, {"attr", "level"}, {"value", 4}}));
    EXPECT_EQ(json(Step{DocAttrStep{"lang", Null{}}}),
              (json{{"stepType", "docAttr"}, {"attr", "lang"}, {"value", nullptr}}));
}

TEST(JsonStep, rejects_malformed_steps) {
    const auto& s = *schema();
    expect_invalid_json([&] { step_from_json(s, json{{"stepType", "teleport"}}); });
    expect_invalid_json([&] { step_from_json(s, json{{"from", 1}}); });
    expect_invalid_json([&] { step_from_json(s, json{{"stepType", "replace"}, {"from", -1}, {"to", 2}}); });
    expect_invalid_json([&] { step_from_json(s, json{{"stepType", "replace"}, {"from", 1}}); });
    expect_invalid_json([&] {
        step_from_json(s, json{{"stepType", "replace"}, {"from", 1}, {"to", 1}, {"structure", "yes"}});
    });
    expect_invalid_json([&] { step_from_json(s, json{{"stepType", "addMark"}, {"from", 1}, {"to", 2}}); });
}

TEST(JsonStep, rejects_inverted_ranges) {
    const auto& s = *schema();
    expect_invalid_json([&] { step_from_json(s, json{{"stepType", "replace"}, {"from", 8}, {"to", 3}}); });
    expect_invalid_json([&] {
        step_from_json(s, json{{"stepType", "replaceAround"}, {"from", 0}, {"to", 5},
                               {"gapFrom", 4}, {"gapTo", 1}, {"insert", 0}});
    });
    expect_invalid_json([&] {
        step_from_json(s, json{{"stepType", "removeMark"}, {"from", 4}, {"to", 2},
                               {"mark", {{"type", "em"}}}});
    });
}

// -- Selections ---------------------------------------------------------------

TEST(JsonSelection, shapes_and_round_trip) {
    auto d = doc({p("hello"), hr()});
    auto text = Selection::text(d, 4, 2);
    auto node = Selection::node(d, 7);
    auto all = Selection::all(d);

    EXPECT_EQ(json(text), (json{{"type", "text"}, {"anchor", 4}, {"head", 2}}));
    EXPECT_EQ(json(node), (json{{"type", "node"}, {"anchor", 7}}));
    EXPECT_EQ(json(all), (json{{"type", "all"}}));

    EXPECT_EQ(selection_from_json(d, json(text)), text);
    EXPECT_EQ(selection_from_json(d, json(node)), node);
    EXPECT_EQ(selection_from_json(d, json(all)), all);
}

TEST(JsonSelection, rejects_bad_positions_and_types) {
    auto d = doc({p("hello")});
    expect_invalid_json([&] { selection_from_json(d, json{{"type", "text"}, {"anchor", 99}, {"head", 1}}); });
    expect_invalid_json([&] { selection_from_json(d, json{{"type", "cell"}, {"anchor", 1}}); });
    expect_invalid_json([&] { selection_from_json(d, json{{"anchor", 1}}); });
}
