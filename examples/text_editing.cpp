// text_editing: build a document, edit it through transforms and
// transactions, and serialize it to JSON
//
// Demonstrates: schemas, insert_text, marks, block types, split/join,
//               selection mapping, JSON round trip

#include <folio-cpp/folio.hpp>
#include <folio-cpp/json.hpp>

#include <cstdint>
#include <cstdio>
#include <string>

namespace fc = folio_cpp;

int main() {
    const auto schema = fc::Schema::create(fc::SchemaSpec{
        .nodes = {
            {"doc", {.content = "block+"}},
            {"paragraph", {.content = "inline*", .group = "block"}},
            {"heading", {.content = "inline*", .group = "block", .defining = true,
                         .attrs = {{"level", {.default_value = std::int64_t{1}}}}}},
            {"text", {.group = "inline", .inline_node = true}},
        },
        .marks = {
            {"em", {}},
            {"strong", {}},
        },
    });

    auto doc = schema->node("doc", {}, {
        schema->node("paragraph", {}, {schema->text("Hello World")}),
    });
    std::printf("Initial:   %s\n", doc->to_string().c_str());

    // A plain transform: the step log and mapping are kept alongside the doc
    auto tr = fc::Transform{doc};
    tr.insert_text(", brave new", 6);
    tr.add_mark(1, 6, schema->mark("strong"));
    tr.split(18);
    tr.set_block_type(0, 1, schema->node_type("heading"), {{"level", std::int64_t{2}}});
    std::printf("Edited:    %s\n", tr.doc()->to_string().c_str());
    std::printf("Steps:     %zu\n", tr.steps().size());
    for (const auto& step : tr.steps()) {
        std::printf("  %s\n", std::string{fc::step_type_name(step)}.c_str());
    }

    // Positions in the old document map into the new one
    std::printf("Position 7 (\"W\") maps to %zu\n", tr.mapping().map(7));

    // Transactions add a selection that follows the edits
    auto state = fc::EditorState::create({.doc = tr.doc()});
    auto tx = state.tr();
    tx.set_selection(fc::Selection::text(state.doc(), 1, 6));
    tx.insert_text("Goodbye");
    state = state.apply(tx.build());
    std::printf("After tx:  %s\n", state.doc()->to_string().c_str());
    std::printf("Selection: %s\n", state.selection().to_string().c_str());

    // JSON round trip
    const auto j = state.to_json();
    std::printf("JSON:      %s\n", j.dump().c_str());
    const auto restored = fc::EditorState::from_json({.schema = schema}, j);
    std::printf("Restored equal: %s\n", restored.doc()->eq(*state.doc()) ? "yes" : "no");

    return 0;
}
