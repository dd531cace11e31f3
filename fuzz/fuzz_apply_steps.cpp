// Fuzz target for step_from_json() and apply_step(). Input is a JSON array
// of steps applied in order to a fixed document; every applied replace
// step is inverted and checked to restore the previous document.

#include <folio-cpp/folio.hpp>
#include <folio-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <variant>

namespace {

auto make_schema() -> std::shared_ptr<const folio_cpp::Schema> {
    return folio_cpp::Schema::create(folio_cpp::SchemaSpec{
        .nodes = {
            {"doc", {.content = "block+"}},
            {"paragraph", {.content = "inline*", .group = "block"}},
            {"blockquote", {.content = "block+", .group = "block"}},
            {"horizontal_rule", {.group = "block"}},
            {"text", {.group = "inline", .inline_node = true}},
        },
        .marks = {
            {"em", {}},
            {"link", {.attrs = {{"href", {}}}, .inclusive = false}},
        },
    });
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto schema = make_schema();
    static const auto start = schema->node("doc", {}, {
        schema->node("paragraph", {}, {schema->text("hello")}),
        schema->node("blockquote", {}, {schema->node("paragraph", {}, {schema->text("world")})}),
    });

    const auto input = nlohmann::json::parse(data, data + size, nullptr, false);
    if (input.is_discarded() || !input.is_array()) return 0;

    auto doc = start;
    for (const auto& j : input) {
        try {
            const auto step = folio_cpp::step_from_json(*schema, j);
            const auto result = folio_cpp::apply_step(step, *doc);
            if (result.failed) continue;

            // Mark steps invert lossily when the mark was already present
            if (!std::holds_alternative<folio_cpp::ReplaceStep>(step)) {
                doc = result.doc;
                continue;
            }
            const auto inverted = folio_cpp::invert_step(step, *doc);
            const auto back = folio_cpp::apply_step(inverted, *result.doc);
            if (back.failed || !back.doc->eq(*doc)) std::abort();
            doc = result.doc;
        } catch (const folio_cpp::Exception&) {
            // Malformed steps and out-of-range positions are reported this way
        }
    }
    return 0;
}
