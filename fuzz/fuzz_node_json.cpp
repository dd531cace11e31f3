// Fuzz target for node_from_json(). Any document that parses must
// serialize back to JSON that reads as an equal document.

#include <folio-cpp/folio.hpp>
#include <folio-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const auto schema = folio_cpp::Schema::create(folio_cpp::SchemaSpec{
        .nodes = {
            {"doc", {.content = "block+"}},
            {"paragraph", {.content = "inline*", .group = "block"}},
            {"heading", {.content = "inline*", .group = "block",
                         .attrs = {{"level", {.default_value = std::int64_t{1}}}}}},
            {"text", {.group = "inline", .inline_node = true}},
        },
        .marks = {{"em", {}}, {"strong", {}}},
    });

    const auto input = nlohmann::json::parse(data, data + size, nullptr, false);
    if (input.is_discarded()) return 0;

    try {
        const auto doc = folio_cpp::node_from_json(*schema, input);
        const auto again = folio_cpp::node_from_json(*schema, nlohmann::json(*doc));
        if (!again->eq(*doc)) std::abort();
    } catch (const folio_cpp::Exception&) {
        // Rejected input
    }
    return 0;
}
