// folio-cpp benchmarks: measures throughput of the core editing paths.

#include <folio-cpp/folio.hpp>
#include <folio-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace folio_cpp;

static auto make_schema() -> std::shared_ptr<const Schema> {
    return Schema::create(SchemaSpec{
        .nodes = {
            {"doc", {.content = "block+"}},
            {"paragraph", {.content = "inline*", .group = "block"}},
            {"heading", {.content = "inline*", .group = "block",
                         .attrs = {{"level", {.default_value = std::int64_t{1}}}}}},
            {"text", {.group = "inline", .inline_node = true}},
        },
        .marks = {
            {"em", {}},
            {"strong", {}},
        },
    });
}

static const auto g_schema = make_schema();

static auto make_doc(std::size_t paragraphs) -> NodePtr {
    auto blocks = std::vector<NodePtr>{};
    blocks.reserve(paragraphs);
    for (std::size_t i = 0; i < paragraphs; ++i) {
        blocks.push_back(g_schema->node("paragraph", {},
            {g_schema->text("The quick brown fox jumps over the lazy dog " + std::to_string(i))}));
    }
    return g_schema->node("doc", {}, std::move(blocks));
}

// =============================================================================
// Transforms
// =============================================================================

static void bm_insert_text(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto tr = Transform{doc};
        tr.insert_text("x", 5);
        benchmark::DoNotOptimize(tr.doc());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_insert_text)->Range(1, 1000);

static void bm_typing_run(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_doc(10);
    for (auto _ : state) {
        auto tr = Transform{doc};
        for (std::size_t i = 0; i < n; ++i) {
            tr.insert_text("a", 1 + i);
        }
        benchmark::DoNotOptimize(tr.doc());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_typing_run)->Range(10, 1000);

static void bm_add_mark_whole_doc(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    const auto strong = g_schema->mark("strong");
    const auto end = doc->content().size();
    for (auto _ : state) {
        auto tr = Transform{doc};
        tr.add_mark(0, end, strong);
        benchmark::DoNotOptimize(tr.doc());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_add_mark_whole_doc)->Range(1, 500);

static void bm_split_and_join(benchmark::State& state) {
    const auto doc = make_doc(100);
    for (auto _ : state) {
        auto tr = Transform{doc};
        tr.split(10);
        tr.join(11);
        benchmark::DoNotOptimize(tr.doc());
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_split_and_join);

// =============================================================================
// Mapping
// =============================================================================

static void bm_map_through_steps(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto tr = Transform{make_doc(10)};
    for (std::size_t i = 0; i < n; ++i) {
        tr.insert_text("a", 1);
    }
    const auto& mapping = tr.mapping();
    for (auto _ : state) {
        benchmark::DoNotOptimize(mapping.map(20));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_map_through_steps)->Range(10, 1000);

static void bm_decoration_set_map(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_doc(n);
    auto decorations = std::vector<Decoration>{};
    auto start = std::size_t{1};
    for (std::size_t i = 0; i < n; ++i) {
        decorations.push_back(Decoration::inline_range(start, start + 3, {{"class", "hl"}}));
        start += doc->child(i)->node_size();
    }
    const auto set = DecorationSet::create(doc, std::move(decorations));
    auto tr = Transform{doc};
    tr.insert_text("abc", 2);
    for (auto _ : state) {
        benchmark::DoNotOptimize(set.map(tr.mapping()));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_decoration_set_map)->Range(10, 1000);

// =============================================================================
// Editor state
// =============================================================================

static void bm_apply_transaction(benchmark::State& state) {
    auto editor = EditorState::create({.doc = make_doc(100)});
    for (auto _ : state) {
        auto tr = editor.tr();
        tr.insert_text("x");
        editor = editor.apply(tr.build());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_transaction);

static void bm_apply_with_history(benchmark::State& state) {
    auto editor = EditorState::create({.doc = make_doc(100), .plugins = {history()}});
    std::int64_t time = 0;
    for (auto _ : state) {
        auto tr = editor.tr();
        tr.set_time(time++);
        tr.insert_text("x");
        editor = editor.apply(tr.build());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_with_history);

static void bm_undo_redo(benchmark::State& state) {
    auto editor = EditorState::create({.doc = make_doc(100), .plugins = {history()}});
    std::int64_t time = 0;
    for (int i = 0; i < 50; ++i) {
        auto tr = editor.tr();
        tr.set_time(time += 1000);
        tr.insert_text("x");
        editor = editor.apply(tr.build());
    }
    const auto apply = [&](const Transaction& tr) { editor = editor.apply(tr); };
    for (auto _ : state) {
        undo(editor, apply);
        redo(editor, apply);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_undo_redo);

// =============================================================================
// JSON
// =============================================================================

static void bm_doc_to_json(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto j = nlohmann::json(*doc);
        benchmark::DoNotOptimize(j);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_doc_to_json)->Range(1, 1000);

static void bm_doc_from_json(benchmark::State& state) {
    const auto j = nlohmann::json(*make_doc(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto doc = node_from_json(*g_schema, j);
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_doc_from_json)->Range(1, 1000);
