// plugins_and_history: an editor session with plugins, decorations,
// key handling and undo/redo
//
// Demonstrates: PluginKey, StateField, appendTransaction, decorations,
//               EditorSession, handle_key_down, the history plugin

#include <folio-cpp/folio.hpp>

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace fc = folio_cpp;

namespace {

const auto word_count_key = fc::PluginKey<std::size_t>{"wordCount"};

auto count_words(const fc::Node& doc) -> std::size_t {
    auto words = std::size_t{0};
    auto in_word = false;
    for (const char c : doc.text_content()) {
        const auto space = c == ' ';
        if (!space && !in_word) ++words;
        in_word = !space;
    }
    return words;
}

// Keeps a running word count as plugin state
auto word_count_plugin() -> fc::Plugin {
    return fc::Plugin{fc::PluginSpec{
        .key = word_count_key,
        .state = fc::StateField<std::size_t>{
            .init = [](const fc::EditorStateConfig&, const fc::EditorState& state) {
                return count_words(*state.doc());
            },
            .apply = [](const fc::Transaction& tr, const std::size_t& count,
                        const fc::EditorState&, const fc::EditorState&) {
                return tr.doc_changed() ? count_words(*tr.doc()) : count;
            },
        }.erase(),
    }};
}

// Highlights the selected range
auto selection_highlight_plugin() -> fc::Plugin {
    auto spec = fc::PluginSpec{};
    spec.props.decorations = [](const fc::EditorState& state) {
        const auto& sel = state.selection();
        if (sel.empty()) return fc::DecorationSet::empty_set();
        return fc::DecorationSet::create(state.doc(), {
            fc::Decoration::inline_range(sel.from(), sel.to(), {{"class", "selected"}}),
        });
    };
    return fc::Plugin{std::move(spec)};
}

// Enter splits the current block; Mod-z and Mod-y run the history commands
auto keymap_plugin() -> fc::Plugin {
    auto spec = fc::PluginSpec{};
    spec.props.handle_key_down = [](fc::EditorHost& host, const fc::KeyEvent& event) {
        const auto dispatch = [&host](const fc::Transaction& tr) { host.dispatch(tr); };
        if (event.ctrl && event.key == "z") return fc::undo(host.state(), dispatch);
        if (event.ctrl && event.key == "y") return fc::redo(host.state(), dispatch);
        if (event.key == "Enter") {
            auto state = host.state();
            auto tr = state.tr();
            tr.delete_selection();
            const auto pos = tr.selection().from();
            if (!fc::can_split(*tr.doc(), pos)) return false;
            tr.split(pos);
            tr.scroll_into_view();
            host.dispatch(tr.build());
            return true;
        }
        return false;
    };
    return fc::Plugin{std::move(spec)};
}

void print_state(const char* label, const fc::EditorState& state) {
    std::printf("%-12s %s  words=%zu  undo=%zu redo=%zu\n", label,
                state.doc()->to_string().c_str(),
                *word_count_key.get_state(state),
                fc::undo_depth(state), fc::redo_depth(state));
}

}  // namespace

int main() {
    const auto schema = fc::Schema::create(fc::SchemaSpec{
        .nodes = {
            {"doc", {.content = "block+"}},
            {"paragraph", {.content = "inline*", .group = "block"}},
            {"text", {.group = "inline", .inline_node = true}},
        },
    });

    auto session = fc::EditorSession{fc::EditorState::create({
        .schema = schema,
        .plugins = {fc::history(), word_count_plugin(), selection_highlight_plugin(), keymap_plugin()},
    })};
    session.on_change([](const fc::EditorState&, const fc::EditorState& state,
                         std::span<const fc::Transaction> trs) {
        std::printf("  (applied %zu transaction(s), selection %s)\n", trs.size(),
                    state.selection().to_string().c_str());
    });

    // Typing goes through the text input path
    session.text_input("hello world");
    print_state("typed:", session.state());

    session.key_down({.key = "Enter"});
    session.text_input("second line");
    print_state("enter:", session.state());

    // Select "world" and look at the decorations the plugin contributes
    session.transact([](fc::TransactionBuilder& tr) {
        tr.set_selection(fc::Selection::text(tr.doc(), 7, 12));
    });
    for (const auto& deco : session.decorations().decorations()) {
        std::printf("decoration:  [%zu, %zu) class=%s\n", deco.from(), deco.to(),
                    deco.attrs().at("class").c_str());
    }

    // transact can return a value
    auto replaced = session.transact([](fc::TransactionBuilder& tr) {
        auto old = tr.doc()->text_between(tr.selection().from(), tr.selection().to());
        tr.insert_text("there");
        return old;
    });
    std::printf("replaced:    \"%s\"\n", replaced.c_str());
    print_state("edited:", session.state());

    // Undo and redo through the key handler
    session.key_down({.key = "z", .ctrl = true});
    print_state("undo:", session.state());
    session.key_down({.key = "z", .ctrl = true});
    print_state("undo:", session.state());
    session.key_down({.key = "y", .ctrl = true});
    print_state("redo:", session.state());

    return 0;
}
