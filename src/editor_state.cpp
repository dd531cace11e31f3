#include <folio-cpp/editor_state.hpp>
#include <folio-cpp/error.hpp>
#include <folio-cpp/json.hpp>

#include <algorithm>
#include <span>
#include <utility>

namespace folio_cpp {

// -- Construction -------------------------------------------------------------

EditorState::EditorState(std::shared_ptr<const Configuration> config, NodePtr doc, Selection selection,
                         std::optional<MarkSet> stored_marks, std::size_t scroll_to_selection)
    : config_{std::move(config)},
      doc_{std::move(doc)},
      selection_{std::move(selection)},
      stored_marks_{std::move(stored_marks)},
      scroll_to_selection_{scroll_to_selection} {
    plugin_states_.reserve(config_->plugins.size());
}

auto EditorState::make_configuration(std::shared_ptr<const Schema> schema, std::vector<Plugin> plugins)
    -> std::shared_ptr<const Configuration> {
    for (std::size_t i = 0; i < plugins.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (plugins[i].key() == plugins[j].key()) {
                throw Exception{ErrorKind::invalid_operation,
                                "Adding different instances of a keyed plugin (" + plugins[i].key() + ")"};
            }
        }
    }
    return std::make_shared<const Configuration>(Configuration{std::move(schema), std::move(plugins)});
}

auto EditorState::create(EditorStateConfig config) -> EditorState {
    auto schema = config.schema;
    if (!schema) {
        if (!config.doc) {
            throw Exception{ErrorKind::invalid_operation, "Creating an editor state requires a schema or a doc"};
        }
        schema = config.doc->type().schema().shared_from_this();
    }
    auto doc = config.doc;
    if (!doc) {
        doc = schema->top_node_type().create_and_fill({}, Fragment{}, {});
        if (!doc) {
            throw Exception{ErrorKind::invalid_schema,
                            "Top node type " + schema->top_node_type().name() + " cannot be filled by default"};
        }
    }
    if (&doc->type().schema() != schema.get()) {
        throw Exception{ErrorKind::invalid_schema, "Document does not belong to the given schema"};
    }
    auto selection = config.selection ? *config.selection : Selection::at_start(doc);
    if (selection.doc().get() != doc.get()) {
        throw Exception{ErrorKind::invalid_selection, "Selection does not point into the state's document"};
    }

    auto instance = EditorState{make_configuration(schema, config.plugins), doc, std::move(selection),
                                config.stored_marks, 0};
    for (const auto& plugin : instance.config_->plugins) {
        const auto& field = plugin.spec().state;
        instance.plugin_states_.push_back(field && field->init ? field->init(config, instance) : std::any{});
    }
    return instance;
}

// -- Transactions -------------------------------------------------------------

auto EditorState::tr() const -> TransactionBuilder {
    return TransactionBuilder{*this};
}

auto EditorState::apply(const Transaction& tr) const -> EditorState {
    return apply_transaction(tr).state;
}

auto EditorState::filter_transaction(const Transaction& tr, std::optional<std::size_t> ignore) const -> bool {
    const auto& plugins = config_->plugins;
    for (std::size_t i = 0; i < plugins.size(); ++i) {
        if (ignore && *ignore == i) continue;
        const auto& filter = plugins[i].spec().filter_transaction;
        if (filter && !filter(tr, *this)) return false;
    }
    return true;
}

auto EditorState::apply_transaction(const Transaction& root) const -> AppliedTransactions {
    if (!filter_transaction(root)) return {*this, {}};

    struct Seen {
        EditorState state;
        std::size_t n;
    };

    const auto& plugins = config_->plugins;
    auto trs = std::vector<Transaction>{root};
    auto new_state = apply_inner(root);
    auto seen = std::vector<Seen>{};

    for (;;) {
        auto have_new = false;
        for (std::size_t i = 0; i < plugins.size(); ++i) {
            const auto& append = plugins[i].spec().append_transaction;
            if (!append) continue;
            auto n = seen.empty() ? std::size_t{0} : seen[i].n;
            const auto& old_state = seen.empty() ? *this : seen[i].state;
            auto tr = std::optional<Transaction>{};
            if (n < trs.size()) {
                tr = append(std::span<const Transaction>{trs}.subspan(n), old_state, new_state);
            }
            if (tr && new_state.filter_transaction(*tr, i)) {
                if (seen.empty()) {
                    for (std::size_t j = 0; j < plugins.size(); ++j) {
                        seen.push_back(j < i ? Seen{new_state, trs.size()} : Seen{*this, 0});
                    }
                }
                trs.push_back(tr->with_meta("appendedTransaction", root));
                new_state = new_state.apply_inner(trs.back());
                have_new = true;
            }
            if (!seen.empty()) seen[i] = Seen{new_state, trs.size()};
        }
        if (!have_new) return {std::move(new_state), std::move(trs)};
    }
}

auto EditorState::apply_inner(const Transaction& tr) const -> EditorState {
    if (tr.before() != doc_ && !tr.before()->eq(*doc_)) {
        throw Exception{ErrorKind::invalid_operation, "Applying a mismatched transaction"};
    }
    auto stored_marks = tr.selection().cursor() ? tr.stored_marks() : std::nullopt;
    auto instance = EditorState{config_, tr.doc(), tr.selection(), std::move(stored_marks),
                                tr.scrolled_into_view() ? scroll_to_selection_ + 1 : scroll_to_selection_};
    for (std::size_t i = 0; i < config_->plugins.size(); ++i) {
        const auto& field = config_->plugins[i].spec().state;
        instance.plugin_states_.push_back(field && field->apply
            ? field->apply(tr, plugin_states_[i], *this, instance)
            : plugin_states_[i]);
    }
    return instance;
}

// -- Reconfiguration ----------------------------------------------------------

auto EditorState::reconfigure(std::vector<Plugin> plugins) const -> EditorState {
    auto config = make_configuration(config_->schema, std::move(plugins));
    auto instance = EditorState{config, doc_, selection_, stored_marks_, scroll_to_selection_};
    auto init_config = EditorStateConfig{config_->schema, doc_, selection_, stored_marks_, config->plugins};
    for (const auto& plugin : config->plugins) {
        if (auto index = plugin_index(plugin.key())) {
            instance.plugin_states_.push_back(plugin_states_[*index]);
            continue;
        }
        const auto& field = plugin.spec().state;
        instance.plugin_states_.push_back(field && field->init ? field->init(init_config, instance) : std::any{});
    }
    return instance;
}

// -- Plugins ------------------------------------------------------------------

auto EditorState::plugin_index(std::string_view key) const -> std::optional<std::size_t> {
    const auto& plugins = config_->plugins;
    auto it = std::ranges::find_if(plugins, [key](const Plugin& p) { return p.key() == key; });
    if (it == plugins.end()) return std::nullopt;
    return static_cast<std::size_t>(it - plugins.begin());
}

auto EditorState::find_plugin(std::string_view key) const -> const Plugin* {
    auto index = plugin_index(key);
    return index ? &config_->plugins[*index] : nullptr;
}

auto EditorState::plugin_state(std::string_view key) const -> const std::any* {
    auto index = plugin_index(key);
    if (!index || *index >= plugin_states_.size()) return nullptr;
    const auto& value = plugin_states_[*index];
    return value.has_value() ? &value : nullptr;
}

// -- JSON ---------------------------------------------------------------------

auto EditorState::to_json(const PluginFields& fields) const -> nlohmann::json {
    auto j = nlohmann::json{{"doc", *doc_}, {"selection", selection_}};
    if (stored_marks_) j["storedMarks"] = *stored_marks_;
    for (const auto& [prop, key] : fields) {
        if (prop == "doc" || prop == "selection") {
            throw Exception{ErrorKind::invalid_operation,
                            "The JSON fields doc and selection are reserved"};
        }
        auto index = plugin_index(key.key());
        if (!index) continue;
        const auto& field = config_->plugins[*index].spec().state;
        if (field && field->to_json && plugin_states_[*index].has_value()) {
            j[prop] = field->to_json(plugin_states_[*index]);
        }
    }
    return j;
}

auto EditorState::from_json(const EditorStateConfig& config, const nlohmann::json& json,
                            const PluginFields& fields) -> EditorState {
    if (!config.schema) {
        throw Exception{ErrorKind::invalid_operation, "Required config field schema missing"};
    }
    if (!json.is_object()) {
        throw Exception{ErrorKind::invalid_json, "Invalid input for EditorState::from_json"};
    }
    const auto& schema = *config.schema;
    auto doc_it = json.find("doc");
    auto sel_it = json.find("selection");
    if (doc_it == json.end() || sel_it == json.end()) {
        throw Exception{ErrorKind::invalid_json, "EditorState JSON needs doc and selection"};
    }
    auto doc = node_from_json(schema, *doc_it);
    auto selection = selection_from_json(doc, *sel_it);
    auto stored_marks = std::optional<MarkSet>{};
    if (auto it = json.find("storedMarks"); it != json.end() && !it->is_null()) {
        stored_marks = marks_from_json(schema, *it);
    }

    auto instance = EditorState{make_configuration(config.schema, config.plugins), doc, selection,
                                stored_marks, 0};
    auto init_config = EditorStateConfig{config.schema, doc, selection, stored_marks, config.plugins};
    for (const auto& plugin : instance.config_->plugins) {
        const auto& field = plugin.spec().state;
        auto value = std::any{};
        auto restored = false;
        if (field && field->from_json) {
            for (const auto& [prop, key] : fields) {
                if (key.key() != plugin.key()) continue;
                if (auto it = json.find(prop); it != json.end()) {
                    value = field->from_json(init_config, *it, instance);
                    restored = true;
                }
                break;
            }
        }
        if (!restored && field && field->init) value = field->init(init_config, instance);
        instance.plugin_states_.push_back(std::move(value));
    }
    return instance;
}

}  // namespace folio_cpp
