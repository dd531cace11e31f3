/// @file editor_state.hpp
/// @brief EditorState: the immutable snapshot of an editor.

#pragma once

#include <folio-cpp/plugin.hpp>
#include <folio-cpp/schema.hpp>
#include <folio-cpp/selection.hpp>
#include <folio-cpp/transaction.hpp>

#include <nlohmann/json.hpp>

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio_cpp {

/// Inputs of EditorState::create. Either `schema` or `doc` must be set.
struct EditorStateConfig {
    std::shared_ptr<const Schema> schema;   ///< Derived from `doc` when null.
    NodePtr doc;                            ///< Defaults to the filled top node.
    std::optional<Selection> selection;     ///< Defaults to the start of the document.
    std::optional<MarkSet> stored_marks;
    std::vector<Plugin> plugins;
};

/// Maps JSON property names to the plugins whose state they hold.
using PluginFields = std::map<std::string, PluginKeyBase, std::less<>>;

/// Callback that hands a transaction to whoever owns the state.
using Dispatch = std::function<void(const Transaction&)>;

struct AppliedTransactions;

/// A document, a selection, stored marks and one state value per
/// plugin. States are values: apply() returns a new state and leaves
/// this one untouched.
///
/// @code
/// auto state = EditorState::create({.schema = schema, .plugins = {history()}});
/// auto tr = state.tr();
/// tr.insert_text("hello");
/// state = state.apply(tr.build());
/// @endcode
class EditorState {
public:
    /// Throws invalid_operation for duplicate plugin keys or when neither
    /// a schema nor a document is given.
    static auto create(EditorStateConfig config) -> EditorState;

    auto doc() const -> const NodePtr& { return doc_; }
    auto selection() const -> const Selection& { return selection_; }
    auto stored_marks() const -> const std::optional<MarkSet>& { return stored_marks_; }
    auto schema() const -> const std::shared_ptr<const Schema>& { return config_->schema; }
    auto plugins() const -> const std::vector<Plugin>& { return config_->plugins; }

    /// Incremented by every transaction that scrolled into view.
    auto scroll_to_selection() const -> std::size_t { return scroll_to_selection_; }

    /// Start a transaction against this state.
    auto tr() const -> TransactionBuilder;

    /// Apply a transaction and every transaction plugins append to it.
    auto apply(const Transaction& tr) const -> EditorState;

    /// Like apply(), but also reports the transactions actually applied,
    /// root first. A filtered root yields this state and no transactions.
    auto apply_transaction(const Transaction& root) const -> AppliedTransactions;

    /// A state with another plugin set. States of plugins present in both
    /// sets are kept; new plugins are initialized.
    auto reconfigure(std::vector<Plugin> plugins) const -> EditorState;

    /// Serialize document, selection, stored marks and the plugin states
    /// named in `fields`.
    auto to_json(const PluginFields& fields = {}) const -> nlohmann::json;

    /// Inverse of to_json(). `config.schema` and `config.plugins` are
    /// used; throws invalid_json on malformed input.
    static auto from_json(const EditorStateConfig& config, const nlohmann::json& json,
                          const PluginFields& fields = {}) -> EditorState;

    /// The plugin with the given key, or nullptr.
    auto find_plugin(std::string_view key) const -> const Plugin*;

    /// The state value of the plugin with the given key; nullptr when the
    /// plugin is absent, keeps no state, or is not initialized yet.
    auto plugin_state(std::string_view key) const -> const std::any*;
    auto plugin_state(const PluginKeyBase& key) const -> const std::any* { return plugin_state(key.key()); }

    /// Run every filter_transaction except the plugin at `ignore`.
    auto filter_transaction(const Transaction& tr, std::optional<std::size_t> ignore = std::nullopt) const -> bool;

private:
    struct Configuration {
        std::shared_ptr<const Schema> schema;
        std::vector<Plugin> plugins;
    };

    EditorState(std::shared_ptr<const Configuration> config, NodePtr doc, Selection selection,
                std::optional<MarkSet> stored_marks, std::size_t scroll_to_selection);

    static auto make_configuration(std::shared_ptr<const Schema> schema, std::vector<Plugin> plugins)
        -> std::shared_ptr<const Configuration>;

    auto apply_inner(const Transaction& tr) const -> EditorState;
    auto plugin_index(std::string_view key) const -> std::optional<std::size_t>;

    std::shared_ptr<const Configuration> config_;
    NodePtr doc_;
    Selection selection_;
    std::optional<MarkSet> stored_marks_;
    std::size_t scroll_to_selection_{0};
    std::vector<std::any> plugin_states_;  ///< Parallel to config_->plugins.
};

/// Result of EditorState::apply_transaction.
struct AppliedTransactions {
    EditorState state;
    std::vector<Transaction> transactions;
};

// -- Template definitions -----------------------------------------------------

template <typename T>
auto PluginKey<T>::get_state(const EditorState& state) const -> const T* {
    const auto* value = state.plugin_state(key());
    return value ? std::any_cast<T>(value) : nullptr;
}

template <typename T>
auto Plugin::get_state(const EditorState& state) const -> const T* {
    const auto* value = state.plugin_state(key_);
    return value ? std::any_cast<T>(value) : nullptr;
}

}  // namespace folio_cpp
