/// @file plugin.hpp
/// @brief Plugin, PluginSpec, and the state fields plugins keep.

#pragma once

#include <folio-cpp/editor_props.hpp>
#include <folio-cpp/plugin_key.hpp>
#include <folio-cpp/transaction.hpp>

#include <nlohmann/json.hpp>

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace folio_cpp {

class EditorState;
struct EditorStateConfig;

// -- State fields -------------------------------------------------------------

/// Type-erased description of the state a plugin keeps in every
/// EditorState. Values are stored as std::any.
struct StateFieldSpec {
    /// Initial value, given the config and the partially built state.
    std::function<std::any(const EditorStateConfig&, const EditorState&)> init;

    /// Next value after a transaction, given the previous value, the old
    /// state and the partially built new state.
    std::function<std::any(const Transaction&, const std::any&,
                           const EditorState& old_state, const EditorState& new_state)> apply;

    /// Optional serialization hooks used by EditorState::to_json/from_json.
    std::function<nlohmann::json(const std::any&)> to_json;
    std::function<std::any(const EditorStateConfig&, const nlohmann::json&, const EditorState&)> from_json;
};

/// A typed state field. Convert it with erase() to store it in a
/// PluginSpec.
///
/// @code
/// auto field = StateField<int>{
///     .init = [](const auto&, const auto&) { return 0; },
///     .apply = [](const Transaction& tr, int n, const auto&, const auto&) {
///         return tr.doc_changed() ? n + 1 : n;
///     },
/// };
/// @endcode
template <typename T>
struct StateField {
    std::function<T(const EditorStateConfig&, const EditorState&)> init;
    std::function<T(const Transaction&, const T&, const EditorState&, const EditorState&)> apply;
    std::function<nlohmann::json(const T&)> to_json;
    std::function<T(const EditorStateConfig&, const nlohmann::json&, const EditorState&)> from_json;

    auto erase() const -> StateFieldSpec {
        auto spec = StateFieldSpec{};
        spec.init = [f = init](const EditorStateConfig& config, const EditorState& state) -> std::any {
            return f(config, state);
        };
        spec.apply = [f = apply](const Transaction& tr, const std::any& value,
                                 const EditorState& old_state, const EditorState& new_state) -> std::any {
            return f(tr, std::any_cast<const T&>(value), old_state, new_state);
        };
        if (to_json) {
            spec.to_json = [f = to_json](const std::any& value) {
                return f(std::any_cast<const T&>(value));
            };
        }
        if (from_json) {
            spec.from_json = [f = from_json](const EditorStateConfig& config, const nlohmann::json& json,
                                             const EditorState& state) -> std::any {
                return f(config, json, state);
            };
        }
        return spec;
    }
};

// -- Plugin -------------------------------------------------------------------

/// Everything a plugin may contribute. Every member is optional.
struct PluginSpec {
    /// Key under which the plugin (and its state) can be found.
    std::optional<PluginKeyBase> key;

    std::optional<StateFieldSpec> state;

    /// Return false to drop a transaction before it is applied.
    std::function<bool(const Transaction&, const EditorState&)> filter_transaction;

    /// Return a follow-up transaction, built against `new_state`, in
    /// reaction to `transactions`.
    std::function<std::optional<Transaction>(std::span<const Transaction> transactions,
                                             const EditorState& old_state,
                                             const EditorState& new_state)> append_transaction;

    EditorProps props;

    /// Set when the plugin relies on history items being kept unmerged
    /// (e.g. for collaborative rebasing).
    bool history_preserve_items{false};
};

/// A plugin instance. Cheap to copy; copies share the spec.
class Plugin {
public:
    explicit Plugin(PluginSpec spec);

    /// The unique key string of this plugin.
    auto key() const -> const std::string& { return key_; }
    auto spec() const -> const PluginSpec& { return *spec_; }
    auto props() const -> const EditorProps& { return spec_->props; }

    /// This plugin's state in `state`, or nullptr. Defined in
    /// editor_state.hpp.
    template <typename T>
    auto get_state(const EditorState& state) const -> const T*;

    auto operator==(const Plugin& other) const -> bool { return spec_ == other.spec_; }

private:
    std::shared_ptr<const PluginSpec> spec_;
    std::string key_;
};

}  // namespace folio_cpp
