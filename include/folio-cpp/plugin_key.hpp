/// @file plugin_key.hpp
/// @brief PluginKey: the capability token that names a plugin.

#pragma once

#include <string>
#include <string_view>

namespace folio_cpp {

class EditorState;
class Plugin;

/// Untyped plugin key. Every key gets a process-unique string, so two
/// keys created with the same name never collide.
class PluginKeyBase {
public:
    explicit PluginKeyBase(std::string_view name = "key");

    /// The unique key string, e.g. `history$3`.
    auto key() const -> const std::string& { return key_; }

    /// The plugin registered under this key, or nullptr.
    auto get(const EditorState& state) const -> const Plugin*;

    auto operator==(const PluginKeyBase&) const -> bool = default;

private:
    std::string key_;
};

/// A key whose plugin keeps state of type T.
///
/// @code
/// static const auto counter_key = PluginKey<int>{"counter"};
/// const int* count = counter_key.get_state(state);
/// @endcode
template <typename T>
class PluginKey : public PluginKeyBase {
public:
    using PluginKeyBase::PluginKeyBase;

    /// The plugin's state, or nullptr when the plugin is not registered
    /// or keeps no state of type T. Defined in editor_state.hpp.
    auto get_state(const EditorState& state) const -> const T*;
};

}  // namespace folio_cpp
