/// @file props.hpp
/// @brief Prop resolution across view props and plugins, and EditorSession.
///
/// Every prop is looked up in the view's own props first and then in
/// each plugin in registration order.

#pragma once

#include <folio-cpp/decoration.hpp>
#include <folio-cpp/editor_props.hpp>
#include <folio-cpp/editor_state.hpp>
#include <folio-cpp/transaction.hpp>

#include <concepts>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace folio_cpp {

namespace detail {

template <typename Sig>
auto is_set(const std::function<Sig>& f) -> bool { return static_cast<bool>(f); }

template <typename K, typename V, typename C>
auto is_set(const std::map<K, V, C>& m) -> bool { return !m.empty(); }

}  // namespace detail

// -- Resolution ---------------------------------------------------------------

/// The first provided value of a prop slot, or nullptr.
///
/// @code
/// if (const auto* editable = some_prop(state, view_props, &EditorProps::editable)) { ... }
/// @endcode
template <typename Slot>
auto some_prop(const EditorState& state, const EditorProps& view_props, Slot EditorProps::*slot) -> const Slot* {
    if (detail::is_set(view_props.*slot)) return &(view_props.*slot);
    for (const auto& plugin : state.plugins()) {
        const auto& value = plugin.props().*slot;
        if (detail::is_set(value)) return &value;
    }
    return nullptr;
}

/// Call every handler of a slot until one returns true.
template <typename... Params, typename... Args>
auto call_prop_handlers(const EditorState& state, const EditorProps& view_props,
                        std::function<bool(Params...)> EditorProps::*slot, Args&&... args) -> bool {
    if (const auto& handler = view_props.*slot; handler && handler(args...)) return true;
    for (const auto& plugin : state.plugins()) {
        const auto& handler = plugin.props().*slot;
        if (handler && handler(args...)) return true;
    }
    return false;
}

/// The union of the decorations of every contributor.
auto collect_decorations(const EditorState& state, const EditorProps& view_props) -> DecorationSet;

/// The first `editable` predicate decides; editable when none is given.
auto is_editable(const EditorState& state, const EditorProps& view_props) -> bool;

/// Merge attribute maps: view props first, then plugins in order, each
/// later contributor overriding the values before it.
auto collect_attributes(const EditorState& state, const EditorProps& view_props) -> EditorAttributes;

/// The node view factory for a node type name, or nullptr.
auto find_node_view(const EditorState& state, const EditorProps& view_props,
                    std::string_view type_name) -> const NodeViewFactory*;

/// Run pasted text through every transform_pasted_text in order.
auto apply_transform_pasted_text(const EditorState& state, const EditorProps& view_props,
                                 std::string_view text, bool plain, EditorHost& host) -> std::string;

// -- EditorSession ------------------------------------------------------------

/// Host-side owner of the one authoritative EditorState.
///
/// All reads copy the current state under a shared lock; dispatch and
/// transact take the exclusive lock. Prop handlers run without any lock
/// held, so they may dispatch through the host they receive.
class EditorSession : public EditorHost {
public:
    /// Called after every state change with the previous state, the new
    /// state and the transactions that were applied.
    using ChangeListener = std::function<void(const EditorState& old_state, const EditorState& new_state,
                                              std::span<const Transaction> transactions)>;

    explicit EditorSession(EditorState state, EditorProps props = {});

    EditorSession(const EditorSession&) = delete;
    auto operator=(const EditorSession&) -> EditorSession& = delete;

    auto state() const -> EditorState override;

    /// Apply a transaction to the current state. A transaction built
    /// against an outdated state throws invalid_operation.
    void dispatch(const Transaction& tr) override;

    /// Build and apply a transaction atomically. `fn` must not call back
    /// into this session.
    void transact(const std::function<void(TransactionBuilder&)>& fn);

    /// Build and apply a transaction atomically, returning fn's result.
    template <typename Fn>
        requires std::invocable<Fn, TransactionBuilder&> &&
                 (!std::is_void_v<std::invoke_result_t<Fn, TransactionBuilder&>>)
    auto transact(Fn&& fn) -> std::invoke_result_t<Fn, TransactionBuilder&>;

    /// Replace the state wholesale, e.g. after reconfigure().
    void update_state(EditorState state);

    auto props() const -> EditorProps;
    void set_props(EditorProps props);
    void on_change(ChangeListener listener);

    // -- Events ---------------------------------------------------------------

    auto key_down(const KeyEvent& event) -> bool;
    auto key_press(const KeyEvent& event) -> bool;

    /// Text typed over [from, to). Inserts the text when no handler
    /// takes it; false when the editor is not editable.
    auto text_input(std::size_t from, std::size_t to, std::string_view text) -> bool;
    /// Text typed over the selection.
    auto text_input(std::string_view text) -> bool;

    /// Places the cursor near `pos` when no handler takes it.
    auto click(std::size_t pos, const MouseEvent& event = {}) -> bool;
    auto double_click(std::size_t pos, const MouseEvent& event = {}) -> bool;
    /// Selects the surrounding textblock when no handler takes it.
    auto triple_click(std::size_t pos, const MouseEvent& event = {}) -> bool;

    /// Replaces the selection with the slice when no handler takes it.
    auto paste(const Slice& slice) -> bool;
    /// Paste text, one paragraph per line unless it fits on one line.
    auto paste_text(std::string_view text, bool plain = true) -> bool;
    /// Inserts the slice at `pos` (removing the selection first when
    /// `moved`) when no handler takes it.
    auto drop(const Slice& slice, std::size_t pos, bool moved) -> bool;
    auto scroll_to_selection() -> bool;

    // -- Derived view data ----------------------------------------------------

    auto decorations() const -> DecorationSet;
    auto editable() const -> bool;
    auto attributes() const -> EditorAttributes;
    /// The factory for a node type, or an empty function.
    auto node_view(std::string_view type_name) const -> NodeViewFactory;

private:
    auto snapshot() const -> std::pair<EditorState, EditorProps>;
    void notify(const EditorState& old_state, const AppliedTransactions& applied);

    mutable std::shared_mutex mutex_;
    EditorState state_;
    EditorProps props_;
    ChangeListener listener_;
};

// -- Template implementations (must be in header) ----------------------------

template <typename Fn>
    requires std::invocable<Fn, TransactionBuilder&> &&
             (!std::is_void_v<std::invoke_result_t<Fn, TransactionBuilder&>>)
auto EditorSession::transact(Fn&& fn) -> std::invoke_result_t<Fn, TransactionBuilder&> {
    auto lock = std::unique_lock{mutex_};
    auto old_state = state_;
    auto tr = state_.tr();
    auto result = fn(tr);
    auto applied = state_.apply_transaction(tr.build());
    state_ = applied.state;
    lock.unlock();
    notify(old_state, applied);
    return result;
}

}  // namespace folio_cpp
