/// @file history.hpp
/// @brief Undo/redo history as a plugin.
///
/// The history plugin records inverted steps in two branches: `done`
/// (undo) and `undone` (redo). Transactions are grouped into events by
/// time and adjacency. Transactions that must not be undone set the
/// string meta `"addToHistory"` to `false`; collaborative rebasing
/// passes the number of rebased steps as `"rebased"` (std::size_t).

#pragma once

#include <folio-cpp/editor_state.hpp>
#include <folio-cpp/plugin.hpp>
#include <folio-cpp/transaction.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace folio_cpp {

namespace detail {
class HistoryBranch;
}  // namespace detail

/// Options of the history plugin.
struct HistoryOptions {
    std::size_t depth{100};               ///< Events kept before the oldest are dropped.
    std::int64_t new_group_delay{500};    ///< Milliseconds after which a new event starts.
};

/// The state the history plugin keeps in every EditorState.
class HistoryState {
public:
    HistoryState(std::shared_ptr<const detail::HistoryBranch> done,
                 std::shared_ptr<const detail::HistoryBranch> undone,
                 std::optional<std::vector<std::size_t>> prev_ranges,
                 std::int64_t prev_time, HistoryOptions options);

    /// An empty history.
    static auto initial(HistoryOptions options) -> HistoryState;

    auto done() const -> const detail::HistoryBranch& { return *done_; }
    auto undone() const -> const detail::HistoryBranch& { return *undone_; }

    /// Number of undoable events.
    auto undo_depth() const -> std::size_t;
    /// Number of redoable events.
    auto redo_depth() const -> std::size_t;

    /// Flat (from, to) pairs touched by the last recorded transaction.
    auto prev_ranges() const -> const std::optional<std::vector<std::size_t>>& { return prev_ranges_; }
    auto prev_time() const -> std::int64_t { return prev_time_; }
    auto options() const -> const HistoryOptions& { return options_; }

    /// The state after recording `tr`, which was applied to `state`.
    auto apply(const Transaction& tr, const EditorState& state) const -> HistoryState;

private:
    std::shared_ptr<const detail::HistoryBranch> done_;
    std::shared_ptr<const detail::HistoryBranch> undone_;
    std::optional<std::vector<std::size_t>> prev_ranges_;
    std::int64_t prev_time_;
    HistoryOptions options_;
};

/// Metadata an undo or redo transaction carries under history_key().
struct HistoryMeta {
    bool redo;
    HistoryState state;
};

/// The key of the history plugin.
auto history_key() -> const PluginKey<HistoryState>&;

/// Create the history plugin.
auto history(HistoryOptions options = {}) -> Plugin;

/// Undo the last event. Returns false when there is nothing to undo;
/// dispatches only when `dispatch` is set.
auto undo(const EditorState& state, const Dispatch& dispatch = {}) -> bool;
/// Redo the last undone event.
auto redo(const EditorState& state, const Dispatch& dispatch = {}) -> bool;
/// undo() without scrolling the selection into view.
auto undo_no_scroll(const EditorState& state, const Dispatch& dispatch = {}) -> bool;
/// redo() without scrolling the selection into view.
auto redo_no_scroll(const EditorState& state, const Dispatch& dispatch = {}) -> bool;

auto undo_depth(const EditorState& state) -> std::size_t;
auto redo_depth(const EditorState& state) -> std::size_t;

/// Keep the next change out of the current event, so it needs its own
/// undo.
void close_history(TransactionBuilder& tr);

/// Whether `tr` was created by undo or redo.
auto is_history_transaction(const Transaction& tr) -> bool;

}  // namespace folio_cpp
