/// @file commands.hpp
/// @brief Structural editing commands: splitting, joining and deleting.
///
/// Every command checks whether it applies to `state`. It returns false
/// when it does not. When it applies and `dispatch` is set, it builds a
/// transaction and passes it to `dispatch`. Calling a command without
/// a dispatch callback only asks whether it would apply.
///
/// @code
/// auto apply = [&](const Transaction& tr) { state = state.apply(tr); };
/// if (!delete_backward(state, apply)) { /* at the start of the document */ }
/// @endcode

#pragma once

#include <folio-cpp/editor_state.hpp>

#include <functional>

namespace folio_cpp {

/// Any command with the signature shared by these and undo()/redo().
using Command = std::function<bool(const EditorState&, const Dispatch&)>;

/// Split the textblock at the cursor, deleting a non-empty selection
/// first. The cursor ends up at the start of the new block.
auto split_block(const EditorState& state, const Dispatch& dispatch = {}) -> bool;

/// split_block(), carrying the stored marks (or the marks at the
/// cursor, when it is not at the start of its block) into the new block.
auto split_block_keep_marks(const EditorState& state, const Dispatch& dispatch = {}) -> bool;

/// With the cursor at the start of a textblock, join it with the block
/// before. An empty block that cannot be joined is deleted instead.
auto join_backward(const EditorState& state, const Dispatch& dispatch = {}) -> bool;

/// With the cursor at the end of a textblock, join it with the block
/// after. An empty next block that cannot be joined is deleted instead.
auto join_forward(const EditorState& state, const Dispatch& dispatch = {}) -> bool;

/// Delete the selection; for a cursor, join_backward() or delete the
/// character before it.
auto delete_backward(const EditorState& state, const Dispatch& dispatch = {}) -> bool;

/// Delete the selection; for a cursor, join_forward() or delete the
/// character after it.
auto delete_forward(const EditorState& state, const Dispatch& dispatch = {}) -> bool;

}  // namespace folio_cpp
