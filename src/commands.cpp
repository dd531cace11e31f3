#include <folio-cpp/commands.hpp>
#include <folio-cpp/resolved_pos.hpp>
#include <folio-cpp/transform.hpp>

#include <optional>

namespace folio_cpp {

namespace {

auto isolating(const Node& node) -> bool { return node.type().spec().isolating; }

/// The boundary between the block around `pos` and the block before it.
auto find_cut_before(const ResolvedPos& pos) -> std::optional<ResolvedPos> {
    if (isolating(*pos.parent())) return std::nullopt;
    for (auto i = pos.depth(); i-- > 0;) {
        if (pos.index(i) > 0) return ResolvedPos::resolve(pos.doc(), pos.before(i + 1));
        if (isolating(*pos.node(i))) break;
    }
    return std::nullopt;
}

/// The boundary between the block around `pos` and the block after it.
auto find_cut_after(const ResolvedPos& pos) -> std::optional<ResolvedPos> {
    if (isolating(*pos.parent())) return std::nullopt;
    for (auto i = pos.depth(); i-- > 0;) {
        const auto& node = pos.node(i);
        if (pos.index_after(i) < node->child_count()) {
            return ResolvedPos::resolve(pos.doc(), pos.after(i + 1));
        }
        if (isolating(*node)) break;
    }
    return std::nullopt;
}

auto run_split_block(const EditorState& state, const Dispatch& dispatch, bool keep_marks) -> bool {
    const auto& sel = state.selection();
    const auto& from = sel.resolved_from();

    auto marks = std::optional<MarkSet>{};
    if (keep_marks) {
        if (state.stored_marks()) {
            marks = state.stored_marks();
        } else if (sel.resolved_to().parent_offset() > 0) {
            marks = from.marks();
        }
    }

    if (!sel.empty()) {
        if (dispatch) {
            auto tr = state.tr();
            tr.delete_selection();
            auto pos = tr.mapping().map(from.pos());
            auto resolved = ResolvedPos::resolve(tr.doc(), pos);
            if (resolved.parent()->is_textblock() && can_split(*tr.doc(), pos)) tr.split(pos);
            if (marks) tr.ensure_marks(*marks);
            dispatch(tr.build());
        }
        return true;
    }

    if (!from.parent()->is_textblock() || !can_split(*state.doc(), from.pos())) return false;

    if (dispatch) {
        auto tr = state.tr();
        tr.split(from.pos());
        tr.set_selection(Selection::text(tr.doc(), tr.mapping().map(from.pos())));
        if (marks) tr.ensure_marks(*marks);
        dispatch(tr.build());
    }
    return true;
}

}  // namespace

// -- Splitting ----------------------------------------------------------------

auto split_block(const EditorState& state, const Dispatch& dispatch) -> bool {
    return run_split_block(state, dispatch, false);
}

auto split_block_keep_marks(const EditorState& state, const Dispatch& dispatch) -> bool {
    return run_split_block(state, dispatch, true);
}

// -- Joining ------------------------------------------------------------------

auto join_backward(const EditorState& state, const Dispatch& dispatch) -> bool {
    const auto* cursor = state.selection().cursor();
    if (!cursor || cursor->parent_offset() > 0) return false;

    auto cut = find_cut_before(*cursor);
    if (!cut) return false;
    auto before = cut->node_before();
    auto after = cut->node_after();
    if (!before || !after) return false;

    if (before->is_textblock() && after->is_textblock() && can_join(*state.doc(), cut->pos())) {
        if (dispatch) {
            auto tr = state.tr();
            tr.join(cut->pos());
            tr.set_selection(Selection::text(tr.doc(), cut->pos() - 1));
            dispatch(tr.build());
        }
        return true;
    }

    if (cursor->parent()->content().size() == 0) {
        if (dispatch) {
            auto tr = state.tr();
            auto from = cursor->before();
            tr.delete_range(from, cursor->after());
            auto target = ResolvedPos::resolve(tr.doc(), from > 0 ? from - 1 : 0);
            tr.set_selection(Selection::near(target, -1));
            dispatch(tr.build());
        }
        return true;
    }
    return false;
}

auto join_forward(const EditorState& state, const Dispatch& dispatch) -> bool {
    const auto* cursor = state.selection().cursor();
    if (!cursor || cursor->parent_offset() < cursor->parent()->content().size()) return false;

    auto cut = find_cut_after(*cursor);
    if (!cut) return false;
    auto before = cut->node_before();
    auto after = cut->node_after();
    if (!before || !after) return false;

    if (before->is_textblock() && after->is_textblock() && can_join(*state.doc(), cut->pos())) {
        if (dispatch) {
            auto tr = state.tr();
            tr.join(cut->pos());
            dispatch(tr.build());
        }
        return true;
    }

    if (after->content().size() == 0) {
        if (dispatch) {
            auto tr = state.tr();
            tr.delete_range(cut->pos(), cut->pos() + after->node_size());
            dispatch(tr.build());
        }
        return true;
    }
    return false;
}

// -- Deleting -----------------------------------------------------------------

auto delete_backward(const EditorState& state, const Dispatch& dispatch) -> bool {
    if (!state.selection().empty()) {
        if (dispatch) {
            auto tr = state.tr();
            tr.delete_selection();
            dispatch(tr.build());
        }
        return true;
    }
    if (join_backward(state, dispatch)) return true;

    const auto& from = state.selection().resolved_from();
    if (from.parent_offset() == 0) return false;
    if (dispatch) {
        auto tr = state.tr();
        tr.delete_range(from.pos() - 1, from.pos());
        dispatch(tr.build());
    }
    return true;
}

auto delete_forward(const EditorState& state, const Dispatch& dispatch) -> bool {
    if (!state.selection().empty()) {
        if (dispatch) {
            auto tr = state.tr();
            tr.delete_selection();
            dispatch(tr.build());
        }
        return true;
    }
    if (join_forward(state, dispatch)) return true;

    const auto& to = state.selection().resolved_to();
    if (to.parent_offset() >= to.parent()->content().size()) return false;
    if (dispatch) {
        auto tr = state.tr();
        tr.delete_range(to.pos(), to.pos() + 1);
        dispatch(tr.build());
    }
    return true;
}

}  // namespace folio_cpp
