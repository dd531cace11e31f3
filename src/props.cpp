#include <folio-cpp/props.hpp>

#include <mutex>
#include <utility>

namespace folio_cpp {

// -- Resolution ---------------------------------------------------------------

namespace {

// View props first, then plugins in registration order.
template <typename Fn>
void for_each_props(const EditorState& state, const EditorProps& view_props, Fn&& fn) {
    fn(view_props);
    for (const auto& plugin : state.plugins()) {
        fn(plugin.props());
    }
}

}  // namespace

auto collect_decorations(const EditorState& state, const EditorProps& view_props) -> DecorationSet {
    auto sets = std::vector<DecorationSet>{};
    for_each_props(state, view_props, [&](const EditorProps& props) {
        if (props.decorations) sets.push_back(props.decorations(state));
    });
    return DecorationSet::merge(sets);
}

auto is_editable(const EditorState& state, const EditorProps& view_props) -> bool {
    const auto* editable = some_prop(state, view_props, &EditorProps::editable);
    return editable ? (*editable)(state) : true;
}

auto collect_attributes(const EditorState& state, const EditorProps& view_props) -> EditorAttributes {
    auto attrs = EditorAttributes{};
    for_each_props(state, view_props, [&](const EditorProps& props) {
        if (!props.attributes) return;
        for (auto& [name, value] : props.attributes(state)) {
            attrs.insert_or_assign(name, std::move(value));
        }
    });
    return attrs;
}

auto find_node_view(const EditorState& state, const EditorProps& view_props,
                    std::string_view type_name) -> const NodeViewFactory* {
    if (auto it = view_props.node_views.find(type_name); it != view_props.node_views.end()) {
        return &it->second;
    }
    for (const auto& plugin : state.plugins()) {
        const auto& views = plugin.props().node_views;
        if (auto it = views.find(type_name); it != views.end()) return &it->second;
    }
    return nullptr;
}

auto apply_transform_pasted_text(const EditorState& state, const EditorProps& view_props,
                                 std::string_view text, bool plain, EditorHost& host) -> std::string {
    auto result = std::string{text};
    for_each_props(state, view_props, [&](const EditorProps& props) {
        if (props.transform_pasted_text) result = props.transform_pasted_text(result, plain, host);
    });
    return result;
}

// -- EditorSession ------------------------------------------------------------

EditorSession::EditorSession(EditorState state, EditorProps props)
    : state_{std::move(state)}, props_{std::move(props)} {}

auto EditorSession::state() const -> EditorState {
    auto lock = std::shared_lock{mutex_};
    return state_;
}

auto EditorSession::snapshot() const -> std::pair<EditorState, EditorProps> {
    auto lock = std::shared_lock{mutex_};
    return {state_, props_};
}

void EditorSession::notify(const EditorState& old_state, const AppliedTransactions& applied) {
    auto listener = ChangeListener{};
    {
        auto lock = std::shared_lock{mutex_};
        listener = listener_;
    }
    if (listener && !applied.transactions.empty()) {
        listener(old_state, applied.state, applied.transactions);
    }
}

void EditorSession::dispatch(const Transaction& tr) {
    auto lock = std::unique_lock{mutex_};
    auto old_state = state_;
    auto applied = state_.apply_transaction(tr);
    state_ = applied.state;
    lock.unlock();
    notify(old_state, applied);
}

void EditorSession::transact(const std::function<void(TransactionBuilder&)>& fn) {
    auto lock = std::unique_lock{mutex_};
    auto old_state = state_;
    auto tr = state_.tr();
    fn(tr);
    auto applied = state_.apply_transaction(tr.build());
    state_ = applied.state;
    lock.unlock();
    notify(old_state, applied);
}

void EditorSession::update_state(EditorState state) {
    auto lock = std::unique_lock{mutex_};
    state_ = std::move(state);
}

auto EditorSession::props() const -> EditorProps {
    auto lock = std::shared_lock{mutex_};
    return props_;
}

void EditorSession::set_props(EditorProps props) {
    auto lock = std::unique_lock{mutex_};
    props_ = std::move(props);
}

void EditorSession::on_change(ChangeListener listener) {
    auto lock = std::unique_lock{mutex_};
    listener_ = std::move(listener);
}

// -- Events -------------------------------------------------------------------

auto EditorSession::key_down(const KeyEvent& event) -> bool {
    auto [state, props] = snapshot();
    return call_prop_handlers(state, props, &EditorProps::handle_key_down, *this, event);
}

auto EditorSession::key_press(const KeyEvent& event) -> bool {
    auto [state, props] = snapshot();
    return call_prop_handlers(state, props, &EditorProps::handle_key_press, *this, event);
}

auto EditorSession::text_input(std::size_t from, std::size_t to, std::string_view text) -> bool {
    auto [state, props] = snapshot();
    if (!is_editable(state, props)) return false;
    if (call_prop_handlers(state, props, &EditorProps::handle_text_input, *this, from, to, text)) return true;
    auto tr = state.tr();
    tr.insert_text(text, from, to);
    tr.scroll_into_view();
    dispatch(tr.build());
    return true;
}

auto EditorSession::text_input(std::string_view text) -> bool {
    auto current = state();
    return text_input(current.selection().from(), current.selection().to(), text);
}

auto EditorSession::click(std::size_t pos, const MouseEvent& event) -> bool {
    auto [state, props] = snapshot();
    if (call_prop_handlers(state, props, &EditorProps::handle_click, *this, pos, event)) return true;
    auto tr = state.tr();
    tr.set_selection(Selection::near(state.doc()->resolve(pos)));
    dispatch(tr.build());
    return true;
}

auto EditorSession::double_click(std::size_t pos, const MouseEvent& event) -> bool {
    auto [state, props] = snapshot();
    return call_prop_handlers(state, props, &EditorProps::handle_double_click, *this, pos, event);
}

auto EditorSession::triple_click(std::size_t pos, const MouseEvent& event) -> bool {
    auto [state, props] = snapshot();
    if (call_prop_handlers(state, props, &EditorProps::handle_triple_click, *this, pos, event)) return true;
    auto rpos = state.doc()->resolve(pos);
    for (auto depth = rpos.depth() + 1; depth-- > 0;) {
        if (!rpos.node(depth)->is_textblock()) continue;
        auto tr = state.tr();
        tr.set_selection(Selection::text(state.doc(), rpos.start(depth), rpos.end(depth)));
        dispatch(tr.build());
        return true;
    }
    return false;
}

auto EditorSession::paste(const Slice& slice) -> bool {
    auto [state, props] = snapshot();
    if (!is_editable(state, props)) return false;
    if (call_prop_handlers(state, props, &EditorProps::handle_paste, *this, slice)) return true;
    auto tr = state.tr();
    tr.replace_selection(slice);
    tr.scroll_into_view();
    tr.set_meta("paste", true);
    tr.set_meta("uiEvent", std::string{"paste"});
    dispatch(tr.build());
    return true;
}

auto EditorSession::paste_text(std::string_view text, bool plain) -> bool {
    auto [state, props] = snapshot();
    if (!is_editable(state, props)) return false;
    auto transformed = apply_transform_pasted_text(state, props, text, plain, *this);
    const auto& schema = *state.schema();

    auto lines = std::vector<std::string_view>{};
    auto rest = std::string_view{transformed};
    for (auto nl = rest.find('\n'); nl != std::string_view::npos; nl = rest.find('\n')) {
        lines.push_back(rest.substr(0, nl));
        rest.remove_prefix(nl + 1);
    }
    lines.push_back(rest);

    const auto& parent = state.selection().resolved_from().parent();
    if (lines.size() == 1 || !parent->is_textblock()) {
        if (transformed.empty()) return false;
        return paste(Slice{Fragment::from(schema.text(transformed)), 0, 0});
    }
    auto blocks = std::vector<NodePtr>{};
    for (auto line : lines) {
        auto content = line.empty() ? Fragment{} : Fragment::from(schema.text(line));
        blocks.push_back(parent->type().create({}, std::move(content), {}));
    }
    return paste(Slice{Fragment::from_array(std::move(blocks)), 1, 1});
}

auto EditorSession::drop(const Slice& slice, std::size_t pos, bool moved) -> bool {
    auto [state, props] = snapshot();
    if (!is_editable(state, props)) return false;
    if (call_prop_handlers(state, props, &EditorProps::handle_drop, *this, slice, pos, moved)) return true;
    auto tr = state.tr();
    if (moved) tr.delete_selection();
    auto insert_pos = tr.mapping().map(pos);
    auto before_insert = tr.steps().size();
    tr.replace(insert_pos, insert_pos, slice);
    if (tr.steps().size() == before_insert) return false;
    auto end = insert_pos;
    tr.mapping().maps().back().for_each([&end](std::size_t, std::size_t, std::size_t, std::size_t new_to) {
        end = new_to;
    });
    tr.set_selection(Selection::between(tr.doc()->resolve(insert_pos), tr.doc()->resolve(end)));
    tr.set_meta("uiEvent", std::string{"drop"});
    dispatch(tr.build());
    return true;
}

auto EditorSession::scroll_to_selection() -> bool {
    auto [state, props] = snapshot();
    return call_prop_handlers(state, props, &EditorProps::handle_scroll_to_selection, *this);
}

// -- Derived view data --------------------------------------------------------

auto EditorSession::decorations() const -> DecorationSet {
    auto [state, props] = snapshot();
    return collect_decorations(state, props);
}

auto EditorSession::editable() const -> bool {
    auto [state, props] = snapshot();
    return is_editable(state, props);
}

auto EditorSession::attributes() const -> EditorAttributes {
    auto [state, props] = snapshot();
    return collect_attributes(state, props);
}

auto EditorSession::node_view(std::string_view type_name) const -> NodeViewFactory {
    auto [state, props] = snapshot();
    const auto* factory = find_node_view(state, props, type_name);
    return factory ? *factory : NodeViewFactory{};
}

}  // namespace folio_cpp
