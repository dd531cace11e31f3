/// @file editor_props.hpp
/// @brief EditorProps: the hooks a view or a plugin offers the editor host.

#pragma once

#include <folio-cpp/decoration.hpp>
#include <folio-cpp/node.hpp>

#include <any>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace folio_cpp {

class EditorState;
class Transaction;

/// What a prop handler sees of the editor: the current state and a way
/// to dispatch transactions.
class EditorHost {
public:
    virtual ~EditorHost() = default;

    virtual auto state() const -> EditorState = 0;
    virtual void dispatch(const Transaction& tr) = 0;
};

/// A keyboard event as delivered by the host.
struct KeyEvent {
    std::string key;    ///< Key name, e.g. "Enter" or "a".
    bool shift{false};
    bool ctrl{false};
    bool alt{false};
    bool meta{false};
};

/// A pointer event as delivered by the host.
struct MouseEvent {
    int button{0};
    bool shift{false};
    bool ctrl{false};
    bool alt{false};
    bool meta{false};
};

/// Creates the host-side view object of a node.
using NodeViewFactory = std::function<std::any(const NodePtr& node, std::size_t pos)>;

/// Attributes for the editable root element.
using EditorAttributes = std::map<std::string, std::string, std::less<>>;

/// Optional hooks. Each empty slot means "not provided".
///
/// Handlers return true when they handled the event, which stops the
/// chain. The remaining props are resolved by the rules in props.hpp.
struct EditorProps {
    std::function<bool(EditorHost&, const KeyEvent&)> handle_key_down;
    std::function<bool(EditorHost&, const KeyEvent&)> handle_key_press;
    std::function<bool(EditorHost&, std::size_t from, std::size_t to, std::string_view text)> handle_text_input;
    std::function<bool(EditorHost&, std::size_t pos, const MouseEvent&)> handle_click;
    std::function<bool(EditorHost&, std::size_t pos, const MouseEvent&)> handle_double_click;
    std::function<bool(EditorHost&, std::size_t pos, const MouseEvent&)> handle_triple_click;
    std::function<bool(EditorHost&, const Slice&)> handle_paste;
    std::function<bool(EditorHost&, const Slice&, std::size_t pos, bool moved)> handle_drop;
    std::function<bool(EditorHost&)> handle_scroll_to_selection;

    std::function<std::string(std::string_view text, bool plain, EditorHost&)> transform_pasted_text;

    std::function<DecorationSet(const EditorState&)> decorations;
    std::map<std::string, NodeViewFactory, std::less<>> node_views;
    std::function<bool(const EditorState&)> editable;
    std::function<EditorAttributes(const EditorState&)> attributes;
};

}  // namespace folio_cpp
