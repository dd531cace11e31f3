#include <folio-cpp/node.hpp>
#include <folio-cpp/error.hpp>
#include <folio-cpp/resolved_pos.hpp>

#include <algorithm>

namespace folio_cpp {

namespace {

/// `a - b`, clamped at zero.
auto sub_sat(std::size_t a, std::size_t b) -> std::size_t {
    return a > b ? a - b : 0;
}

auto quote_text(const std::string& text) -> std::string {
    return to_string(ScalarValue{text});
}

auto wrap_marks(const MarkSet& marks, std::string str) -> std::string {
    for (auto it = marks.rbegin(); it != marks.rend(); ++it) {
        str = it->type->name() + "(" + str + ")";
    }
    return str;
}

}  // namespace

// -- Fragment -----------------------------------------------------------------

Fragment::Fragment(std::vector<NodePtr> content) : content_{std::move(content)} {
    for (const auto& child : content_) size_ += child->node_size();
}

auto Fragment::from_array(std::vector<NodePtr> nodes) -> Fragment {
    auto joined = std::vector<NodePtr>{};
    joined.reserve(nodes.size());
    for (auto& node : nodes) {
        if (!joined.empty() && node->is_text() && joined.back()->is_text()
            && joined.back()->same_markup(*node)) {
            joined.back() = joined.back()->with_text(joined.back()->text() + node->text());
        } else {
            joined.push_back(std::move(node));
        }
    }
    return Fragment{std::move(joined)};
}

auto Fragment::from(NodePtr node) -> Fragment {
    if (!node) return Fragment{};
    return Fragment{std::vector<NodePtr>{std::move(node)}};
}

auto Fragment::child(std::size_t index) const -> const NodePtr& {
    if (index >= content_.size()) {
        throw Exception{ErrorKind::invalid_position,
                        "Index " + std::to_string(index) + " out of range for " + to_string()};
    }
    return content_[index];
}

auto Fragment::maybe_child(std::size_t index) const -> NodePtr {
    return index < content_.size() ? content_[index] : nullptr;
}

auto Fragment::first_child() const -> NodePtr {
    return content_.empty() ? nullptr : content_.front();
}

auto Fragment::last_child() const -> NodePtr {
    return content_.empty() ? nullptr : content_.back();
}

void Fragment::nodes_between(std::size_t from, std::size_t to, const NodeVisitor& f,
                             std::size_t node_start, const Node* parent) const {
    auto pos = std::size_t{0};
    for (std::size_t i = 0; i < content_.size() && pos < to; ++i) {
        const auto& child = content_[i];
        auto end = pos + child->node_size();
        if (end > from && f(child, node_start + pos, parent, i) && child->content().size() > 0) {
            auto start = pos + 1;
            child->nodes_between(sub_sat(from, start),
                                 std::min(child->content().size(), sub_sat(to, start)),
                                 f, node_start + start);
        }
        pos = end;
    }
}

void Fragment::descendants(const NodeVisitor& f) const {
    nodes_between(0, size_, f);
}

auto Fragment::text_between(std::size_t from, std::size_t to, std::string_view block_separator,
                            std::string_view leaf_text) const -> std::string {
    auto text = std::string{};
    auto first = true;
    nodes_between(from, to, [&](const NodePtr& node, std::size_t pos, const Node*, std::size_t) {
        auto node_text = std::string{};
        if (node->is_text()) {
            auto start = std::max(from, pos) - pos;
            node_text = node->text().substr(start, to - pos - start);
        } else if (node->is_leaf()) {
            node_text = std::string{leaf_text};
        }
        if (node->is_block() && ((node->is_leaf() && !node_text.empty()) || node->is_textblock())
            && !block_separator.empty()) {
            if (first) first = false;
            else text += block_separator;
        }
        text += node_text;
        return true;
    });
    return text;
}

auto Fragment::append(const Fragment& other) const -> Fragment {
    if (other.size() == 0) return *this;
    if (size_ == 0) return other;
    auto content = content_;
    auto i = std::size_t{0};
    const auto& last = content.back();
    const auto& first = other.content_.front();
    if (last->is_text() && first->is_text() && last->same_markup(*first)) {
        content.back() = last->with_text(last->text() + first->text());
        i = 1;
    }
    for (; i < other.content_.size(); ++i) content.push_back(other.content_[i]);
    return Fragment{std::move(content)};
}

auto Fragment::cut(std::size_t from, std::size_t to) const -> Fragment {
    if (from == 0 && to == size_) return *this;
    auto result = std::vector<NodePtr>{};
    if (to > from) {
        auto pos = std::size_t{0};
        for (std::size_t i = 0; i < content_.size() && pos < to; ++i) {
            auto child = content_[i];
            auto end = pos + child->node_size();
            if (end > from) {
                if (pos < from || end > to) {
                    if (child->is_text()) {
                        child = child->cut(sub_sat(from, pos), std::min(child->text().size(), to - pos));
                    } else {
                        child = child->cut(sub_sat(from, pos + 1),
                                           std::min(child->content().size(), sub_sat(to, pos + 1)));
                    }
                }
                result.push_back(std::move(child));
            }
            pos = end;
        }
    }
    return Fragment{std::move(result)};
}

auto Fragment::cut_by_index(std::size_t from, std::size_t to) const -> Fragment {
    if (from == to) return Fragment{};
    if (from == 0 && to == content_.size()) return *this;
    return Fragment{std::vector<NodePtr>(content_.begin() + static_cast<std::ptrdiff_t>(from),
                                         content_.begin() + static_cast<std::ptrdiff_t>(to))};
}

auto Fragment::replace_child(std::size_t index, NodePtr node) const -> Fragment {
    if (content_.at(index) == node) return *this;
    auto copy = content_;
    copy[index] = std::move(node);
    return Fragment{std::move(copy)};
}

auto Fragment::add_to_start(NodePtr node) const -> Fragment {
    auto copy = std::vector<NodePtr>{std::move(node)};
    copy.insert(copy.end(), content_.begin(), content_.end());
    return Fragment{std::move(copy)};
}

auto Fragment::add_to_end(NodePtr node) const -> Fragment {
    auto copy = content_;
    copy.push_back(std::move(node));
    return Fragment{std::move(copy)};
}

auto Fragment::find_index(std::size_t pos, int round) const -> IndexInfo {
    if (pos == 0) return {0, 0};
    if (pos == size_) return {content_.size(), pos};
    if (pos > size_) {
        throw Exception{ErrorKind::invalid_position,
                        "Position " + std::to_string(pos) + " outside of fragment (" + to_string() + ")"};
    }
    auto cur = std::size_t{0};
    for (std::size_t i = 0;; ++i) {
        auto end = cur + content_[i]->node_size();
        if (end >= pos) {
            if (end == pos || round > 0) return {i + 1, end};
            return {i, cur};
        }
        cur = end;
    }
}

auto Fragment::eq(const Fragment& other) const -> bool {
    if (content_.size() != other.content_.size()) return false;
    for (std::size_t i = 0; i < content_.size(); ++i) {
        if (!content_[i]->eq(*other.content_[i])) return false;
    }
    return true;
}

auto Fragment::to_string() const -> std::string {
    return "<" + to_string_inner() + ">";
}

auto Fragment::to_string_inner() const -> std::string {
    auto out = std::string{};
    for (std::size_t i = 0; i < content_.size(); ++i) {
        if (i) out += ", ";
        out += content_[i]->to_string();
    }
    return out;
}

// -- Slice --------------------------------------------------------------------

namespace {

auto insert_into(const Fragment& content, std::size_t dist, const Fragment& insert,
                 const Node* parent) -> std::optional<Fragment> {
    auto [index, offset] = content.find_index(dist);
    auto child = content.maybe_child(index);
    if (offset == dist || child->is_text()) {
        if (parent && !parent->can_replace(index, index, insert)) return std::nullopt;
        return content.cut(0, dist).append(insert).append(content.cut(dist));
    }
    auto inner = insert_into(child->content(), dist - offset - 1, insert, child.get());
    if (!inner) return std::nullopt;
    return content.replace_child(index, child->copy(std::move(*inner)));
}

auto remove_range(const Fragment& content, std::size_t from, std::size_t to) -> Fragment {
    auto [index, offset] = content.find_index(from);
    auto child = content.maybe_child(index);
    auto [index_to, offset_to] = content.find_index(to);
    if (offset == from || child->is_text()) {
        if (offset_to != to && !content.child(index_to)->is_text()) {
            throw Exception{ErrorKind::invalid_content, "Removing non-flat range"};
        }
        return content.cut(0, from).append(content.cut(to));
    }
    if (index != index_to) throw Exception{ErrorKind::invalid_content, "Removing non-flat range"};
    return content.replace_child(
        index, child->copy(remove_range(child->content(), from - offset - 1, to - offset - 1)));
}

}  // namespace

Slice::Slice(Fragment content, std::size_t open_start, std::size_t open_end)
    : content_{std::move(content)}, open_start_{open_start}, open_end_{open_end} {}

auto Slice::max_open(const Fragment& fragment, bool open_isolating) -> Slice {
    auto open_start = std::size_t{0};
    auto open_end = std::size_t{0};
    for (auto n = fragment.first_child(); n && !n->is_leaf()
         && (open_isolating || !n->type().spec().isolating); n = n->first_child()) {
        ++open_start;
    }
    for (auto n = fragment.last_child(); n && !n->is_leaf()
         && (open_isolating || !n->type().spec().isolating); n = n->last_child()) {
        ++open_end;
    }
    return Slice{fragment, open_start, open_end};
}

auto Slice::insert_at(std::size_t pos, const Fragment& fragment) const -> std::optional<Slice> {
    auto content = insert_into(content_, pos + open_start_, fragment, nullptr);
    if (!content) return std::nullopt;
    return Slice{std::move(*content), open_start_, open_end_};
}

auto Slice::remove_between(std::size_t from, std::size_t to) const -> Slice {
    return Slice{remove_range(content_, from + open_start_, to + open_start_), open_start_, open_end_};
}

auto Slice::eq(const Slice& other) const -> bool {
    return content_.eq(other.content_) && open_start_ == other.open_start_
        && open_end_ == other.open_end_;
}

auto Slice::to_string() const -> std::string {
    return content_.to_string() + "(" + std::to_string(open_start_) + "," + std::to_string(open_end_) + ")";
}

// -- Replace ------------------------------------------------------------------

namespace {

auto close(const NodePtr& node, const Fragment& content) -> NodePtr {
    node->type().check_content(content);
    return node->copy(content);
}

void check_join(const Node& main, const Node& sub) {
    if (!sub.type().compatible_content(main.type())) {
        throw Exception{ErrorKind::invalid_content,
                        "Cannot join " + sub.type().name() + " onto " + main.type().name()};
    }
}

auto joinable(const ResolvedPos& before, const ResolvedPos& after, std::size_t depth) -> NodePtr {
    const auto& node = before.node(depth);
    check_join(*node, *after.node(depth));
    return node;
}

void add_node(const NodePtr& child, std::vector<NodePtr>& target) {
    if (!target.empty() && child->is_text() && target.back()->is_text()
        && child->same_markup(*target.back())) {
        target.back() = child->with_text(target.back()->text() + child->text());
    } else {
        target.push_back(child);
    }
}

void add_range(const ResolvedPos* start, const ResolvedPos* end, std::size_t depth,
               std::vector<NodePtr>& target) {
    const auto& node = (end ? end : start)->node(depth);
    auto start_index = std::size_t{0};
    auto end_index = end ? end->index(depth) : node->child_count();
    if (start) {
        start_index = start->index(depth);
        if (start->depth() > depth) {
            ++start_index;
        } else if (start->text_offset()) {
            add_node(start->node_after(), target);
            ++start_index;
        }
    }
    for (auto i = start_index; i < end_index; ++i) add_node(node->child(i), target);
    if (end && end->depth() == depth && end->text_offset()) add_node(end->node_before(), target);
}

auto replace_two_way(const ResolvedPos& from, const ResolvedPos& to, std::size_t depth) -> Fragment {
    auto content = std::vector<NodePtr>{};
    add_range(nullptr, &from, depth, content);
    if (from.depth() > depth) {
        auto type = joinable(from, to, depth + 1);
        add_node(close(type, replace_two_way(from, to, depth + 1)), content);
    }
    add_range(&to, nullptr, depth, content);
    return Fragment{std::move(content)};
}

auto replace_three_way(const ResolvedPos& from, const ResolvedPos& start, const ResolvedPos& end,
                       const ResolvedPos& to, std::size_t depth) -> Fragment {
    auto open_start = from.depth() > depth ? joinable(from, start, depth + 1) : nullptr;
    auto open_end = to.depth() > depth ? joinable(end, to, depth + 1) : nullptr;

    auto content = std::vector<NodePtr>{};
    add_range(nullptr, &from, depth, content);
    if (open_start && open_end && start.index(depth) == end.index(depth)) {
        check_join(*open_start, *open_end);
        add_node(close(open_start, replace_three_way(from, start, end, to, depth + 1)), content);
    } else {
        if (open_start) add_node(close(open_start, replace_two_way(from, start, depth + 1)), content);
        add_range(&start, &end, depth, content);
        if (open_end) add_node(close(open_end, replace_two_way(end, to, depth + 1)), content);
    }
    add_range(&to, nullptr, depth, content);
    return Fragment{std::move(content)};
}

/// Wrap the slice content in copies of the ancestors of `along` so its
/// open sides can be resolved like a document.
auto prepare_slice_for_replace(const Slice& slice, const ResolvedPos& along)
    -> std::pair<ResolvedPos, ResolvedPos> {
    auto extra = along.depth() - slice.open_start();
    auto node = along.node(extra)->copy(slice.content());
    for (auto i = extra; i-- > 0;) node = along.node(i)->copy(Fragment::from(node));
    return {node->resolve(slice.open_start() + extra),
            node->resolve(node->content().size() - slice.open_end() - extra)};
}

auto replace_outer(const ResolvedPos& from, const ResolvedPos& to, const Slice& slice,
                   std::size_t depth) -> NodePtr {
    auto index = from.index(depth);
    const auto& node = from.node(depth);
    if (index == to.index(depth) && depth < from.depth() - slice.open_start()) {
        auto inner = replace_outer(from, to, slice, depth + 1);
        return node->copy(node->content().replace_child(index, std::move(inner)));
    }
    if (slice.content().size() == 0) {
        return close(node, replace_two_way(from, to, depth));
    }
    if (!slice.open_start() && !slice.open_end() && from.depth() == depth && to.depth() == depth) {
        const auto& parent = from.parent();
        const auto& content = parent->content();
        return close(parent, content.cut(0, from.parent_offset())
                                 .append(slice.content())
                                 .append(content.cut(to.parent_offset())));
    }
    auto [start, end] = prepare_slice_for_replace(slice, from);
    return close(node, replace_three_way(from, start, end, to, depth));
}

auto replace_slice(const ResolvedPos& from, const ResolvedPos& to, const Slice& slice) -> NodePtr {
    if (slice.open_start() > from.depth()) {
        throw Exception{ErrorKind::invalid_content, "Inserted content deeper than insertion position"};
    }
    if (from.depth() - slice.open_start() != to.depth() - slice.open_end()) {
        throw Exception{ErrorKind::invalid_content, "Inconsistent open depths"};
    }
    return replace_outer(from, to, slice, 0);
}

}  // namespace

// -- Node ---------------------------------------------------------------------

Node::Node(const NodeType& type, Attrs attrs, Fragment content, MarkSet marks)
    : type_{&type}, attrs_{std::move(attrs)}, content_{std::move(content)}, marks_{std::move(marks)} {}

Node::Node(const NodeType& type, Attrs attrs, std::string text, MarkSet marks)
    : type_{&type}, attrs_{std::move(attrs)}, marks_{std::move(marks)}, text_{std::move(text)} {}

auto Node::node_size() const -> std::size_t {
    if (is_text()) return text_.size();
    if (is_leaf()) return 1;
    return content_.size() + 2;
}

void Node::nodes_between(std::size_t from, std::size_t to, const NodeVisitor& f,
                         std::size_t start_pos) const {
    content_.nodes_between(from, to, f, start_pos, this);
}

void Node::descendants(const NodeVisitor& f) const {
    nodes_between(0, content_.size(), f);
}

auto Node::text_content() const -> std::string {
    if (is_text()) return text_;
    return text_between(0, content_.size());
}

auto Node::text_between(std::size_t from, std::size_t to, std::string_view block_separator,
                        std::string_view leaf_text) const -> std::string {
    if (is_text()) return text_.substr(from, to - from);
    return content_.text_between(from, to, block_separator, leaf_text);
}

auto Node::same_markup(const Node& other) const -> bool {
    return has_markup(other.type(), other.attrs(), other.marks());
}

auto Node::has_markup(const NodeType& type, const Attrs& attrs, const MarkSet& marks) const -> bool {
    return type_ == &type && attrs_ == attrs && Mark::same_set(marks_, marks);
}

auto Node::eq(const Node& other) const -> bool {
    if (this == &other) return true;
    if (!same_markup(other)) return false;
    if (is_text()) return text_ == other.text_;
    return content_.eq(other.content_);
}

auto Node::copy(Fragment content) const -> NodePtr {
    return std::make_shared<const Node>(*type_, attrs_, std::move(content), marks_);
}

auto Node::mark(MarkSet marks) const -> NodePtr {
    if (Mark::same_set(marks, marks_)) return shared_from_this();
    if (is_text()) return std::make_shared<const Node>(*type_, attrs_, text_, std::move(marks));
    return std::make_shared<const Node>(*type_, attrs_, content_, std::move(marks));
}

auto Node::with_text(std::string text) const -> NodePtr {
    if (text == text_) return shared_from_this();
    return std::make_shared<const Node>(*type_, attrs_, std::move(text), marks_);
}

auto Node::cut(std::size_t from, std::size_t to) const -> NodePtr {
    if (is_text()) {
        if (from == 0 && to == text_.size()) return shared_from_this();
        return with_text(text_.substr(from, to - from));
    }
    if (from == 0 && to == content_.size()) return shared_from_this();
    return copy(content_.cut(from, to));
}

auto Node::cut(std::size_t from) const -> NodePtr {
    return cut(from, is_text() ? text_.size() : content_.size());
}

auto Node::slice(std::size_t from, std::size_t to, bool include_parents) const -> Slice {
    if (from == to) return Slice::empty();
    auto rfrom = resolve(from);
    auto rto = resolve(to);
    auto depth = include_parents ? 0 : rfrom.shared_depth(to);
    auto start = rfrom.start(depth);
    const auto& node = rfrom.node(depth);
    auto content = node->content().cut(rfrom.pos() - start, rto.pos() - start);
    return Slice{std::move(content), rfrom.depth() - depth, rto.depth() - depth};
}

auto Node::replace(std::size_t from, std::size_t to, const Slice& slice) const -> NodePtr {
    return replace_slice(resolve(from), resolve(to), slice);
}

auto Node::node_at(std::size_t pos) const -> NodePtr {
    auto node = shared_from_this();
    for (;;) {
        auto [index, offset] = node->content().find_index(pos);
        node = node->maybe_child(index);
        if (!node) return nullptr;
        if (offset == pos || node->is_text()) return node;
        pos -= offset + 1;
    }
}

auto Node::child_after(std::size_t pos) const -> ChildInfo {
    auto [index, offset] = content_.find_index(pos);
    return {content_.maybe_child(index), index, offset};
}

auto Node::child_before(std::size_t pos) const -> ChildInfo {
    if (pos == 0) return {nullptr, 0, 0};
    auto [index, offset] = content_.find_index(pos);
    if (offset < pos) return {content_.child(index), index, offset};
    const auto& node = content_.child(index - 1);
    return {node, index - 1, offset - node->node_size()};
}

auto Node::resolve(std::size_t pos) const -> ResolvedPos {
    return ResolvedPos::resolve(shared_from_this(), pos);
}

auto Node::range_has_mark(std::size_t from, std::size_t to, const MarkType& type) const -> bool {
    auto found = false;
    if (to > from) {
        nodes_between(from, to, [&](const NodePtr& node, std::size_t, const Node*, std::size_t) {
            if (type.is_in_set(node->marks())) found = true;
            return !found;
        });
    }
    return found;
}

auto Node::can_replace(std::size_t from, std::size_t to, const Fragment& replacement,
                       std::size_t start, std::size_t end) const -> bool {
    end = std::min(end, replacement.child_count());
    auto children = std::vector<NodePtr>{};
    for (std::size_t i = 0; i < from; ++i) children.push_back(content_.child(i));
    for (auto i = start; i < end; ++i) children.push_back(replacement.child(i));
    for (auto i = to; i < content_.child_count(); ++i) children.push_back(content_.child(i));
    if (!type_->content_match().valid_content(Fragment{std::move(children)})) return false;
    for (auto i = start; i < end; ++i) {
        if (!type_->allows_marks(replacement.child(i)->marks())) return false;
    }
    return true;
}

auto Node::can_replace(std::size_t from, std::size_t to, const Fragment& replacement) const -> bool {
    return can_replace(from, to, replacement, 0, replacement.child_count());
}

auto Node::can_replace_with(std::size_t from, std::size_t to, const NodeType& type,
                            const MarkSet& marks) const -> bool {
    if (!marks.empty() && !type_->allows_marks(marks)) return false;
    const auto& match = type_->content_match();
    if (!match.allows_type(type)) return false;
    auto count = from + 1 + (content_.child_count() - to);
    return count >= match.min_count() && (!match.max_count() || count <= *match.max_count());
}

auto Node::can_append(const Node& other) const -> bool {
    if (other.content().size() > 0) return can_replace(child_count(), child_count(), other.content());
    return type_->compatible_content(other.type());
}

void Node::check() const {
    type_->check_content(content_);
    type_->compute_attrs(attrs_);
    auto copy = MarkSet{};
    for (const auto& m : marks_) copy = m.add_to_set(copy);
    if (!Mark::same_set(copy, marks_)) {
        throw Exception{ErrorKind::invalid_content,
                        "Invalid collection of marks for node " + type_->name()};
    }
    for (const auto& child : content_.children()) child->check();
}

auto Node::to_string() const -> std::string {
    if (is_text()) return wrap_marks(marks_, quote_text(text_));
    auto name = type_->name();
    if (content_.size() > 0) name += "(" + content_.to_string_inner() + ")";
    return wrap_marks(marks_, name);
}

}  // namespace folio_cpp
