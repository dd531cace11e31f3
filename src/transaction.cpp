#include <folio-cpp/transaction.hpp>
#include <folio-cpp/editor_state.hpp>
#include <folio-cpp/error.hpp>

#include <algorithm>
#include <chrono>

namespace folio_cpp {

namespace {

auto now_millis() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

auto lookup(const MetaMap& meta, std::string_view key) -> const std::any* {
    auto it = meta.find(key);
    return it == meta.end() ? nullptr : &it->second;
}

}  // namespace

// -- Transaction --------------------------------------------------------------

Transaction::Transaction(Transform transform, Selection selection, bool selection_set,
                         std::optional<MarkSet> stored_marks, bool stored_marks_set,
                         bool scrolled_into_view, std::int64_t time, TransactionMeta meta)
    : transform_{std::move(transform)},
      selection_{std::move(selection)},
      selection_set_{selection_set},
      stored_marks_{std::move(stored_marks)},
      stored_marks_set_{stored_marks_set},
      scrolled_into_view_{scrolled_into_view},
      time_{time},
      meta_{std::move(meta)} {}

auto Transaction::get_meta(std::string_view key) const -> const std::any* {
    return lookup(meta_.named, key);
}

auto Transaction::get_meta(const PluginKeyBase& key) const -> const std::any* {
    return lookup(meta_.plugins, key.key());
}

auto Transaction::is_generic() const -> bool {
    return meta_.named.empty();
}

auto Transaction::with_meta(std::string_view key, std::any value) const -> Transaction {
    auto copy = *this;
    copy.meta_.named.insert_or_assign(std::string{key}, std::move(value));
    return copy;
}

// -- TransactionBuilder -------------------------------------------------------

TransactionBuilder::TransactionBuilder(const EditorState& state)
    : TransactionBuilder{state.doc(), state.selection(), state.stored_marks()} {}

TransactionBuilder::TransactionBuilder(NodePtr doc, Selection selection, std::optional<MarkSet> stored_marks)
    : Transform{std::move(doc)},
      time_{now_millis()},
      cur_selection_{std::move(selection)},
      stored_marks_{std::move(stored_marks)} {}

auto TransactionBuilder::selection() const -> const Selection& {
    if (cur_selection_for_ < steps().size()) {
        cur_selection_ = cur_selection_.map(doc(), mapping().slice(cur_selection_for_));
        cur_selection_for_ = steps().size();
    }
    return cur_selection_;
}

void TransactionBuilder::set_selection(const Selection& selection) {
    if (selection.doc().get() != doc().get()) {
        throw Exception{ErrorKind::invalid_selection,
                        "Selection passed to set_selection must point at the current document"};
    }
    cur_selection_ = selection;
    cur_selection_for_ = steps().size();
    updated_ = static_cast<std::uint8_t>((updated_ | updated_sel) & ~updated_marks);
    stored_marks_.reset();
}

void TransactionBuilder::delete_selection() {
    auto sel = selection();
    sel.replace(*this);
}

void TransactionBuilder::replace_selection(const Slice& slice) {
    auto sel = selection();
    sel.replace(*this, slice);
}

void TransactionBuilder::replace_selection_with(const NodePtr& node, bool inherit_marks) {
    auto sel = selection();
    auto replacement = node;
    if (inherit_marks) {
        auto marks = stored_marks_ ? *stored_marks_
            : sel.empty() ? sel.resolved_from().marks()
            : sel.resolved_from().marks_across(sel.resolved_to()).value_or(MarkSet{});
        replacement = node->mark(std::move(marks));
    }
    sel.replace_with(*this, replacement);
}

void TransactionBuilder::insert_text(std::string_view text) {
    if (text.empty()) {
        delete_selection();
        return;
    }
    replace_selection_with(doc()->type().schema().text(text), true);
}

void TransactionBuilder::insert_text(std::string_view text, std::size_t from, std::optional<std::size_t> to) {
    auto end = to.value_or(from);
    if (text.empty()) {
        delete_range(from, end);
        return;
    }
    auto marks = stored_marks_;
    if (!marks) {
        auto rfrom = doc()->resolve(from);
        marks = from == end ? rfrom.marks() : rfrom.marks_across(doc()->resolve(end)).value_or(MarkSet{});
    }
    replace_with(from, end, doc()->type().schema().text(text, std::move(*marks)));
    if (!selection().empty()) set_selection(Selection::near(selection().resolved_to()));
}

void TransactionBuilder::set_stored_marks(std::optional<MarkSet> marks) {
    stored_marks_ = std::move(marks);
    updated_ |= updated_marks;
}

auto TransactionBuilder::marks_at_head() const -> MarkSet {
    return stored_marks_ ? *stored_marks_ : selection().resolved_head().marks();
}

void TransactionBuilder::ensure_marks(const MarkSet& marks) {
    auto current = stored_marks_ ? *stored_marks_ : selection().resolved_from().marks();
    if (!Mark::same_set(current, marks)) set_stored_marks(marks);
}

void TransactionBuilder::add_stored_mark(const Mark& mark) {
    ensure_marks(mark.add_to_set(marks_at_head()));
}

void TransactionBuilder::remove_stored_mark(const Mark& mark) {
    ensure_marks(mark.remove_from_set(marks_at_head()));
}

void TransactionBuilder::remove_stored_mark(const MarkType& type) {
    ensure_marks(type.remove_from_set(marks_at_head()));
}

void TransactionBuilder::set_meta(std::string_view key, std::any value) {
    meta_.named.insert_or_assign(std::string{key}, std::move(value));
}

void TransactionBuilder::set_meta(const PluginKeyBase& key, std::any value) {
    meta_.plugins.insert_or_assign(key.key(), std::move(value));
}

auto TransactionBuilder::get_meta(std::string_view key) const -> const std::any* {
    return lookup(meta_.named, key);
}

auto TransactionBuilder::get_meta(const PluginKeyBase& key) const -> const std::any* {
    return lookup(meta_.plugins, key.key());
}

auto TransactionBuilder::is_generic() const -> bool {
    return meta_.named.empty();
}

auto TransactionBuilder::build() const -> Transaction {
    return Transaction{static_cast<const Transform&>(*this), selection(), selection_set(),
                       stored_marks_, stored_marks_set(), scrolled_into_view(), time_, meta_};
}

void TransactionBuilder::add_step(const Step& step, NodePtr doc) {
    Transform::add_step(step, std::move(doc));
    updated_ = static_cast<std::uint8_t>(updated_ & ~updated_marks);
    stored_marks_.reset();
}

}  // namespace folio_cpp
