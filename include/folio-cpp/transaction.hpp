/// @file transaction.hpp
/// @brief TransactionBuilder and the immutable Transaction it produces.

#pragma once

#include <folio-cpp/mark.hpp>
#include <folio-cpp/plugin_key.hpp>
#include <folio-cpp/selection.hpp>
#include <folio-cpp/transform.hpp>

#include <any>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace folio_cpp {

class EditorState;

using MetaMap = std::map<std::string, std::any, std::less<>>;

/// Metadata of a transaction. String keys and plugin keys are kept
/// apart, so a string equal to a plugin key never shadows its entry.
struct TransactionMeta {
    MetaMap named;
    MetaMap plugins;  ///< Keyed by PluginKeyBase::key().
};

/// An applied-ready, immutable batch of steps plus selection, stored
/// marks, and metadata. Produced by TransactionBuilder::build().
class Transaction {
public:
    auto before() const -> const NodePtr& { return transform_.before(); }
    auto doc() const -> const NodePtr& { return transform_.doc(); }
    auto steps() const -> const std::vector<Step>& { return transform_.steps(); }
    auto docs() const -> const std::vector<NodePtr>& { return transform_.docs(); }
    auto mapping() const -> const Mapping& { return transform_.mapping(); }
    auto doc_changed() const -> bool { return transform_.doc_changed(); }

    auto selection() const -> const Selection& { return selection_; }
    auto selection_set() const -> bool { return selection_set_; }
    auto stored_marks() const -> const std::optional<MarkSet>& { return stored_marks_; }
    auto stored_marks_set() const -> bool { return stored_marks_set_; }
    auto scrolled_into_view() const -> bool { return scrolled_into_view_; }

    /// Creation time in milliseconds since the epoch.
    auto time() const -> std::int64_t { return time_; }

    auto get_meta(std::string_view key) const -> const std::any*;
    auto get_meta(const PluginKeyBase& key) const -> const std::any*;

    /// Typed metadata lookup; nullptr when absent or of another type.
    template <typename V>
    auto meta(std::string_view key) const -> const V* {
        const auto* value = get_meta(key);
        return value ? std::any_cast<V>(value) : nullptr;
    }

    template <typename V>
    auto meta(const PluginKeyBase& key) const -> const V* {
        const auto* value = get_meta(key);
        return value ? std::any_cast<V>(value) : nullptr;
    }

    /// True when the only metadata is keyed by plugins.
    auto is_generic() const -> bool;

    /// A copy with one more string-keyed metadata entry.
    auto with_meta(std::string_view key, std::any value) const -> Transaction;

private:
    friend class TransactionBuilder;

    Transaction(Transform transform, Selection selection, bool selection_set,
                std::optional<MarkSet> stored_marks, bool stored_marks_set,
                bool scrolled_into_view, std::int64_t time, TransactionMeta meta);

    Transform transform_;
    Selection selection_;
    bool selection_set_;
    std::optional<MarkSet> stored_marks_;
    bool stored_marks_set_;
    bool scrolled_into_view_;
    std::int64_t time_;
    TransactionMeta meta_;
};

/// Accumulates steps against a state's document and tracks how the
/// selection and stored marks follow them.
///
/// Obtain one from EditorState::tr(), edit, then build() the Transaction
/// that EditorState::apply() consumes.
class TransactionBuilder : public Transform {
public:
    explicit TransactionBuilder(const EditorState& state);
    TransactionBuilder(NodePtr doc, Selection selection, std::optional<MarkSet> stored_marks = std::nullopt);

    // -- Time -----------------------------------------------------------------

    auto time() const -> std::int64_t { return time_; }
    void set_time(std::int64_t time) { time_ = time; }

    // -- Selection ------------------------------------------------------------

    /// The selection, mapped through every step added so far.
    auto selection() const -> const Selection&;

    /// Set the selection; throws invalid_selection when it points into
    /// another document.
    void set_selection(const Selection& selection);
    auto selection_set() const -> bool { return (updated_ & updated_sel) != 0; }

    void delete_selection();
    void replace_selection(const Slice& slice);
    void replace_selection_with(const NodePtr& node, bool inherit_marks = true);

    /// Replace the selection with text.
    void insert_text(std::string_view text);
    /// Replace [from, to) with text, using the stored marks when set.
    void insert_text(std::string_view text, std::size_t from, std::optional<std::size_t> to = std::nullopt);

    // -- Stored marks ---------------------------------------------------------

    auto stored_marks() const -> const std::optional<MarkSet>& { return stored_marks_; }
    void set_stored_marks(std::optional<MarkSet> marks);
    /// Set the stored marks unless the marks at the cursor already match.
    void ensure_marks(const MarkSet& marks);
    void add_stored_mark(const Mark& mark);
    void remove_stored_mark(const Mark& mark);
    void remove_stored_mark(const MarkType& type);
    auto stored_marks_set() const -> bool { return (updated_ & updated_marks) != 0; }

    // -- Scroll ---------------------------------------------------------------

    void scroll_into_view() { updated_ |= updated_scroll; }
    auto scrolled_into_view() const -> bool { return (updated_ & updated_scroll) != 0; }

    // -- Metadata -------------------------------------------------------------

    void set_meta(std::string_view key, std::any value);
    void set_meta(const PluginKeyBase& key, std::any value);
    auto get_meta(std::string_view key) const -> const std::any*;
    auto get_meta(const PluginKeyBase& key) const -> const std::any*;
    auto is_generic() const -> bool;

    /// Finalize into an immutable Transaction.
    auto build() const -> Transaction;

protected:
    void add_step(const Step& step, NodePtr doc) override;

private:
    static constexpr std::uint8_t updated_sel = 1;
    static constexpr std::uint8_t updated_marks = 2;
    static constexpr std::uint8_t updated_scroll = 4;

    auto marks_at_head() const -> MarkSet;

    std::int64_t time_;
    mutable Selection cur_selection_;
    mutable std::size_t cur_selection_for_{0};
    std::optional<MarkSet> stored_marks_;
    std::uint8_t updated_{0};
    TransactionMeta meta_;
};

}  // namespace folio_cpp
