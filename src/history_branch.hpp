#pragma once

// Internal header, not installed. Implementation detail of the history plugin.

#include <folio-cpp/history.hpp>
#include <folio-cpp/mapping.hpp>
#include <folio-cpp/selection.hpp>
#include <folio-cpp/step.hpp>
#include <folio-cpp/transaction.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace folio_cpp::detail {

// One entry of a branch: a forward step map plus, unless it only tracks
// positions, the inverted step that undoes it. An item with a selection
// starts an event.
struct HistoryItem {
    StepMap map;
    std::optional<Step> step;
    std::optional<SelectionBookmark> selection;
    std::optional<std::size_t> mirror_offset;  // distance back to the item this one inverts

    auto merge(const HistoryItem& other) const -> std::optional<HistoryItem>;
};

// The steps a branch takes from a transform or transaction.
struct RecordedSteps {
    const std::vector<Step>& steps;
    const std::vector<NodePtr>& docs;
    const Mapping& mapping;
};

class HistoryBranch : public std::enable_shared_from_this<HistoryBranch> {
public:
    // Items without a step before compress() kicks in.
    static constexpr std::size_t max_empty_items = 500;
    // Events allowed beyond the depth before old ones are cut off.
    static constexpr std::size_t depth_overflow = 20;

    HistoryBranch() = default;
    HistoryBranch(std::vector<HistoryItem> items, std::size_t event_count)
        : items_{std::move(items)}, event_count_{event_count} {}

    static auto empty() -> std::shared_ptr<const HistoryBranch>;

    auto items() const -> const std::vector<HistoryItem>& { return items_; }
    auto event_count() const -> std::size_t { return event_count_; }

    struct PoppedEvent {
        std::shared_ptr<const HistoryBranch> remaining;
        TransactionBuilder transform;
        SelectionBookmark selection;
    };

    // Undo the latest event into a transaction against `state`.
    auto pop_event(const EditorState& state, bool preserve_items) const -> std::optional<PoppedEvent>;

    auto add_transform(RecordedSteps recorded, std::optional<SelectionBookmark> selection,
                       const HistoryOptions& options, bool preserve_items) const
        -> std::shared_ptr<const HistoryBranch>;

    // Maps of items [from, to), with mirrors between them.
    auto remapping(std::size_t from, std::size_t to) const -> Mapping;

    auto add_maps(const std::vector<StepMap>& maps) const -> std::shared_ptr<const HistoryBranch>;

    // Rebase after `rebased_count` of this branch's steps were undone,
    // other steps applied, and the undone steps mapped over them again.
    auto rebased(RecordedSteps recorded, std::size_t rebased_count) const
        -> std::shared_ptr<const HistoryBranch>;

    auto empty_item_count() const -> std::size_t;

    // Drop position-only items before `upto`, mapping the steps over them.
    auto compress(std::optional<std::size_t> upto = std::nullopt) const -> std::shared_ptr<const HistoryBranch>;

private:
    std::vector<HistoryItem> items_;
    std::size_t event_count_{0};
};

}  // namespace folio_cpp::detail
