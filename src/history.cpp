#include <folio-cpp/history.hpp>

#include "history_branch.hpp"

#include <algorithm>
#include <utility>

namespace folio_cpp {

namespace detail {

// -- HistoryItem --------------------------------------------------------------

auto HistoryItem::merge(const HistoryItem& other) const -> std::optional<HistoryItem> {
    if (step && other.step && !other.selection) {
        if (auto merged = merge_steps(*other.step, *step)) {
            return HistoryItem{step_map(*merged).invert(), *merged, selection, std::nullopt};
        }
    }
    return std::nullopt;
}

// -- HistoryBranch ------------------------------------------------------------

namespace {

auto cut_off_events(std::vector<HistoryItem> items, std::size_t n) -> std::vector<HistoryItem> {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i].selection && n-- == 0) {
            items.erase(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(i));
            break;
        }
    }
    return items;
}

}  // namespace

auto HistoryBranch::empty() -> std::shared_ptr<const HistoryBranch> {
    static const auto empty_branch = std::make_shared<const HistoryBranch>();
    return empty_branch;
}

auto HistoryBranch::pop_event(const EditorState& state, bool preserve_items) const
    -> std::optional<PoppedEvent> {
    if (event_count_ == 0) return std::nullopt;

    auto end = items_.size();
    for (; end > 0; --end) {
        if (items_[end - 1].selection) {
            --end;
            break;
        }
    }

    auto remap = std::optional<Mapping>{};
    auto map_from = std::size_t{0};
    if (preserve_items) {
        remap = remapping(end, items_.size());
        map_from = remap->size();
    }

    auto transform = state.tr();
    auto add_after = std::vector<HistoryItem>{};
    auto add_before = std::vector<HistoryItem>{};

    for (auto i = items_.size(); i-- > 0;) {
        const auto& item = items_[i];
        if (!item.step) {
            if (!remap) {
                remap = remapping(end, i + 1);
                map_from = remap->size();
            }
            --map_from;
            add_before.push_back(item);
            continue;
        }

        if (remap) {
            add_before.push_back(HistoryItem{item.map, std::nullopt, std::nullopt, std::nullopt});
            auto step = map_step(*item.step, remap->slice(map_from));
            auto map = std::optional<StepMap>{};
            if (step && transform.maybe_step(*step).doc) {
                map = transform.mapping().maps().back();
                auto offset = add_after.size() + add_before.size();
                add_after.push_back(HistoryItem{*map, std::nullopt, std::nullopt, offset});
            }
            --map_from;
            if (map) remap->append_map(*map, map_from);
        } else {
            // A step that no longer fits is skipped; the rest of the event still applies.
            static_cast<void>(transform.maybe_step(*item.step));
        }

        if (item.selection) {
            auto selection = remap ? item.selection->map(remap->slice(map_from)) : *item.selection;
            auto items = std::vector<HistoryItem>(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(end));
            items.insert(items.end(), add_before.rbegin(), add_before.rend());
            items.insert(items.end(), add_after.begin(), add_after.end());
            return PoppedEvent{std::make_shared<const HistoryBranch>(std::move(items), event_count_ - 1),
                               std::move(transform), selection};
        }
    }
    return std::nullopt;
}

auto HistoryBranch::add_transform(RecordedSteps recorded, std::optional<SelectionBookmark> selection,
                                  const HistoryOptions& options, bool preserve_items) const
    -> std::shared_ptr<const HistoryBranch> {
    auto new_items = std::vector<HistoryItem>{};
    auto event_count = event_count_;
    auto items = items_;
    auto last_item = std::optional<HistoryItem>{};
    if (!preserve_items && !items.empty()) last_item = items.back();

    for (std::size_t i = 0; i < recorded.steps.size(); ++i) {
        auto item = HistoryItem{recorded.mapping.maps()[i], invert_step(recorded.steps[i], *recorded.docs[i]),
                                selection, std::nullopt};
        auto merged = last_item ? last_item->merge(item) : std::nullopt;
        if (merged) {
            if (i > 0) {
                new_items.pop_back();
            } else {
                items.pop_back();
            }
            new_items.push_back(std::move(*merged));
        } else {
            new_items.push_back(std::move(item));
        }

        if (selection) {
            ++event_count;
            selection.reset();
        }
        if (!preserve_items) last_item = new_items.back();
    }

    if (event_count > options.depth + depth_overflow) {
        auto overflow = event_count - options.depth;
        items = cut_off_events(std::move(items), overflow);
        event_count -= overflow;
    }

    items.insert(items.end(), std::make_move_iterator(new_items.begin()),
                 std::make_move_iterator(new_items.end()));
    return std::make_shared<const HistoryBranch>(std::move(items), event_count);
}

auto HistoryBranch::remapping(std::size_t from, std::size_t to) const -> Mapping {
    auto maps = Mapping{};
    for (auto i = from; i < to; ++i) {
        const auto& item = items_[i];
        auto mirror_pos = std::optional<std::size_t>{};
        if (item.mirror_offset && *item.mirror_offset <= i && i - *item.mirror_offset >= from) {
            mirror_pos = maps.size() - *item.mirror_offset;
        }
        maps.append_map(item.map, mirror_pos);
    }
    return maps;
}

auto HistoryBranch::add_maps(const std::vector<StepMap>& maps) const -> std::shared_ptr<const HistoryBranch> {
    if (event_count_ == 0) return shared_from_this();
    auto items = items_;
    for (const auto& map : maps) {
        items.push_back(HistoryItem{map, std::nullopt, std::nullopt, std::nullopt});
    }
    return std::make_shared<const HistoryBranch>(std::move(items), event_count_);
}

auto HistoryBranch::rebased(RecordedSteps recorded, std::size_t rebased_count) const
    -> std::shared_ptr<const HistoryBranch> {
    if (event_count_ == 0) return shared_from_this();

    auto rebased_items = std::vector<HistoryItem>{};
    auto start = items_.size() > rebased_count ? items_.size() - rebased_count : 0;
    const auto& mapping = recorded.mapping;
    auto new_until = recorded.steps.size();
    auto event_count = event_count_;

    for (auto i = start; i < items_.size(); ++i) {
        if (items_[i].selection) --event_count;
    }

    auto i_rebased = rebased_count;
    for (auto i = start; i < items_.size(); ++i) {
        const auto& item = items_[i];
        auto pos = mapping.get_mirror(--i_rebased);
        if (!pos) continue;

        new_until = std::min(new_until, *pos);
        const auto& map = mapping.maps()[*pos];
        if (item.step) {
            auto step = invert_step(recorded.steps[*pos], *recorded.docs[*pos]);
            auto selection = std::optional<SelectionBookmark>{};
            if (item.selection) {
                selection = item.selection->map(mapping.slice(i_rebased + 1, *pos));
                ++event_count;
            }
            rebased_items.push_back(HistoryItem{map, std::move(step), selection, std::nullopt});
        } else {
            rebased_items.push_back(HistoryItem{map, std::nullopt, std::nullopt, std::nullopt});
        }
    }

    auto items = std::vector<HistoryItem>(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(start));
    for (auto i = rebased_count; i < new_until; ++i) {
        items.push_back(HistoryItem{mapping.maps()[i], std::nullopt, std::nullopt, std::nullopt});
    }
    auto rebased_size = rebased_items.size();
    items.insert(items.end(), std::make_move_iterator(rebased_items.begin()),
                 std::make_move_iterator(rebased_items.end()));

    auto branch = std::make_shared<const HistoryBranch>(std::move(items), event_count);
    if (branch->empty_item_count() > max_empty_items) {
        return branch->compress(items_.size() - rebased_size);
    }
    return branch;
}

auto HistoryBranch::empty_item_count() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(items_, [](const HistoryItem& item) {
        return !item.step.has_value();
    }));
}

auto HistoryBranch::compress(std::optional<std::size_t> upto) const -> std::shared_ptr<const HistoryBranch> {
    auto limit = upto.value_or(items_.size());
    auto remap = remapping(0, limit);
    auto map_from = remap.size();
    auto items = std::vector<HistoryItem>{};
    auto events = std::size_t{0};

    for (auto i = items_.size(); i-- > 0;) {
        const auto& item = items_[i];
        if (i >= limit) {
            items.push_back(item);
            if (item.selection) ++events;
        } else if (item.step) {
            auto step = map_step(*item.step, remap.slice(map_from));
            auto map = step ? std::optional<StepMap>{step_map(*step)} : std::nullopt;
            --map_from;
            if (map) remap.append_map(*map, map_from);
            if (step) {
                auto selection = std::optional<SelectionBookmark>{};
                if (item.selection) {
                    selection = item.selection->map(remap.slice(map_from));
                    ++events;
                }
                auto new_item = HistoryItem{map->invert(), *step, selection, std::nullopt};
                auto merged = items.empty() ? std::nullopt : items.back().merge(new_item);
                if (merged) {
                    items.back() = std::move(*merged);
                } else {
                    items.push_back(std::move(new_item));
                }
            }
        } else {
            --map_from;
        }
    }

    std::ranges::reverse(items);
    return std::make_shared<const HistoryBranch>(std::move(items), events);
}

}  // namespace detail

// -- HistoryState -------------------------------------------------------------

namespace {

using detail::HistoryBranch;
using detail::RecordedSteps;

auto close_history_key() -> const PluginKeyBase& {
    static const auto key = PluginKeyBase{"closeHistory"};
    return key;
}

auto must_preserve_items(const EditorState& state) -> bool {
    return std::ranges::any_of(state.plugins(), [](const Plugin& plugin) {
        return plugin.spec().history_preserve_items;
    });
}

auto is_false_meta(const Transaction& tr, std::string_view key) -> bool {
    const auto* value = tr.meta<bool>(key);
    return value && !*value;
}

auto is_adjacent_to(const Transaction& tr, const std::optional<std::vector<std::size_t>>& prev_ranges) -> bool {
    if (!prev_ranges) return false;
    if (!tr.doc_changed()) return true;
    auto adjacent = false;
    tr.mapping().maps().front().for_each([&](std::size_t start, std::size_t end, std::size_t, std::size_t) {
        for (std::size_t i = 0; i + 1 < prev_ranges->size(); i += 2) {
            if (start <= (*prev_ranges)[i + 1] && end >= (*prev_ranges)[i]) adjacent = true;
        }
    });
    return adjacent;
}

auto ranges_for(const std::vector<StepMap>& maps) -> std::vector<std::size_t> {
    auto result = std::vector<std::size_t>{};
    for (auto i = maps.size(); i-- > 0 && result.empty();) {
        maps[i].for_each([&](std::size_t, std::size_t, std::size_t from, std::size_t to) {
            result.push_back(from);
            result.push_back(to);
        });
    }
    return result;
}

auto map_ranges(const std::optional<std::vector<std::size_t>>& ranges, const Mapping& mapping)
    -> std::optional<std::vector<std::size_t>> {
    if (!ranges) return std::nullopt;
    auto result = std::vector<std::size_t>{};
    for (std::size_t i = 0; i + 1 < ranges->size(); i += 2) {
        auto from = mapping.map((*ranges)[i], 1);
        auto to = mapping.map((*ranges)[i + 1], -1);
        if (from <= to) {
            result.push_back(from);
            result.push_back(to);
        }
    }
    return result;
}

}  // namespace

HistoryState::HistoryState(std::shared_ptr<const detail::HistoryBranch> done,
                           std::shared_ptr<const detail::HistoryBranch> undone,
                           std::optional<std::vector<std::size_t>> prev_ranges,
                           std::int64_t prev_time, HistoryOptions options)
    : done_{std::move(done)},
      undone_{std::move(undone)},
      prev_ranges_{std::move(prev_ranges)},
      prev_time_{prev_time},
      options_{options} {}

auto HistoryState::initial(HistoryOptions options) -> HistoryState {
    return HistoryState{HistoryBranch::empty(), HistoryBranch::empty(), std::nullopt, 0, options};
}

auto HistoryState::undo_depth() const -> std::size_t { return done_->event_count(); }
auto HistoryState::redo_depth() const -> std::size_t { return undone_->event_count(); }

auto HistoryState::apply(const Transaction& tr, const EditorState& state) const -> HistoryState {
    if (const auto* meta = tr.meta<HistoryMeta>(history_key())) return meta->state;

    auto history = *this;
    if (tr.get_meta(close_history_key())) {
        history.prev_ranges_.reset();
        history.prev_time_ = 0;
    }

    if (tr.steps().empty()) return history;

    const auto* appended = tr.meta<Transaction>("appendedTransaction");
    auto preserve = must_preserve_items(state);
    auto recorded = RecordedSteps{tr.steps(), tr.docs(), tr.mapping()};

    if (appended) {
        if (const auto* hist_meta = appended->meta<HistoryMeta>(history_key())) {
            // Follow-up of an undo or redo: record it with that event.
            if (hist_meta->redo) {
                return HistoryState{history.done_->add_transform(recorded, std::nullopt, options_, preserve),
                                    history.undone_, ranges_for(tr.mapping().maps()),
                                    history.prev_time_, options_};
            }
            return HistoryState{history.done_,
                                history.undone_->add_transform(recorded, std::nullopt, options_, preserve),
                                std::nullopt, history.prev_time_, options_};
        }
    }

    if (!is_false_meta(tr, "addToHistory") && !(appended && is_false_meta(*appended, "addToHistory"))) {
        auto new_group = history.prev_time_ == 0
            || (!appended && (history.prev_time_ < tr.time() - options_.new_group_delay
                              || !is_adjacent_to(tr, history.prev_ranges_)));
        auto prev_ranges = appended ? map_ranges(history.prev_ranges_, tr.mapping())
                                    : std::optional{ranges_for(tr.mapping().maps())};
        auto selection = new_group ? std::optional{state.selection().get_bookmark()} : std::nullopt;
        return HistoryState{history.done_->add_transform(recorded, selection, options_, preserve),
                            HistoryBranch::empty(), std::move(prev_ranges), tr.time(), options_};
    }

    if (const auto* rebased = tr.meta<std::size_t>("rebased")) {
        return HistoryState{history.done_->rebased(recorded, *rebased),
                            history.undone_->rebased(recorded, *rebased),
                            map_ranges(history.prev_ranges_, tr.mapping()), history.prev_time_, options_};
    }

    return HistoryState{history.done_->add_maps(tr.mapping().maps()),
                        history.undone_->add_maps(tr.mapping().maps()),
                        map_ranges(history.prev_ranges_, tr.mapping()), history.prev_time_, options_};
}

// -- Plugin and commands ------------------------------------------------------

auto history_key() -> const PluginKey<HistoryState>& {
    static const auto key = PluginKey<HistoryState>{"history"};
    return key;
}

auto history(HistoryOptions options) -> Plugin {
    auto field = StateField<HistoryState>{
        .init = [options](const EditorStateConfig&, const EditorState&) {
            return HistoryState::initial(options);
        },
        .apply = [](const Transaction& tr, const HistoryState& hist, const EditorState& old_state,
                    const EditorState&) {
            return hist.apply(tr, old_state);
        },
    };
    auto spec = PluginSpec{};
    spec.key = history_key();
    spec.state = field.erase();
    return Plugin{std::move(spec)};
}

namespace {

auto history_transaction(const HistoryState& history, const EditorState& state, bool redo, bool scroll)
    -> std::optional<Transaction> {
    auto preserve = must_preserve_items(state);
    auto pop = (redo ? history.undone() : history.done()).pop_event(state, preserve);
    if (!pop) return std::nullopt;

    auto& tr = pop->transform;
    auto added = (redo ? history.done() : history.undone())
        .add_transform(RecordedSteps{tr.steps(), tr.docs(), tr.mapping()},
                       state.selection().get_bookmark(), history.options(), preserve);
    auto new_history = HistoryState{redo ? added : pop->remaining, redo ? pop->remaining : added,
                                    std::nullopt, 0, history.options()};

    tr.set_selection(pop->selection.resolve(tr.doc()));
    tr.set_meta(history_key(), HistoryMeta{redo, std::move(new_history)});
    if (scroll) tr.scroll_into_view();
    return tr.build();
}

auto run_history_command(const EditorState& state, const Dispatch& dispatch, bool redo, bool scroll) -> bool {
    const auto* hist = history_key().get_state(state);
    if (!hist || (redo ? hist->redo_depth() : hist->undo_depth()) == 0) return false;
    if (dispatch) {
        if (auto tr = history_transaction(*hist, state, redo, scroll)) dispatch(*tr);
    }
    return true;
}

}  // namespace

auto undo(const EditorState& state, const Dispatch& dispatch) -> bool {
    return run_history_command(state, dispatch, false, true);
}

auto redo(const EditorState& state, const Dispatch& dispatch) -> bool {
    return run_history_command(state, dispatch, true, true);
}

auto undo_no_scroll(const EditorState& state, const Dispatch& dispatch) -> bool {
    return run_history_command(state, dispatch, false, false);
}

auto redo_no_scroll(const EditorState& state, const Dispatch& dispatch) -> bool {
    return run_history_command(state, dispatch, true, false);
}

auto undo_depth(const EditorState& state) -> std::size_t {
    const auto* hist = history_key().get_state(state);
    return hist ? hist->undo_depth() : 0;
}

auto redo_depth(const EditorState& state) -> std::size_t {
    const auto* hist = history_key().get_state(state);
    return hist ? hist->redo_depth() : 0;
}

void close_history(TransactionBuilder& tr) {
    tr.set_meta(close_history_key(), true);
}

auto is_history_transaction(const Transaction& tr) -> bool {
    return tr.get_meta(history_key()) != nullptr;
}

}  // namespace folio_cpp
