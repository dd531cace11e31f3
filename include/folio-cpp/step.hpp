/// @file step.hpp
/// @brief Steps: atomic, invertible, mappable document changes.
///
/// Step is a closed variant. The free functions apply_step(),
/// step_map(), invert_step(), map_step() and merge_steps() dispatch on
/// it with std::visit.

#pragma once

#include <folio-cpp/mapping.hpp>
#include <folio-cpp/mark.hpp>
#include <folio-cpp/node.hpp>
#include <folio-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace folio_cpp {

/// Replace a range with a slice.
struct ReplaceStep {
    std::size_t from;
    std::size_t to;
    Slice slice;
    bool structure{false};  ///< Fail instead of overwriting content.
};

/// Replace a range while keeping the content of an inner gap, placing
/// it at `insert` inside the new slice. Used for wrapping and lifting.
struct ReplaceAroundStep {
    std::size_t from;
    std::size_t to;
    std::size_t gap_from;
    std::size_t gap_to;
    Slice slice;
    std::size_t insert;
    bool structure{false};
};

/// Add a mark to all inline content in a range.
struct AddMarkStep {
    std::size_t from;
    std::size_t to;
    Mark mark;
};

/// Remove a mark from all inline content in a range.
struct RemoveMarkStep {
    std::size_t from;
    std::size_t to;
    Mark mark;
};

/// Set one attribute of the node at `pos`.
struct AttrStep {
    std::size_t pos;
    std::string attr;
    ScalarValue value;
};

/// Set one attribute of the document node.
struct DocAttrStep {
    std::string attr;
    ScalarValue value;
};

using Step = std::variant<
    ReplaceStep,
    ReplaceAroundStep,
    AddMarkStep,
    RemoveMarkStep,
    AttrStep,
    DocAttrStep
>;

/// The outcome of applying a step: a new document, or a failure message.
struct StepResult {
    NodePtr doc;                        ///< nullptr on failure.
    std::optional<std::string> failed;  ///< Why the step could not be applied.

    static auto ok(NodePtr doc) -> StepResult { return {std::move(doc), std::nullopt}; }
    static auto fail(std::string message) -> StepResult { return {nullptr, std::move(message)}; }

    /// Replace a range, turning content errors into a failed result.
    static auto from_replace(const Node& doc, std::size_t from, std::size_t to,
                             const Slice& slice) -> StepResult;
};

/// Throws Exception{invalid_position} when a range of the step is
/// inverted, or when a ReplaceAroundStep's gap or insert point lies
/// outside it.
void check_step(const Step& step);

/// Apply a step to a document. Checks the step with check_step().
auto apply_step(const Step& step, const Node& doc) -> StepResult;

/// The position map of a step. Checks the step with check_step().
auto step_map(const Step& step) -> StepMap;

/// The step that undoes `step`, given the document it was applied to.
auto invert_step(const Step& step, const Node& doc) -> Step;

/// Map a step through a mapping; nullopt when it no longer applies.
auto map_step(const Step& step, const Mappable& mapping) -> std::optional<Step>;

/// Merge `other` into `step` when the two can be expressed as one.
auto merge_steps(const Step& step, const Step& other) -> std::optional<Step>;

/// The step type name used in JSON ("replace", "addMark", ...).
auto step_type_name(const Step& step) -> std::string_view;

}  // namespace folio_cpp
