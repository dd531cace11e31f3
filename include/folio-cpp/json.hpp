/// @file json.hpp
/// @brief nlohmann/json interoperability for folio-cpp.
///
/// Provides ADL serialization (to_json/from_json) for attribute values
/// and to_json for every document value type. Deserializing documents
/// needs a schema, so those readers are plain functions taking one.
/// Malformed input raises Exception{invalid_json}.

#pragma once

#include <folio-cpp/mark.hpp>
#include <folio-cpp/node.hpp>
#include <folio-cpp/schema.hpp>
#include <folio-cpp/selection.hpp>
#include <folio-cpp/step.hpp>
#include <folio-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace folio_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Attribute values ---------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const ScalarValue& v);
void from_json(const nlohmann::json& j, ScalarValue& v);

// -- Document values ----------------------------------------------------------

/// `{"type": "em", "attrs": {...}}`; attrs omitted when empty.
void to_json(nlohmann::json& j, const Mark& m);

/// `{"type", "attrs"?, "content"?, "marks"?, "text"?}`.
void to_json(nlohmann::json& j, const Node& n);

/// An array of nodes; null when empty.
void to_json(nlohmann::json& j, const Fragment& f);

/// `{"content"?, "openStart"?, "openEnd"?}`; null for the empty slice.
void to_json(nlohmann::json& j, const Slice& s);

/// Tagged with `"stepType"`.
void to_json(nlohmann::json& j, const Step& s);

/// Tagged with `"type"`: text, node or all.
void to_json(nlohmann::json& j, const Selection& s);

// =============================================================================
// Schema-aware deserialization
// =============================================================================

auto attrs_from_json(const nlohmann::json& j) -> Attrs;
auto mark_from_json(const Schema& schema, const nlohmann::json& j) -> Mark;
auto marks_from_json(const Schema& schema, const nlohmann::json& j) -> MarkSet;
auto node_from_json(const Schema& schema, const nlohmann::json& j) -> NodePtr;
auto fragment_from_json(const Schema& schema, const nlohmann::json& j) -> Fragment;
auto slice_from_json(const Schema& schema, const nlohmann::json& j) -> Slice;
auto step_from_json(const Schema& schema, const nlohmann::json& j) -> Step;

/// Positions are resolved in `doc`.
auto selection_from_json(const NodePtr& doc, const nlohmann::json& j) -> Selection;

}  // namespace folio_cpp
