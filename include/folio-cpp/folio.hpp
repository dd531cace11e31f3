/// @file folio.hpp
/// @brief Umbrella header for the folio-cpp library.
///
/// Include this single header for access to all public types:
/// Schema, Node, Slice, ResolvedPos, Step, Mapping, Transform,
/// Selection, Transaction, EditorState, Plugin, Decoration,
/// EditorSession, the history plugin, editing commands, and Error.

#pragma once

#include <folio-cpp/commands.hpp>
#include <folio-cpp/decoration.hpp>
#include <folio-cpp/editor_props.hpp>
#include <folio-cpp/editor_state.hpp>
#include <folio-cpp/error.hpp>
#include <folio-cpp/history.hpp>
#include <folio-cpp/mapping.hpp>
#include <folio-cpp/mark.hpp>
#include <folio-cpp/node.hpp>
#include <folio-cpp/plugin.hpp>
#include <folio-cpp/plugin_key.hpp>
#include <folio-cpp/props.hpp>
#include <folio-cpp/resolved_pos.hpp>
#include <folio-cpp/schema.hpp>
#include <folio-cpp/selection.hpp>
#include <folio-cpp/step.hpp>
#include <folio-cpp/transaction.hpp>
#include <folio-cpp/transform.hpp>
#include <folio-cpp/value.hpp>
