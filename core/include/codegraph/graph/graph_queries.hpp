// codegraph/graph/graph_queries.hpp - Structural lookups shared by passes
//
// Ownership chain: Module -DECLARES-> Class/Function/Variable (nested),
// Function -HAS_PARAMETER-> Parameter, Function -HAS_CALLSITE-> CallSite.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/graph/code_graph.hpp"

namespace codegraph
{

/// Parameter of a function together with its binding attributes
struct ParameterInfo
{
  const Node * node = nullptr;
  int64_t position = 0;
  ParamKind kind = ParamKind::Positional;
  bool has_default = false;
};

/**
 * Owner of a node along its ownership edge.
 *
 * DECLARES parent for declared entities, the Function for Parameters
 * (HAS_PARAMETER) and CallSites (HAS_CALLSITE). Returns nullptr for
 * Modules, Types and orphans. With several owners the first in key order
 * is returned; structural validation reports the duplicate.
 */
[[nodiscard]] const Node * owner_of(const CodeGraph & graph, const Node & node);

/// Chain of owners from the node's owner up to (and including) its Module
[[nodiscard]] std::vector<const Node *> ancestors_of(const CodeGraph & graph, const Node & node);

/// Closest Module owning the node (the node itself for a Module)
[[nodiscard]] const Node * enclosing_module(const CodeGraph & graph, const Node & node);

/// Closest Class owning the node, or nullptr
[[nodiscard]] const Node * enclosing_class(const CodeGraph & graph, const Node & node);

/// Entities a scope declares directly (DECLARES targets that exist)
[[nodiscard]] std::vector<const Node *> declared_children(
  const CodeGraph & graph, std::string_view scope_id);

/// Parameters of a function sorted by position
[[nodiscard]] std::vector<ParameterInfo> parameters_of(
  const CodeGraph & graph, std::string_view function_id);

/**
 * Declared type of a Variable/Parameter (HAS_TYPE) or return type of a
 * Function (RETURNS_TYPE).
 *
 * Falls back to the `type_annotation` property when no type edge exists.
 */
[[nodiscard]] std::optional<std::string> declared_type(const CodeGraph & graph, const Node & node);

/// Display name of an edge target: its node's qualified name or the recorded target name
[[nodiscard]] std::string target_name(const CodeGraph & graph, const Edge & edge);

/// Last dotted segment ("a.b.c" -> "c")
[[nodiscard]] std::string_view last_segment(std::string_view qname) noexcept;

}  // namespace codegraph
