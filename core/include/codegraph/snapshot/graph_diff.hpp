// codegraph/snapshot/graph_diff.hpp - Structural diff of two graph states
//
// Nodes are matched by id and edges by (source, kind, target). The changed
// flag is bookkeeping and never part of a diff.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "codegraph/graph/code_graph.hpp"

namespace codegraph
{

/**
 * One differing property.
 *
 * `before`/`after` is std::nullopt when the property is absent on that
 * side. For list values `added`/`removed` hold the elements present on only
 * one side.
 */
struct PropertyChange
{
  std::string key;
  std::optional<PropertyValue> before;
  std::optional<PropertyValue> after;
  StringList added;
  StringList removed;
};

struct NodeChange
{
  NodeId id;
  NodeKind kind = NodeKind::Module;
  std::string qualified_name;
  std::vector<PropertyChange> changes;  ///< sorted by key

  /// nullptr if the property did not change
  [[nodiscard]] const PropertyChange * find(std::string_view key) const;
};

struct EdgeChange
{
  EdgeKey key;
  std::vector<PropertyChange> changes;  ///< sorted by key
};

struct DiffSummary
{
  size_t nodes_added = 0;
  size_t nodes_removed = 0;
  size_t nodes_modified = 0;
  size_t nodes_unchanged = 0;
  size_t edges_added = 0;
  size_t edges_removed = 0;
  size_t edges_modified = 0;
  size_t edges_unchanged = 0;
};

struct GraphDiff
{
  std::vector<Node> added_nodes;
  std::vector<Node> removed_nodes;
  std::vector<NodeChange> modified_nodes;
  std::vector<NodeId> unchanged_nodes;

  std::vector<Edge> added_edges;
  std::vector<Edge> removed_edges;
  std::vector<EdgeChange> modified_edges;
  size_t unchanged_edges = 0;

  /// No node or edge was added, removed or modified
  [[nodiscard]] bool empty() const noexcept
  {
    return added_nodes.empty() && removed_nodes.empty() && modified_nodes.empty() &&
           added_edges.empty() && removed_edges.empty() && modified_edges.empty();
  }

  [[nodiscard]] DiffSummary summary() const;

  [[nodiscard]] const NodeChange * find_modified(std::string_view id) const;
};

/// Property-level differences, sorted by key
[[nodiscard]] std::vector<PropertyChange> diff_properties(
  const PropertyMap & before, const PropertyMap & after);

/// Partition nodes and edges of `before` and `after`; every list is in id / key order
[[nodiscard]] GraphDiff diff_graphs(const CodeGraph & before, const CodeGraph & after);

}  // namespace codegraph
