// codegraph/graph/code_graph.hpp - In-memory property graph with indexes
//
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/graph/mutation.hpp"
#include "codegraph/graph/node.hpp"

namespace codegraph
{

/**
 * Node and edge sets plus the indexes every component needs.
 *
 * A CodeGraph is a plain value: copying it produces an independent graph.
 * Stores publish immutable CodeGraph instances as views; builders apply
 * batches to private copies.
 */
class CodeGraph
{
public:
  using NodeMap = std::map<NodeId, Node, std::less<>>;
  using EdgeMap = std::map<EdgeKey, Edge>;

  CodeGraph() = default;

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] const Node * find_node(std::string_view id) const;
  [[nodiscard]] const Edge * find_edge(const EdgeKey & key) const;
  [[nodiscard]] bool contains(std::string_view id) const { return find_node(id) != nullptr; }

  [[nodiscard]] const NodeMap & nodes() const noexcept { return nodes_; }
  [[nodiscard]] const EdgeMap & edges() const noexcept { return edges_; }
  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty() && edges_.empty(); }

  /// Outgoing edges of `id` in key order, optionally restricted to one kind
  [[nodiscard]] std::vector<const Edge *> out_edges(
    std::string_view id, std::optional<EdgeKind> kind = std::nullopt) const;

  /// Incoming edges of `id` in key order, optionally restricted to one kind
  [[nodiscard]] std::vector<const Edge *> in_edges(
    std::string_view id, std::optional<EdgeKind> kind = std::nullopt) const;

  /// Check if any edge (either direction) touches `id`
  [[nodiscard]] bool has_incident_edges(std::string_view id) const;

  [[nodiscard]] std::vector<const Node *> nodes_of_kind(NodeKind kind) const;

  /// Nodes whose `qualified_name` equals `qname` (any kind)
  [[nodiscard]] std::vector<const Node *> find_by_qualified_name(std::string_view qname) const;

  /// Nodes and edges written by one module's extraction
  [[nodiscard]] std::vector<const Node *> nodes_in_module(std::string_view module) const;
  [[nodiscard]] std::vector<const Edge *> edges_in_module(std::string_view module) const;

  /// Names of all modules that own at least one node
  [[nodiscard]] std::vector<std::string> module_names() const;

  /// Ids of nodes whose changed flag is set, sorted
  [[nodiscard]] std::vector<NodeId> changed_node_ids() const;

  // ===========================================================================
  // Mutation
  // ===========================================================================

  /// Insert or replace a node; the changed flag is OR-ed in
  void upsert_node(Node node);

  /**
   * Insert or replace an edge.
   *
   * @throws StoreError if the source node does not exist
   */
  void upsert_edge(Edge edge);

  /// Remove a node and its outgoing edges; returns false if it did not exist
  bool erase_node(std::string_view id);

  bool erase_edge(const EdgeKey & key);

  /// Returns false if the node does not exist
  bool set_changed(std::string_view id, bool value);

  /// Apply every operation of a batch in order (no rollback on failure)
  void apply(const MutationBatch & batch);

private:
  void index_node(const Node & node);
  void unindex_node(const Node & node);
  void index_edge(const Edge & edge);
  void unindex_edge(const Edge & edge);

  NodeMap nodes_;
  EdgeMap edges_;

  std::map<NodeId, std::set<EdgeKey>, std::less<>> out_;
  std::map<NodeId, std::set<EdgeKey>, std::less<>> in_;
  std::map<std::string, std::set<NodeId>, std::less<>> by_qualified_name_;
  std::map<std::string, std::set<NodeId>, std::less<>> nodes_by_module_;
  std::map<std::string, std::set<EdgeKey>, std::less<>> edges_by_module_;
};

}  // namespace codegraph
