// codegraph/graph/mutation.hpp - Atomic batches of graph mutations
//
#pragma once

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "codegraph/graph/node.hpp"

namespace codegraph
{

/// Raised when a batch cannot be applied; the graph is left untouched
class StoreError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// ============================================================================
// Mutation Operations
// ============================================================================

/**
 * Create the node, or replace kind/properties of the node with the same id.
 *
 * The changed flag is OR-ed into the stored flag; only SetChanged clears it.
 */
struct UpsertNode
{
  Node node;
};

/// Create the edge, or replace properties of the edge with the same key
struct UpsertEdge
{
  Edge edge;
};

/**
 * Delete a node and its outgoing edges.
 *
 * Incoming edges are kept: edges written by other modules that point at the
 * node become dangling and are reported by the validator.
 */
struct DeleteNode
{
  NodeId id;
};

struct DeleteEdge
{
  EdgeKey key;
};

/// Set or clear the changed flag; missing ids are ignored
struct SetChanged
{
  NodeId id;
  bool value = true;
};

/**
 * Delete a node only if, at commit time, no edge touches it.
 *
 * Used to collect shared nodes (Types) that several modules may reference:
 * the check runs inside the commit, so a concurrent writer that just added
 * a reference keeps the node alive.
 */
struct PruneIfDetached
{
  NodeId id;
};

using Mutation =
  std::variant<UpsertNode, UpsertEdge, DeleteNode, DeleteEdge, SetChanged, PruneIfDetached>;

// ============================================================================
// MutationBatch
// ============================================================================

/**
 * Ordered list of mutations committed all-or-nothing.
 *
 * Operations apply in insertion order. An edge upsert requires its source
 * node to exist at that point; the target may be missing (a cross-module
 * reference to an entity that is not indexed yet, or has been deleted).
 */
class MutationBatch
{
public:
  MutationBatch() = default;

  void upsert_node(Node node) { ops_.emplace_back(UpsertNode{std::move(node)}); }
  void upsert_edge(Edge edge) { ops_.emplace_back(UpsertEdge{std::move(edge)}); }
  void delete_node(NodeId id) { ops_.emplace_back(DeleteNode{std::move(id)}); }
  void delete_edge(EdgeKey key) { ops_.emplace_back(DeleteEdge{std::move(key)}); }
  void set_changed(NodeId id, bool value = true)
  {
    ops_.emplace_back(SetChanged{std::move(id), value});
  }
  void prune_if_detached(NodeId id) { ops_.emplace_back(PruneIfDetached{std::move(id)}); }

  void append(MutationBatch && other)
  {
    ops_.insert(
      ops_.end(), std::make_move_iterator(other.ops_.begin()),
      std::make_move_iterator(other.ops_.end()));
    other.ops_.clear();
  }

  [[nodiscard]] const std::vector<Mutation> & ops() const noexcept { return ops_; }
  [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return ops_.size(); }

  [[nodiscard]] auto begin() const { return ops_.begin(); }
  [[nodiscard]] auto end() const { return ops_.end(); }

private:
  std::vector<Mutation> ops_;
};

}  // namespace codegraph
