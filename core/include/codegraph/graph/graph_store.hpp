// codegraph/graph/graph_store.hpp - Abstract graph store adapter
//
// Components never hold graph state of their own: they read immutable views
// from a GraphStore and hand it batches to commit. A persistent backend plugs
// in by implementing commit() and view().
//
#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "codegraph/graph/code_graph.hpp"
#include "codegraph/graph/mutation.hpp"

namespace codegraph
{

using NodePredicate = std::function<bool(const Node &)>;

class GraphStore
{
public:
  virtual ~GraphStore() = default;

  GraphStore() = default;
  GraphStore(const GraphStore &) = delete;
  GraphStore & operator=(const GraphStore &) = delete;

  /**
   * Apply a batch atomically.
   *
   * Either every operation takes effect or none does; readers holding an
   * older view never observe a partial batch.
   *
   * @throws StoreError if any operation is rejected
   */
  virtual void commit(const MutationBatch & batch) = 0;

  /// Current immutable state; stays valid after later commits
  [[nodiscard]] virtual std::shared_ptr<const CodeGraph> view() const = 0;

  // ===========================================================================
  // Single-operation helpers (each one is its own atomic commit)
  // ===========================================================================

  void create_or_update_node(Node node);
  void create_or_update_edge(Edge edge);
  void delete_node(NodeId id);
  void delete_edge(EdgeKey key);

  /// Copies of the nodes matching `pred`, in id order
  [[nodiscard]] std::vector<Node> query(const NodePredicate & pred) const;
};

}  // namespace codegraph
