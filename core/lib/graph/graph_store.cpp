// codegraph/graph/graph_store.cpp - Single-operation helpers
//
#include "codegraph/graph/graph_store.hpp"

#include <utility>

namespace codegraph
{

void GraphStore::create_or_update_node(Node node)
{
  MutationBatch batch;
  batch.upsert_node(std::move(node));
  commit(batch);
}

void GraphStore::create_or_update_edge(Edge edge)
{
  MutationBatch batch;
  batch.upsert_edge(std::move(edge));
  commit(batch);
}

void GraphStore::delete_node(NodeId id)
{
  MutationBatch batch;
  batch.delete_node(std::move(id));
  commit(batch);
}

void GraphStore::delete_edge(EdgeKey key)
{
  MutationBatch batch;
  batch.delete_edge(std::move(key));
  commit(batch);
}

std::vector<Node> GraphStore::query(const NodePredicate & pred) const
{
  const auto graph = view();
  std::vector<Node> result;
  for (const auto & [id, node] : graph->nodes()) {
    if (pred(node)) {
      result.push_back(node);
    }
  }
  return result;
}

}  // namespace codegraph
