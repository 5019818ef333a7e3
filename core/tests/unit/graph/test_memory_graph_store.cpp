// tests/unit/graph/test_memory_graph_store.cpp - Atomic commits and stable views
//
#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "codegraph/graph/memory_graph_store.hpp"

using namespace codegraph;

namespace
{

Node make_node(const std::string & id, NodeKind kind = NodeKind::Function)
{
  Node n;
  n.id = id;
  n.kind = kind;
  set_string(n.props, "qualified_name", id);
  return n;
}

Edge make_edge(const std::string & source, const std::string & target)
{
  Edge e;
  e.kind = EdgeKind::Declares;
  e.source = source;
  e.target = target;
  return e;
}

}  // namespace

TEST(MemoryGraphStoreTest, CommitPublishesNewView)
{
  MemoryGraphStore store;
  const auto empty = store.view();

  MutationBatch batch;
  batch.upsert_node(make_node("m", NodeKind::Module));
  batch.upsert_node(make_node("f"));
  batch.upsert_edge(make_edge("m", "f"));
  store.commit(batch);

  EXPECT_TRUE(empty->empty());
  EXPECT_EQ(store.view()->node_count(), 2u);
  EXPECT_EQ(store.view()->edge_count(), 1u);
  EXPECT_EQ(store.revision(), 1u);
}

TEST(MemoryGraphStoreTest, FailedBatchLeavesStoreUntouched)
{
  MemoryGraphStore store;
  store.create_or_update_node(make_node("m", NodeKind::Module));
  const auto before = store.view();

  MutationBatch batch;
  batch.upsert_node(make_node("f"));
  batch.upsert_edge(make_edge("m", "f"));
  batch.upsert_edge(make_edge("ghost", "f"));  // source does not exist

  EXPECT_THROW(store.commit(batch), StoreError);
  EXPECT_EQ(store.view(), before);
  EXPECT_FALSE(store.view()->contains("f"));
  EXPECT_EQ(store.revision(), 1u);
}

TEST(MemoryGraphStoreTest, EmptyBatchIsNotARevision)
{
  MemoryGraphStore store;
  store.commit(MutationBatch{});
  EXPECT_EQ(store.revision(), 0u);
}

TEST(MemoryGraphStoreTest, SingleOperationHelpers)
{
  MemoryGraphStore store;
  store.create_or_update_node(make_node("m", NodeKind::Module));
  store.create_or_update_node(make_node("f"));
  store.create_or_update_edge(make_edge("m", "f"));

  const auto functions =
    store.query([](const Node & n) { return n.is(NodeKind::Function); });
  ASSERT_EQ(functions.size(), 1u);
  EXPECT_EQ(functions[0].id, "f");

  store.delete_edge(EdgeKey{"m", EdgeKind::Declares, "f"});
  EXPECT_EQ(store.view()->edge_count(), 0u);
  store.delete_node("f");
  EXPECT_FALSE(store.view()->contains("f"));
}

TEST(MemoryGraphStoreTest, ReadersNeverSeePartialBatches)
{
  MemoryGraphStore store;
  store.create_or_update_node(make_node("m", NodeKind::Module));

  std::thread writer([&store] {
    for (int i = 0; i < 200; ++i) {
      MutationBatch batch;
      const std::string id = "f" + std::to_string(i);
      batch.upsert_node(make_node(id));
      batch.upsert_edge(make_edge("m", id));
      store.commit(batch);
    }
  });

  bool consistent = true;
  for (int i = 0; i < 200; ++i) {
    const auto view = store.view();
    // Every committed function arrives together with its DECLARES edge.
    consistent = consistent && view->node_count() == view->edge_count() + 1;
  }
  writer.join();

  EXPECT_TRUE(consistent);
  EXPECT_EQ(store.view()->node_count(), 201u);
}
