// tests/unit/graph/test_code_graph.cpp - CodeGraph indexes and mutations
//
#include <gtest/gtest.h>

#include <string>

#include "codegraph/graph/code_graph.hpp"

using namespace codegraph;

namespace
{

Node make_node(const std::string & id, NodeKind kind, const std::string & qname,
               const std::string & module)
{
  Node n;
  n.id = id;
  n.kind = kind;
  set_string(n.props, "name", qname);
  set_string(n.props, "qualified_name", qname);
  if (!module.empty()) set_string(n.props, "module", module);
  return n;
}

Edge make_edge(EdgeKind kind, const std::string & source, const std::string & target,
               const std::string & module = "m")
{
  Edge e;
  e.kind = kind;
  e.source = source;
  e.target = target;
  set_string(e.props, "module", module);
  return e;
}

CodeGraph small_graph()
{
  CodeGraph g;
  g.upsert_node(make_node("mod", NodeKind::Module, "m", "m"));
  g.upsert_node(make_node("f", NodeKind::Function, "m.f", "m"));
  g.upsert_node(make_node("g", NodeKind::Function, "m.g", "m"));
  g.upsert_edge(make_edge(EdgeKind::Declares, "mod", "f"));
  g.upsert_edge(make_edge(EdgeKind::Declares, "mod", "g"));
  return g;
}

}  // namespace

TEST(CodeGraphTest, LookupAndAdjacency)
{
  const CodeGraph g = small_graph();

  EXPECT_EQ(g.node_count(), 3u);
  EXPECT_EQ(g.edge_count(), 2u);
  ASSERT_NE(g.find_node("f"), nullptr);
  EXPECT_EQ(g.find_node("f")->qualified_name(), "m.f");
  EXPECT_EQ(g.find_node("missing"), nullptr);

  const auto out = g.out_edges("mod", EdgeKind::Declares);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0]->target, "f");
  EXPECT_EQ(out[1]->target, "g");

  EXPECT_EQ(g.in_edges("g").size(), 1u);
  EXPECT_TRUE(g.out_edges("mod", EdgeKind::Imports).empty());
}

TEST(CodeGraphTest, QualifiedNameAndModuleIndexes)
{
  CodeGraph g = small_graph();
  g.upsert_node(make_node("other", NodeKind::Module, "n", "n"));

  const auto found = g.find_by_qualified_name("m.g");
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0]->id, "g");

  EXPECT_EQ(g.nodes_in_module("m").size(), 3u);
  EXPECT_EQ(g.edges_in_module("m").size(), 2u);
  EXPECT_EQ(g.module_names(), (std::vector<std::string>{"m", "n"}));

  // Renaming moves the node between index buckets.
  Node renamed = *g.find_node("g");
  set_string(renamed.props, "qualified_name", "m.h");
  g.upsert_node(renamed);
  EXPECT_TRUE(g.find_by_qualified_name("m.g").empty());
  EXPECT_EQ(g.find_by_qualified_name("m.h").size(), 1u);
}

TEST(CodeGraphTest, ChangedFlagIsOredOnUpsert)
{
  CodeGraph g = small_graph();
  ASSERT_TRUE(g.set_changed("f", true));

  Node f = *g.find_node("f");
  f.changed = false;
  set_string(f.props, "visibility", "private");
  g.upsert_node(f);

  EXPECT_TRUE(g.find_node("f")->changed);
  EXPECT_EQ(g.changed_node_ids(), (std::vector<NodeId>{"f"}));

  ASSERT_TRUE(g.set_changed("f", false));
  EXPECT_TRUE(g.changed_node_ids().empty());
  EXPECT_FALSE(g.set_changed("missing", true));
}

TEST(CodeGraphTest, EraseNodeKeepsIncomingEdges)
{
  CodeGraph g = small_graph();
  g.upsert_edge(make_edge(EdgeKind::References, "g", "f"));

  ASSERT_TRUE(g.erase_node("f"));
  EXPECT_FALSE(g.contains("f"));
  // DECLARES mod->f and REFERENCES g->f point at a missing node now.
  EXPECT_NE(g.find_edge(EdgeKey{"mod", EdgeKind::Declares, "f"}), nullptr);
  EXPECT_NE(g.find_edge(EdgeKey{"g", EdgeKind::References, "f"}), nullptr);

  ASSERT_TRUE(g.erase_node("g"));
  EXPECT_EQ(g.find_edge(EdgeKey{"g", EdgeKind::References, "f"}), nullptr);
  EXPECT_FALSE(g.erase_node("g"));
}

TEST(CodeGraphTest, EdgeWithoutSourceIsRejected)
{
  CodeGraph g = small_graph();
  EXPECT_THROW(g.upsert_edge(make_edge(EdgeKind::Declares, "nope", "f")), StoreError);
  // A missing target is allowed.
  EXPECT_NO_THROW(g.upsert_edge(make_edge(EdgeKind::Imports, "mod", "elsewhere")));
}

TEST(CodeGraphTest, PruneIfDetachedOnlyRemovesUnreferencedNodes)
{
  CodeGraph g = small_graph();
  g.upsert_node(make_node("t1", NodeKind::Type, "int", ""));
  g.upsert_node(make_node("t2", NodeKind::Type, "str", ""));
  g.upsert_edge(make_edge(EdgeKind::ReturnsType, "f", "t1"));

  MutationBatch batch;
  batch.prune_if_detached("t1");
  batch.prune_if_detached("t2");
  g.apply(batch);

  EXPECT_TRUE(g.contains("t1"));
  EXPECT_FALSE(g.contains("t2"));
}

TEST(CodeGraphTest, EdgeKeyText)
{
  const EdgeKey key{"a", EdgeKind::ResolvesTo, "b"};
  EXPECT_EQ(key.to_string(), "a-RESOLVES_TO->b");
}
