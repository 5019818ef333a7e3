// tests/unit/build/test_graph_builder.cpp - Payload to graph mutations
//
// Covers identity, idempotent re-indexing, minimal diffs, payload rejection
// and cross-module re-resolution.

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "codegraph/build/graph_builder.hpp"
#include "codegraph/build/node_identity.hpp"
#include "codegraph/build/resolution.hpp"
#include "codegraph/graph/graph_queries.hpp"
#include "codegraph/graph/memory_graph_store.hpp"
#include "codegraph/test_support/payload_builder.hpp"

using namespace codegraph;
using test_support::PayloadBuilder;

namespace
{

NodeId fn_id(const std::string & qname) { return make_node_id(NodeKind::Function, qname); }

std::string text(const Node & n, std::string_view key)
{
  return std::string(get_string(n.props, key).value_or(std::string_view{}));
}

ExtractionPayload calc_module(const std::string & return_type = "int")
{
  PayloadBuilder b("lib.math");
  b.function("lib.math.calc", return_type)
    .param("lib.math.calc", "a", "int")
    .param("lib.math.calc", "b", "int");
  return b.build();
}

}  // namespace

// ============================================================================
// Indexing
// ============================================================================

TEST(GraphBuilderTest, BuildsNodesEdgesAndProperties)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  const auto result = builder.apply_extraction(calc_module());
  ASSERT_TRUE(result.success) << result.error;

  const auto g = store.view();
  const Node * module = g->find_node(make_node_id(NodeKind::Module, "lib.math"));
  const Node * calc = g->find_node(fn_id("lib.math.calc"));
  ASSERT_NE(module, nullptr);
  ASSERT_NE(calc, nullptr);

  EXPECT_EQ(module->qualified_name(), "lib.math");
  EXPECT_EQ(text(*module, prop::k_path), "lib/math.py");
  EXPECT_EQ(calc->module(), "lib.math");
  EXPECT_EQ(text(*calc, prop::k_file), "lib/math.py");
  EXPECT_EQ(text(*calc, prop::k_signature), "calc(a: int, b: int) -> int");
  const auto * params = get_list(calc->props, prop::k_parameters);
  ASSERT_NE(params, nullptr);
  EXPECT_EQ(*params, (StringList{"a", "b"}));

  // Parameters in position order, reachable from the module
  const auto infos = parameters_of(*g, calc->id);
  ASSERT_EQ(infos.size(), 2u);
  EXPECT_EQ(infos[0].node->name(), "a");
  EXPECT_EQ(infos[1].position, 1);
  EXPECT_EQ(enclosing_module(*g, *infos[1].node), module);

  // Type annotations become shared Type nodes
  EXPECT_EQ(declared_type(*g, *calc).value_or(""), "int");
  const Node * int_type = g->find_node(make_type_id("int"));
  ASSERT_NE(int_type, nullptr);
  EXPECT_EQ(g->in_edges(int_type->id).size(), 3u);

  // Everything new is flagged changed
  EXPECT_EQ(g->changed_node_ids().size(), g->node_count());
  EXPECT_EQ(result.stats.nodes_added, g->node_count());
}

TEST(GraphBuilderTest, IdsAreStableAcrossLineShifts)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);
  ASSERT_TRUE(builder.apply_extraction(calc_module()).success);

  ExtractionPayload shifted = calc_module();
  for (auto & e : shifted.entities) {
    e.location += "0";
  }
  const auto result = builder.apply_extraction(shifted);
  ASSERT_TRUE(result.success);

  // Same ids, locations updated in place
  EXPECT_TRUE(result.added.empty());
  EXPECT_TRUE(result.removed.empty());
  EXPECT_EQ(result.updated.size(), 4u);
}

TEST(GraphBuilderTest, ReapplyingIdenticalPayloadIsANoOp)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  ASSERT_TRUE(builder.apply_extraction(calc_module()).success);
  const auto revision = store.revision();
  const auto before = store.view();

  const auto again = builder.apply_extraction(calc_module());
  ASSERT_TRUE(again.success);
  EXPECT_EQ(again.stats.mutations(), 0u);
  EXPECT_EQ(store.revision(), revision);
  EXPECT_EQ(store.view(), before);
}

TEST(GraphBuilderTest, ChangedSourceYieldsMinimalUpdate)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);
  ASSERT_TRUE(builder.apply_extraction(calc_module("int")).success);

  // Only parameters still use "int"; the return type moves to "float".
  const auto result = builder.apply_extraction(calc_module("float"));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.updated, (std::vector<NodeId>{fn_id("lib.math.calc")}));
  EXPECT_EQ(result.added, (std::vector<NodeId>{make_type_id("float")}));
  EXPECT_EQ(result.stats.edges_added, 1u);
  EXPECT_EQ(result.stats.edges_removed, 1u);

  const auto g = store.view();
  EXPECT_EQ(declared_type(*g, *g->find_node(fn_id("lib.math.calc"))).value_or(""), "float");
  EXPECT_TRUE(g->contains(make_type_id("int")));
}

TEST(GraphBuilderTest, RemovedEntitiesAndUnusedTypesAreDeleted)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  PayloadBuilder full("m");
  full.function("m.keep", "None").function("m.drop", "bytes").param("m.drop", "x", "bytes");
  full.call("m.drop", "keep", 0);
  ASSERT_TRUE(builder.apply_extraction(full.build()).success);

  PayloadBuilder reduced("m");
  reduced.function("m.keep", "None");
  const auto result = builder.apply_extraction(reduced.build());
  ASSERT_TRUE(result.success);

  // m.drop, its parameter and its call site
  EXPECT_EQ(result.removed.size(), 3u);
  const auto g = store.view();
  EXPECT_FALSE(g->contains(fn_id("m.drop")));
  EXPECT_FALSE(g->contains(make_node_id(NodeKind::Parameter, "m.drop.x")));
  EXPECT_FALSE(g->contains(make_type_id("bytes")));
  EXPECT_TRUE(g->contains(make_type_id("None")));
}

TEST(GraphBuilderTest, TypeEntitiesExistOnlyWhileReferenced)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  // Payload reporting the types Tag and Meta; only m.v (if present) uses Tag
  const auto with_types = [](bool typed_variable) {
    PayloadBuilder b("m");
    if (typed_variable) {
      b.variable("m.v");
      b.relate(EdgeKind::HasType, "m.v", "Tag");
    }
    ExtractionPayload payload = b.build();
    for (const char * name : {"Tag", "Meta"}) {
      RawEntity t;
      t.kind = NodeKind::Type;
      t.name = name;
      t.qualified_name = name;
      t.location = b.file() + ":1:0";
      payload.entities.push_back(std::move(t));
    }
    return payload;
  };

  ASSERT_TRUE(builder.apply_extraction(with_types(true)).success);
  {
    const auto g = store.view();
    EXPECT_TRUE(g->contains(make_type_id("Tag")));
    EXPECT_FALSE(g->contains(make_type_id("Meta")));
  }
  EXPECT_EQ(builder.apply_extraction(with_types(true)).stats.mutations(), 0u);

  ASSERT_TRUE(builder.apply_extraction(with_types(false)).success);
  {
    const auto g = store.view();
    EXPECT_FALSE(g->contains(make_type_id("Tag")));
    EXPECT_FALSE(g->contains(make_type_id("Meta")));
  }
}

TEST(GraphBuilderTest, RemoveModuleDeletesEverythingItOwns)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);
  ASSERT_TRUE(builder.apply_extraction(calc_module()).success);

  const auto result = builder.remove_module("lib.math");
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(store.view()->empty());
}

// ============================================================================
// Rejection
// ============================================================================

TEST(GraphBuilderTest, RejectedPayloadLeavesStoreUntouched)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);
  ASSERT_TRUE(builder.apply_extraction(calc_module()).success);
  const auto before = store.view();

  ExtractionPayload gap = calc_module("str");
  gap.entities.back().position = 3;
  const auto result = builder.apply_extraction(gap);

  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("gap"), std::string::npos);
  EXPECT_EQ(result.offending_ids.front(), "lib.math.calc");
  EXPECT_EQ(store.view(), before);
}

TEST(GraphBuilderTest, RejectsMalformedPayloads)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  {
    ExtractionPayload p = calc_module();
    p.entities.push_back(p.entities[1]);  // duplicate key
    EXPECT_FALSE(builder.apply_extraction(p).success);
  }
  {
    ExtractionPayload p = calc_module();
    p.entities.erase(p.entities.begin());  // no Module entity
    const auto r = builder.apply_extraction(p);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("no Module entity"), std::string::npos);
  }
  {
    PayloadBuilder b("m");
    b.function("m.f");
    b.relate(EdgeKind::ResolvesTo, "m.f", "m.f");
    EXPECT_FALSE(builder.apply_extraction(b.build()).success);
  }
  {
    PayloadBuilder b("m");
    b.function("m.f").param("m.f", "x");
    b.function("m.g");
    b.relate(EdgeKind::HasParameter, "m.g", "m.f.x");  // two owners
    const auto r = builder.apply_extraction(b.build());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.offending_ids, (std::vector<std::string>{"m.f.x"}));
  }
  {
    PayloadBuilder b("m");
    b.function("m.f");
    b.relate(EdgeKind::Declares, "m.f", "m.f");  // second DECLARES parent
    EXPECT_FALSE(builder.apply_extraction(b.build()).success);
  }
  {
    PayloadBuilder b("m");
    b.function("m.f");
    b.relate(EdgeKind::References, "m.nowhere", "m.f");
    EXPECT_FALSE(builder.apply_extraction(b.build()).success);
  }

  EXPECT_TRUE(store.view()->empty());
}

// ============================================================================
// Resolution across modules
// ============================================================================

TEST(GraphBuilderTest, CallSiteResolvesOnceTheCalleeModuleIsIndexed)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  PayloadBuilder app("app");
  app.function("app.run", "None")
    .import("lib.math.calc", "", NodeKind::Function)
    .call("app.run", "calc", 2);
  ASSERT_TRUE(builder.apply_extraction(app.build()).success);

  const NodeId cs_id = make_callsite_id("app.run", "calc", 0);
  {
    const auto g = store.view();
    const Node * cs = g->find_node(cs_id);
    ASSERT_NE(cs, nullptr);
    EXPECT_TRUE(std::holds_alternative<Unresolved>(read_resolution(*g, *cs)));
    EXPECT_EQ(text(*cs, prop::k_resolution), "unresolved");
  }

  const auto lib = builder.apply_extraction(calc_module());
  ASSERT_TRUE(lib.success);
  EXPECT_EQ(lib.refreshed_modules, (std::vector<std::string>{"app"}));
  {
    const auto g = store.view();
    const auto r = read_resolution(*g, *g->find_node(cs_id));
    ASSERT_TRUE(std::holds_alternative<Resolved>(r));
    EXPECT_EQ(std::get<Resolved>(r).target, fn_id("lib.math.calc"));
  }

  // The target disappears: back to Unresolved, no dangling RESOLVES_TO
  ASSERT_TRUE(builder.remove_module("lib.math").success);
  {
    const auto g = store.view();
    const Node * cs = g->find_node(cs_id);
    EXPECT_TRUE(std::holds_alternative<Unresolved>(read_resolution(*g, *cs)));
    EXPECT_TRUE(g->out_edges(cs_id, EdgeKind::ResolvesTo).empty());
  }
}

TEST(GraphBuilderTest, BaseClassChangeReResolvesSubclassModules)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  const auto base_module = [](const std::string & mid_base) {
    PayloadBuilder a("a");
    a.cls("a.Base1").function("a.Base1.m", "int");
    a.cls("a.Base2").function("a.Base2.m", "int");
    a.cls("a.Mid", {mid_base});
    return a.build();
  };
  PayloadBuilder b("b");
  b.cls("b.C", {"a.Mid"}).function("b.C.g", "None").call("b.C.g", "self.m", 0);
  PayloadBuilder c("c");
  c.cls("c.D", {"b.C"}).function("c.D.h", "None").call("c.D.h", "self.m", 0);

  ASSERT_TRUE(builder.apply_extraction(base_module("a.Base1")).success);
  ASSERT_TRUE(builder.apply_extraction(b.build()).success);
  ASSERT_TRUE(builder.apply_extraction(c.build()).success);

  const NodeId in_b = make_callsite_id("b.C.g", "self.m", 0);
  const NodeId in_c = make_callsite_id("c.D.h", "self.m", 0);
  const auto target_of = [&store](const NodeId & cs_id) {
    const auto g = store.view();
    const auto r = read_resolution(*g, *g->find_node(cs_id));
    return std::holds_alternative<Resolved>(r) ? std::get<Resolved>(r).target : NodeId{};
  };
  ASSERT_EQ(target_of(in_b), fn_id("a.Base1.m"));
  ASSERT_EQ(target_of(in_c), fn_id("a.Base1.m"));

  // No name is added or removed; only the base chain of a.Mid moves
  const auto rebuilt = builder.apply_extraction(base_module("a.Base2"));
  ASSERT_TRUE(rebuilt.success) << rebuilt.error;
  EXPECT_TRUE(rebuilt.added.empty());
  EXPECT_TRUE(rebuilt.removed.empty());
  EXPECT_EQ(rebuilt.refreshed_modules, (std::vector<std::string>{"b", "c"}));

  EXPECT_EQ(target_of(in_b), fn_id("a.Base2.m"));
  EXPECT_EQ(target_of(in_c), fn_id("a.Base2.m"));
}

TEST(GraphBuilderTest, AmbiguousCandidatesAreRecorded)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  PayloadBuilder a("pkg.a");
  a.function("pkg.a.load", "None");
  PayloadBuilder b("pkg.b");
  b.function("pkg.b.load", "None");
  PayloadBuilder app("app");
  app.import("pkg.a", "*").import("pkg.b", "*").function("app.main", "None").call(
    "app.main", "load", 0);

  ASSERT_TRUE(builder.apply_extraction(a.build()).success);
  ASSERT_TRUE(builder.apply_extraction(b.build()).success);
  ASSERT_TRUE(builder.apply_extraction(app.build()).success);

  const auto g = store.view();
  const Node * cs = g->find_node(make_callsite_id("app.main", "load", 0));
  ASSERT_NE(cs, nullptr);
  const auto r = read_resolution(*g, *cs);
  ASSERT_TRUE(std::holds_alternative<Ambiguous>(r));
  EXPECT_EQ(std::get<Ambiguous>(r).candidates.size(), 2u);
  const auto * names = get_list(cs->props, prop::k_candidates);
  ASSERT_NE(names, nullptr);
  EXPECT_EQ(*names, (StringList{"pkg.a.load", "pkg.b.load"}));
  EXPECT_TRUE(g->out_edges(cs->id, EdgeKind::ResolvesTo).empty());
}

TEST(GraphBuilderTest, DistinctModulesBuildConcurrently)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&builder, i] {
      const std::string module = "mod" + std::to_string(i);
      PayloadBuilder b(module);
      b.function(module + ".f", "int").param(module + ".f", "x", "int");
      const auto r = builder.apply_extraction(b.build());
      EXPECT_TRUE(r.success) << r.error;
    });
  }
  for (auto & t : threads) t.join();

  const auto g = store.view();
  EXPECT_EQ(g->module_names().size(), 8u);
  // 8 x (module, function, parameter) plus the shared "int" type
  EXPECT_EQ(g->node_count(), 25u);
  EXPECT_TRUE(g->contains(make_type_id("int")));
}
