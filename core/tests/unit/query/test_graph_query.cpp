// tests/unit/query/test_graph_query.cpp - Callers, callees, references, impact
//

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "codegraph/build/graph_builder.hpp"
#include "codegraph/build/node_identity.hpp"
#include "codegraph/graph/memory_graph_store.hpp"
#include "codegraph/query/graph_query.hpp"
#include "codegraph/test_support/payload_builder.hpp"

using namespace codegraph;
using test_support::PayloadBuilder;

namespace
{

NodeId fn_id(const std::string & qname) { return make_node_id(NodeKind::Function, qname); }

std::shared_ptr<const CodeGraph> index_all(const std::vector<ExtractionPayload> & payloads)
{
  MemoryGraphStore store;
  GraphBuilder builder(store);
  for (const auto & p : payloads) {
    const auto r = builder.apply_extraction(p);
    EXPECT_TRUE(r.success) << r.error;
  }
  return store.view();
}

/// app.run -> app.main -> lib.calc -> lib.helper, plus app.run REFERENCES lib.calc
std::shared_ptr<const CodeGraph> call_chain()
{
  PayloadBuilder lib("lib");
  lib.function("lib.helper", "int");
  lib.function("lib.calc", "int")
    .param("lib.calc", "a", "int")
    .param("lib.calc", "b", "int")
    .call("lib.calc", "helper", 0);
  lib.cls("lib.Base").cls("lib.Derived", {"lib.Base"});

  PayloadBuilder app("app");
  app.import("lib");
  app.function("app.main", "None").call("app.main", "lib.calc", 2);
  app.function("app.run", "None").call("app.run", "main", 0);
  app.relate(EdgeKind::References, "app.run", "lib.calc").to_kind = NodeKind::Function;
  return index_all({lib.build(), app.build()});
}

std::vector<std::string> qualified_names(const std::vector<Dependency> & deps)
{
  std::vector<std::string> out;
  for (const auto & d : deps) {
    out.push_back(std::string(d.function->qualified_name()) + "@" + std::to_string(d.distance));
  }
  return out;
}

const CascadingChange * find_cascade(
  const ImpactAnalysis & impact, EdgeKind edge, NodeKind connected)
{
  for (const auto & c : impact.cascading_changes) {
    if (c.edge_kind == edge && c.connected_kind == connected) return &c;
  }
  return nullptr;
}

}  // namespace

// ============================================================================
// Calls
// ============================================================================

TEST(GraphQueryTest, FindCallersListsEachResolvedCallSite)
{
  const auto g = call_chain();
  const GraphQuery query(*g);

  const auto callers = query.find_callers(fn_id("lib.calc"));
  ASSERT_EQ(callers.size(), 1u);
  EXPECT_EQ(callers[0].function->id, fn_id("app.main"));
  EXPECT_EQ(callers[0].callsite->id, make_callsite_id("app.main", "lib.calc", 0));
  EXPECT_EQ(callers[0].arg_count.value_or(-1), 2);

  EXPECT_TRUE(query.find_callers(fn_id("app.run")).empty());
  EXPECT_TRUE(query.find_callers("missing").empty());
}

TEST(GraphQueryTest, FindCalleesFollowsCallSites)
{
  const auto g = call_chain();
  const GraphQuery query(*g);

  const auto from_main = query.find_callees(fn_id("app.main"));
  ASSERT_EQ(from_main.size(), 1u);
  EXPECT_EQ(from_main[0].function->id, fn_id("lib.calc"));

  const auto from_calc = query.find_callees(fn_id("lib.calc"));
  ASSERT_EQ(from_calc.size(), 1u);
  EXPECT_EQ(from_calc[0].function->id, fn_id("lib.helper"));
  EXPECT_EQ(from_calc[0].arg_count.value_or(-1), 0);

  EXPECT_TRUE(query.find_callees(fn_id("lib.helper")).empty());
}

TEST(GraphQueryTest, UnresolvedCallsLinkNothing)
{
  PayloadBuilder b("app");
  b.function("app.main", "None").call("app.main", "nowhere", 1);
  const auto g = index_all({b.build()});

  EXPECT_TRUE(GraphQuery(*g).find_callees(fn_id("app.main")).empty());
}

// ============================================================================
// References and hierarchy
// ============================================================================

TEST(GraphQueryTest, FindReferencesCoversReferenceEdges)
{
  const auto g = call_chain();
  const GraphQuery query(*g);

  const auto to_calc = query.find_references(fn_id("lib.calc"));
  ASSERT_EQ(to_calc.size(), 1u);
  EXPECT_EQ(to_calc[0].source->id, fn_id("app.run"));
  EXPECT_EQ(to_calc[0].kind, EdgeKind::References);
  EXPECT_FALSE(to_calc[0].location.empty());

  const auto to_lib = query.find_references(make_node_id(NodeKind::Module, "lib"));
  ASSERT_EQ(to_lib.size(), 1u);
  EXPECT_EQ(to_lib[0].source->id, make_node_id(NodeKind::Module, "app"));
  EXPECT_EQ(to_lib[0].kind, EdgeKind::Imports);
}

TEST(GraphQueryTest, ClassHierarchyListsDirectBasesAndSubclasses)
{
  const auto g = call_chain();
  const GraphQuery query(*g);
  const NodeId base = make_node_id(NodeKind::Class, "lib.Base");
  const NodeId derived = make_node_id(NodeKind::Class, "lib.Derived");

  const auto of_derived = query.class_hierarchy(derived);
  ASSERT_EQ(of_derived.bases.size(), 1u);
  EXPECT_EQ(of_derived.bases[0]->id, base);
  EXPECT_TRUE(of_derived.derived.empty());

  const auto of_base = query.class_hierarchy(base);
  EXPECT_TRUE(of_base.bases.empty());
  ASSERT_EQ(of_base.derived.size(), 1u);
  EXPECT_EQ(of_base.derived[0]->id, derived);
}

// ============================================================================
// Dependencies
// ============================================================================

TEST(GraphQueryTest, FunctionDependenciesHonourDepth)
{
  const auto g = call_chain();
  const GraphQuery query(*g);

  EXPECT_EQ(
    qualified_names(query.function_dependencies(fn_id("app.run")).outbound),
    (std::vector<std::string>{"app.main@1"}));
  EXPECT_EQ(
    qualified_names(query.function_dependencies(fn_id("app.run"), 3).outbound),
    (std::vector<std::string>{"app.main@1", "lib.calc@2", "lib.helper@3"}));

  const auto helper = query.function_dependencies(fn_id("lib.helper"), 2);
  EXPECT_TRUE(helper.outbound.empty());
  EXPECT_EQ(
    qualified_names(helper.inbound), (std::vector<std::string>{"lib.calc@1", "app.main@2"}));

  const auto none = query.function_dependencies(fn_id("app.run"), 0);
  EXPECT_TRUE(none.outbound.empty());
  EXPECT_TRUE(none.inbound.empty());
}

TEST(GraphQueryTest, RecursionIsReportedAtShortestDistance)
{
  PayloadBuilder b("m");
  b.function("m.ping", "None").call("m.ping", "pong", 0).call("m.ping", "ping", 0);
  b.function("m.pong", "None").call("m.pong", "ping", 0);
  const auto g = index_all({b.build()});

  const auto deps = GraphQuery(*g).function_dependencies(fn_id("m.ping"), 5);
  EXPECT_EQ(qualified_names(deps.outbound), (std::vector<std::string>{"m.pong@1"}));
  EXPECT_EQ(qualified_names(deps.inbound), (std::vector<std::string>{"m.pong@1"}));
}

// ============================================================================
// Impact
// ============================================================================

TEST(GraphQueryTest, DeleteImpactCountsIncidentEdges)
{
  const auto g = call_chain();
  const auto impact = GraphQuery(*g).impact_of(fn_id("lib.calc"), ChangeType::Delete);

  EXPECT_EQ(impact.entity_id, fn_id("lib.calc"));
  EXPECT_EQ(impact.change_type, ChangeType::Delete);
  ASSERT_EQ(impact.affected_callers.size(), 1u);
  EXPECT_EQ(impact.affected_callers[0].function->id, fn_id("app.main"));
  ASSERT_EQ(impact.affected_references.size(), 1u);

  const auto * params = find_cascade(impact, EdgeKind::HasParameter, NodeKind::Parameter);
  ASSERT_NE(params, nullptr);
  EXPECT_EQ(params->count, 2u);
  const auto * owner = find_cascade(impact, EdgeKind::Declares, NodeKind::Module);
  ASSERT_NE(owner, nullptr);
  EXPECT_EQ(owner->count, 1u);
  const auto * calls = find_cascade(impact, EdgeKind::ResolvesTo, NodeKind::CallSite);
  ASSERT_NE(calls, nullptr);
  EXPECT_EQ(calls->count, 1u);
  EXPECT_NE(find_cascade(impact, EdgeKind::References, NodeKind::Function), nullptr);
}

TEST(GraphQueryTest, ModifyImpactHasNoCascade)
{
  const auto g = call_chain();
  const GraphQuery query(*g);

  const auto impact = query.impact_of(fn_id("lib.calc"), ChangeType::Modify);
  EXPECT_EQ(impact.affected_callers.size(), 1u);
  EXPECT_TRUE(impact.cascading_changes.empty());

  EXPECT_TRUE(query.impact_of(fn_id("app.run"), ChangeType::Rename).empty());
}

TEST(GraphQueryTest, ChangeTypeNames)
{
  for (const ChangeType t : {ChangeType::Modify, ChangeType::Delete, ChangeType::Rename}) {
    EXPECT_EQ(parse_change_type(to_string(t)), t);
  }
  EXPECT_EQ(to_string(ChangeType::Delete), "delete");
  EXPECT_FALSE(parse_change_type("drop").has_value());
  EXPECT_FALSE(parse_change_type("Delete").has_value());
}
