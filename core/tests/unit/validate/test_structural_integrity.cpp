// tests/unit/validate/test_structural_integrity.cpp - Ownership, positions, resolutions, cycles
//
// Graphs that a valid payload cannot produce are assembled directly.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "codegraph/build/graph_builder.hpp"
#include "codegraph/build/node_identity.hpp"
#include "codegraph/graph/memory_graph_store.hpp"
#include "codegraph/test_support/payload_builder.hpp"
#include "codegraph/validate/conservation_validator.hpp"
#include "codegraph/validate/inheritance_cycle_checker.hpp"

using namespace codegraph;
using test_support::PayloadBuilder;

namespace
{

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

std::vector<Violation> structural(const CodeGraph & g)
{
  return ConservationValidator()
    .validate(g, NodeFilter::all(), {}, {Law::StructuralIntegrity})
    .violations;
}

Node node(NodeKind kind, const std::string & qname)
{
  Node n;
  n.kind = kind;
  n.id = make_node_id(kind, qname);
  set_string(n.props, std::string(prop::k_name), qname.substr(qname.rfind('.') + 1));
  set_string(n.props, std::string(prop::k_qualified_name), qname);
  set_string(n.props, std::string(prop::k_module), "m");
  return n;
}

Edge edge(
  EdgeKind kind, const Node & source, const Node & target,
  std::optional<int64_t> position = std::nullopt)
{
  Edge e;
  e.kind = kind;
  e.source = source.id;
  e.target = target.id;
  if (position) set_int(e.props, std::string(prop::k_position), *position);
  return e;
}

/// Module "m" declaring function "m.f"
struct SmallGraph
{
  CodeGraph graph;
  Node module = node(NodeKind::Module, "m");
  Node f = node(NodeKind::Function, "m.f");

  SmallGraph()
  {
    graph.upsert_node(module);
    graph.upsert_node(f);
    graph.upsert_edge(edge(EdgeKind::Declares, module, f));
  }
};

}  // namespace

// ============================================================================
// Clean graphs
// ============================================================================

TEST(StructuralIntegrityTest, BuilderOutputIsStructurallySound)
{
  PayloadBuilder b("m");
  b.cls("m.Base").cls("m.Child", {"m.Base"});
  b.function("m.Child.run", "None").param("m.Child.run", "self", "", ParamKind::Receiver);
  b.param("m.Child.run", "n", "int").call("m.Child.run", "print", 1);
  const auto g = index_all({b.build()});

  EXPECT_TRUE(structural(*g).empty());
}

// ============================================================================
// Inheritance cycles
// ============================================================================

TEST(StructuralIntegrityTest, TwoClassCycleIsReportedOnce)
{
  PayloadBuilder b("m");
  b.cls("m.A", {"m.B"}).cls("m.B", {"m.A"});
  const auto g = index_all({b.build()});

  const auto found = structural(*g);
  ASSERT_EQ(found.size(), 1u);
  const Violation & v = found.front();
  EXPECT_EQ(v.type, "circular_inheritance");
  EXPECT_EQ(v.severity, Severity::Error);
  EXPECT_EQ(v.message, "Circular inheritance: A -> B -> A");
  EXPECT_EQ(
    v.entity_ids, (std::vector<NodeId>{make_node_id(NodeKind::Class, "m.A"),
                                       make_node_id(NodeKind::Class, "m.B")}));
  const auto * cycle = get_list(v.details, "cycle");
  ASSERT_NE(cycle, nullptr);
  EXPECT_EQ(*cycle, (StringList{"A", "B"}));
}

TEST(StructuralIntegrityTest, LongerCyclesAndSelfInheritance)
{
  PayloadBuilder b("m");
  b.cls("m.E", {"m.C"}).cls("m.D", {"m.E"}).cls("m.C", {"m.D"});
  b.cls("m.Self", {"m.Self"});
  b.cls("m.Leaf", {"m.C"});
  const auto g = index_all({b.build()});

  const auto cycles = InheritanceCycleChecker(*g).find_cycles();
  ASSERT_EQ(cycles.size(), 2u);
  ASSERT_EQ(cycles[0].classes.size(), 3u);
  EXPECT_EQ(cycles[0].classes[0]->qualified_name(), "m.C");
  EXPECT_EQ(cycles[0].classes[1]->qualified_name(), "m.D");
  EXPECT_EQ(cycles[0].classes[2]->qualified_name(), "m.E");
  ASSERT_EQ(cycles[1].classes.size(), 1u);
  EXPECT_EQ(cycle_message(cycles[1].classes), "Self -> Self");

  EXPECT_EQ(structural(*g).size(), 2u);
}

TEST(StructuralIntegrityTest, CancelledCycleSearchReturnsNothing)
{
  PayloadBuilder b("m");
  b.cls("m.A", {"m.B"}).cls("m.B", {"m.A"});
  const auto g = index_all({b.build()});

  const auto token = CancellationToken::make();
  token.cancel();
  EXPECT_TRUE(InheritanceCycleChecker(*g).find_cycles(token).empty());
}

// ============================================================================
// Parameters and call sites
// ============================================================================

TEST(StructuralIntegrityTest, ParameterPositionGap)
{
  SmallGraph s;
  const Node p0 = node(NodeKind::Parameter, "m.f.a");
  const Node p2 = node(NodeKind::Parameter, "m.f.c");
  s.graph.upsert_node(p0);
  s.graph.upsert_node(p2);
  s.graph.upsert_edge(edge(EdgeKind::HasParameter, s.f, p0, 0));
  s.graph.upsert_edge(edge(EdgeKind::HasParameter, s.f, p2, 2));

  const auto found = structural(s.graph);
  ASSERT_EQ(found.size(), 1u);
  const Violation & v = found.front();
  EXPECT_EQ(v.type, "parameter_position_gap");
  EXPECT_EQ(v.entity_ids, (std::vector<NodeId>{s.f.id, p2.id}));
  EXPECT_EQ(get_int(v.details, "expected_position").value_or(-1), 1);
  EXPECT_EQ(get_int(v.details, "actual_position").value_or(-1), 2);
}

TEST(StructuralIntegrityTest, ParameterWithTwoOwners)
{
  SmallGraph s;
  const Node g = node(NodeKind::Function, "m.g");
  const Node x = node(NodeKind::Parameter, "m.f.x");
  s.graph.upsert_node(g);
  s.graph.upsert_node(x);
  s.graph.upsert_edge(edge(EdgeKind::Declares, s.module, g));
  s.graph.upsert_edge(edge(EdgeKind::HasParameter, s.f, x, 0));
  s.graph.upsert_edge(edge(EdgeKind::HasParameter, g, x, 0));

  const auto found = structural(s.graph);
  ASSERT_EQ(found.size(), 1u);
  const Violation & v = found.front();
  EXPECT_EQ(v.type, "parameter_ownership");
  ASSERT_EQ(v.entity_ids.size(), 3u);
  EXPECT_EQ(v.entity_ids[0], x.id);
  const auto * owners = get_list(v.details, "owners");
  ASSERT_NE(owners, nullptr);
  StringList sorted = *owners;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sorted, (StringList{"m.f", "m.g"}));
}

TEST(StructuralIntegrityTest, CallSiteResolvingToANonFunction)
{
  SmallGraph s;
  const Node var = node(NodeKind::Variable, "m.value");
  Node cs;
  cs.kind = NodeKind::CallSite;
  cs.id = make_callsite_id("m.f", "value", 0);
  set_string(cs.props, std::string(prop::k_name), "value");
  set_string(cs.props, std::string(prop::k_callee), "value");
  s.graph.upsert_node(var);
  s.graph.upsert_node(cs);
  s.graph.upsert_edge(edge(EdgeKind::Declares, s.module, var));
  s.graph.upsert_edge(edge(EdgeKind::HasCallsite, s.f, cs));
  s.graph.upsert_edge(edge(EdgeKind::ResolvesTo, cs, var));

  const auto found = structural(s.graph);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found.front().type, "invalid_resolution");
  EXPECT_EQ(found.front().entity_ids, (std::vector<NodeId>{cs.id, var.id}));
}

// ============================================================================
// Orphans
// ============================================================================

TEST(StructuralIntegrityTest, EntitiesUnreachableFromAModule)
{
  SmallGraph s;
  const Node lost = node(NodeKind::Function, "m.lost");
  const Node stray = node(NodeKind::Parameter, "m.lost.p");
  s.graph.upsert_node(lost);
  s.graph.upsert_node(stray);
  s.graph.upsert_edge(edge(EdgeKind::HasParameter, lost, stray, 0));

  const auto found = structural(s.graph);
  ASSERT_EQ(found.size(), 2u);
  std::vector<NodeId> anchors;
  for (const auto & v : found) {
    EXPECT_EQ(v.type, "orphan_node");
    anchors.emplace_back(v.anchor());
  }
  std::sort(anchors.begin(), anchors.end());
  std::vector<NodeId> expected{lost.id, stray.id};
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(anchors, expected);
}
