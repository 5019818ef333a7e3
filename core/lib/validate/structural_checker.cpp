// codegraph/validate/structural_checker.cpp - Structural Integrity
//
#include "codegraph/validate/structural_checker.hpp"

#include <fmt/format.h>

#include "codegraph/graph/graph_queries.hpp"
#include "codegraph/validate/inheritance_cycle_checker.hpp"

namespace codegraph
{

namespace
{

/// Owners along one ownership edge kind that exist
std::vector<const Node *> owners_via(const CodeGraph & graph, const Node & node, EdgeKind via)
{
  std::vector<const Node *> owners;
  for (const auto * e : graph.in_edges(node.id, via)) {
    if (const Node * owner = graph.find_node(e->source)) {
      owners.push_back(owner);
    }
  }
  return owners;
}

StringList qualified_names(const std::vector<const Node *> & nodes)
{
  StringList names;
  names.reserve(nodes.size());
  for (const auto * n : nodes) names.emplace_back(n->qualified_name());
  return names;
}

}  // namespace

bool StructuralChecker::check()
{
  return check_parameter_positions() && check_ownership() && check_resolutions() &&
         check_inheritance() && check_orphans();
}

bool StructuralChecker::check_parameter_positions()
{
  for (const auto * fn : ctx_.graph.nodes_of_kind(NodeKind::Function)) {
    if (ctx_.cancelled()) return false;
    if (!ctx_.in_scope(*fn)) continue;

    int64_t expected = 0;
    for (const auto & param : parameters_of(ctx_.graph, fn->id)) {
      if (param.position != expected) {
        ctx_.bag
          .report(
            Law::StructuralIntegrity, violation_type::k_parameter_position_gap, Severity::Error,
            *fn,
            fmt::format(
              "Parameters of {} are not contiguous: expected position {} but found {} ({})",
              fn->name(), expected, param.position, param.node->name()))
          .with_entity(param.node->id)
          .with_detail("expected_position", expected)
          .with_detail("actual_position", param.position);
        break;
      }
      ++expected;
    }
  }
  return true;
}

bool StructuralChecker::check_ownership()
{
  const std::pair<NodeKind, EdgeKind> owned[] = {
    {NodeKind::Parameter, EdgeKind::HasParameter},
    {NodeKind::CallSite, EdgeKind::HasCallsite},
  };

  for (const auto & [kind, via] : owned) {
    const std::string_view type = kind == NodeKind::Parameter
                                    ? violation_type::k_parameter_ownership
                                    : violation_type::k_callsite_ownership;
    for (const auto * node : ctx_.graph.nodes_of_kind(kind)) {
      if (ctx_.cancelled()) return false;
      if (!ctx_.in_scope(*node)) continue;

      // No owner at all is reported as an orphan.
      const auto owners = owners_via(ctx_.graph, *node, via);
      if (owners.size() <= 1) continue;

      auto v = ctx_.bag.report(
        Law::StructuralIntegrity, type, Severity::Error, *node,
        fmt::format(
          "{} {} is owned by {} functions", to_string(kind), node->name(), owners.size()));
      for (const auto * owner : owners) v.with_entity(owner->id);
      v.with_detail("owners", qualified_names(owners));
    }
  }
  return true;
}

bool StructuralChecker::check_resolutions()
{
  for (const auto * callsite : ctx_.graph.nodes_of_kind(NodeKind::CallSite)) {
    if (ctx_.cancelled()) return false;
    if (!ctx_.in_scope(*callsite)) continue;

    const auto targets = ctx_.graph.out_edges(callsite->id, EdgeKind::ResolvesTo);
    if (targets.empty()) continue;

    if (targets.size() > 1) {
      auto v = ctx_.bag.report(
        Law::StructuralIntegrity, violation_type::k_invalid_resolution, Severity::Error, *callsite,
        fmt::format("Call site {} resolves to {} targets", callsite->name(), targets.size()));
      for (const auto * e : targets) v.with_entity(e->target);
      continue;
    }

    const Node * target = ctx_.graph.find_node(targets.front()->target);
    if (target != nullptr && target->is(NodeKind::Function)) continue;
    ctx_.bag
      .report(
        Law::StructuralIntegrity, violation_type::k_invalid_resolution, Severity::Error, *callsite,
        target == nullptr
          ? fmt::format("Call site {} resolves to a missing function", callsite->name())
          : fmt::format(
              "Call site {} resolves to {} {}", callsite->name(), to_string(target->kind),
              target->name()))
      .with_entity(targets.front()->target);
  }
  return true;
}

bool StructuralChecker::check_inheritance()
{
  const InheritanceCycleChecker checker(ctx_.graph);
  const auto cycles = checker.find_cycles(ctx_.token);
  if (ctx_.cancelled()) return false;

  for (const auto & cycle : cycles) {
    const Node & anchor = *cycle.classes.front();
    if (!ctx_.in_scope(anchor)) continue;

    StringList names;
    for (const auto * c : cycle.classes) names.emplace_back(c->name());

    auto v = ctx_.bag.report(
      Law::StructuralIntegrity, violation_type::k_circular_inheritance, Severity::Error, anchor,
      fmt::format("Circular inheritance: {}", cycle_message(cycle.classes)));
    for (size_t i = 1; i < cycle.classes.size(); ++i) {
      v.with_entity(cycle.classes[i]->id);
    }
    v.with_fix("Remove one of the base classes to break the cycle")
      .with_detail("cycle", std::move(names));
  }
  return true;
}

bool StructuralChecker::check_orphans()
{
  for (const auto & [id, node] : ctx_.graph.nodes()) {
    if (ctx_.cancelled()) return false;
    if (node.is(NodeKind::Module) || node.is(NodeKind::Type) || !ctx_.in_scope(node)) continue;

    const auto chain = ancestors_of(ctx_.graph, node);
    if (!chain.empty() && chain.back()->is(NodeKind::Module)) continue;

    ctx_.bag
      .report(
        Law::StructuralIntegrity, violation_type::k_orphan_node, Severity::Error, node,
        fmt::format("{} {} is not reachable from any module", to_string(node.kind), node.name()))
      .with_fix("Declare it from its module or remove it");
  }
  return true;
}

}  // namespace codegraph
