// codegraph/validate/data_flow_checker.cpp - Data Flow Consistency
//
#include "codegraph/validate/data_flow_checker.hpp"

#include <fmt/format.h>

#include <optional>
#include <set>

#include "codegraph/build/resolution.hpp"
#include "codegraph/graph/graph_queries.hpp"

namespace codegraph
{

namespace
{

constexpr std::string_view k_constructor_name = "__init__";

/// Function a resolved call site targets, or nullptr
const Node * resolved_callee(const CodeGraph & graph, const Node & callsite)
{
  const auto resolution = read_resolution(graph, callsite);
  if (const auto * r = std::get_if<Resolved>(&resolution)) {
    const Node * target = graph.find_node(r->target);
    if (target != nullptr && target->is(NodeKind::Function)) return target;
  }
  return nullptr;
}

std::optional<std::string> string_prop(const PropertyMap & props, std::string_view key)
{
  if (const auto v = get_string(props, key); v && !v->empty()) return std::string(*v);
  return std::nullopt;
}

std::optional<std::string> assigned_type(
  const CodeGraph & graph, const Edge & edge, std::set<NodeId, std::less<>> & visited);

/// Type a value-carrying node is known to hold: its annotation, or for an
/// unannotated Variable/Parameter the first known type assigned to it
std::optional<std::string> value_type_of(
  const CodeGraph & graph, const Node & node, std::set<NodeId, std::less<>> & visited)
{
  if (node.is(NodeKind::CallSite)) {
    if (const Node * callee = resolved_callee(graph, node)) return declared_type(graph, *callee);
    return std::nullopt;
  }
  if (!node.is(NodeKind::Variable) && !node.is(NodeKind::Parameter)) return std::nullopt;
  if (auto declared = declared_type(graph, node)) return declared;
  if (!visited.insert(node.id).second) return std::nullopt;

  for (const auto * e : graph.in_edges(node.id, EdgeKind::AssignsTo)) {
    if (auto t = assigned_type(graph, *e, visited)) return t;
  }
  return std::nullopt;
}

/// Observed type of the value an ASSIGNS_TO edge carries
std::optional<std::string> assigned_type(
  const CodeGraph & graph, const Edge & edge, std::set<NodeId, std::less<>> & visited)
{
  if (auto explicit_type = string_prop(edge.props, prop::k_value_type)) return explicit_type;
  const Node * source = graph.find_node(edge.source);
  if (source == nullptr) return std::nullopt;
  return value_type_of(graph, *source, visited);
}

}  // namespace

bool DataFlowChecker::check()
{
  if (!check_assignments()) return false;
  if (!check_references()) return false;
  if (!check_arguments()) return false;
  return check_annotations();
}

void DataFlowChecker::report_mismatch(
  const Node & anchor, std::string message, const std::string & declared,
  const std::string & observed)
{
  ctx_.bag
    .report(
      Law::DataFlowConsistency, violation_type::k_type_mismatch, Severity::Error, anchor,
      std::move(message))
    .with_fix(fmt::format("Change the value to {} or update the annotation", declared))
    .with_detail("declared_type", declared)
    .with_detail("observed_type", observed);
}

// ============================================================================
// Observed types
// ============================================================================

bool DataFlowChecker::check_assignments()
{
  for (const auto & [key, edge] : ctx_.graph.edges()) {
    if (ctx_.cancelled()) return false;
    if (key.kind != EdgeKind::AssignsTo) continue;

    const Node * source = ctx_.graph.find_node(key.source);
    const Node * target = ctx_.graph.find_node(key.target);
    if (source == nullptr || target == nullptr || !ctx_.in_scope(*source)) continue;

    const auto declared = declared_type(ctx_.graph, *target);
    if (!declared) continue;

    std::set<NodeId, std::less<>> visited{target->id};
    const auto observed = assigned_type(ctx_.graph, edge, visited);
    if (!observed || types_.compatible(*declared, *observed)) continue;

    report_mismatch(
      *source,
      fmt::format(
        "{} is declared as {} but is assigned a value of type {}", target->name(), *declared,
        *observed),
      *declared, *observed);
  }
  return true;
}

bool DataFlowChecker::check_references()
{
  for (const auto & [key, edge] : ctx_.graph.edges()) {
    if (ctx_.cancelled()) return false;
    if (key.kind != EdgeKind::References) continue;

    const auto expected = string_prop(edge.props, prop::k_expected_type);
    if (!expected) continue;

    const Node * source = ctx_.graph.find_node(key.source);
    const Node * target = ctx_.graph.find_node(key.target);
    if (source == nullptr || target == nullptr || !ctx_.in_scope(*source)) continue;

    const auto actual = declared_type(ctx_.graph, *target);
    if (!actual || types_.compatible(*expected, *actual)) continue;

    report_mismatch(
      *source,
      fmt::format(
        "{} is used as {} but is declared as {}", target->name(), *expected, *actual),
      *expected, *actual);
  }
  return true;
}

bool DataFlowChecker::check_arguments()
{
  for (const auto * callsite : ctx_.graph.nodes_of_kind(NodeKind::CallSite)) {
    if (ctx_.cancelled()) return false;
    if (!ctx_.in_scope(*callsite)) continue;

    const auto * arg_types = get_list(callsite->props, prop::k_arg_types);
    if (arg_types == nullptr || arg_types->empty()) continue;

    const Node * callee = resolved_callee(ctx_.graph, *callsite);
    if (callee == nullptr) continue;

    size_t index = 0;
    for (const auto & param : parameters_of(ctx_.graph, callee->id)) {
      if (param.kind == ParamKind::Receiver) continue;
      if (param.kind != ParamKind::Positional && param.kind != ParamKind::PositionalOnly) break;
      if (index >= arg_types->size()) break;

      const std::string & observed = (*arg_types)[index++];
      const auto declared = declared_type(ctx_.graph, *param.node);
      if (!declared || observed.empty() || types_.compatible(*declared, observed)) continue;

      report_mismatch(
        *callsite,
        fmt::format(
          "Argument {} of {} expects {} but receives {}", param.node->name(), callee->name(),
          *declared, observed),
        *declared, observed);
    }
  }
  return true;
}

// ============================================================================
// Annotations
// ============================================================================

bool DataFlowChecker::check_annotations()
{
  if (!ctx_.config.report_missing_annotations) return true;

  for (const auto * fn : ctx_.graph.nodes_of_kind(NodeKind::Function)) {
    if (ctx_.cancelled()) return false;
    if (get_string(fn->props, prop::k_visibility) != to_string(Visibility::Public)) continue;

    for (const auto & param : parameters_of(ctx_.graph, fn->id)) {
      if (param.kind == ParamKind::Receiver) continue;
      if (!ctx_.in_scope(*param.node) || declared_type(ctx_.graph, *param.node)) continue;
      ctx_.bag
        .report(
          Law::DataFlowConsistency, violation_type::k_missing_annotation, Severity::Warning,
          *param.node,
          fmt::format("Parameter {} of public function {} has no type annotation",
                      param.node->name(), fn->name()))
        .with_entity(fn->id)
        .with_fix(fmt::format("Annotate {}", param.node->name()))
        .with_detail("function", std::string(fn->qualified_name()));
    }

    if (fn->name() == k_constructor_name || !ctx_.in_scope(*fn)) continue;
    if (declared_type(ctx_.graph, *fn)) continue;
    ctx_.bag
      .report(
        Law::DataFlowConsistency, violation_type::k_missing_annotation, Severity::Warning, *fn,
        fmt::format("Public function {} has no return type annotation", fn->name()))
      .with_fix(fmt::format("Add a return annotation to {}", fn->name()))
      .with_detail("function", std::string(fn->qualified_name()));
  }
  return true;
}

}  // namespace codegraph
