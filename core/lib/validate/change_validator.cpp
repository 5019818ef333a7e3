// codegraph/validate/change_validator.cpp - Pre-flight check of a proposed edit
//
#include "codegraph/validate/change_validator.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "codegraph/basic/log.hpp"
#include "codegraph/validate/signature_checker.hpp"

namespace codegraph
{

namespace
{

void report_broken_callers(const Node & entity, const ImpactAnalysis & impact, ViolationBag & bag)
{
  if (impact.affected_callers.empty()) return;

  StringList callers;
  for (const auto & link : impact.affected_callers) {
    callers.emplace_back(link.function->qualified_name());
  }
  auto v = bag.report(
    Law::ReferenceIntegrity, violation_type::k_dangling_reference, Severity::Error, entity,
    fmt::format(
      "Deleting {} would break {} caller(s)", entity.name(), impact.affected_callers.size()));
  for (const auto & link : impact.affected_callers) {
    v.with_entity(link.callsite->id);
  }
  v.with_fix("Update or remove all call sites before deleting")
    .with_detail("callers", std::move(callers));
}

void report_unresolved_calls(
  const Node & entity, const ProposedChange & change, const ImpactAnalysis & impact,
  ViolationBag & bag)
{
  const std::string renamed =
    change.new_name ? fmt::format("{} to {}", entity.name(), *change.new_name)
                    : std::string(entity.name());
  for (const auto & link : impact.affected_callers) {
    const auto callee = std::string(get_string(link.callsite->props, prop::k_callee).value_or(""));
    auto v = bag.report(
      Law::ReferenceIntegrity, violation_type::k_unresolved_reference, Severity::Error,
      *link.callsite,
      fmt::format("Call to '{}' would no longer resolve after renaming {}", callee, renamed));
    v.with_entity(entity.id).with_detail("callee", callee);
    if (change.new_name) v.with_fix(fmt::format("Call '{}' instead", *change.new_name));
  }
}

void report_broken_references(
  const Node & entity, const ProposedChange & change, const ImpactAnalysis & impact,
  ViolationBag & bag)
{
  const auto qname = std::string(entity.qualified_name());
  for (const auto & ref : impact.affected_references) {
    auto v = bag.report(
      Law::ReferenceIntegrity, violation_type::k_dangling_reference, Severity::Error, *ref.source,
      fmt::format(
        "{} {} '{}' which would no longer exist", ref.source->name(), to_string(ref.kind), qname));
    v.with_entity(entity.id)
      .with_detail("edge", std::string(to_string(ref.kind)))
      .with_detail("target", qname);
    if (change.type == ChangeType::Delete) {
      v.with_fix(fmt::format("Remove the reference to '{}' first", qname));
    } else if (change.new_name) {
      v.with_fix(fmt::format("Refer to '{}' instead", *change.new_name));
    }
  }
}

/// Re-bind every resolved call site of `entity` against a new parameter list
void report_signature_breaks(
  const Node & entity, const std::vector<ProposedParameter> & proposed,
  const ImpactAnalysis & impact, ViolationBag & bag)
{
  // Parameter nodes that would exist after the change
  std::vector<Node> nodes;
  nodes.reserve(proposed.size());
  std::vector<ParameterInfo> params;
  for (size_t i = 0; i < proposed.size(); ++i) {
    Node n;
    n.kind = NodeKind::Parameter;
    set_string(n.props, std::string(prop::k_name), proposed[i].name);
    nodes.push_back(std::move(n));
    params.push_back(
      ParameterInfo{&nodes.back(), static_cast<int64_t>(i), proposed[i].kind,
                    proposed[i].has_default});
  }
  const Arity arity = arity_of(params);
  const std::string expected_text = describe_arity(arity);

  for (const auto & link : impact.affected_callers) {
    const Node & callsite = *link.callsite;
    if (link.arg_count && !arity.accepts(*link.arg_count)) {
      bag
        .report(
          Law::SignatureConservation, violation_type::k_signature_mismatch, Severity::Error,
          callsite,
          fmt::format(
            "Function {} would expect {} but is called with {}", entity.name(), expected_text,
            *link.arg_count))
        .with_entity(entity.id)
        .with_fix(
          fmt::format("Update the call to {} to provide {}", callsite.name(), expected_text))
        .with_detail("function", std::string(entity.qualified_name()))
        .with_detail("caller", std::string(link.function->qualified_name()))
        .with_detail("actual_args", *link.arg_count)
        .with_detail("min_args", arity.min);
    }

    const auto * keywords = get_list(callsite.props, prop::k_keyword_args);
    if (keywords == nullptr) continue;
    for (const auto & keyword : *keywords) {
      if (accepts_keyword(params, keyword)) continue;
      bag
        .report(
          Law::SignatureConservation, violation_type::k_signature_mismatch, Severity::Error,
          callsite,
          fmt::format("Function {} would have no parameter named '{}'", entity.name(), keyword))
        .with_entity(entity.id)
        .with_fix(fmt::format("Remove the keyword argument '{}'", keyword))
        .with_detail("function", std::string(entity.qualified_name()))
        .with_detail("keyword", keyword);
    }
  }
}

}  // namespace

bool ChangeValidationResult::has_errors() const
{
  return std::any_of(violations.begin(), violations.end(), [](const Violation & v) {
    return v.severity == Severity::Error;
  });
}

ChangeValidationResult validate_change(const CodeGraph & graph, const ProposedChange & change)
{
  const Node * entity = graph.find_node(change.entity_id);
  if (entity == nullptr) {
    return ChangeValidationResult::fail(fmt::format("Unknown entity '{}'", change.entity_id));
  }
  if (change.parameters && !entity->is(NodeKind::Function)) {
    return ChangeValidationResult::fail(fmt::format(
      "{} is a {}; only functions take a parameter list", entity->qualified_name(),
      to_string(entity->kind)));
  }

  ImpactAnalysis impact = GraphQuery(graph).impact_of(entity->id, change.type);
  ViolationBag bag;
  switch (change.type) {
    case ChangeType::Delete:
      report_broken_callers(*entity, impact, bag);
      report_broken_references(*entity, change, impact, bag);
      break;
    case ChangeType::Rename:
      report_unresolved_calls(*entity, change, impact, bag);
      report_broken_references(*entity, change, impact, bag);
      break;
    case ChangeType::Modify:
      if (change.parameters) report_signature_breaks(*entity, *change.parameters, impact, bag);
      break;
  }

  log::debug(
    "validate_change {} {}: {} caller(s), {} reference(s), {} violation(s)",
    to_string(change.type), entity->qualified_name(), impact.affected_callers.size(),
    impact.affected_references.size(), bag.size());
  return ChangeValidationResult::ok(std::move(impact), bag.take_sorted());
}

}  // namespace codegraph
