// codegraph/validate/reference_checker.cpp - Reference Integrity
//
#include "codegraph/validate/reference_checker.hpp"

#include <fmt/format.h>

#include "codegraph/build/resolution.hpp"
#include "codegraph/graph/graph_queries.hpp"

namespace codegraph
{

bool ReferenceChecker::check() { return check_edges() && check_callsites(); }

bool ReferenceChecker::check_edges()
{
  for (const auto & [key, edge] : ctx_.graph.edges()) {
    if (ctx_.cancelled()) return false;
    if (!is_reference_edge(key.kind) || ctx_.graph.contains(key.target)) continue;

    const Node * source = ctx_.graph.find_node(key.source);
    if (source == nullptr || !ctx_.in_scope(*source)) continue;

    std::string name = target_name(ctx_.graph, edge);
    if (name.empty()) name = key.target;

    ctx_.bag
      .report(
        Law::ReferenceIntegrity, violation_type::k_dangling_reference, Severity::Error, *source,
        fmt::format("{} {} '{}' which does not exist", source->name(), to_string(key.kind), name))
      .with_entity(key.target)
      .with_fix(fmt::format("Define '{}' or remove the reference", name))
      .with_detail("edge", std::string(to_string(key.kind)))
      .with_detail("target", name);
  }
  return true;
}

bool ReferenceChecker::check_callsites()
{
  for (const auto * callsite : ctx_.graph.nodes_of_kind(NodeKind::CallSite)) {
    if (ctx_.cancelled()) return false;
    if (!ctx_.in_scope(*callsite)) continue;

    const auto callee = std::string(get_string(callsite->props, prop::k_callee).value_or(""));
    const auto resolution = read_resolution(ctx_.graph, *callsite);

    if (std::holds_alternative<Unresolved>(resolution)) {
      if (!ctx_.config.unresolved_severity) continue;
      ctx_.bag
        .report(
          Law::ReferenceIntegrity, violation_type::k_unresolved_reference,
          *ctx_.config.unresolved_severity, *callsite,
          fmt::format("Call to '{}' does not resolve to any known function", callee))
        .with_fix(fmt::format("Define or import '{}'", callee))
        .with_detail("callee", callee);
      continue;
    }

    if (const auto * ambiguous = std::get_if<Ambiguous>(&resolution)) {
      StringList names;
      if (const auto * stored = get_list(callsite->props, prop::k_candidates)) {
        names = *stored;
      }
      auto v = ctx_.bag.report(
        Law::ReferenceIntegrity, violation_type::k_ambiguous_reference, Severity::Error, *callsite,
        fmt::format(
          "Call to '{}' is ambiguous between {} candidates", callee, ambiguous->candidates.size()));
      for (const auto & id : ambiguous->candidates) {
        v.with_entity(id);
      }
      v.with_fix(fmt::format("Qualify the call to '{}'", callee))
        .with_detail("callee", callee)
        .with_detail("candidates", std::move(names));
    }
  }
  return true;
}

}  // namespace codegraph
