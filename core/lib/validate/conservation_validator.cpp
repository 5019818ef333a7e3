// codegraph/validate/conservation_validator.cpp - The four conservation laws
//
#include "codegraph/validate/conservation_validator.hpp"

#include <algorithm>
#include <chrono>
#include <deque>

#include "codegraph/basic/log.hpp"
#include "codegraph/validate/check_context.hpp"
#include "codegraph/validate/data_flow_checker.hpp"
#include "codegraph/validate/reference_checker.hpp"
#include "codegraph/validate/signature_checker.hpp"
#include "codegraph/validate/structural_checker.hpp"

namespace codegraph
{

size_t ValidationReport::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    violations.begin(), violations.end(),
    [severity](const Violation & v) { return v.severity == severity; }));
}

size_t ValidationReport::count(Law law) const
{
  return static_cast<size_t>(std::count_if(
    violations.begin(), violations.end(), [law](const Violation & v) { return v.law == law; }));
}

std::vector<const Violation *> ValidationReport::of_type(std::string_view type) const
{
  std::vector<const Violation *> result;
  for (const auto & v : violations) {
    if (v.type == type) result.push_back(&v);
  }
  return result;
}

namespace
{

bool run_law(Law law, CheckContext & ctx)
{
  switch (law) {
    case Law::SignatureConservation:
      return SignatureChecker(ctx).check();
    case Law::ReferenceIntegrity:
      return ReferenceChecker(ctx).check();
    case Law::DataFlowConsistency:
      return DataFlowChecker(ctx).check();
    case Law::StructuralIntegrity:
      return StructuralChecker(ctx).check();
  }
  return true;
}

}  // namespace

ValidationReport ConservationValidator::validate(
  const CodeGraph & graph, const NodeFilter & filter, const CancellationToken & token,
  const std::vector<Law> & laws) const
{
  const auto started = std::chrono::steady_clock::now();

  ValidationReport report;
  report.incremental = !filter.is_all();
  report.scope_size = filter.is_all() ? graph.node_count() : filter.ids()->size();

  ViolationBag bag;
  CheckContext ctx{graph, config_, filter, bag, token};

  for (const Law law : laws) {
    const size_t before = bag.size();
    if (!run_law(law, ctx)) {
      log::info("validation cancelled during {}", to_string(law));
      report.cancelled = true;
      return report;
    }
    log::debug("{}: {} violation(s)", to_string(law), bag.size() - before);
  }

  report.violations = bag.take_sorted();

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started);
  log::info(
    "validated {} of {} node(s): {} error(s), {} warning(s) in {} ms", report.scope_size,
    graph.node_count(), report.count(Severity::Error), report.count(Severity::Warning),
    elapsed.count());
  return report;
}

ValidationReport ConservationValidator::validate_full(
  const CodeGraph & graph, const CancellationToken & token) const
{
  return validate(graph, NodeFilter::all(), token);
}

ValidationReport ConservationValidator::validate_incremental(
  const CodeGraph & graph, const CancellationToken & token) const
{
  return validate(graph, incremental_scope(graph), token);
}

NodeFilter ConservationValidator::incremental_scope(const CodeGraph & graph) const
{
  NodeFilter::IdSet scope;
  std::deque<std::pair<NodeId, uint32_t>> queue;
  for (auto & id : graph.changed_node_ids()) {
    if (scope.insert(id).second) queue.emplace_back(std::move(id), 0);
  }

  while (!queue.empty()) {
    const NodeId id = queue.front().first;
    const uint32_t depth = queue.front().second;
    queue.pop_front();
    if (depth >= config_.incremental_hops) continue;

    const auto visit = [&](const NodeId & next) {
      if (graph.contains(next) && scope.insert(next).second) {
        queue.emplace_back(next, depth + 1);
      }
    };
    for (const auto * e : graph.out_edges(id)) visit(e->target);
    for (const auto * e : graph.in_edges(id)) visit(e->source);
  }
  return NodeFilter::only(std::move(scope));
}

}  // namespace codegraph
