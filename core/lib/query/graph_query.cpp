// codegraph/query/graph_query.cpp - Read-only navigation over one graph view
//
#include "codegraph/query/graph_query.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <tuple>
#include <utility>

#include "codegraph/graph/graph_queries.hpp"

namespace codegraph
{

std::string_view to_string(ChangeType type) noexcept
{
  switch (type) {
    case ChangeType::Modify:
      return "modify";
    case ChangeType::Delete:
      return "delete";
    case ChangeType::Rename:
      return "rename";
  }
  return "unknown";
}

std::optional<ChangeType> parse_change_type(std::string_view text) noexcept
{
  for (const ChangeType t : {ChangeType::Modify, ChangeType::Delete, ChangeType::Rename}) {
    if (to_string(t) == text) {
      return t;
    }
  }
  return std::nullopt;
}

// ============================================================================
// Calls
// ============================================================================

std::vector<CallLink> GraphQuery::find_callers(std::string_view function_id) const
{
  std::vector<CallLink> links;
  for (const auto * e : graph_.in_edges(function_id, EdgeKind::ResolvesTo)) {
    const Node * cs = graph_.find_node(e->source);
    if (cs == nullptr) continue;
    const Node * caller = owner_of(graph_, *cs);
    if (caller == nullptr) continue;
    links.push_back(CallLink{caller, cs, get_int(cs->props, prop::k_arg_count)});
  }
  return links;
}

std::vector<CallLink> GraphQuery::find_callees(std::string_view function_id) const
{
  std::vector<CallLink> links;
  for (const auto * owns : graph_.out_edges(function_id, EdgeKind::HasCallsite)) {
    const Node * cs = graph_.find_node(owns->target);
    if (cs == nullptr) continue;
    for (const auto * e : graph_.out_edges(cs->id, EdgeKind::ResolvesTo)) {
      const Node * callee = graph_.find_node(e->target);
      if (callee == nullptr) continue;
      links.push_back(CallLink{callee, cs, get_int(cs->props, prop::k_arg_count)});
    }
  }
  return links;
}

std::vector<const Node *> GraphQuery::callers_of(std::string_view function_id) const
{
  std::vector<const Node *> out;
  for (const auto & link : find_callers(function_id)) out.push_back(link.function);
  return out;
}

std::vector<const Node *> GraphQuery::callees_of(std::string_view function_id) const
{
  std::vector<const Node *> out;
  for (const auto & link : find_callees(function_id)) out.push_back(link.function);
  return out;
}

// ============================================================================
// References and hierarchy
// ============================================================================

std::vector<ReferenceLink> GraphQuery::find_references(std::string_view entity_id) const
{
  std::vector<ReferenceLink> links;
  for (const auto * e : graph_.in_edges(entity_id)) {
    if (!is_reference_edge(e->kind)) continue;
    const Node * source = graph_.find_node(e->source);
    if (source == nullptr) continue;
    const auto location = get_string(e->props, prop::k_location);
    links.push_back(
      ReferenceLink{source, e->kind, std::string(location ? *location : source->location())});
  }
  return links;
}

ClassHierarchy GraphQuery::class_hierarchy(std::string_view class_id) const
{
  ClassHierarchy h;
  for (const auto * e : graph_.out_edges(class_id, EdgeKind::Inherits)) {
    if (const Node * base = graph_.find_node(e->target)) h.bases.push_back(base);
  }
  for (const auto * e : graph_.in_edges(class_id, EdgeKind::Inherits)) {
    if (const Node * derived = graph_.find_node(e->source)) h.derived.push_back(derived);
  }
  return h;
}

// ============================================================================
// Dependencies
// ============================================================================

namespace
{

bool by_distance(const Dependency & a, const Dependency & b)
{
  return std::tie(a.distance, a.function->id) < std::tie(b.distance, b.function->id);
}

}  // namespace

FunctionDependencies GraphQuery::function_dependencies(
  std::string_view function_id, int depth) const
{
  FunctionDependencies deps;
  if (depth < 1 || !graph_.contains(function_id)) return deps;

  const auto walk = [&](bool outbound) {
    std::vector<Dependency> found;
    std::set<std::string_view> seen{function_id};
    std::deque<std::pair<std::string_view, int>> queue{{function_id, 0}};
    while (!queue.empty()) {
      const auto [id, distance] = queue.front();
      queue.pop_front();
      if (distance == depth) continue;
      for (const Node * next : outbound ? callees_of(id) : callers_of(id)) {
        if (!seen.insert(next->id).second) continue;
        found.push_back(Dependency{next, distance + 1});
        queue.emplace_back(next->id, distance + 1);
      }
    }
    std::sort(found.begin(), found.end(), by_distance);
    return found;
  };

  deps.outbound = walk(true);
  deps.inbound = walk(false);
  return deps;
}

// ============================================================================
// Impact
// ============================================================================

ImpactAnalysis GraphQuery::impact_of(std::string_view entity_id, ChangeType type) const
{
  ImpactAnalysis impact;
  impact.entity_id = std::string(entity_id);
  impact.change_type = type;
  impact.affected_callers = find_callers(entity_id);
  impact.affected_references = find_references(entity_id);

  if (type == ChangeType::Delete) {
    std::map<std::pair<EdgeKind, NodeKind>, size_t> counts;
    const auto tally = [&](const Edge & e, const NodeId & other) {
      if (const Node * n = graph_.find_node(other)) ++counts[{e.kind, n->kind}];
    };
    for (const auto * e : graph_.out_edges(entity_id)) tally(*e, e->target);
    for (const auto * e : graph_.in_edges(entity_id)) tally(*e, e->source);
    for (const auto & [key, count] : counts) {
      impact.cascading_changes.push_back(CascadingChange{key.first, key.second, count});
    }
  }
  return impact;
}

}  // namespace codegraph
