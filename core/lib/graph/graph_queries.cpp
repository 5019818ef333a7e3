// codegraph/graph/graph_queries.cpp - Structural lookups shared by passes
//
#include "codegraph/graph/graph_queries.hpp"

#include <algorithm>
#include <unordered_set>

namespace codegraph
{

const Node * owner_of(const CodeGraph & graph, const Node & node)
{
  EdgeKind via = EdgeKind::Declares;
  switch (node.kind) {
    case NodeKind::Module:
    case NodeKind::Type:
      return nullptr;
    case NodeKind::Parameter:
      via = EdgeKind::HasParameter;
      break;
    case NodeKind::CallSite:
      via = EdgeKind::HasCallsite;
      break;
    default:
      break;
  }
  for (const auto * e : graph.in_edges(node.id, via)) {
    if (const Node * owner = graph.find_node(e->source)) {
      return owner;
    }
  }
  return nullptr;
}

std::vector<const Node *> ancestors_of(const CodeGraph & graph, const Node & node)
{
  std::vector<const Node *> chain;
  std::unordered_set<std::string_view> seen{node.id};
  const Node * cur = owner_of(graph, node);
  while (cur != nullptr && seen.insert(cur->id).second) {
    chain.push_back(cur);
    if (cur->is(NodeKind::Module)) break;
    cur = owner_of(graph, *cur);
  }
  return chain;
}

const Node * enclosing_module(const CodeGraph & graph, const Node & node)
{
  if (node.is(NodeKind::Module)) return &node;
  for (const auto * a : ancestors_of(graph, node)) {
    if (a->is(NodeKind::Module)) return a;
  }
  return nullptr;
}

const Node * enclosing_class(const CodeGraph & graph, const Node & node)
{
  for (const auto * a : ancestors_of(graph, node)) {
    if (a->is(NodeKind::Class)) return a;
  }
  return nullptr;
}

std::vector<const Node *> declared_children(const CodeGraph & graph, std::string_view scope_id)
{
  std::vector<const Node *> result;
  for (const auto * e : graph.out_edges(scope_id, EdgeKind::Declares)) {
    if (const Node * child = graph.find_node(e->target)) {
      result.push_back(child);
    }
  }
  return result;
}

std::vector<ParameterInfo> parameters_of(const CodeGraph & graph, std::string_view function_id)
{
  std::vector<ParameterInfo> params;
  for (const auto * e : graph.out_edges(function_id, EdgeKind::HasParameter)) {
    const Node * p = graph.find_node(e->target);
    if (p == nullptr) continue;

    ParameterInfo info;
    info.node = p;
    info.position = get_int(e->props, prop::k_position)
                      .value_or(get_int(p->props, prop::k_position).value_or(0));
    if (const auto kind = get_string(p->props, prop::k_param_kind)) {
      info.kind = parse_param_kind(*kind).value_or(ParamKind::Positional);
    }
    info.has_default = get_bool(p->props, prop::k_has_default);
    params.push_back(info);
  }
  std::stable_sort(
    params.begin(), params.end(),
    [](const ParameterInfo & a, const ParameterInfo & b) { return a.position < b.position; });
  return params;
}

std::optional<std::string> declared_type(const CodeGraph & graph, const Node & node)
{
  const EdgeKind via = node.is(NodeKind::Function) ? EdgeKind::ReturnsType : EdgeKind::HasType;
  for (const auto * e : graph.out_edges(node.id, via)) {
    const std::string name = target_name(graph, *e);
    if (!name.empty()) return name;
  }
  if (const auto annotation = get_string(node.props, prop::k_type_annotation)) {
    if (!annotation->empty()) return std::string(*annotation);
  }
  return std::nullopt;
}

std::string target_name(const CodeGraph & graph, const Edge & edge)
{
  if (const Node * t = graph.find_node(edge.target)) {
    const auto q = t->qualified_name();
    if (!q.empty()) return std::string(q);
  }
  return std::string(get_string(edge.props, prop::k_target_name).value_or(std::string_view{}));
}

std::string_view last_segment(std::string_view qname) noexcept
{
  const auto dot = qname.rfind('.');
  return dot == std::string_view::npos ? qname : qname.substr(dot + 1);
}

}  // namespace codegraph
