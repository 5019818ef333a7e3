// codegraph/build/resolution.cpp - Outcome of call-site resolution
//
#include "codegraph/build/resolution.hpp"

#include <algorithm>

#include "codegraph/build/node_identity.hpp"

namespace codegraph
{

std::string_view resolution_state(const Resolution & r) noexcept
{
  if (std::holds_alternative<Resolved>(r)) return "resolved";
  if (std::holds_alternative<Ambiguous>(r)) return "ambiguous";
  return "unresolved";
}

Resolution read_resolution(const CodeGraph & graph, const Node & callsite)
{
  const auto targets = graph.out_edges(callsite.id, EdgeKind::ResolvesTo);
  if (!targets.empty()) {
    return Resolved{targets.front()->target};
  }

  if (get_string(callsite.props, prop::k_resolution) == std::string_view("ambiguous")) {
    Ambiguous a;
    if (const auto * names = get_list(callsite.props, prop::k_candidates)) {
      for (const auto & qname : *names) {
        a.candidates.push_back(make_node_id(NodeKind::Function, qname));
      }
    }
    std::sort(a.candidates.begin(), a.candidates.end());
    a.candidates.erase(std::unique(a.candidates.begin(), a.candidates.end()), a.candidates.end());
    return a;
  }

  return Unresolved{};
}

}  // namespace codegraph
