// codegraph/build/resolution.hpp - Outcome of call-site resolution
//
#pragma once

#include <string_view>
#include <variant>
#include <vector>

#include "codegraph/graph/code_graph.hpp"

namespace codegraph
{

/// The call site denotes exactly one Function
struct Resolved
{
  NodeId target;

  [[nodiscard]] bool operator==(const Resolved & o) const { return target == o.target; }
};

/// No candidate was found
struct Unresolved
{
  [[nodiscard]] bool operator==(const Unresolved &) const { return true; }
};

/// Several candidates at the deciding scope; none is picked
struct Ambiguous
{
  std::vector<NodeId> candidates;  ///< sorted, distinct

  [[nodiscard]] bool operator==(const Ambiguous & o) const { return candidates == o.candidates; }
};

using Resolution = std::variant<Resolved, Unresolved, Ambiguous>;

/// "resolved" | "unresolved" | "ambiguous" (stored in the `resolution` property)
[[nodiscard]] std::string_view resolution_state(const Resolution & r) noexcept;

/**
 * Read back the resolution recorded on a CallSite node.
 *
 * Resolved comes from the RESOLVES_TO edge; Ambiguous from the
 * `resolution`/`candidates` properties (candidates are stored as qualified
 * names). Anything else reads as Unresolved.
 */
[[nodiscard]] Resolution read_resolution(const CodeGraph & graph, const Node & callsite);

}  // namespace codegraph
