// codegraph/validate/check_context.hpp - State shared by the law checkers
//
#pragma once

#include "codegraph/basic/cancellation.hpp"
#include "codegraph/graph/code_graph.hpp"
#include "codegraph/validate/node_filter.hpp"
#include "codegraph/validate/validator_config.hpp"
#include "codegraph/validate/violation.hpp"

namespace codegraph
{

/**
 * One validation run over one immutable graph view.
 *
 * Checkers read the whole graph but only report violations whose anchor
 * passes `filter`.
 */
struct CheckContext
{
  const CodeGraph & graph;
  const ValidatorConfig & config;
  const NodeFilter & filter;
  ViolationBag & bag;
  CancellationToken token;

  [[nodiscard]] bool in_scope(const Node & anchor) const { return filter.contains(anchor.id); }
  [[nodiscard]] bool cancelled() const noexcept { return token.is_cancelled(); }
};

}  // namespace codegraph
