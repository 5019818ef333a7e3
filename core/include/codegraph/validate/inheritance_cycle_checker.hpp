// codegraph/validate/inheritance_cycle_checker.hpp - INHERITS cycle detection
//
// Recursive calls between functions are legal and handled by the change
// propagator's visited set; this pass only concerns the class hierarchy.
//
#pragma once

#include <gsl/span>

#include <string>
#include <vector>

#include "codegraph/basic/cancellation.hpp"
#include "codegraph/graph/code_graph.hpp"

namespace codegraph
{

/**
 * One inheritance cycle.
 *
 * Rotated so that the class with the smallest qualified name comes first;
 * the edge from the last class back to the first closes the cycle.
 */
struct InheritanceCycle
{
  std::vector<const Node *> classes;
};

/**
 * Detect cycles in INHERITS restricted to Class nodes.
 *
 * Depth-first search with a recursion stack: every back-edge to a class
 * still on the stack closes a cycle. Roots are visited in qualified-name
 * order so the result does not depend on node ids.
 */
class InheritanceCycleChecker
{
public:
  explicit InheritanceCycleChecker(const CodeGraph & graph) : graph_(graph) {}

  /**
   * Find every distinct cycle reachable by the search.
   *
   * @return cycles sorted by their first class; empty if cancelled
   */
  [[nodiscard]] std::vector<InheritanceCycle> find_cycles(
    const CancellationToken & token = {}) const;

private:
  const CodeGraph & graph_;
};

/// "A -> B -> A" (simple class names)
[[nodiscard]] std::string cycle_message(gsl::span<const Node * const> cycle);

}  // namespace codegraph
