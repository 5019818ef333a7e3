// codegraph/propagate/change_propagator.hpp - Expansion of the changed marker
//
// Edits mark the nodes declared in the edited files; propagation then spreads
// the marker to everything that depends on a changed node:
//
//   callee  <-RESOLVES_TO-  CallSite  <-HAS_CALLSITE-  calling Function
//   module  <-IMPORTS-      importing Module
//   class   <-INHERITS-     subclass
//
// Call cycles are legal and end at the visited set.
//
#pragma once

#include <gsl/span>

#include <cstddef>
#include <string>
#include <vector>

#include "codegraph/basic/cancellation.hpp"
#include "codegraph/graph/graph_store.hpp"

namespace codegraph
{

struct PropagationResult
{
  /// Ids that became changed during this call, sorted
  std::vector<NodeId> added;

  /// Breadth-first rounds until the fixpoint
  size_t rounds = 0;

  /// The run was cancelled; no flag was written
  bool cancelled = false;
};

class ChangePropagator
{
public:
  explicit ChangePropagator(GraphStore & store) : store_(store) {}

  /**
   * Set changed=true on every node declared in one of `files`.
   *
   * A node matches through its `file` property (its Module also through
   * `path`). A given path also matches a stored path it is a trailing
   * component sequence of ("x.py" matches "pkg/x.py").
   *
   * @return ids newly marked, sorted
   */
  std::vector<NodeId> mark_changed(gsl::span<const std::string> files);

  /**
   * Expand the changed set to its dependents until nothing new is added.
   *
   * Monotonic and idempotent: a second call adds nothing.
   */
  PropagationResult propagate(const CancellationToken & token = {});

  /// Reset every changed flag
  void clear_changed();

  [[nodiscard]] std::vector<NodeId> changed_node_ids() const;

private:
  GraphStore & store_;
};

/// Nodes one propagation step away from `id`
[[nodiscard]] std::vector<NodeId> dependents_of(const CodeGraph & graph, std::string_view id);

}  // namespace codegraph
