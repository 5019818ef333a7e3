// codegraph/validate/change_validator.hpp - Pre-flight check of a proposed edit
//
// A proposed change is checked against the current graph before anyone
// edits source: the violations returned are those the edit would introduce
// at the entity's callers and referrers.
//
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "codegraph/graph/code_graph.hpp"
#include "codegraph/query/graph_query.hpp"
#include "codegraph/validate/violation.hpp"

namespace codegraph
{

/// One parameter of a proposed signature, in declaration order
struct ProposedParameter
{
  std::string name;
  ParamKind kind = ParamKind::Positional;
  bool has_default = false;
};

struct ProposedChange
{
  NodeId entity_id;
  ChangeType type = ChangeType::Modify;

  /// New parameter list of a Function (Modify only)
  std::optional<std::vector<ProposedParameter>> parameters;

  /// New simple name (Rename only)
  std::optional<std::string> new_name;
};

struct ChangeValidationResult
{
  bool success = false;

  /// Why the change could not be evaluated
  std::string error;

  ImpactAnalysis impact;

  /// Sorted by violation_less
  std::vector<Violation> violations;

  [[nodiscard]] bool has_errors() const;

  static ChangeValidationResult ok(ImpactAnalysis impact, std::vector<Violation> violations)
  {
    ChangeValidationResult r;
    r.success = true;
    r.impact = std::move(impact);
    r.violations = std::move(violations);
    return r;
  }

  static ChangeValidationResult fail(std::string msg)
  {
    ChangeValidationResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Violations a change would cause, without applying it.
 *
 * - Delete breaks every caller and every reference (Reference Integrity).
 * - Rename leaves every call site unresolved and every reference dangling.
 * - Modify with a parameter list re-binds each resolved call site against
 *   the new signature (Signature Conservation).
 *
 * Fails for an unknown entity, or for a parameter list on a non-Function.
 */
[[nodiscard]] ChangeValidationResult validate_change(
  const CodeGraph & graph, const ProposedChange & change);

}  // namespace codegraph
