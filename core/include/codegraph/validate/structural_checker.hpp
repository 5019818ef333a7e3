// codegraph/validate/structural_checker.hpp - Structural Integrity
//
#pragma once

#include "codegraph/validate/check_context.hpp"

namespace codegraph
{

/**
 * Structural Integrity.
 *
 * - HAS_PARAMETER positions of a function are 0..n-1 without gaps or repeats
 * - every Parameter has exactly one owning Function, every CallSite likewise
 * - a CallSite has at most one RESOLVES_TO edge and it targets a Function
 * - INHERITS restricted to classes is acyclic
 * - every node other than Modules and Types hangs off a Module
 */
class StructuralChecker
{
public:
  explicit StructuralChecker(CheckContext & ctx) : ctx_(ctx) {}

  /// Returns false if the run was cancelled
  bool check();

private:
  bool check_parameter_positions();
  bool check_ownership();
  bool check_resolutions();
  bool check_inheritance();
  bool check_orphans();

  CheckContext & ctx_;
};

}  // namespace codegraph
