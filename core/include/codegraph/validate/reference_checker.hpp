// codegraph/validate/reference_checker.hpp - Reference Integrity
//
#pragma once

#include "codegraph/validate/check_context.hpp"

namespace codegraph
{

/**
 * Reference Integrity.
 *
 * - REFERENCES / ASSIGNS_TO / READS_FROM / IMPORTS edges must point at an
 *   existing node (dangling_reference, anchored at the edge source)
 * - Unresolved call sites are reported at the configured severity
 * - Ambiguous call sites are errors listing their candidates
 *
 * Orphan nodes belong to Structural Integrity and are reported there only.
 */
class ReferenceChecker
{
public:
  explicit ReferenceChecker(CheckContext & ctx) : ctx_(ctx) {}

  /// Returns false if the run was cancelled
  bool check();

private:
  bool check_edges();
  bool check_callsites();

  CheckContext & ctx_;
};

}  // namespace codegraph
