// codegraph/validate/data_flow_checker.hpp - Data Flow Consistency
//
// Where both a declared type and an observed type are known they must be
// compatible under the configured rule. Observed types come from:
//
//   - `value_type` on ASSIGNS_TO edges
//   - the callee's return type, for ASSIGNS_TO edges leaving a resolved CallSite
//   - `expected_type` on REFERENCES edges (checked against the target's type)
//   - positional `arg_types` of a resolved CallSite (checked against parameters)
//
// Unannotated ends are skipped.
//
#pragma once

#include <string>

#include "codegraph/validate/check_context.hpp"
#include "codegraph/validate/type_compatibility.hpp"

namespace codegraph
{

class DataFlowChecker
{
public:
  explicit DataFlowChecker(CheckContext & ctx) : ctx_(ctx), types_(ctx.graph, ctx.config) {}

  /// Returns false if the run was cancelled
  bool check();

private:
  bool check_assignments();
  bool check_references();
  bool check_arguments();
  bool check_annotations();

  void report_mismatch(
    const Node & anchor, std::string message, const std::string & declared,
    const std::string & observed);

  CheckContext & ctx_;
  TypeCompatibilityChecker types_;
};

}  // namespace codegraph
