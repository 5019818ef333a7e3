// codegraph/validate/type_compatibility.hpp - Declared vs observed type check
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "codegraph/graph/code_graph.hpp"
#include "codegraph/validate/validator_config.hpp"

namespace codegraph
{

class TypeCompatibilityChecker
{
public:
  TypeCompatibilityChecker(const CodeGraph & graph, const ValidatorConfig & config)
  : graph_(graph), config_(config)
  {
  }

  /**
   * Check whether a value of type `observed` may flow where `declared` is
   * expected.
   *
   * Under the nominal rule a user type is compatible with every type
   * reachable from it along IS_SUBTYPE_OF (between Type nodes) or INHERITS
   * (between the Classes the names denote).
   */
  [[nodiscard]] bool compatible(std::string_view declared, std::string_view observed) const;

  [[nodiscard]] bool is_builtin(std::string_view type) const;

private:
  /// Type names reachable upward from `type` (including itself)
  [[nodiscard]] std::vector<std::string> supertypes_of(std::string_view type) const;

  /// Classes a type name may denote (qualified-name match, else simple-name match)
  [[nodiscard]] std::vector<const Node *> classes_named(std::string_view type) const;

  const CodeGraph & graph_;
  const ValidatorConfig & config_;
};

}  // namespace codegraph
