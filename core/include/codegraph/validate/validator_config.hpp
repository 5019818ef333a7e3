// codegraph/validate/validator_config.hpp - Validation policy
//
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "codegraph/validate/violation.hpp"

namespace codegraph
{

/**
 * How declared and observed types are compared.
 */
enum class TypeCompatibility : uint8_t {
  Exact,    ///< identical type text
  Nominal,  ///< exact for built-ins; user types also through subtype/base chains
  Off,      ///< never report type_mismatch
};

[[nodiscard]] std::string_view to_string(TypeCompatibility mode) noexcept;
[[nodiscard]] std::optional<TypeCompatibility> parse_type_compatibility(
  std::string_view text) noexcept;

/**
 * Validation policy (the `validation:` section of codegraph.yaml).
 */
struct ValidatorConfig
{
  /// Severity of unresolved call sites; std::nullopt turns the check off
  std::optional<Severity> unresolved_severity = Severity::Warning;

  TypeCompatibility type_compatibility = TypeCompatibility::Nominal;

  /// Report missing annotations on public functions
  bool report_missing_annotations = true;

  /// Incremental scope: changed nodes plus nodes this many edges away
  uint32_t incremental_hops = 1;

  /// Types compared by exact name only
  std::set<std::string, std::less<>> builtin_types = {
    "int", "float", "complex", "str", "bytes", "bool", "None", "list", "dict", "set", "tuple",
  };

  /// Matches any type in either position
  std::string any_type = "Any";
};

}  // namespace codegraph
