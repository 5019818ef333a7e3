// codegraph/validate/violation.hpp - Conservation-law violation records
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/graph/node.hpp"
#include "codegraph/graph/property.hpp"

namespace codegraph
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Law : uint8_t {
  SignatureConservation,
  ReferenceIntegrity,
  DataFlowConsistency,
  StructuralIntegrity,
};

inline constexpr Law k_all_laws[] = {
  Law::SignatureConservation,
  Law::ReferenceIntegrity,
  Law::DataFlowConsistency,
  Law::StructuralIntegrity,
};

/// "signature_conservation", "reference_integrity", ...
[[nodiscard]] std::string_view to_string(Law law) noexcept;

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view text) noexcept;

/// Violation type names
namespace violation_type
{
inline constexpr std::string_view k_signature_mismatch = "signature_mismatch";
inline constexpr std::string_view k_visibility_violation = "visibility_violation";
inline constexpr std::string_view k_dangling_reference = "dangling_reference";
inline constexpr std::string_view k_unresolved_reference = "unresolved_reference";
inline constexpr std::string_view k_ambiguous_reference = "ambiguous_reference";
inline constexpr std::string_view k_type_mismatch = "type_mismatch";
inline constexpr std::string_view k_missing_annotation = "missing_annotation";
inline constexpr std::string_view k_parameter_position_gap = "parameter_position_gap";
inline constexpr std::string_view k_parameter_ownership = "parameter_ownership";
inline constexpr std::string_view k_callsite_ownership = "callsite_ownership";
inline constexpr std::string_view k_invalid_resolution = "invalid_resolution";
inline constexpr std::string_view k_circular_inheritance = "circular_inheritance";
inline constexpr std::string_view k_orphan_node = "orphan_node";
}  // namespace violation_type

/**
 * One broken invariant.
 *
 * entity_ids[0] is the anchor: the entity the violation is about. Results
 * restricted to a node set keep exactly the violations anchored in it.
 */
struct Violation
{
  Law law = Law::StructuralIntegrity;
  std::string type;
  Severity severity = Severity::Error;
  std::vector<NodeId> entity_ids;
  std::string message;
  std::string location;
  std::optional<std::string> suggested_fix;
  PropertyMap details;

  [[nodiscard]] std::string_view anchor() const noexcept
  {
    return entity_ids.empty() ? std::string_view{} : std::string_view(entity_ids.front());
  }
};

/// Deterministic report order: anchor, law, type, then message
[[nodiscard]] bool violation_less(const Violation & a, const Violation & b);

// ============================================================================
// Forward Declarations
// ============================================================================

class ViolationBag;

// ============================================================================
// ViolationBuilder
// ============================================================================

/**
 * Fluent builder that adds its violation to the bag when destroyed.
 */
class ViolationBuilder
{
public:
  ViolationBuilder(ViolationBag & bag, Violation violation);

  ViolationBuilder(const ViolationBuilder &) = delete;
  ViolationBuilder & operator=(const ViolationBuilder &) = delete;

  ViolationBuilder(ViolationBuilder && other) noexcept;

  ~ViolationBuilder();

  /// Append a related entity after the anchor
  ViolationBuilder & with_entity(NodeId id);

  ViolationBuilder & with_location(std::string location);

  ViolationBuilder & with_fix(std::string fix);

  ViolationBuilder & with_detail(std::string key, int64_t value);
  ViolationBuilder & with_detail(std::string key, std::string value);
  ViolationBuilder & with_detail(std::string key, StringList value);

private:
  ViolationBag & bag_;
  Violation violation_;
  bool active_ = true;
};

// ============================================================================
// ViolationBag
// ============================================================================

class ViolationBag
{
public:
  ViolationBag() = default;

  /// Start a violation anchored at `anchor`
  ViolationBuilder report(
    Law law, std::string_view type, Severity severity, const Node & anchor, std::string message);

  void add(Violation && violation);

  [[nodiscard]] const std::vector<Violation> & all() const { return violations_; }
  [[nodiscard]] bool empty() const { return violations_.empty(); }
  [[nodiscard]] size_t size() const { return violations_.size(); }

  [[nodiscard]] bool has_errors() const;

  /// Move the violations out, sorted deterministically
  [[nodiscard]] std::vector<Violation> take_sorted();

  [[nodiscard]] auto begin() const { return violations_.begin(); }
  [[nodiscard]] auto end() const { return violations_.end(); }

private:
  std::vector<Violation> violations_;
};

}  // namespace codegraph
