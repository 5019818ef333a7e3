// codegraph/validate/conservation_validator.hpp - The four conservation laws
//
// Full and incremental validation are one algorithm parameterized by a
// NodeFilter. Every violation is anchored at one entity and the checks for
// an anchor read the whole graph, so an incremental run over S reports
// exactly the full run's violations anchored in S.
//
#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "codegraph/basic/cancellation.hpp"
#include "codegraph/graph/code_graph.hpp"
#include "codegraph/validate/node_filter.hpp"
#include "codegraph/validate/validator_config.hpp"
#include "codegraph/validate/violation.hpp"

namespace codegraph
{

// ============================================================================
// Report
// ============================================================================

struct ValidationReport
{
  /// Sorted by violation_less; empty when cancelled
  std::vector<Violation> violations;

  /// The run was cancelled and its partial result discarded
  bool cancelled = false;

  bool incremental = false;

  /// Nodes in the filter (the whole graph for a full run)
  size_t scope_size = 0;

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] size_t count(Law law) const;

  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }

  /// Violations of one type, in report order
  [[nodiscard]] std::vector<const Violation *> of_type(std::string_view type) const;
};

// ============================================================================
// ConservationValidator
// ============================================================================

class ConservationValidator
{
public:
  explicit ConservationValidator(ValidatorConfig config = {}) : config_(std::move(config)) {}

  [[nodiscard]] const ValidatorConfig & config() const noexcept { return config_; }

  /**
   * Run the selected laws over one graph view.
   *
   * Only violations anchored at nodes passing `filter` are reported.
   */
  [[nodiscard]] ValidationReport validate(
    const CodeGraph & graph, const NodeFilter & filter, const CancellationToken & token = {},
    const std::vector<Law> & laws = {std::begin(k_all_laws), std::end(k_all_laws)}) const;

  /// Every law over every node
  [[nodiscard]] ValidationReport validate_full(
    const CodeGraph & graph, const CancellationToken & token = {}) const;

  /// Every law over incremental_scope(graph)
  [[nodiscard]] ValidationReport validate_incremental(
    const CodeGraph & graph, const CancellationToken & token = {}) const;

  /**
   * Changed nodes plus every existing node within `incremental_hops` edges
   * of one, following edges in either direction.
   */
  [[nodiscard]] NodeFilter incremental_scope(const CodeGraph & graph) const;

private:
  ValidatorConfig config_;
};

}  // namespace codegraph
