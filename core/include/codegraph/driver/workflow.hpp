// codegraph/driver/workflow.hpp - Composite edit/validate operations
//
// Single entry point for the "after an edit" pipeline.
// Used by the CLI and can be embedded into editing agents.
//
#pragma once

#include <gsl/span>

#include <optional>
#include <string>
#include <vector>

#include "codegraph/basic/cancellation.hpp"
#include "codegraph/build/graph_builder.hpp"
#include "codegraph/extract/extraction.hpp"
#include "codegraph/graph/graph_store.hpp"
#include "codegraph/propagate/change_propagator.hpp"
#include "codegraph/snapshot/snapshot.hpp"
#include "codegraph/validate/conservation_validator.hpp"

namespace codegraph
{

// ============================================================================
// Workflow Options
// ============================================================================

struct WorkflowOptions
{
  /// Snapshot label (defaults to "After editing N module(s)")
  std::string description;

  /// Reset every changed flag before re-indexing
  bool clear_changed = true;

  /// Files marked changed in addition to what the builder marks
  std::vector<std::string> changed_files;

  /// Expand the changed set before validating
  bool propagate = true;

  /// Capture a snapshot after re-indexing
  bool create_snapshot = true;

  /// Diff the new snapshot against the most recent earlier one
  bool compare_with_previous = true;

  /// Validate only the changed region instead of the whole graph
  bool incremental = true;
};

// ============================================================================
// Workflow Result
// ============================================================================

enum class WorkflowStatus {
  Completed,
  Failed,     ///< the store rejected a commit
  Cancelled,
};

[[nodiscard]] std::string_view to_string(WorkflowStatus status) noexcept;

struct WorkflowResult
{
  WorkflowStatus status = WorkflowStatus::Completed;
  std::vector<std::string> steps_completed;

  /// One entry per payload, in input order
  std::vector<BuildResult> builds;
  size_t entities_indexed = 0;
  size_t relationships_indexed = 0;

  /// Ids added by change propagation
  std::vector<NodeId> propagated;

  std::optional<std::string> snapshot_id;
  std::optional<std::string> previous_snapshot_id;
  std::optional<DiffSummary> changes;

  ValidationReport report;

  std::string message;

  /// Completed, every payload accepted and no error-severity violation
  [[nodiscard]] bool is_valid() const;

  [[nodiscard]] size_t failed_builds() const;
};

// ============================================================================
// Workflow
// ============================================================================

/**
 * Orchestrates builder, propagator, snapshot engine and validator over one
 * store.
 *
 * The pipeline consists of:
 * 1. Re-indexing every payload (rejected payloads leave their module untouched)
 * 2. Marking extra changed files and propagating the changed set
 * 3. Snapshot and diff against the previous snapshot
 * 4. Validation (incremental or full)
 */
class Workflow
{
public:
  Workflow(GraphStore & store, ValidatorConfig config = {});

  [[nodiscard]] WorkflowResult validate_after_edit(
    gsl::span<const ExtractionPayload> payloads, const WorkflowOptions & options = {},
    const CancellationToken & token = {});

  /// Baseline snapshot taken before an edit
  [[nodiscard]] WorkflowResult prepare_for_editing(std::string description = {});

  [[nodiscard]] GraphStore & store() noexcept { return store_; }
  [[nodiscard]] GraphBuilder & builder() noexcept { return builder_; }
  [[nodiscard]] ChangePropagator & propagator() noexcept { return propagator_; }
  [[nodiscard]] SnapshotManager & snapshots() noexcept { return snapshots_; }
  [[nodiscard]] const ConservationValidator & validator() const noexcept { return validator_; }

private:
  void run_pipeline(
    gsl::span<const ExtractionPayload> payloads, const WorkflowOptions & options,
    const CancellationToken & token, WorkflowResult & result);

  GraphStore & store_;
  GraphBuilder builder_;
  ChangePropagator propagator_;
  SnapshotManager snapshots_;
  ConservationValidator validator_;
};

}  // namespace codegraph
