// codegraph/driver/workflow.cpp - Composite edit/validate operations
//
#include "codegraph/driver/workflow.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "codegraph/basic/log.hpp"

namespace codegraph
{

std::string_view to_string(WorkflowStatus status) noexcept
{
  switch (status) {
    case WorkflowStatus::Completed:
      return "completed";
    case WorkflowStatus::Failed:
      return "failed";
    case WorkflowStatus::Cancelled:
      return "cancelled";
  }
  return "failed";
}

size_t WorkflowResult::failed_builds() const
{
  return static_cast<size_t>(std::count_if(
    builds.begin(), builds.end(), [](const BuildResult & b) { return !b.success; }));
}

bool WorkflowResult::is_valid() const
{
  return status == WorkflowStatus::Completed && failed_builds() == 0 && !report.has_errors();
}

Workflow::Workflow(GraphStore & store, ValidatorConfig config)
: store_(store),
  builder_(store),
  propagator_(store),
  snapshots_(store),
  validator_(std::move(config))
{
}

WorkflowResult Workflow::validate_after_edit(
  gsl::span<const ExtractionPayload> payloads, const WorkflowOptions & options,
  const CancellationToken & token)
{
  WorkflowResult result;
  log::info("validate_after_edit: {} payload(s)", payloads.size());

  try {
    run_pipeline(payloads, options, token, result);
  } catch (const StoreError & e) {
    log::error("workflow failed: {}", e.what());
    result.status = WorkflowStatus::Failed;
    result.message = fmt::format("Workflow failed: {}", e.what());
    return result;
  }

  if (result.status == WorkflowStatus::Cancelled) {
    result.message = "Workflow cancelled";
    return result;
  }

  const size_t errors = result.report.count(Severity::Error);
  const size_t warnings = result.report.count(Severity::Warning);
  if (result.is_valid()) {
    result.message = fmt::format("Validation passed: {} warning(s)", warnings);
  } else if (result.failed_builds() > 0) {
    result.message = fmt::format(
      "{} payload(s) rejected; {} error(s), {} warning(s)", result.failed_builds(), errors,
      warnings);
  } else {
    result.message = fmt::format("Validation failed: {} error(s), {} warning(s)", errors, warnings);
  }
  log::info("{}", result.message);
  return result;
}

void Workflow::run_pipeline(
  gsl::span<const ExtractionPayload> payloads, const WorkflowOptions & options,
  const CancellationToken & token, WorkflowResult & result)
{
  std::optional<std::string> previous;
  if (options.create_snapshot && options.compare_with_previous) {
    const auto existing = snapshots_.list();
    if (!existing.empty()) previous = existing.back()->id;
  }

  if (options.clear_changed) {
    propagator_.clear_changed();
  }

  // Step 1: re-index
  for (const auto & payload : payloads) {
    auto build = builder_.apply_extraction(payload);
    if (build.success) {
      result.entities_indexed += payload.entities.size();
      result.relationships_indexed += payload.relationships.size();
    } else {
      log::warn("payload for {} rejected: {}", payload.module_id, build.error);
    }
    result.builds.push_back(std::move(build));
  }
  result.steps_completed.emplace_back("re-indexing");

  // Step 2: changed set
  if (!options.changed_files.empty()) {
    propagator_.mark_changed(options.changed_files);
    result.steps_completed.emplace_back("mark_changed");
  }
  if (options.propagate) {
    auto propagation = propagator_.propagate(token);
    if (propagation.cancelled) {
      result.status = WorkflowStatus::Cancelled;
      return;
    }
    result.propagated = std::move(propagation.added);
    result.steps_completed.emplace_back("propagation");
  }

  // Step 3: snapshot + diff
  if (options.create_snapshot) {
    const std::string label = options.description.empty()
                                ? fmt::format("After editing {} module(s)", payloads.size())
                                : options.description;
    const auto snapshot = snapshots_.create(label);
    result.snapshot_id = snapshot->id;
    result.steps_completed.emplace_back("snapshot_created");

    if (previous) {
      if (const auto diff = snapshots_.diff(*previous, snapshot->id)) {
        result.previous_snapshot_id = previous;
        result.changes = diff->summary();
        result.steps_completed.emplace_back("snapshot_comparison");
      }
    }
  }

  // Step 4: validate
  const auto view = store_.view();
  result.report = options.incremental ? validator_.validate_incremental(*view, token)
                                      : validator_.validate_full(*view, token);
  if (result.report.cancelled) {
    result.status = WorkflowStatus::Cancelled;
    return;
  }
  result.steps_completed.emplace_back("validation");
}

WorkflowResult Workflow::prepare_for_editing(std::string description)
{
  WorkflowResult result;
  if (description.empty()) {
    description = "Baseline before editing";
  }
  const auto snapshot = snapshots_.create(std::move(description));
  result.snapshot_id = snapshot->id;
  result.steps_completed.emplace_back("baseline_snapshot");
  result.message = fmt::format("Baseline snapshot created: {}", snapshot->id);
  log::info("{}", result.message);
  return result;
}

}  // namespace codegraph
