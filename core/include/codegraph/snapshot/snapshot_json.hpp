// codegraph/snapshot/snapshot_json.hpp - JSON persistence of snapshots and diffs
//
#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "codegraph/snapshot/graph_diff.hpp"
#include "codegraph/snapshot/snapshot.hpp"

namespace codegraph
{

/**
 * Result of loading a snapshot document.
 */
struct SnapshotLoadResult
{
  /// Loaded snapshot (only valid if success == true)
  Snapshot snapshot;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static SnapshotLoadResult ok(Snapshot s)
  {
    SnapshotLoadResult r;
    r.snapshot = std::move(s);
    r.success = true;
    return r;
  }

  static SnapshotLoadResult fail(std::string msg)
  {
    SnapshotLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// {"id", "label", "created_at", "graph": {"nodes": [...], "edges": [...]}}
[[nodiscard]] nlohmann::json to_json(const Snapshot & snapshot);

[[nodiscard]] SnapshotLoadResult snapshot_from_json(const nlohmann::json & j);

[[nodiscard]] SnapshotLoadResult load_snapshot_file(const std::filesystem::path & path);

/**
 * Write a snapshot document.
 *
 * @return empty string on success, otherwise an error message
 */
[[nodiscard]] std::string save_snapshot_file(
  const Snapshot & snapshot, const std::filesystem::path & path);

[[nodiscard]] nlohmann::json to_json(const PropertyChange & change);

/**
 * {"summary": {...}, "nodes": {"added", "removed", "modified"},
 *  "edges": {"added", "removed", "modified"}}
 *
 * Unchanged entries only appear as counts.
 */
[[nodiscard]] nlohmann::json to_json(const GraphDiff & diff);

}  // namespace codegraph
