// codegraph/snapshot/snapshot.hpp - Immutable captures of graph state
//
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/graph/graph_store.hpp"
#include "codegraph/snapshot/graph_diff.hpp"

namespace codegraph
{

/**
 * A labeled, timestamped copy of the node and edge sets.
 *
 * The graph is deep-copied from one store view and never modified
 * afterwards.
 */
struct Snapshot
{
  std::string id;
  std::string label;

  /// UTC, ISO 8601 ("2024-05-01T12:00:00Z")
  std::string created_at;

  std::shared_ptr<const CodeGraph> graph;

  [[nodiscard]] size_t node_count() const { return graph ? graph->node_count() : 0; }
  [[nodiscard]] size_t edge_count() const { return graph ? graph->edge_count() : 0; }
};

/**
 * Snapshot registry for one store.
 *
 * Thread-safe; snapshots are handed out as shared pointers and stay valid
 * after remove().
 */
class SnapshotManager
{
public:
  explicit SnapshotManager(GraphStore & store) : store_(store) {}

  SnapshotManager(const SnapshotManager &) = delete;
  SnapshotManager & operator=(const SnapshotManager &) = delete;

  /// Capture the store's current view
  std::shared_ptr<const Snapshot> create(std::string label);

  /**
   * Register a snapshot built elsewhere (e.g. loaded from JSON).
   *
   * @return false if a snapshot with the same id already exists
   */
  bool add(Snapshot snapshot);

  /// All snapshots in creation order
  [[nodiscard]] std::vector<std::shared_ptr<const Snapshot>> list() const;

  /// nullptr if unknown
  [[nodiscard]] std::shared_ptr<const Snapshot> get(std::string_view id) const;

  /// Returns false if the id is unknown
  bool remove(std::string_view id);

  /**
   * Bring the store back to a snapshot's node and edge sets in one batch.
   *
   * Restored nodes (added or modified relative to the current view) get
   * changed=true so the next incremental validation covers them.
   *
   * @return what the restore changed, or std::nullopt if the id is unknown
   * @throws StoreError if the store rejects the commit
   */
  std::optional<DiffSummary> restore(std::string_view id);

  /// Diff of two registered snapshots; std::nullopt if either id is unknown
  [[nodiscard]] std::optional<GraphDiff> diff(
    std::string_view old_id, std::string_view new_id) const;

private:
  GraphStore & store_;

  mutable std::mutex mutex_;
  uint64_t sequence_ = 0;
  std::map<std::string, std::shared_ptr<const Snapshot>, std::less<>> snapshots_;
  std::vector<std::string> order_;
};

}  // namespace codegraph
