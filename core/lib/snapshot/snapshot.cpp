// codegraph/snapshot/snapshot.cpp - Immutable captures of graph state
//
#include "codegraph/snapshot/snapshot.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <ctime>

#include "codegraph/basic/hash.hpp"
#include "codegraph/basic/log.hpp"

namespace codegraph
{

namespace
{

std::string utc_timestamp()
{
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

}  // namespace

std::shared_ptr<const Snapshot> SnapshotManager::create(std::string label)
{
  const auto view = store_.view();

  auto snapshot = std::make_shared<Snapshot>();
  snapshot->label = std::move(label);
  snapshot->created_at = utc_timestamp();
  snapshot->graph = std::make_shared<const CodeGraph>(*view);

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sequence = std::to_string(++sequence_);
  snapshot->id = to_hex(hash_fields({snapshot->label, snapshot->created_at, sequence}));
  while (snapshots_.count(snapshot->id) > 0) {
    snapshot->id = to_hex(hash_fields({snapshot->id, sequence}));
  }

  snapshots_.emplace(snapshot->id, snapshot);
  order_.push_back(snapshot->id);
  log::info(
    "snapshot {} '{}': {} node(s), {} edge(s)", snapshot->id, snapshot->label,
    snapshot->node_count(), snapshot->edge_count());
  return snapshot;
}

bool SnapshotManager::add(Snapshot snapshot)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (snapshots_.count(snapshot.id) > 0) return false;
  if (!snapshot.graph) snapshot.graph = std::make_shared<const CodeGraph>();

  const std::string id = snapshot.id;
  snapshots_.emplace(id, std::make_shared<const Snapshot>(std::move(snapshot)));
  order_.push_back(id);
  return true;
}

std::vector<std::shared_ptr<const Snapshot>> SnapshotManager::list() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<const Snapshot>> result;
  result.reserve(order_.size());
  for (const auto & id : order_) {
    result.push_back(snapshots_.at(id));
  }
  return result;
}

std::shared_ptr<const Snapshot> SnapshotManager::get(std::string_view id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = snapshots_.find(id);
  return it != snapshots_.end() ? it->second : nullptr;
}

bool SnapshotManager::remove(std::string_view id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = snapshots_.find(id);
  if (it == snapshots_.end()) return false;
  snapshots_.erase(it);
  order_.erase(std::find(order_.begin(), order_.end(), id));
  return true;
}

std::optional<DiffSummary> SnapshotManager::restore(std::string_view id)
{
  const auto snapshot = get(id);
  if (!snapshot) return std::nullopt;

  const auto current = store_.view();
  const GraphDiff delta = diff_graphs(*current, *snapshot->graph);
  if (delta.empty()) {
    log::info("restore {}: store already matches", snapshot->id);
    return delta.summary();
  }

  MutationBatch batch;
  for (const auto & e : delta.removed_edges) batch.delete_edge(e.key());
  for (const auto & n : delta.removed_nodes) batch.delete_node(n.id);

  const auto restore_node = [&batch, &snapshot](std::string_view node_id) {
    Node node = *snapshot->graph->find_node(node_id);
    node.changed = true;
    batch.upsert_node(std::move(node));
  };
  for (const auto & n : delta.added_nodes) restore_node(n.id);
  for (const auto & change : delta.modified_nodes) restore_node(change.id);

  for (const auto & e : delta.added_edges) batch.upsert_edge(e);
  for (const auto & change : delta.modified_edges) {
    batch.upsert_edge(*snapshot->graph->find_edge(change.key));
  }

  store_.commit(batch);
  const DiffSummary summary = delta.summary();
  log::info(
    "restore {} '{}': nodes +{} ~{} -{}, edges +{} ~{} -{}", snapshot->id, snapshot->label,
    summary.nodes_added, summary.nodes_modified, summary.nodes_removed, summary.edges_added,
    summary.edges_modified, summary.edges_removed);
  return summary;
}

std::optional<GraphDiff> SnapshotManager::diff(
  std::string_view old_id, std::string_view new_id) const
{
  const auto before = get(old_id);
  const auto after = get(new_id);
  if (!before || !after) return std::nullopt;
  return diff_graphs(*before->graph, *after->graph);
}

}  // namespace codegraph
