// codegraph/snapshot/snapshot_json.cpp - JSON persistence of snapshots and diffs
//
#include "codegraph/snapshot/snapshot_json.hpp"

#include <fmt/format.h>

#include <fstream>
#include <stdexcept>

#include "codegraph/graph/graph_json.hpp"

namespace codegraph
{

using nlohmann::json;

json to_json(const Snapshot & snapshot)
{
  json j;
  j["id"] = snapshot.id;
  j["label"] = snapshot.label;
  j["created_at"] = snapshot.created_at;
  j["graph"] = snapshot.graph ? to_json(*snapshot.graph) : to_json(CodeGraph{});
  return j;
}

SnapshotLoadResult snapshot_from_json(const json & j)
{
  if (!j.is_object()) {
    return SnapshotLoadResult::fail("snapshot document must be an object");
  }

  Snapshot snapshot;
  auto graph = std::make_shared<CodeGraph>();
  try {
    snapshot.id = j.at("id").get<std::string>();
    snapshot.label = j.value("label", std::string{});
    snapshot.created_at = j.value("created_at", std::string{});

    const json & g = j.at("graph");
    for (const auto & n : g.value("nodes", json::array())) {
      graph->upsert_node(node_from_json(n));
    }
    for (const auto & e : g.value("edges", json::array())) {
      graph->upsert_edge(edge_from_json(e));
    }
  } catch (const json::exception & e) {
    return SnapshotLoadResult::fail(fmt::format("malformed snapshot: {}", e.what()));
  } catch (const std::invalid_argument & e) {
    return SnapshotLoadResult::fail(fmt::format("malformed snapshot: {}", e.what()));
  } catch (const StoreError & e) {
    return SnapshotLoadResult::fail(fmt::format("inconsistent snapshot: {}", e.what()));
  }

  snapshot.graph = std::move(graph);
  return SnapshotLoadResult::ok(std::move(snapshot));
}

SnapshotLoadResult load_snapshot_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) {
    return SnapshotLoadResult::fail("Failed to open snapshot file: " + path.string());
  }
  try {
    return snapshot_from_json(json::parse(in));
  } catch (const json::parse_error & e) {
    return SnapshotLoadResult::fail(fmt::format("{}: {}", path.string(), e.what()));
  }
}

std::string save_snapshot_file(const Snapshot & snapshot, const std::filesystem::path & path)
{
  std::ofstream out(path);
  if (!out) {
    return "Failed to open output file: " + path.string();
  }
  out << to_json(snapshot).dump(2) << "\n";
  if (!out) {
    return "Failed to write snapshot file: " + path.string();
  }
  return {};
}

// ============================================================================
// Diff
// ============================================================================

json to_json(const PropertyChange & change)
{
  json j;
  j["key"] = change.key;
  j["before"] = change.before ? to_json(*change.before) : json();
  j["after"] = change.after ? to_json(*change.after) : json();
  if (!change.added.empty() || !change.removed.empty()) {
    j["added"] = change.added;
    j["removed"] = change.removed;
  }
  return j;
}

namespace
{

json changes_to_json(const std::vector<PropertyChange> & changes)
{
  json arr = json::array();
  for (const auto & c : changes) arr.push_back(to_json(c));
  return arr;
}

json edge_key_json(const EdgeKey & key)
{
  json j;
  j["source"] = key.source;
  j["kind"] = std::string(to_string(key.kind));
  j["target"] = key.target;
  return j;
}

}  // namespace

json to_json(const GraphDiff & diff)
{
  const DiffSummary s = diff.summary();
  json summary;
  summary["nodes_added"] = s.nodes_added;
  summary["nodes_removed"] = s.nodes_removed;
  summary["nodes_modified"] = s.nodes_modified;
  summary["nodes_unchanged"] = s.nodes_unchanged;
  summary["edges_added"] = s.edges_added;
  summary["edges_removed"] = s.edges_removed;
  summary["edges_modified"] = s.edges_modified;
  summary["edges_unchanged"] = s.edges_unchanged;

  json nodes;
  nodes["added"] = json::array();
  for (const auto & n : diff.added_nodes) nodes["added"].push_back(to_json(n));
  nodes["removed"] = json::array();
  for (const auto & n : diff.removed_nodes) nodes["removed"].push_back(to_json(n));
  nodes["modified"] = json::array();
  for (const auto & m : diff.modified_nodes) {
    json entry;
    entry["id"] = m.id;
    entry["kind"] = std::string(to_string(m.kind));
    entry["qualified_name"] = m.qualified_name;
    entry["changes"] = changes_to_json(m.changes);
    nodes["modified"].push_back(std::move(entry));
  }

  json edges;
  edges["added"] = json::array();
  for (const auto & e : diff.added_edges) edges["added"].push_back(to_json(e));
  edges["removed"] = json::array();
  for (const auto & e : diff.removed_edges) edges["removed"].push_back(to_json(e));
  edges["modified"] = json::array();
  for (const auto & m : diff.modified_edges) {
    json entry = edge_key_json(m.key);
    entry["changes"] = changes_to_json(m.changes);
    edges["modified"].push_back(std::move(entry));
  }

  json j;
  j["summary"] = std::move(summary);
  j["nodes"] = std::move(nodes);
  j["edges"] = std::move(edges);
  return j;
}

}  // namespace codegraph
