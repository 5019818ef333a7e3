// tests/unit/snapshot/test_snapshot.cpp - Snapshot registry and JSON persistence
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "codegraph/build/graph_builder.hpp"
#include "codegraph/build/node_identity.hpp"
#include "codegraph/graph/memory_graph_store.hpp"
#include "codegraph/snapshot/snapshot.hpp"
#include "codegraph/snapshot/graph_diff.hpp"
#include "codegraph/snapshot/snapshot_json.hpp"
#include "codegraph/test_support/payload_builder.hpp"

using namespace codegraph;
using test_support::PayloadBuilder;

namespace
{

class SnapshotTest : public ::testing::Test
{
protected:
  void SetUp() override { ASSERT_TRUE(builder_.apply_extraction(app_main()).success); }

  static ExtractionPayload app_main()
  {
    PayloadBuilder b("app.main");
    b.function("app.main.run", "None").param("app.main.run", "n", "int");
    b.call("app.main.run", "run", 1);
    return b.build();
  }

  MemoryGraphStore store_;
  GraphBuilder builder_{store_};
  SnapshotManager snapshots_{store_};
};

}  // namespace

TEST_F(SnapshotTest, CreateCapturesTheCurrentView)
{
  const auto snapshot = snapshots_.create("baseline");
  ASSERT_NE(snapshot, nullptr);
  EXPECT_FALSE(snapshot->id.empty());
  EXPECT_EQ(snapshot->label, "baseline");
  EXPECT_EQ(snapshot->created_at.size(), 20u);
  EXPECT_EQ(snapshot->created_at.back(), 'Z');
  EXPECT_EQ(snapshot->node_count(), store_.view()->node_count());
  EXPECT_EQ(snapshot->edge_count(), store_.view()->edge_count());
}

TEST_F(SnapshotTest, LaterEditsDoNotTouchOlderSnapshots)
{
  const auto snapshot = snapshots_.create("baseline");
  const size_t nodes = snapshot->node_count();

  ASSERT_TRUE(builder_.remove_module("app.main").success);
  EXPECT_TRUE(store_.view()->empty());
  EXPECT_EQ(snapshot->node_count(), nodes);
  EXPECT_EQ(snapshots_.get(snapshot->id)->node_count(), nodes);
}

TEST_F(SnapshotTest, ListGetAndRemove)
{
  const auto first = snapshots_.create("one");
  const auto second = snapshots_.create("two");
  EXPECT_NE(first->id, second->id);

  const auto all = snapshots_.list();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0]->id, first->id);
  EXPECT_EQ(all[1]->id, second->id);

  EXPECT_EQ(snapshots_.get(second->id), second);
  EXPECT_EQ(snapshots_.get("missing"), nullptr);

  EXPECT_TRUE(snapshots_.remove(first->id));
  EXPECT_FALSE(snapshots_.remove(first->id));
  EXPECT_EQ(snapshots_.list().size(), 1u);
  // Handed-out pointers stay usable
  EXPECT_EQ(first->label, "one");
}

TEST_F(SnapshotTest, AddRejectsDuplicateIds)
{
  Snapshot s;
  s.id = "imported";
  s.label = "from disk";
  EXPECT_TRUE(snapshots_.add(s));
  EXPECT_FALSE(snapshots_.add(s));
  ASSERT_NE(snapshots_.get("imported"), nullptr);
  EXPECT_EQ(snapshots_.get("imported")->node_count(), 0u);
}

TEST_F(SnapshotTest, RestoreBringsBackTheCapturedState)
{
  const auto baseline = snapshots_.create("baseline");

  PayloadBuilder edited("app.main");
  edited.function("app.main.run", "None").param("app.main.run", "n", "str");
  edited.function("app.main.helper", "int");
  ASSERT_TRUE(builder_.apply_extraction(edited.build()).success);
  ASSERT_FALSE(diff_graphs(*store_.view(), *baseline->graph).empty());

  const auto restored = snapshots_.restore(baseline->id);
  ASSERT_TRUE(restored.has_value());
  EXPECT_GE(restored->nodes_removed, 1u);
  EXPECT_GE(restored->nodes_added, 1u);
  EXPECT_TRUE(diff_graphs(*store_.view(), *baseline->graph).empty());

  const auto g = store_.view();
  EXPECT_EQ(g->find_node(make_node_id(NodeKind::Function, "app.main.helper")), nullptr);
  const Node * call = g->find_node(make_callsite_id("app.main.run", "run", 0));
  ASSERT_NE(call, nullptr);
  EXPECT_TRUE(call->changed);

  // The builder sees the restored graph as its own output
  EXPECT_EQ(builder_.apply_extraction(app_main()).stats.mutations(), 0u);

  const auto again = snapshots_.restore(baseline->id);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->nodes_added + again->nodes_removed + again->nodes_modified, 0u);
  EXPECT_FALSE(snapshots_.restore("missing").has_value());
}

TEST_F(SnapshotTest, SaveAndLoadRoundTrip)
{
  const auto snapshot = snapshots_.create("persisted");
  const auto path = std::filesystem::temp_directory_path() / "codegraph_snapshot_test.json";

  ASSERT_EQ(save_snapshot_file(*snapshot, path), "");
  const auto loaded = load_snapshot_file(path);
  std::filesystem::remove(path);

  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.snapshot.id, snapshot->id);
  EXPECT_EQ(loaded.snapshot.label, "persisted");
  EXPECT_EQ(loaded.snapshot.created_at, snapshot->created_at);
  ASSERT_NE(loaded.snapshot.graph, nullptr);
  EXPECT_TRUE(diff_graphs(*snapshot->graph, *loaded.snapshot.graph).empty());
  EXPECT_EQ(loaded.snapshot.graph->changed_node_ids(), snapshot->graph->changed_node_ids());

  // A loaded snapshot can be registered and diffed against live ones
  const std::string loaded_id = loaded.snapshot.id + "-disk";
  Snapshot copy = loaded.snapshot;
  copy.id = loaded_id;
  ASSERT_TRUE(snapshots_.add(copy));
  const auto diff = snapshots_.diff(snapshot->id, loaded_id);
  ASSERT_TRUE(diff.has_value());
  EXPECT_TRUE(diff->empty());
}

TEST_F(SnapshotTest, LoadErrors)
{
  EXPECT_FALSE(load_snapshot_file("/nonexistent/codegraph/snapshot.json").success);

  EXPECT_FALSE(snapshot_from_json(nlohmann::json::array()).success);
  EXPECT_FALSE(snapshot_from_json(nlohmann::json{{"label", "no id"}}).success);

  const auto path = std::filesystem::temp_directory_path() / "codegraph_snapshot_bad.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  const auto broken = load_snapshot_file(path);
  std::filesystem::remove(path);
  EXPECT_FALSE(broken.success);
  EXPECT_FALSE(broken.error.empty());
}
