// codegraph/build/graph_builder.hpp - Extraction payload -> graph mutations
//
// The builder is the only component that writes entity nodes. Each module
// is rebuilt as one atomic batch holding the minimal set of changes relative
// to what the module currently owns in the store; call sites in other
// modules that may resolve differently afterwards are re-resolved in
// separate per-module batches.
//
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/extract/extraction.hpp"
#include "codegraph/graph/graph_store.hpp"

namespace codegraph
{

// ============================================================================
// Build Result
// ============================================================================

/**
 * Mutation counts of one build.
 */
struct BuildStats
{
  size_t nodes_added = 0;
  size_t nodes_updated = 0;
  size_t nodes_removed = 0;
  size_t edges_added = 0;
  size_t edges_updated = 0;
  size_t edges_removed = 0;

  [[nodiscard]] size_t mutations() const noexcept
  {
    return nodes_added + nodes_updated + nodes_removed + edges_added + edges_updated +
           edges_removed;
  }
};

/**
 * Result of applying one module's extraction.
 *
 * A rejected payload leaves the store untouched; `error` explains why and
 * `offending_ids` names the payload keys involved.
 */
struct BuildResult
{
  bool success = false;
  std::string module_id;
  std::string error;
  std::vector<std::string> offending_ids;

  BuildStats stats;

  /// Node ids by outcome, sorted
  std::vector<NodeId> added;
  std::vector<NodeId> updated;
  std::vector<NodeId> removed;

  /// Other modules whose call sites were re-resolved afterwards
  std::vector<std::string> refreshed_modules;

  static BuildResult ok(std::string module_id)
  {
    BuildResult r;
    r.module_id = std::move(module_id);
    r.success = true;
    return r;
  }

  static BuildResult fail(
    std::string module_id, std::string msg, std::vector<std::string> offending = {})
  {
    BuildResult r;
    r.module_id = std::move(module_id);
    r.error = std::move(msg);
    r.offending_ids = std::move(offending);
    r.success = false;
    return r;
  }
};

// ============================================================================
// GraphBuilder
// ============================================================================

class GraphBuilder
{
public:
  explicit GraphBuilder(GraphStore & store) : store_(store) {}

  GraphBuilder(const GraphBuilder &) = delete;
  GraphBuilder & operator=(const GraphBuilder &) = delete;

  /**
   * Bring the graph in line with a fresh extraction of one module.
   *
   * Idempotent: re-applying an unchanged payload commits nothing. Added and
   * updated nodes get changed=true. Distinct modules may be applied from
   * different threads; the same module is serialized.
   *
   * @throws StoreError if the store rejects the commit
   */
  BuildResult apply_extraction(const ExtractionPayload & payload);

  /// Delete everything a module owns (applies the empty extraction)
  BuildResult remove_module(std::string_view module_id);

  /**
   * Re-run call-site resolution for one module against the current graph.
   *
   * @return number of call sites whose resolution changed
   */
  size_t refresh_resolution(std::string_view module_id);

private:
  struct DesiredState;

  std::mutex & module_mutex(std::string_view module_id);

  BuildResult apply_locked(const ExtractionPayload & payload, bool removal);

  /// Re-resolve other modules affected by changes to `build`
  void refresh_dependents(
    const CodeGraph & before, const CodeGraph & after, BuildResult & build);

  /// Modules with RESOLVES_TO, IMPORTS or (transitive) INHERITS edges into `module_id`
  static std::set<std::string> linked_modules(
    const CodeGraph & before, const CodeGraph & after, std::string_view module_id);

  GraphStore & store_;

  std::mutex registry_mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>, std::less<>> module_mutexes_;
};

}  // namespace codegraph
