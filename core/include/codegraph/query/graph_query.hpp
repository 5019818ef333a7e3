// codegraph/query/graph_query.hpp - Read-only navigation over one graph view
//
// Calls are followed through their CallSite: caller -HAS_CALLSITE-> CallSite
// -RESOLVES_TO-> callee. Unresolved and ambiguous call sites link nothing.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/graph/code_graph.hpp"

namespace codegraph
{

// ============================================================================
// ChangeType
// ============================================================================

enum class ChangeType : uint8_t {
  Modify,
  Delete,
  Rename,
};

[[nodiscard]] std::string_view to_string(ChangeType type) noexcept;
[[nodiscard]] std::optional<ChangeType> parse_change_type(std::string_view text) noexcept;

// ============================================================================
// Query Results
// ============================================================================

/// One resolved call between two entities
struct CallLink
{
  /// The caller for find_callers, the callee for find_callees
  const Node * function = nullptr;
  const Node * callsite = nullptr;
  std::optional<int64_t> arg_count;
};

/// One reference edge into an entity
struct ReferenceLink
{
  const Node * source = nullptr;
  EdgeKind kind = EdgeKind::References;
  std::string location;
};

struct ClassHierarchy
{
  /// Direct bases that exist in the graph
  std::vector<const Node *> bases;
  /// Direct subclasses
  std::vector<const Node *> derived;
};

struct Dependency
{
  const Node * function = nullptr;
  /// Number of calls on the shortest path (1 = direct)
  int distance = 0;
};

struct FunctionDependencies
{
  /// What the function calls, transitively up to the requested depth
  std::vector<Dependency> outbound;
  /// What calls the function
  std::vector<Dependency> inbound;
};

/// Incident edges of one kind whose other end is one node kind
struct CascadingChange
{
  EdgeKind edge_kind = EdgeKind::Declares;
  NodeKind connected_kind = NodeKind::Module;
  size_t count = 0;
};

struct ImpactAnalysis
{
  NodeId entity_id;
  ChangeType change_type = ChangeType::Modify;
  std::vector<CallLink> affected_callers;
  std::vector<ReferenceLink> affected_references;
  /// Filled for ChangeType::Delete only
  std::vector<CascadingChange> cascading_changes;

  [[nodiscard]] bool empty() const noexcept
  {
    return affected_callers.empty() && affected_references.empty() && cascading_changes.empty();
  }
};

// ============================================================================
// GraphQuery
// ============================================================================

/**
 * Navigation helpers over a CodeGraph.
 *
 * Returned pointers point into the graph and live as long as it does. All
 * results are in deterministic (edge key) order; an unknown id yields
 * empty results.
 */
class GraphQuery
{
public:
  explicit GraphQuery(const CodeGraph & graph) : graph_(graph) {}

  /// Call sites resolving to `function_id`, with the function owning each
  [[nodiscard]] std::vector<CallLink> find_callers(std::string_view function_id) const;

  /// Resolved call sites of `function_id`, with their targets
  [[nodiscard]] std::vector<CallLink> find_callees(std::string_view function_id) const;

  /// REFERENCES, ASSIGNS_TO, READS_FROM and IMPORTS edges into `entity_id`
  [[nodiscard]] std::vector<ReferenceLink> find_references(std::string_view entity_id) const;

  [[nodiscard]] ClassHierarchy class_hierarchy(std::string_view class_id) const;

  /**
   * Functions reachable along calls within `depth` steps, in both directions.
   *
   * Each function appears once per direction at its shortest distance.
   * The function itself is never listed, even when it is recursive.
   */
  [[nodiscard]] FunctionDependencies function_dependencies(
    std::string_view function_id, int depth = 1) const;

  /// What a change to `entity_id` would touch
  [[nodiscard]] ImpactAnalysis impact_of(std::string_view entity_id, ChangeType type) const;

private:
  std::vector<const Node *> callers_of(std::string_view function_id) const;
  std::vector<const Node *> callees_of(std::string_view function_id) const;

  const CodeGraph & graph_;
};

}  // namespace codegraph
