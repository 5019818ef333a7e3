// codegraph/graph/node.hpp - Node and edge records
//
#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <tuple>

#include "codegraph/graph/graph_enums.hpp"
#include "codegraph/graph/property.hpp"

namespace codegraph
{

using NodeId = std::string;

// ============================================================================
// Well-known property keys
// ============================================================================

namespace prop
{
inline constexpr std::string_view k_name = "name";
inline constexpr std::string_view k_qualified_name = "qualified_name";
inline constexpr std::string_view k_module = "module";
inline constexpr std::string_view k_location = "location";
inline constexpr std::string_view k_file = "file";
inline constexpr std::string_view k_path = "path";
inline constexpr std::string_view k_visibility = "visibility";
inline constexpr std::string_view k_type_annotation = "type_annotation";
inline constexpr std::string_view k_decorators = "decorators";
// Function
inline constexpr std::string_view k_parameters = "parameters";
inline constexpr std::string_view k_signature = "signature";
// Parameter / HAS_PARAMETER
inline constexpr std::string_view k_position = "position";
inline constexpr std::string_view k_param_kind = "param_kind";
inline constexpr std::string_view k_has_default = "has_default";
// CallSite
inline constexpr std::string_view k_callee = "callee";
inline constexpr std::string_view k_arg_count = "arg_count";
inline constexpr std::string_view k_keyword_args = "keyword_args";
inline constexpr std::string_view k_arg_types = "arg_types";
inline constexpr std::string_view k_resolution = "resolution";
inline constexpr std::string_view k_candidates = "candidates";
// Edges
inline constexpr std::string_view k_alias = "alias";
inline constexpr std::string_view k_target_name = "target_name";
inline constexpr std::string_view k_access_kind = "access_kind";
inline constexpr std::string_view k_value_type = "value_type";
inline constexpr std::string_view k_expected_type = "expected_type";
}  // namespace prop

// ============================================================================
// Node
// ============================================================================

struct Node
{
  NodeId id;
  NodeKind kind = NodeKind::Module;
  PropertyMap props;

  /// Change-tracking flag. Bookkeeping only: not part of node content.
  bool changed = false;

  [[nodiscard]] std::string_view name() const
  {
    return get_string(props, prop::k_name).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view qualified_name() const
  {
    return get_string(props, prop::k_qualified_name).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view module() const
  {
    return get_string(props, prop::k_module).value_or(std::string_view{});
  }

  [[nodiscard]] std::string_view location() const
  {
    return get_string(props, prop::k_location).value_or(std::string_view{});
  }

  [[nodiscard]] bool is(NodeKind k) const noexcept { return kind == k; }

  /// Content equality (ignores the changed flag)
  [[nodiscard]] bool same_content(const Node & other) const
  {
    return id == other.id && kind == other.kind && props == other.props;
  }
};

// ============================================================================
// Edge
// ============================================================================

/**
 * Identity of an edge.
 *
 * Edges carry no independent id; (source, kind, target) identifies them.
 */
struct EdgeKey
{
  NodeId source;
  EdgeKind kind = EdgeKind::Declares;
  NodeId target;

  [[nodiscard]] bool operator==(const EdgeKey & o) const
  {
    return kind == o.kind && source == o.source && target == o.target;
  }
  [[nodiscard]] bool operator!=(const EdgeKey & o) const { return !(*this == o); }
  [[nodiscard]] bool operator<(const EdgeKey & o) const
  {
    return std::tie(source, kind, target) < std::tie(o.source, o.kind, o.target);
  }

  /// "source-KIND->target"
  [[nodiscard]] std::string to_string() const;
};

struct Edge
{
  EdgeKind kind = EdgeKind::Declares;
  NodeId source;
  NodeId target;
  PropertyMap props;

  [[nodiscard]] EdgeKey key() const { return EdgeKey{source, kind, target}; }

  [[nodiscard]] std::string_view module() const
  {
    return get_string(props, prop::k_module).value_or(std::string_view{});
  }
};

}  // namespace codegraph
