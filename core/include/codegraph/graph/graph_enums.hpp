// codegraph/graph/graph_enums.hpp - Node and edge kinds of the code graph
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace codegraph
{

// ============================================================================
// NodeKind
// ============================================================================

enum class NodeKind : uint8_t {
  Module,
  Class,
  Function,
  Variable,
  Parameter,
  Type,
  CallSite,
};

inline constexpr NodeKind k_all_node_kinds[] = {
  NodeKind::Module,   NodeKind::Class, NodeKind::Function, NodeKind::Variable,
  NodeKind::Parameter, NodeKind::Type, NodeKind::CallSite,
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;
[[nodiscard]] std::optional<NodeKind> parse_node_kind(std::string_view text) noexcept;

// ============================================================================
// EdgeKind
// ============================================================================

enum class EdgeKind : uint8_t {
  Declares,      ///< Module/Class/Function -> declared entity
  HasParameter,  ///< Function -> Parameter (edge carries `position`)
  HasType,       ///< Variable/Parameter -> Type
  ReturnsType,   ///< Function -> Type
  Inherits,      ///< Class -> base Class
  Imports,       ///< Module -> imported Module or entity (edge may carry `alias`)
  AssignsTo,     ///< writer -> Variable
  ReadsFrom,     ///< reader -> Variable
  References,    ///< user -> referenced entity
  HasCallsite,   ///< Function -> CallSite
  ResolvesTo,    ///< CallSite -> Function (written by the builder only)
  IsSubtypeOf,   ///< Type -> Type
  HasDecorator,  ///< decorated entity -> decorator Function
  Decorates,     ///< decorator Function -> decorated entity
};

[[nodiscard]] std::string_view to_string(EdgeKind kind) noexcept;
[[nodiscard]] std::optional<EdgeKind> parse_edge_kind(std::string_view text) noexcept;

/**
 * Edge kinds whose target is a symbolic reference that must resolve to an
 * existing node (Reference Integrity).
 */
[[nodiscard]] constexpr bool is_reference_edge(EdgeKind kind) noexcept
{
  return kind == EdgeKind::References || kind == EdgeKind::AssignsTo ||
         kind == EdgeKind::ReadsFrom || kind == EdgeKind::Imports;
}

/**
 * Edge kinds that express ownership (who keeps the target alive).
 */
[[nodiscard]] constexpr bool is_ownership_edge(EdgeKind kind) noexcept
{
  return kind == EdgeKind::Declares || kind == EdgeKind::HasParameter ||
         kind == EdgeKind::HasCallsite;
}

// ============================================================================
// Entity attributes
// ============================================================================

enum class Visibility : uint8_t {
  Public,
  Private,
};

[[nodiscard]] std::string_view to_string(Visibility v) noexcept;
[[nodiscard]] std::optional<Visibility> parse_visibility(std::string_view text) noexcept;

/**
 * How a parameter binds arguments.
 *
 * Receiver is the implicit bound object of a method (`self`); it is not
 * supplied by the call site and never counted against the argument count.
 */
enum class ParamKind : uint8_t {
  Positional,      ///< positional-or-keyword
  PositionalOnly,
  KeywordOnly,
  VarPositional,   ///< *args
  VarKeyword,      ///< **kwargs
  Receiver,
};

[[nodiscard]] std::string_view to_string(ParamKind k) noexcept;
[[nodiscard]] std::optional<ParamKind> parse_param_kind(std::string_view text) noexcept;

[[nodiscard]] constexpr bool is_variadic(ParamKind k) noexcept
{
  return k == ParamKind::VarPositional || k == ParamKind::VarKeyword;
}

}  // namespace codegraph
