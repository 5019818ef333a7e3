// codegraph/graph/graph_enums.cpp - Enum <-> string mapping
//
#include "codegraph/graph/graph_enums.hpp"

namespace codegraph
{

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::Module:
      return "Module";
    case NodeKind::Class:
      return "Class";
    case NodeKind::Function:
      return "Function";
    case NodeKind::Variable:
      return "Variable";
    case NodeKind::Parameter:
      return "Parameter";
    case NodeKind::Type:
      return "Type";
    case NodeKind::CallSite:
      return "CallSite";
  }
  return "Unknown";
}

std::optional<NodeKind> parse_node_kind(std::string_view text) noexcept
{
  for (const NodeKind k : k_all_node_kinds) {
    if (to_string(k) == text) {
      return k;
    }
  }
  return std::nullopt;
}

std::string_view to_string(EdgeKind kind) noexcept
{
  switch (kind) {
    case EdgeKind::Declares:
      return "DECLARES";
    case EdgeKind::HasParameter:
      return "HAS_PARAMETER";
    case EdgeKind::HasType:
      return "HAS_TYPE";
    case EdgeKind::ReturnsType:
      return "RETURNS_TYPE";
    case EdgeKind::Inherits:
      return "INHERITS";
    case EdgeKind::Imports:
      return "IMPORTS";
    case EdgeKind::AssignsTo:
      return "ASSIGNS_TO";
    case EdgeKind::ReadsFrom:
      return "READS_FROM";
    case EdgeKind::References:
      return "REFERENCES";
    case EdgeKind::HasCallsite:
      return "HAS_CALLSITE";
    case EdgeKind::ResolvesTo:
      return "RESOLVES_TO";
    case EdgeKind::IsSubtypeOf:
      return "IS_SUBTYPE_OF";
    case EdgeKind::HasDecorator:
      return "HAS_DECORATOR";
    case EdgeKind::Decorates:
      return "DECORATES";
  }
  return "UNKNOWN";
}

std::optional<EdgeKind> parse_edge_kind(std::string_view text) noexcept
{
  static constexpr EdgeKind k_all[] = {
    EdgeKind::Declares,    EdgeKind::HasParameter, EdgeKind::HasType,     EdgeKind::ReturnsType,
    EdgeKind::Inherits,    EdgeKind::Imports,      EdgeKind::AssignsTo,   EdgeKind::ReadsFrom,
    EdgeKind::References,  EdgeKind::HasCallsite,  EdgeKind::ResolvesTo,  EdgeKind::IsSubtypeOf,
    EdgeKind::HasDecorator, EdgeKind::Decorates,
  };
  for (const EdgeKind k : k_all) {
    if (to_string(k) == text) {
      return k;
    }
  }
  return std::nullopt;
}

std::string_view to_string(Visibility v) noexcept
{
  return v == Visibility::Private ? "private" : "public";
}

std::optional<Visibility> parse_visibility(std::string_view text) noexcept
{
  if (text == "public") return Visibility::Public;
  if (text == "private") return Visibility::Private;
  return std::nullopt;
}

std::string_view to_string(ParamKind k) noexcept
{
  switch (k) {
    case ParamKind::Positional:
      return "positional";
    case ParamKind::PositionalOnly:
      return "positional_only";
    case ParamKind::KeywordOnly:
      return "keyword_only";
    case ParamKind::VarPositional:
      return "var_positional";
    case ParamKind::VarKeyword:
      return "var_keyword";
    case ParamKind::Receiver:
      return "receiver";
  }
  return "positional";
}

std::optional<ParamKind> parse_param_kind(std::string_view text) noexcept
{
  static constexpr ParamKind k_all[] = {
    ParamKind::Positional,    ParamKind::PositionalOnly, ParamKind::KeywordOnly,
    ParamKind::VarPositional, ParamKind::VarKeyword,     ParamKind::Receiver,
  };
  for (const ParamKind k : k_all) {
    if (to_string(k) == text) {
      return k;
    }
  }
  return std::nullopt;
}

}  // namespace codegraph
