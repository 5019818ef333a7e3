// codegraph/build/node_identity.cpp - Stable node identity
//
#include "codegraph/build/node_identity.hpp"

#include <string>

#include "codegraph/basic/hash.hpp"

namespace codegraph
{

NodeId make_node_id(NodeKind kind, std::string_view qualified_name)
{
  return to_hex(hash_fields({to_string(kind), qualified_name}));
}

NodeId make_callsite_id(std::string_view caller_qname, std::string_view callee, int64_t ordinal)
{
  const std::string ord = std::to_string(ordinal);
  return to_hex(hash_fields({to_string(NodeKind::CallSite), caller_qname, callee, ord}));
}

NodeId make_type_id(std::string_view type_text)
{
  return make_node_id(NodeKind::Type, type_text);
}

NodeKind default_target_kind(EdgeKind kind) noexcept
{
  switch (kind) {
    case EdgeKind::Inherits:
      return NodeKind::Class;
    case EdgeKind::Imports:
      return NodeKind::Module;
    case EdgeKind::HasType:
    case EdgeKind::ReturnsType:
    case EdgeKind::IsSubtypeOf:
      return NodeKind::Type;
    case EdgeKind::HasParameter:
      return NodeKind::Parameter;
    case EdgeKind::HasCallsite:
      return NodeKind::CallSite;
    case EdgeKind::ResolvesTo:
    case EdgeKind::HasDecorator:
      return NodeKind::Function;
    case EdgeKind::Declares:
    case EdgeKind::Decorates:
    case EdgeKind::AssignsTo:
    case EdgeKind::ReadsFrom:
    case EdgeKind::References:
      return NodeKind::Variable;
  }
  return NodeKind::Variable;
}

}  // namespace codegraph
