// codegraph/build/node_identity.hpp - Stable node identity
//
// Ids depend only on what an entity is, never on where it currently sits in
// the file, so re-indexing an edited module updates nodes in place instead
// of deleting and re-creating them.
//
#pragma once

#include <cstdint>
#include <string_view>

#include "codegraph/graph/graph_enums.hpp"
#include "codegraph/graph/node.hpp"

namespace codegraph
{

/// Id of a declared entity: hash of (kind, qualified name)
[[nodiscard]] NodeId make_node_id(NodeKind kind, std::string_view qualified_name);

/**
 * Id of a call site.
 *
 * @param caller_qname Qualified name of the function containing the call
 * @param callee Callee text as written (e.g. "self.save", "calc")
 * @param ordinal 0-based index among calls to the same callee text in the caller
 */
[[nodiscard]] NodeId make_callsite_id(
  std::string_view caller_qname, std::string_view callee, int64_t ordinal);

/// Id of the shared Type node for a type expression
[[nodiscard]] NodeId make_type_id(std::string_view type_text);

/**
 * Node kind assumed for a relationship target that names an entity outside
 * the payload and carries no explicit kind.
 */
[[nodiscard]] NodeKind default_target_kind(EdgeKind kind) noexcept;

}  // namespace codegraph
