// codegraph/validate/node_filter.hpp - Node set restricting a validation run
//
#pragma once

#include <optional>
#include <set>
#include <string_view>
#include <utility>

#include "codegraph/graph/node.hpp"

namespace codegraph
{

/**
 * Either "every node" (full validation) or an explicit id set
 * (incremental validation). A violation is kept iff its anchor passes.
 */
class NodeFilter
{
public:
  using IdSet = std::set<NodeId, std::less<>>;

  /// Passes every node
  [[nodiscard]] static NodeFilter all() { return NodeFilter{}; }

  [[nodiscard]] static NodeFilter only(IdSet ids)
  {
    NodeFilter f;
    f.ids_ = std::move(ids);
    return f;
  }

  [[nodiscard]] bool contains(std::string_view id) const
  {
    return !ids_ || ids_->find(id) != ids_->end();
  }

  [[nodiscard]] bool is_all() const noexcept { return !ids_.has_value(); }

  /// nullptr for the all-nodes filter
  [[nodiscard]] const IdSet * ids() const noexcept { return ids_ ? &*ids_ : nullptr; }

private:
  NodeFilter() = default;

  std::optional<IdSet> ids_;
};

}  // namespace codegraph
