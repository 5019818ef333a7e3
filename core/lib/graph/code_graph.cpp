// codegraph/graph/code_graph.cpp - In-memory property graph implementation
//
#include "codegraph/graph/code_graph.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace codegraph
{

std::string EdgeKey::to_string() const
{
  return fmt::format("{}-{}->{}", source, codegraph::to_string(kind), target);
}

namespace
{

template <typename Index, typename Value>
void index_insert(Index & index, std::string_view key, const Value & value)
{
  auto it = index.find(key);
  if (it == index.end()) {
    it = index.emplace(std::string(key), typename Index::mapped_type{}).first;
  }
  it->second.insert(value);
}

template <typename Index, typename Value>
void index_erase(Index & index, std::string_view key, const Value & value)
{
  const auto it = index.find(key);
  if (it == index.end()) return;
  it->second.erase(value);
  if (it->second.empty()) {
    index.erase(it);
  }
}

}  // namespace

// ============================================================================
// Lookup
// ============================================================================

const Node * CodeGraph::find_node(std::string_view id) const
{
  const auto it = nodes_.find(id);
  return it != nodes_.end() ? &it->second : nullptr;
}

const Edge * CodeGraph::find_edge(const EdgeKey & key) const
{
  const auto it = edges_.find(key);
  return it != edges_.end() ? &it->second : nullptr;
}

std::vector<const Edge *> CodeGraph::out_edges(
  std::string_view id, std::optional<EdgeKind> kind) const
{
  std::vector<const Edge *> result;
  const auto it = out_.find(id);
  if (it == out_.end()) return result;
  for (const auto & key : it->second) {
    if (kind && key.kind != *kind) continue;
    if (const Edge * e = find_edge(key)) {
      result.push_back(e);
    }
  }
  return result;
}

std::vector<const Edge *> CodeGraph::in_edges(
  std::string_view id, std::optional<EdgeKind> kind) const
{
  std::vector<const Edge *> result;
  const auto it = in_.find(id);
  if (it == in_.end()) return result;
  for (const auto & key : it->second) {
    if (kind && key.kind != *kind) continue;
    if (const Edge * e = find_edge(key)) {
      result.push_back(e);
    }
  }
  return result;
}

bool CodeGraph::has_incident_edges(std::string_view id) const
{
  const auto o = out_.find(id);
  if (o != out_.end() && !o->second.empty()) return true;
  const auto i = in_.find(id);
  return i != in_.end() && !i->second.empty();
}

std::vector<const Node *> CodeGraph::nodes_of_kind(NodeKind kind) const
{
  std::vector<const Node *> result;
  for (const auto & [id, node] : nodes_) {
    if (node.kind == kind) {
      result.push_back(&node);
    }
  }
  return result;
}

std::vector<const Node *> CodeGraph::find_by_qualified_name(std::string_view qname) const
{
  std::vector<const Node *> result;
  const auto it = by_qualified_name_.find(qname);
  if (it == by_qualified_name_.end()) return result;
  for (const auto & id : it->second) {
    if (const Node * n = find_node(id)) {
      result.push_back(n);
    }
  }
  return result;
}

std::vector<const Node *> CodeGraph::nodes_in_module(std::string_view module) const
{
  std::vector<const Node *> result;
  const auto it = nodes_by_module_.find(module);
  if (it == nodes_by_module_.end()) return result;
  result.reserve(it->second.size());
  for (const auto & id : it->second) {
    if (const Node * n = find_node(id)) {
      result.push_back(n);
    }
  }
  return result;
}

std::vector<const Edge *> CodeGraph::edges_in_module(std::string_view module) const
{
  std::vector<const Edge *> result;
  const auto it = edges_by_module_.find(module);
  if (it == edges_by_module_.end()) return result;
  result.reserve(it->second.size());
  for (const auto & key : it->second) {
    if (const Edge * e = find_edge(key)) {
      result.push_back(e);
    }
  }
  return result;
}

std::vector<std::string> CodeGraph::module_names() const
{
  std::vector<std::string> result;
  result.reserve(nodes_by_module_.size());
  for (const auto & [name, ids] : nodes_by_module_) {
    result.push_back(name);
  }
  return result;
}

std::vector<NodeId> CodeGraph::changed_node_ids() const
{
  std::vector<NodeId> result;
  for (const auto & [id, node] : nodes_) {
    if (node.changed) {
      result.push_back(id);
    }
  }
  return result;
}

// ============================================================================
// Mutation
// ============================================================================

void CodeGraph::upsert_node(Node node)
{
  auto it = nodes_.find(node.id);
  if (it != nodes_.end()) {
    node.changed = node.changed || it->second.changed;
    unindex_node(it->second);
    it->second = std::move(node);
    index_node(it->second);
    return;
  }
  NodeId id = node.id;
  const auto pos = nodes_.emplace(std::move(id), std::move(node)).first;
  index_node(pos->second);
}

void CodeGraph::upsert_edge(Edge edge)
{
  if (!contains(edge.source)) {
    throw StoreError(fmt::format("edge source does not exist: {}", edge.key().to_string()));
  }
  const EdgeKey key = edge.key();
  auto it = edges_.find(key);
  if (it != edges_.end()) {
    unindex_edge(it->second);
    it->second = std::move(edge);
    index_edge(it->second);
    return;
  }
  const auto pos = edges_.emplace(key, std::move(edge)).first;
  index_edge(pos->second);
}

bool CodeGraph::erase_node(std::string_view id)
{
  const auto it = nodes_.find(id);
  if (it == nodes_.end()) return false;

  // Collect first: erase_edge mutates out_.
  std::vector<EdgeKey> outgoing;
  if (const auto o = out_.find(id); o != out_.end()) {
    outgoing.assign(o->second.begin(), o->second.end());
  }
  for (const auto & key : outgoing) {
    erase_edge(key);
  }

  unindex_node(it->second);
  nodes_.erase(it);
  return true;
}

bool CodeGraph::erase_edge(const EdgeKey & key)
{
  const auto it = edges_.find(key);
  if (it == edges_.end()) return false;
  unindex_edge(it->second);
  edges_.erase(it);
  return true;
}

bool CodeGraph::set_changed(std::string_view id, bool value)
{
  const auto it = nodes_.find(id);
  if (it == nodes_.end()) return false;
  it->second.changed = value;
  return true;
}

void CodeGraph::apply(const MutationBatch & batch)
{
  for (const auto & op : batch) {
    std::visit(
      [this](const auto & m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, UpsertNode>) {
          upsert_node(m.node);
        } else if constexpr (std::is_same_v<T, UpsertEdge>) {
          upsert_edge(m.edge);
        } else if constexpr (std::is_same_v<T, DeleteNode>) {
          erase_node(m.id);
        } else if constexpr (std::is_same_v<T, DeleteEdge>) {
          erase_edge(m.key);
        } else if constexpr (std::is_same_v<T, SetChanged>) {
          set_changed(m.id, m.value);
        } else if constexpr (std::is_same_v<T, PruneIfDetached>) {
          if (contains(m.id) && !has_incident_edges(m.id)) {
            erase_node(m.id);
          }
        }
      },
      op);
  }
}

// ============================================================================
// Index maintenance
// ============================================================================

void CodeGraph::index_node(const Node & node)
{
  const auto qname = node.qualified_name();
  if (!qname.empty()) {
    index_insert(by_qualified_name_, qname, node.id);
  }
  const auto module = node.module();
  if (!module.empty()) {
    index_insert(nodes_by_module_, module, node.id);
  }
}

void CodeGraph::unindex_node(const Node & node)
{
  const auto qname = node.qualified_name();
  if (!qname.empty()) {
    index_erase(by_qualified_name_, qname, node.id);
  }
  const auto module = node.module();
  if (!module.empty()) {
    index_erase(nodes_by_module_, module, node.id);
  }
}

void CodeGraph::index_edge(const Edge & edge)
{
  const EdgeKey key = edge.key();
  index_insert(out_, edge.source, key);
  index_insert(in_, edge.target, key);
  const auto module = edge.module();
  if (!module.empty()) {
    index_insert(edges_by_module_, module, key);
  }
}

void CodeGraph::unindex_edge(const Edge & edge)
{
  const EdgeKey key = edge.key();
  index_erase(out_, edge.source, key);
  index_erase(in_, edge.target, key);
  const auto module = edge.module();
  if (!module.empty()) {
    index_erase(edges_by_module_, module, key);
  }
}

}  // namespace codegraph
