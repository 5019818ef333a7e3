// codegraph/snapshot/graph_diff.cpp - Structural diff of two graph states
//
#include "codegraph/snapshot/graph_diff.hpp"

#include <algorithm>
#include <set>

namespace codegraph
{

namespace
{

/// Elements of `a` missing from `b`, in `a`'s order
StringList missing_from(const StringList & a, const StringList & b)
{
  const std::set<std::string, std::less<>> other(b.begin(), b.end());
  StringList result;
  for (const auto & s : a) {
    if (other.find(s) == other.end()) result.push_back(s);
  }
  return result;
}

PropertyChange make_change(
  const std::string & key, const PropertyValue * before, const PropertyValue * after)
{
  PropertyChange change;
  change.key = key;
  if (before != nullptr) change.before = *before;
  if (after != nullptr) change.after = *after;

  static const StringList k_empty;
  const auto * old_list = before != nullptr ? std::get_if<StringList>(before) : nullptr;
  const auto * new_list = after != nullptr ? std::get_if<StringList>(after) : nullptr;
  if (old_list != nullptr || new_list != nullptr) {
    const StringList & o = old_list != nullptr ? *old_list : k_empty;
    const StringList & n = new_list != nullptr ? *new_list : k_empty;
    change.added = missing_from(n, o);
    change.removed = missing_from(o, n);
  }
  return change;
}

}  // namespace

const PropertyChange * NodeChange::find(std::string_view key) const
{
  for (const auto & c : changes) {
    if (c.key == key) return &c;
  }
  return nullptr;
}

const NodeChange * GraphDiff::find_modified(std::string_view id) const
{
  for (const auto & n : modified_nodes) {
    if (n.id == id) return &n;
  }
  return nullptr;
}

DiffSummary GraphDiff::summary() const
{
  DiffSummary s;
  s.nodes_added = added_nodes.size();
  s.nodes_removed = removed_nodes.size();
  s.nodes_modified = modified_nodes.size();
  s.nodes_unchanged = unchanged_nodes.size();
  s.edges_added = added_edges.size();
  s.edges_removed = removed_edges.size();
  s.edges_modified = modified_edges.size();
  s.edges_unchanged = unchanged_edges;
  return s;
}

std::vector<PropertyChange> diff_properties(const PropertyMap & before, const PropertyMap & after)
{
  std::vector<PropertyChange> changes;
  auto b = before.begin();
  auto a = after.begin();

  // Both maps are ordered by key: merge.
  while (b != before.end() || a != after.end()) {
    if (a == after.end() || (b != before.end() && b->first < a->first)) {
      changes.push_back(make_change(b->first, &b->second, nullptr));
      ++b;
    } else if (b == before.end() || a->first < b->first) {
      changes.push_back(make_change(a->first, nullptr, &a->second));
      ++a;
    } else {
      if (b->second != a->second) {
        changes.push_back(make_change(b->first, &b->second, &a->second));
      }
      ++b;
      ++a;
    }
  }
  return changes;
}

GraphDiff diff_graphs(const CodeGraph & before, const CodeGraph & after)
{
  GraphDiff diff;

  for (const auto & [id, old_node] : before.nodes()) {
    const Node * new_node = after.find_node(id);
    if (new_node == nullptr) {
      diff.removed_nodes.push_back(old_node);
      continue;
    }

    auto changes = diff_properties(old_node.props, new_node->props);
    if (old_node.kind != new_node->kind) {
      PropertyChange kind_change;
      kind_change.key = "kind";
      kind_change.before = PropertyValue{std::string(to_string(old_node.kind))};
      kind_change.after = PropertyValue{std::string(to_string(new_node->kind))};
      changes.insert(changes.begin(), std::move(kind_change));
    }

    if (changes.empty()) {
      diff.unchanged_nodes.push_back(id);
    } else {
      NodeChange change;
      change.id = id;
      change.kind = new_node->kind;
      change.qualified_name = std::string(new_node->qualified_name());
      change.changes = std::move(changes);
      diff.modified_nodes.push_back(std::move(change));
    }
  }
  for (const auto & [id, new_node] : after.nodes()) {
    if (!before.contains(id)) diff.added_nodes.push_back(new_node);
  }

  for (const auto & [key, old_edge] : before.edges()) {
    const Edge * new_edge = after.find_edge(key);
    if (new_edge == nullptr) {
      diff.removed_edges.push_back(old_edge);
      continue;
    }
    auto changes = diff_properties(old_edge.props, new_edge->props);
    if (changes.empty()) {
      ++diff.unchanged_edges;
    } else {
      diff.modified_edges.push_back(EdgeChange{key, std::move(changes)});
    }
  }
  for (const auto & [key, new_edge] : after.edges()) {
    if (before.find_edge(key) == nullptr) diff.added_edges.push_back(new_edge);
  }

  return diff;
}

}  // namespace codegraph
