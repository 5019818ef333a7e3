// codegraph/validate/type_compatibility.cpp - Declared vs observed type check
//
#include "codegraph/validate/type_compatibility.hpp"

#include <algorithm>
#include <deque>
#include <set>

#include "codegraph/build/node_identity.hpp"

namespace codegraph
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

}  // namespace

bool TypeCompatibilityChecker::is_builtin(std::string_view type) const
{
  return config_.builtin_types.find(trim(type)) != config_.builtin_types.end();
}

bool TypeCompatibilityChecker::compatible(
  std::string_view declared, std::string_view observed) const
{
  declared = trim(declared);
  observed = trim(observed);

  if (config_.type_compatibility == TypeCompatibility::Off) return true;
  if (declared.empty() || observed.empty()) return true;
  if (declared == observed) return true;
  if (declared == config_.any_type || observed == config_.any_type) return true;
  if (config_.type_compatibility == TypeCompatibility::Exact) return false;

  // Nominal: built-ins only match themselves.
  if (is_builtin(declared) || is_builtin(observed)) return false;

  const auto supers = supertypes_of(observed);
  const auto declared_classes = classes_named(declared);
  for (const auto & s : supers) {
    if (s == declared) return true;
    for (const auto * c : declared_classes) {
      if (s == c->qualified_name()) return true;
    }
  }
  return false;
}

std::vector<std::string> TypeCompatibilityChecker::supertypes_of(std::string_view type) const
{
  std::set<std::string, std::less<>> seen{std::string(type)};
  std::deque<std::string> queue{std::string(type)};

  // Class qualified names count as aliases of the simple type name.
  for (const auto * c : classes_named(type)) {
    const std::string q(c->qualified_name());
    if (seen.insert(q).second) queue.push_back(q);
  }

  while (!queue.empty()) {
    const std::string current = queue.front();
    queue.pop_front();

    for (const auto * e : graph_.out_edges(make_type_id(current), EdgeKind::IsSubtypeOf)) {
      if (const Node * t = graph_.find_node(e->target)) {
        const std::string q(t->qualified_name());
        if (seen.insert(q).second) queue.push_back(q);
      }
    }
    for (const auto * c : graph_.find_by_qualified_name(current)) {
      if (!c->is(NodeKind::Class)) continue;
      for (const auto * e : graph_.out_edges(c->id, EdgeKind::Inherits)) {
        const Node * base = graph_.find_node(e->target);
        if (base == nullptr || !base->is(NodeKind::Class)) continue;
        const std::string q(base->qualified_name());
        if (seen.insert(q).second) queue.push_back(q);
        const std::string simple(base->name());
        if (seen.insert(simple).second) queue.push_back(simple);
      }
    }
  }
  return {seen.begin(), seen.end()};
}

std::vector<const Node *> TypeCompatibilityChecker::classes_named(std::string_view type) const
{
  std::vector<const Node *> result;
  for (const auto * n : graph_.find_by_qualified_name(type)) {
    if (n->is(NodeKind::Class)) result.push_back(n);
  }
  if (!result.empty()) return result;
  for (const auto * n : graph_.nodes_of_kind(NodeKind::Class)) {
    if (n->name() == type) result.push_back(n);
  }
  return result;
}

}  // namespace codegraph
