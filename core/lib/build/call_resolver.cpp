// codegraph/build/call_resolver.cpp - Call-site resolution
//
#include "codegraph/build/call_resolver.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

#include "codegraph/build/node_identity.hpp"
#include "codegraph/graph/graph_queries.hpp"

namespace codegraph
{

namespace
{

constexpr std::string_view k_constructor_name = "__init__";
constexpr std::string_view k_wildcard_alias = "*";

bool is_receiver_name(std::string_view head) { return head == "self" || head == "cls"; }

}  // namespace

Resolution to_resolution(std::vector<NodeId> candidates)
{
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
  if (candidates.empty()) return Unresolved{};
  if (candidates.size() == 1) return Resolved{std::move(candidates.front())};
  return Ambiguous{std::move(candidates)};
}

// ============================================================================
// Entry Points
// ============================================================================

Resolution CallResolver::resolve(const Node & callsite) const
{
  const Node * caller = owner_of(graph_, callsite);
  if (caller == nullptr) return Unresolved{};
  const auto callee = get_string(callsite.props, prop::k_callee).value_or(std::string_view{});
  return resolve(*caller, callee);
}

Resolution CallResolver::resolve(const Node & caller, std::string_view callee) const
{
  if (callee.empty()) return Unresolved{};
  if (callee.find('.') != std::string_view::npos) {
    return resolve_dotted(caller, callee);
  }
  return resolve_bare(caller, callee);
}

std::vector<ImportEntry> CallResolver::imports_of(const Node & module) const
{
  std::vector<ImportEntry> entries;
  for (const auto * e : graph_.out_edges(module.id, EdgeKind::Imports)) {
    ImportEntry entry;
    entry.target = target_name(graph_, *e);
    if (entry.target.empty()) continue;

    const auto alias = get_string(e->props, prop::k_alias).value_or(std::string_view{});
    if (alias == k_wildcard_alias) {
      entry.wildcard = true;
    } else if (!alias.empty()) {
      entry.alias = std::string(alias);
    } else if (e->target == make_node_id(NodeKind::Module, entry.target)) {
      entry.alias = entry.target;
    } else {
      entry.alias = std::string(last_segment(entry.target));
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

// ============================================================================
// Lookup steps
// ============================================================================

Resolution CallResolver::resolve_dotted(const Node & caller, std::string_view callee) const
{
  const auto dot = callee.find('.');
  const std::string_view head = callee.substr(0, dot);
  const std::string_view rest = callee.substr(dot + 1);

  // 1a. Receiver: self.method() / cls.method()
  if (is_receiver_name(head)) {
    const Node * cls = enclosing_class(graph_, caller);
    if (cls == nullptr || rest.find('.') != std::string_view::npos) {
      return Unresolved{};
    }
    return resolve_method(*cls, rest);
  }

  // 1b. Import aliases; the longest matching alias decides.
  if (const Node * module = enclosing_module(graph_, caller)) {
    const auto imports = imports_of(*module);
    const ImportEntry * best = nullptr;
    for (const auto & entry : imports) {
      if (entry.wildcard) continue;
      const bool matches = callee.size() > entry.alias.size() &&
                           callee.compare(0, entry.alias.size(), entry.alias) == 0 &&
                           callee[entry.alias.size()] == '.';
      if (matches && (best == nullptr || entry.alias.size() > best->alias.size())) {
        best = &entry;
      }
    }
    if (best != nullptr) {
      const std::string qname = best->target + std::string(callee.substr(best->alias.size()));
      return to_resolution(functions_named(qname));
    }
  }

  // 1c. Exact qualified name.
  if (auto exact = functions_named(callee); !exact.empty()) {
    return to_resolution(std::move(exact));
  }

  // Class visible from the caller's scope: Helper.create()
  if (rest.find('.') == std::string_view::npos) {
    std::vector<const Node *> scopes{&caller};
    const auto ancestors = ancestors_of(graph_, caller);
    scopes.insert(scopes.end(), ancestors.begin(), ancestors.end());
    for (const auto * scope : scopes) {
      for (const auto * child : declared_children(graph_, scope->id)) {
        if (child->is(NodeKind::Class) && child->name() == head) {
          return resolve_method(*child, rest);
        }
      }
    }
  }

  return Unresolved{};
}

Resolution CallResolver::resolve_bare(const Node & caller, std::string_view name) const
{
  // 2. Lexical scope chain, innermost first.
  std::vector<const Node *> scopes{&caller};
  const auto ancestors = ancestors_of(graph_, caller);
  scopes.insert(scopes.end(), ancestors.begin(), ancestors.end());

  for (const auto * scope : scopes) {
    auto found = declared_callables(*scope, name);
    if (!found.empty()) {
      return to_resolution(std::move(found));
    }
  }

  // Then the module's imports.
  const Node * module = enclosing_module(graph_, caller);
  if (module == nullptr) return Unresolved{};

  std::vector<NodeId> candidates;
  for (const auto & entry : imports_of(*module)) {
    std::vector<NodeId> found;
    if (entry.wildcard) {
      found = functions_named(entry.target + "." + std::string(name));
    } else if (entry.alias == name) {
      found = functions_named(entry.target);
    }
    candidates.insert(candidates.end(), found.begin(), found.end());
  }
  return to_resolution(std::move(candidates));
}

Resolution CallResolver::resolve_method(const Node & cls, std::string_view name) const
{
  // Breadth-first over the class and its bases; the nearest class wins.
  std::deque<const Node *> queue{&cls};
  std::unordered_set<std::string_view> visited{cls.id};

  while (!queue.empty()) {
    const Node * current = queue.front();
    queue.pop_front();

    auto found = declared_callables(*current, name);
    if (!found.empty()) {
      return to_resolution(std::move(found));
    }

    for (const auto * e : graph_.out_edges(current->id, EdgeKind::Inherits)) {
      const Node * base = graph_.find_node(e->target);
      if (base != nullptr && base->is(NodeKind::Class) && visited.insert(base->id).second) {
        queue.push_back(base);
      }
    }
  }
  return Unresolved{};
}

// ============================================================================
// Candidate collection
// ============================================================================

std::vector<NodeId> CallResolver::functions_named(std::string_view qname) const
{
  std::vector<NodeId> result;
  for (const auto * n : graph_.find_by_qualified_name(qname)) {
    if (n->is(NodeKind::Function)) {
      result.push_back(n->id);
    } else if (n->is(NodeKind::Class)) {
      auto ctors = declared_callables(*n, k_constructor_name);
      result.insert(result.end(), ctors.begin(), ctors.end());
    }
  }
  return result;
}

std::vector<NodeId> CallResolver::declared_callables(
  const Node & scope, std::string_view name) const
{
  std::vector<NodeId> result;
  for (const auto * child : declared_children(graph_, scope.id)) {
    if (child->name() != name) continue;
    if (child->is(NodeKind::Function)) {
      result.push_back(child->id);
    } else if (child->is(NodeKind::Class)) {
      for (const auto * member : declared_children(graph_, child->id)) {
        if (member->is(NodeKind::Function) && member->name() == k_constructor_name) {
          result.push_back(member->id);
        }
      }
    }
  }
  return result;
}

}  // namespace codegraph
