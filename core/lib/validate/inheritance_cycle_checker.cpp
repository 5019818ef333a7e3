// codegraph/validate/inheritance_cycle_checker.cpp - INHERITS cycle detection
//
#include "codegraph/validate/inheritance_cycle_checker.hpp"

#include <algorithm>
#include <functional>
#include <set>
#include <string_view>
#include <unordered_map>

#include "codegraph/basic/log.hpp"

namespace codegraph
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

bool qname_less(const Node * a, const Node * b)
{
  if (a->qualified_name() != b->qualified_name()) {
    return a->qualified_name() < b->qualified_name();
  }
  return a->id < b->id;
}

/// Bases of a class that exist and are classes, in qualified-name order
std::vector<const Node *> bases_of(const CodeGraph & graph, const Node & cls)
{
  std::vector<const Node *> bases;
  for (const auto * e : graph.out_edges(cls.id, EdgeKind::Inherits)) {
    const Node * base = graph.find_node(e->target);
    if (base != nullptr && base->is(NodeKind::Class)) {
      bases.push_back(base);
    }
  }
  std::sort(bases.begin(), bases.end(), qname_less);
  return bases;
}

/// Slice the stack from `target` to the top and rotate it into canonical order
InheritanceCycle close_cycle(gsl::span<const Node * const> stack, const Node * target)
{
  InheritanceCycle cycle;
  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start] == target) break;
  }
  for (size_t i = start; i < stack.size(); ++i) {
    cycle.classes.push_back(stack[i]);
  }
  if (cycle.classes.empty()) {
    cycle.classes.push_back(target);
  }

  const auto first = std::min_element(cycle.classes.begin(), cycle.classes.end(), qname_less);
  std::rotate(cycle.classes.begin(), first, cycle.classes.end());
  return cycle;
}

}  // namespace

std::vector<InheritanceCycle> InheritanceCycleChecker::find_cycles(
  const CancellationToken & token) const
{
  std::vector<const Node *> roots = graph_.nodes_of_kind(NodeKind::Class);
  std::sort(roots.begin(), roots.end(), qname_less);

  std::unordered_map<const Node *, Color> color;
  color.reserve(roots.size());
  for (const auto * r : roots) {
    color.emplace(r, Color::White);
  }

  std::vector<const Node *> stack;
  stack.reserve(64);

  std::vector<InheritanceCycle> cycles;
  std::set<std::vector<std::string_view>> seen;
  bool cancelled = false;

  std::function<void(const Node *)> dfs;
  dfs = [&](const Node * u) {
    if (cancelled) return;
    color[u] = Color::Gray;
    stack.push_back(u);

    for (const auto * base : bases_of(graph_, *u)) {
      const Color c = color[base];
      if (c == Color::Gray) {
        const gsl::span<const Node * const> stack_view(stack.data(), stack.size());
        auto cycle = close_cycle(stack_view, base);

        std::vector<std::string_view> key;
        for (const auto * n : cycle.classes) key.push_back(n->id);
        if (seen.insert(std::move(key)).second) {
          cycles.push_back(std::move(cycle));
        }
        continue;
      }
      if (c == Color::White) {
        dfs(base);
      }
    }

    stack.pop_back();
    color[u] = Color::Black;
  };

  for (const auto * r : roots) {
    if (token.is_cancelled()) {
      cancelled = true;
      break;
    }
    if (color[r] == Color::White) {
      dfs(r);
    }
  }
  if (cancelled) return {};

  std::sort(
    cycles.begin(), cycles.end(), [](const InheritanceCycle & a, const InheritanceCycle & b) {
      return std::lexicographical_compare(
        a.classes.begin(), a.classes.end(), b.classes.begin(), b.classes.end(), qname_less);
    });
  log::debug("inheritance: {} class(es), {} cycle(s)", roots.size(), cycles.size());
  return cycles;
}

std::string cycle_message(gsl::span<const Node * const> cycle)
{
  std::string msg;
  for (const auto * n : cycle) {
    if (!msg.empty()) msg += " -> ";
    msg += std::string(n->name());
  }
  if (!cycle.empty()) {
    msg += " -> ";
    msg += std::string(cycle[0]->name());
  }
  return msg;
}

}  // namespace codegraph
