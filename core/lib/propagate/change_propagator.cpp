// codegraph/propagate/change_propagator.cpp - Expansion of the changed marker
//
#include "codegraph/propagate/change_propagator.hpp"

#include <algorithm>
#include <set>

#include "codegraph/basic/log.hpp"

namespace codegraph
{

namespace
{

bool path_matches(std::string_view stored, std::string_view wanted)
{
  if (stored.empty() || wanted.empty()) return false;
  if (stored == wanted) return true;
  return stored.size() > wanted.size() &&
         stored.compare(stored.size() - wanted.size(), wanted.size(), wanted) == 0 &&
         stored[stored.size() - wanted.size() - 1] == '/';
}

bool declared_in(const Node & node, gsl::span<const std::string> files)
{
  const auto file = get_string(node.props, prop::k_file).value_or(std::string_view{});
  const auto path = node.is(NodeKind::Module)
                      ? get_string(node.props, prop::k_path).value_or(std::string_view{})
                      : std::string_view{};
  return std::any_of(files.begin(), files.end(), [&](const std::string & f) {
    return path_matches(file, f) || path_matches(path, f);
  });
}

}  // namespace

std::vector<NodeId> dependents_of(const CodeGraph & graph, std::string_view id)
{
  std::vector<NodeId> result;
  for (const auto * e : graph.in_edges(id, EdgeKind::ResolvesTo)) {
    result.push_back(e->source);
    for (const auto * owner : graph.in_edges(e->source, EdgeKind::HasCallsite)) {
      result.push_back(owner->source);
    }
  }
  for (const auto * e : graph.in_edges(id, EdgeKind::Imports)) {
    result.push_back(e->source);
  }
  for (const auto * e : graph.in_edges(id, EdgeKind::Inherits)) {
    result.push_back(e->source);
  }
  return result;
}

std::vector<NodeId> ChangePropagator::mark_changed(gsl::span<const std::string> files)
{
  const auto graph = store_.view();

  MutationBatch batch;
  std::vector<NodeId> marked;
  for (const auto & [id, node] : graph->nodes()) {
    if (node.changed || !declared_in(node, files)) continue;
    batch.set_changed(id);
    marked.push_back(id);
  }
  if (!batch.empty()) {
    store_.commit(batch);
  }
  log::info("marked {} node(s) changed in {} file(s)", marked.size(), files.size());
  return marked;
}

PropagationResult ChangePropagator::propagate(const CancellationToken & token)
{
  const auto graph = store_.view();

  PropagationResult result;
  std::set<NodeId, std::less<>> visited;
  std::vector<NodeId> frontier = graph->changed_node_ids();
  visited.insert(frontier.begin(), frontier.end());

  while (!frontier.empty()) {
    if (token.is_cancelled()) {
      log::info("propagation cancelled after {} round(s)", result.rounds);
      return PropagationResult{{}, result.rounds, true};
    }
    ++result.rounds;

    std::vector<NodeId> next;
    for (const auto & id : frontier) {
      for (auto & dep : dependents_of(*graph, id)) {
        if (!graph->contains(dep) || !visited.insert(dep).second) continue;
        result.added.push_back(dep);
        next.push_back(std::move(dep));
      }
    }
    frontier = std::move(next);
  }

  std::sort(result.added.begin(), result.added.end());
  if (!result.added.empty()) {
    MutationBatch batch;
    for (const auto & id : result.added) {
      batch.set_changed(id);
    }
    store_.commit(batch);
  }
  log::info(
    "propagated changes to {} node(s) in {} round(s)", result.added.size(), result.rounds);
  return result;
}

void ChangePropagator::clear_changed()
{
  const auto graph = store_.view();
  MutationBatch batch;
  for (const auto & id : graph->changed_node_ids()) {
    batch.set_changed(id, false);
  }
  if (!batch.empty()) {
    store_.commit(batch);
  }
  log::debug("cleared {} changed flag(s)", batch.size());
}

std::vector<NodeId> ChangePropagator::changed_node_ids() const
{
  return store_.view()->changed_node_ids();
}

}  // namespace codegraph
