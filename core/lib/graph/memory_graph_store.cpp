// codegraph/graph/memory_graph_store.cpp - Copy-on-write in-memory store
//
#include "codegraph/graph/memory_graph_store.hpp"

#include <utility>

#include "codegraph/basic/log.hpp"

namespace codegraph
{

MemoryGraphStore::MemoryGraphStore() : current_(std::make_shared<const CodeGraph>()) {}

void MemoryGraphStore::commit(const MutationBatch & batch)
{
  if (batch.empty()) return;

  const std::lock_guard<std::mutex> lock(mutex_);

  auto next = std::make_shared<CodeGraph>(*current_);
  try {
    next->apply(batch);
  } catch (const StoreError & e) {
    log::warn("store: batch of {} operation(s) rejected: {}", batch.size(), e.what());
    throw;
  }

  current_ = std::move(next);
  ++revision_;
  log::debug(
    "store: committed {} operation(s), revision {} ({} nodes, {} edges)", batch.size(), revision_,
    current_->node_count(), current_->edge_count());
}

std::shared_ptr<const CodeGraph> MemoryGraphStore::view() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

uint64_t MemoryGraphStore::revision() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return revision_;
}

}  // namespace codegraph
