// codegraph/graph/memory_graph_store.hpp - Copy-on-write in-memory store
//
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "codegraph/graph/graph_store.hpp"

namespace codegraph
{

/**
 * GraphStore keeping the whole graph in memory.
 *
 * commit() applies the batch to a private copy of the current graph and
 * publishes the copy only if every operation succeeded. Views are
 * shared_ptr<const CodeGraph> snapshots, so readers never block writers.
 */
class MemoryGraphStore : public GraphStore
{
public:
  MemoryGraphStore();

  void commit(const MutationBatch & batch) override;

  [[nodiscard]] std::shared_ptr<const CodeGraph> view() const override;

  /// Number of successful non-empty commits so far
  [[nodiscard]] uint64_t revision() const;

private:
  mutable std::mutex mutex_;
  std::shared_ptr<const CodeGraph> current_;
  uint64_t revision_ = 0;
};

}  // namespace codegraph
