// codegraph/build/call_resolver.hpp - Call-site resolution
//
// Maps the callee text of a CallSite to the Function it denotes.
//
// Search order:
//   1. dotted callees: `self.`/`cls.` through the enclosing class and its
//      bases, import aliases, then an exact qualified-name match
//   2. bare names: the lexical scope chain (function -> class -> module),
//      innermost scope first, then the module's imports
//   3. several candidates at the deciding step: Ambiguous, never a guess
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "codegraph/build/resolution.hpp"
#include "codegraph/graph/code_graph.hpp"

namespace codegraph
{

/**
 * One entry of a module's static import table.
 *
 * `import a.b` binds "a.b"; `import a.b as m` binds "m";
 * `from a import f` binds "f"; `from a import *` is a wildcard entry whose
 * target is the module "a".
 */
struct ImportEntry
{
  std::string alias;
  std::string target;  ///< qualified name of the imported module or entity
  bool wildcard = false;
};

class CallResolver
{
public:
  explicit CallResolver(const CodeGraph & graph) : graph_(graph) {}

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /// Resolve a CallSite node; its caller is the HAS_CALLSITE owner
  [[nodiscard]] Resolution resolve(const Node & callsite) const;

  /// Resolve callee text as written inside `caller`
  [[nodiscard]] Resolution resolve(const Node & caller, std::string_view callee) const;

  /// Import table of a module (IMPORTS edges in key order)
  [[nodiscard]] std::vector<ImportEntry> imports_of(const Node & module) const;

private:
  [[nodiscard]] Resolution resolve_dotted(const Node & caller, std::string_view callee) const;
  [[nodiscard]] Resolution resolve_bare(const Node & caller, std::string_view name) const;
  [[nodiscard]] Resolution resolve_method(const Node & cls, std::string_view name) const;

  /// Function ids denoted by a qualified name (a Class denotes its __init__)
  [[nodiscard]] std::vector<NodeId> functions_named(std::string_view qname) const;

  /// Functions (or constructors) called `name` declared directly in `scope`
  [[nodiscard]] std::vector<NodeId> declared_callables(
    const Node & scope, std::string_view name) const;

  const CodeGraph & graph_;
};

/// Collapse a candidate list into a Resolution
[[nodiscard]] Resolution to_resolution(std::vector<NodeId> candidates);

}  // namespace codegraph
