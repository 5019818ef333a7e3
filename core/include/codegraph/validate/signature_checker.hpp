// codegraph/validate/signature_checker.hpp - Signature Conservation
//
// Every resolved call site must bind against its target's parameter list,
// and private functions may only be called from inside their declaring
// scope.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/graph/graph_queries.hpp"
#include "codegraph/validate/check_context.hpp"

namespace codegraph
{

/**
 * Accepted argument count of a function.
 *
 * Receiver parameters are not counted; `max` is std::nullopt when a
 * variadic parameter is present.
 */
struct Arity
{
  int64_t min = 0;
  std::optional<int64_t> max;

  [[nodiscard]] bool accepts(int64_t count) const noexcept
  {
    return count >= min && (!max || count <= *max);
  }
};

[[nodiscard]] Arity arity_of(const std::vector<ParameterInfo> & params);

/// "2 arguments", "1-3 arguments", "at least 1 argument"
[[nodiscard]] std::string describe_arity(const Arity & arity);

/// Whether some parameter binds `keyword` (a **kwargs parameter binds any)
[[nodiscard]] bool accepts_keyword(
  const std::vector<ParameterInfo> & params, std::string_view keyword);

class SignatureChecker
{
public:
  explicit SignatureChecker(CheckContext & ctx) : ctx_(ctx) {}

  /// Returns false if the run was cancelled
  bool check();

private:
  void check_arguments(const Node & callsite, const Node & target);
  void check_visibility(const Node & callsite, const Node & target);

  CheckContext & ctx_;
};

}  // namespace codegraph
