// codegraph/validate/signature_checker.cpp - Signature Conservation
//
#include "codegraph/validate/signature_checker.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>

#include "codegraph/build/resolution.hpp"

namespace codegraph
{

std::string describe_arity(const Arity & arity)
{
  if (!arity.max) {
    return fmt::format("at least {} argument{}", arity.min, arity.min == 1 ? "" : "s");
  }
  if (*arity.max == arity.min) {
    return fmt::format("{} argument{}", arity.min, arity.min == 1 ? "" : "s");
  }
  return fmt::format("{}-{} arguments", arity.min, *arity.max);
}

bool accepts_keyword(const std::vector<ParameterInfo> & params, std::string_view keyword)
{
  for (const auto & p : params) {
    if (p.kind == ParamKind::VarKeyword) return true;
    if (p.kind == ParamKind::Receiver || p.kind == ParamKind::PositionalOnly ||
        p.kind == ParamKind::VarPositional) {
      continue;
    }
    if (p.node->name() == keyword) return true;
  }
  return false;
}

Arity arity_of(const std::vector<ParameterInfo> & params)
{
  Arity arity;
  int64_t total = 0;
  bool variadic = false;
  for (const auto & p : params) {
    if (p.kind == ParamKind::Receiver) continue;
    if (is_variadic(p.kind)) {
      variadic = true;
      continue;
    }
    ++total;
    if (!p.has_default) ++arity.min;
  }
  if (!variadic) arity.max = total;
  return arity;
}

bool SignatureChecker::check()
{
  for (const auto * callsite : ctx_.graph.nodes_of_kind(NodeKind::CallSite)) {
    if (ctx_.cancelled()) return false;
    if (!ctx_.in_scope(*callsite)) continue;

    const auto resolution = read_resolution(ctx_.graph, *callsite);
    const auto * resolved = std::get_if<Resolved>(&resolution);
    if (resolved == nullptr) continue;

    const Node * target = ctx_.graph.find_node(resolved->target);
    if (target == nullptr || !target->is(NodeKind::Function)) continue;

    check_arguments(*callsite, *target);
    check_visibility(*callsite, *target);
  }
  return true;
}

void SignatureChecker::check_arguments(const Node & callsite, const Node & target)
{
  const auto params = parameters_of(ctx_.graph, target.id);
  const Arity arity = arity_of(params);

  const auto actual = get_int(callsite.props, prop::k_arg_count);
  if (actual && !arity.accepts(*actual)) {
    const int64_t expected = (arity.max && *actual > *arity.max) ? *arity.max : arity.min;
    const std::string expected_text = describe_arity(arity);

    auto v = ctx_.bag.report(
      Law::SignatureConservation, violation_type::k_signature_mismatch, Severity::Error, callsite,
      fmt::format(
        "Function {} expects {} but is called with {}", target.name(), expected_text, *actual));
    v.with_entity(target.id)
      .with_fix(fmt::format("Update the call to {} to provide {}", callsite.name(), expected_text))
      .with_detail("function", std::string(target.qualified_name()))
      .with_detail("expected_args", expected)
      .with_detail("actual_args", *actual)
      .with_detail("min_args", arity.min);
    if (arity.max) v.with_detail("max_args", *arity.max);
  }

  if (const auto * keywords = get_list(callsite.props, prop::k_keyword_args)) {
    for (const auto & keyword : *keywords) {
      if (accepts_keyword(params, keyword)) continue;
      ctx_.bag
        .report(
          Law::SignatureConservation, violation_type::k_signature_mismatch, Severity::Error,
          callsite,
          fmt::format("Function {} has no parameter named '{}'", target.name(), keyword))
        .with_entity(target.id)
        .with_fix(fmt::format("Remove the keyword argument '{}'", keyword))
        .with_detail("function", std::string(target.qualified_name()))
        .with_detail("keyword", keyword);
    }
  }
}

void SignatureChecker::check_visibility(const Node & callsite, const Node & target)
{
  if (get_string(target.props, prop::k_visibility) != to_string(Visibility::Private)) return;

  const Node * scope = owner_of(ctx_.graph, target);
  const Node * caller = owner_of(ctx_.graph, callsite);
  if (scope == nullptr || caller == nullptr) return;

  if (caller == scope) return;
  const auto chain = ancestors_of(ctx_.graph, *caller);
  if (std::find(chain.begin(), chain.end(), scope) != chain.end()) return;

  ctx_.bag
    .report(
      Law::SignatureConservation, violation_type::k_visibility_violation, Severity::Error,
      callsite,
      fmt::format(
        "Private function {} called from outside {}", target.name(), scope->qualified_name()))
    .with_entity(target.id)
    .with_fix(fmt::format("Make {} public or move the call into {}", target.name(), scope->name()))
    .with_detail("function", std::string(target.qualified_name()))
    .with_detail("caller", std::string(caller->qualified_name()));
}

}  // namespace codegraph
