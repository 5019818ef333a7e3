// codegraph/validate/violation.cpp - Violation records and bag
//
#include "codegraph/validate/violation.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace codegraph
{

std::string_view to_string(Law law) noexcept
{
  switch (law) {
    case Law::SignatureConservation:
      return "signature_conservation";
    case Law::ReferenceIntegrity:
      return "reference_integrity";
    case Law::DataFlowConsistency:
      return "data_flow_consistency";
    case Law::StructuralIntegrity:
      return "structural_integrity";
  }
  return "unknown";
}

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "error";
}

std::optional<Severity> parse_severity(std::string_view text) noexcept
{
  if (text == "error") return Severity::Error;
  if (text == "warning") return Severity::Warning;
  if (text == "info") return Severity::Info;
  return std::nullopt;
}

bool violation_less(const Violation & a, const Violation & b)
{
  return std::forward_as_tuple(a.anchor(), a.law, a.type, a.message, a.entity_ids) <
         std::forward_as_tuple(b.anchor(), b.law, b.type, b.message, b.entity_ids);
}

// ============================================================================
// ViolationBuilder
// ============================================================================

ViolationBuilder::ViolationBuilder(ViolationBag & bag, Violation violation)
: bag_(bag), violation_(std::move(violation))
{
}

ViolationBuilder::ViolationBuilder(ViolationBuilder && other) noexcept
: bag_(other.bag_), violation_(std::move(other.violation_)), active_(other.active_)
{
  other.active_ = false;
}

ViolationBuilder::~ViolationBuilder()
{
  if (active_) {
    bag_.add(std::move(violation_));
  }
}

ViolationBuilder & ViolationBuilder::with_entity(NodeId id)
{
  violation_.entity_ids.push_back(std::move(id));
  return *this;
}

ViolationBuilder & ViolationBuilder::with_location(std::string location)
{
  violation_.location = std::move(location);
  return *this;
}

ViolationBuilder & ViolationBuilder::with_fix(std::string fix)
{
  violation_.suggested_fix = std::move(fix);
  return *this;
}

ViolationBuilder & ViolationBuilder::with_detail(std::string key, int64_t value)
{
  set_int(violation_.details, std::move(key), value);
  return *this;
}

ViolationBuilder & ViolationBuilder::with_detail(std::string key, std::string value)
{
  set_string(violation_.details, std::move(key), std::move(value));
  return *this;
}

ViolationBuilder & ViolationBuilder::with_detail(std::string key, StringList value)
{
  set_list(violation_.details, std::move(key), std::move(value));
  return *this;
}

// ============================================================================
// ViolationBag
// ============================================================================

ViolationBuilder ViolationBag::report(
  Law law, std::string_view type, Severity severity, const Node & anchor, std::string message)
{
  Violation v;
  v.law = law;
  v.type = std::string(type);
  v.severity = severity;
  v.entity_ids.push_back(anchor.id);
  v.message = std::move(message);
  v.location = std::string(anchor.location());
  return {*this, std::move(v)};
}

void ViolationBag::add(Violation && violation) { violations_.push_back(std::move(violation)); }

bool ViolationBag::has_errors() const
{
  return std::any_of(violations_.begin(), violations_.end(), [](const Violation & v) {
    return v.severity == Severity::Error;
  });
}

std::vector<Violation> ViolationBag::take_sorted()
{
  std::vector<Violation> out = std::move(violations_);
  violations_.clear();
  std::sort(out.begin(), out.end(), violation_less);
  return out;
}

}  // namespace codegraph
