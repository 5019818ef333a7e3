// codegraph/validate/report_json.cpp - JSON rendering of validation results
//
#include "codegraph/validate/report_json.hpp"

#include <string>

#include "codegraph/graph/graph_json.hpp"

namespace codegraph
{

using nlohmann::json;

json to_json(const Violation & violation)
{
  json j;
  j["law"] = std::string(to_string(violation.law));
  j["type"] = violation.type;
  j["severity"] = std::string(to_string(violation.severity));
  j["entity_ids"] = violation.entity_ids;
  j["message"] = violation.message;
  j["location"] = violation.location;
  if (violation.suggested_fix) {
    j["suggested_fix"] = *violation.suggested_fix;
  }
  j["details"] = to_json(violation.details);
  return j;
}

json to_json(const ValidationReport & report)
{
  json violations = json::array();
  for (const auto & v : report.violations) {
    violations.push_back(to_json(v));
  }

  json by_law = json::object();
  for (const Law law : k_all_laws) {
    by_law[std::string(to_string(law))] = report.count(law);
  }

  json summary;
  summary["errors"] = report.count(Severity::Error);
  summary["warnings"] = report.count(Severity::Warning);
  summary["infos"] = report.count(Severity::Info);
  summary["by_law"] = std::move(by_law);
  summary["scope_size"] = report.scope_size;
  summary["incremental"] = report.incremental;
  summary["cancelled"] = report.cancelled;

  json j;
  j["violations"] = std::move(violations);
  j["summary"] = std::move(summary);
  return j;
}

}  // namespace codegraph
