// codegraph/validate/report_json.hpp - JSON rendering of validation results
//
#pragma once

#include <nlohmann/json.hpp>

#include "codegraph/validate/conservation_validator.hpp"
#include "codegraph/validate/violation.hpp"

namespace codegraph
{

/// {"law", "type", "severity", "entity_ids", "message", "location", "suggested_fix"?, "details"}
[[nodiscard]] nlohmann::json to_json(const Violation & violation);

/**
 * {"violations": [...], "summary": {...}}
 *
 * The summary holds counts per severity and per law, the scope size and the
 * cancelled / incremental flags.
 */
[[nodiscard]] nlohmann::json to_json(const ValidationReport & report);

}  // namespace codegraph
