// codegraph/graph/graph_json.hpp - JSON serialization of graph values
//
// Shared by payload loading, snapshot persistence and report output.
//
#pragma once

#include <nlohmann/json.hpp>

#include "codegraph/graph/code_graph.hpp"
#include "codegraph/graph/node.hpp"
#include "codegraph/graph/property.hpp"

namespace codegraph
{

[[nodiscard]] nlohmann::json to_json(const PropertyValue & value);
[[nodiscard]] nlohmann::json to_json(const PropertyMap & props);

/**
 * Convert a JSON scalar or string array into a property value.
 *
 * Floating-point numbers are truncated to integers; null, objects and
 * mixed arrays are rejected.
 *
 * @return std::nullopt for unsupported JSON values
 */
[[nodiscard]] std::optional<PropertyValue> property_from_json(const nlohmann::json & j);

/**
 * Convert a JSON object into a property map.
 *
 * @throws std::invalid_argument naming the offending key on an unsupported value
 */
[[nodiscard]] PropertyMap properties_from_json(const nlohmann::json & j);

/// {"id", "kind", "properties", "changed"}
[[nodiscard]] nlohmann::json to_json(const Node & node);

/// {"kind", "source", "target", "properties"}
[[nodiscard]] nlohmann::json to_json(const Edge & edge);

/// {"nodes": [...], "edges": [...]} in id / key order
[[nodiscard]] nlohmann::json to_json(const CodeGraph & graph);

/**
 * Rebuild nodes and edges written by to_json().
 *
 * @throws std::invalid_argument or nlohmann::json::exception on malformed input
 */
[[nodiscard]] Node node_from_json(const nlohmann::json & j);
[[nodiscard]] Edge edge_from_json(const nlohmann::json & j);

}  // namespace codegraph
