// codegraph/graph/graph_json.cpp - JSON serialization of graph values
//
#include "codegraph/graph/graph_json.hpp"

#include <stdexcept>
#include <string>

namespace codegraph
{

using nlohmann::json;

// ============================================================================
// Properties
// ============================================================================

json to_json(const PropertyValue & value)
{
  if (const auto * b = std::get_if<bool>(&value)) return *b;
  if (const auto * i = std::get_if<int64_t>(&value)) return *i;
  if (const auto * s = std::get_if<std::string>(&value)) return *s;
  return std::get<StringList>(value);
}

json to_json(const PropertyMap & props)
{
  json j = json::object();
  for (const auto & [key, value] : props) {
    j[key] = to_json(value);
  }
  return j;
}

std::optional<PropertyValue> property_from_json(const json & j)
{
  if (j.is_boolean()) return PropertyValue{j.get<bool>()};
  if (j.is_number_integer()) return PropertyValue{j.get<int64_t>()};
  if (j.is_number_float()) return PropertyValue{static_cast<int64_t>(j.get<double>())};
  if (j.is_string()) return PropertyValue{j.get<std::string>()};
  if (j.is_array()) {
    StringList list;
    list.reserve(j.size());
    for (const auto & item : j) {
      if (!item.is_string()) return std::nullopt;
      list.push_back(item.get<std::string>());
    }
    return PropertyValue{std::move(list)};
  }
  return std::nullopt;
}

PropertyMap properties_from_json(const json & j)
{
  PropertyMap props;
  if (j.is_null()) return props;
  if (!j.is_object()) {
    throw std::invalid_argument("properties must be an object");
  }
  for (const auto & [key, value] : j.items()) {
    auto v = property_from_json(value);
    if (!v) {
      throw std::invalid_argument("unsupported value for property '" + key + "'");
    }
    props.insert_or_assign(key, std::move(*v));
  }
  return props;
}

// ============================================================================
// Nodes and edges
// ============================================================================

json to_json(const Node & node)
{
  return json{
    {"id", node.id},
    {"kind", std::string(to_string(node.kind))},
    {"properties", to_json(node.props)},
    {"changed", node.changed}};
}

json to_json(const Edge & edge)
{
  return json{
    {"kind", std::string(to_string(edge.kind))},
    {"source", edge.source},
    {"target", edge.target},
    {"properties", to_json(edge.props)}};
}

json to_json(const CodeGraph & graph)
{
  json nodes = json::array();
  for (const auto & [id, node] : graph.nodes()) {
    nodes.push_back(to_json(node));
  }
  json edges = json::array();
  for (const auto & [key, edge] : graph.edges()) {
    edges.push_back(to_json(edge));
  }
  return json{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}

Node node_from_json(const json & j)
{
  Node node;
  node.id = j.at("id").get<std::string>();
  const auto kind_text = j.at("kind").get<std::string>();
  const auto kind = parse_node_kind(kind_text);
  if (!kind) {
    throw std::invalid_argument("unknown node kind '" + kind_text + "'");
  }
  node.kind = *kind;
  if (j.contains("properties")) {
    node.props = properties_from_json(j.at("properties"));
  }
  node.changed = j.value("changed", false);
  return node;
}

Edge edge_from_json(const json & j)
{
  Edge edge;
  const auto kind_text = j.at("kind").get<std::string>();
  const auto kind = parse_edge_kind(kind_text);
  if (!kind) {
    throw std::invalid_argument("unknown edge kind '" + kind_text + "'");
  }
  edge.kind = *kind;
  edge.source = j.at("source").get<std::string>();
  edge.target = j.at("target").get<std::string>();
  if (j.contains("properties")) {
    edge.props = properties_from_json(j.at("properties"));
  }
  return edge;
}

}  // namespace codegraph
