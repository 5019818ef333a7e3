// codegraph/extract/payload_json.cpp - JSON wire form of extractor payloads
//
#include "codegraph/extract/payload_json.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "codegraph/graph/graph_json.hpp"

namespace codegraph
{

namespace
{

using nlohmann::json;

std::vector<std::string> string_list(const json & j, const char * field)
{
  if (!j.contains(field)) return {};
  const auto & v = j.at(field);
  if (!v.is_array()) {
    throw std::invalid_argument(fmt::format("'{}' must be a list of strings", field));
  }
  return v.get<std::vector<std::string>>();
}

std::string opt_string(const json & j, const char * field)
{
  if (!j.contains(field) || j.at(field).is_null()) return {};
  return j.at(field).get<std::string>();
}

std::optional<int64_t> opt_int(const json & j, const char * field)
{
  if (!j.contains(field) || j.at(field).is_null()) return std::nullopt;
  return j.at(field).get<int64_t>();
}

RawEntity entity_from_json(const json & j)
{
  RawEntity e;
  const auto kind_text = j.at("kind").get<std::string>();
  const auto kind = parse_node_kind(kind_text);
  if (!kind) {
    throw std::invalid_argument(fmt::format("unknown entity kind '{}'", kind_text));
  }
  e.kind = *kind;
  e.key = opt_string(j, "key");
  e.name = opt_string(j, "name");
  e.qualified_name = opt_string(j, "qualified_name");
  if (e.qualified_name.empty() && (e.kind != NodeKind::CallSite || e.key.empty())) {
    throw std::invalid_argument(fmt::format("{} '{}' has no qualified_name", kind_text, e.name));
  }
  e.location = opt_string(j, "location");
  e.type_annotation = opt_string(j, "type_annotation");

  const auto visibility = opt_string(j, "visibility");
  if (!visibility.empty()) {
    const auto v = parse_visibility(visibility);
    if (!v) {
      throw std::invalid_argument(fmt::format("invalid visibility '{}'", visibility));
    }
    e.visibility = *v;
  }
  e.decorators = string_list(j, "decorators");

  e.position = opt_int(j, "position");
  const auto param_kind = opt_string(j, "param_kind");
  if (!param_kind.empty()) {
    const auto pk = parse_param_kind(param_kind);
    if (!pk) {
      throw std::invalid_argument(fmt::format("invalid param_kind '{}'", param_kind));
    }
    e.param_kind = *pk;
  }
  e.has_default = j.value("has_default", false);

  e.callee = opt_string(j, "callee");
  e.arg_count = opt_int(j, "arg_count").value_or(0);
  e.keyword_args = string_list(j, "keyword_args");
  e.arg_types = string_list(j, "arg_types");

  if (j.contains("attributes")) {
    e.attributes = properties_from_json(j.at("attributes"));
  }
  return e;
}

RawRelationship relationship_from_json(const json & j)
{
  RawRelationship r;
  const auto kind_text = j.at("kind").get<std::string>();
  const auto kind = parse_edge_kind(kind_text);
  if (!kind) {
    throw std::invalid_argument(fmt::format("unknown relationship kind '{}'", kind_text));
  }
  r.kind = *kind;
  r.from = j.at("from").get<std::string>();
  r.to = j.at("to").get<std::string>();

  const auto to_kind = opt_string(j, "to_kind");
  if (!to_kind.empty()) {
    r.to_kind = parse_node_kind(to_kind);
    if (!r.to_kind) {
      throw std::invalid_argument(fmt::format("unknown to_kind '{}'", to_kind));
    }
  }
  r.arg_count = opt_int(j, "arg_count");
  r.access_kind = opt_string(j, "access_kind");
  r.position = opt_int(j, "position");
  r.alias = opt_string(j, "alias");
  r.value_type = opt_string(j, "value_type");
  r.expected_type = opt_string(j, "expected_type");
  return r;
}

}  // namespace

PayloadLoadResult payload_from_json(const json & j)
{
  if (!j.is_object()) {
    return PayloadLoadResult::fail("payload must be a JSON object");
  }

  ExtractionPayload payload;
  try {
    payload.module_id = j.at("module").get<std::string>();

    if (j.contains("entities")) {
      const auto & entities = j.at("entities");
      if (!entities.is_array()) {
        return PayloadLoadResult::fail("'entities' must be a list");
      }
      for (size_t i = 0; i < entities.size(); ++i) {
        try {
          payload.entities.push_back(entity_from_json(entities[i]));
        } catch (const std::exception & e) {
          return PayloadLoadResult::fail(fmt::format("entities[{}]: {}", i, e.what()));
        }
      }
    }

    if (j.contains("relationships")) {
      const auto & rels = j.at("relationships");
      if (!rels.is_array()) {
        return PayloadLoadResult::fail("'relationships' must be a list");
      }
      for (size_t i = 0; i < rels.size(); ++i) {
        try {
          payload.relationships.push_back(relationship_from_json(rels[i]));
        } catch (const std::exception & e) {
          return PayloadLoadResult::fail(fmt::format("relationships[{}]: {}", i, e.what()));
        }
      }
    }
  } catch (const json::exception & e) {
    return PayloadLoadResult::fail(fmt::format("invalid payload: {}", e.what()));
  }

  return PayloadLoadResult::ok(std::move(payload));
}

PayloadLoadResult parse_payload(std::string_view text)
{
  json j;
  try {
    j = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return PayloadLoadResult::fail(fmt::format("failed to parse JSON: {}", e.what()));
  }
  return payload_from_json(j);
}

PayloadLoadResult load_payload_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in.is_open()) {
    return PayloadLoadResult::fail("failed to open payload file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto result = parse_payload(buffer.str());
  if (!result.success) {
    result.error = path.string() + ": " + result.error;
  }
  return result;
}

json to_json(const ExtractionPayload & payload)
{
  json entities = json::array();
  for (const auto & e : payload.entities) {
    json j{
      {"kind", std::string(to_string(e.kind))},
      {"name", e.name},
      {"qualified_name", e.qualified_name},
      {"visibility", std::string(to_string(e.visibility))}};
    if (!e.key.empty()) j["key"] = e.key;
    if (!e.location.empty()) j["location"] = e.location;
    if (!e.type_annotation.empty()) j["type_annotation"] = e.type_annotation;
    if (!e.decorators.empty()) j["decorators"] = e.decorators;
    if (e.kind == NodeKind::Parameter) {
      if (e.position) j["position"] = *e.position;
      j["param_kind"] = std::string(to_string(e.param_kind));
      j["has_default"] = e.has_default;
    }
    if (e.kind == NodeKind::CallSite) {
      j["callee"] = e.callee;
      j["arg_count"] = e.arg_count;
      if (!e.keyword_args.empty()) j["keyword_args"] = e.keyword_args;
      if (!e.arg_types.empty()) j["arg_types"] = e.arg_types;
    }
    if (!e.attributes.empty()) j["attributes"] = to_json(e.attributes);
    entities.push_back(std::move(j));
  }

  json rels = json::array();
  for (const auto & r : payload.relationships) {
    json j{{"kind", std::string(to_string(r.kind))}, {"from", r.from}, {"to", r.to}};
    if (r.to_kind) j["to_kind"] = std::string(to_string(*r.to_kind));
    if (r.arg_count) j["arg_count"] = *r.arg_count;
    if (!r.access_kind.empty()) j["access_kind"] = r.access_kind;
    if (r.position) j["position"] = *r.position;
    if (!r.alias.empty()) j["alias"] = r.alias;
    if (!r.value_type.empty()) j["value_type"] = r.value_type;
    if (!r.expected_type.empty()) j["expected_type"] = r.expected_type;
    rels.push_back(std::move(j));
  }

  return json{
    {"module", payload.module_id},
    {"entities", std::move(entities)},
    {"relationships", std::move(rels)}};
}

}  // namespace codegraph
