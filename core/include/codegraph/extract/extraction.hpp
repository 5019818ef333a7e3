// codegraph/extract/extraction.hpp - Raw extractor output for one module
//
// An extractor (language-specific, out of process or linked in) reports the
// entities and relationships it found in one source unit. The builder turns
// a payload into graph mutations; nothing here is validated yet.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "codegraph/graph/graph_enums.hpp"
#include "codegraph/graph/property.hpp"

namespace codegraph
{

/**
 * One program entity as reported by an extractor.
 *
 * Only the fields relevant to the entity's kind are meaningful.
 */
struct RawEntity
{
  /// Payload-local handle used by relationship endpoints (defaults to qualified_name)
  std::string key;

  NodeKind kind = NodeKind::Variable;
  std::string name;
  std::string qualified_name;

  /// "file:line:column"
  std::string location;

  /// Declared type text; empty when unannotated
  std::string type_annotation;

  Visibility visibility = Visibility::Public;
  std::vector<std::string> decorators;

  // Parameter
  std::optional<int64_t> position;
  ParamKind param_kind = ParamKind::Positional;
  bool has_default = false;

  // CallSite
  std::string callee;
  int64_t arg_count = 0;
  std::vector<std::string> keyword_args;
  std::vector<std::string> arg_types;

  /// Extra extractor attributes carried through as node properties
  PropertyMap attributes;

  /// Key used by relationships (key, or qualified_name when unset)
  [[nodiscard]] const std::string & effective_key() const
  {
    return key.empty() ? qualified_name : key;
  }
};

/**
 * One relationship as reported by an extractor.
 *
 * `from` must name an entity of the same payload. `to` names an entity of
 * the same payload or, if no such key exists, the qualified name of an
 * entity in another module (of kind `to_kind`, or the default target kind
 * of the edge kind).
 */
struct RawRelationship
{
  EdgeKind kind = EdgeKind::References;
  std::string from;
  std::string to;
  std::optional<NodeKind> to_kind;

  std::optional<int64_t> arg_count;
  std::string access_kind;
  std::optional<int64_t> position;
  std::string alias;
  std::string value_type;
  std::string expected_type;
};

/// Everything an extractor reported for one module
struct ExtractionPayload
{
  std::string module_id;
  std::vector<RawEntity> entities;
  std::vector<RawRelationship> relationships;
};

}  // namespace codegraph
