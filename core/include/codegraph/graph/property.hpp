// codegraph/graph/property.hpp - Property values carried by nodes and edges
//
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace codegraph
{

using StringList = std::vector<std::string>;

/**
 * A single property value.
 *
 * The value set mirrors what property-graph backends store natively.
 * Construct through the typed setters below; a bare string literal would
 * otherwise convert to bool.
 */
using PropertyValue = std::variant<bool, int64_t, std::string, StringList>;

/// Ordered so that diffs and serialized output are deterministic.
using PropertyMap = std::map<std::string, PropertyValue, std::less<>>;

// ============================================================================
// Setters
// ============================================================================

inline void set_string(PropertyMap & props, std::string key, std::string value)
{
  props.insert_or_assign(std::move(key), PropertyValue{std::move(value)});
}

inline void set_int(PropertyMap & props, std::string key, int64_t value)
{
  props.insert_or_assign(std::move(key), PropertyValue{value});
}

inline void set_bool(PropertyMap & props, std::string key, bool value)
{
  props.insert_or_assign(std::move(key), PropertyValue{value});
}

inline void set_list(PropertyMap & props, std::string key, StringList value)
{
  props.insert_or_assign(std::move(key), PropertyValue{std::move(value)});
}

// ============================================================================
// Getters
// ============================================================================

[[nodiscard]] inline const PropertyValue * find_property(
  const PropertyMap & props, std::string_view key)
{
  const auto it = props.find(key);
  return it != props.end() ? &it->second : nullptr;
}

[[nodiscard]] inline std::optional<std::string_view> get_string(
  const PropertyMap & props, std::string_view key)
{
  if (const auto * v = find_property(props, key)) {
    if (const auto * s = std::get_if<std::string>(v)) return std::string_view(*s);
  }
  return std::nullopt;
}

[[nodiscard]] inline std::optional<int64_t> get_int(const PropertyMap & props, std::string_view key)
{
  if (const auto * v = find_property(props, key)) {
    if (const auto * i = std::get_if<int64_t>(v)) return *i;
  }
  return std::nullopt;
}

[[nodiscard]] inline bool get_bool(
  const PropertyMap & props, std::string_view key, bool fallback = false)
{
  if (const auto * v = find_property(props, key)) {
    if (const auto * b = std::get_if<bool>(v)) return *b;
  }
  return fallback;
}

/// Returns nullptr if the property is missing or not a list
[[nodiscard]] inline const StringList * get_list(const PropertyMap & props, std::string_view key)
{
  if (const auto * v = find_property(props, key)) {
    return std::get_if<StringList>(v);
  }
  return nullptr;
}

/// Human-readable rendering (lists as `[a, b]`)
[[nodiscard]] std::string to_display_string(const PropertyValue & value);

}  // namespace codegraph
