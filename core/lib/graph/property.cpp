// codegraph/graph/property.cpp - Property value rendering
//
#include "codegraph/graph/property.hpp"

#include <fmt/format.h>

namespace codegraph
{

std::string to_display_string(const PropertyValue & value)
{
  if (const auto * b = std::get_if<bool>(&value)) {
    return *b ? "true" : "false";
  }
  if (const auto * i = std::get_if<int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto * s = std::get_if<std::string>(&value)) {
    return *s;
  }
  const auto & list = std::get<StringList>(value);
  return fmt::format("[{}]", fmt::join(list, ", "));
}

}  // namespace codegraph
