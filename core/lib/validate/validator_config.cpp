// codegraph/validate/validator_config.cpp - Validation policy
//
#include "codegraph/validate/validator_config.hpp"

namespace codegraph
{

std::string_view to_string(TypeCompatibility mode) noexcept
{
  switch (mode) {
    case TypeCompatibility::Exact:
      return "exact";
    case TypeCompatibility::Nominal:
      return "nominal";
    case TypeCompatibility::Off:
      return "off";
  }
  return "nominal";
}

std::optional<TypeCompatibility> parse_type_compatibility(std::string_view text) noexcept
{
  if (text == "exact") return TypeCompatibility::Exact;
  if (text == "nominal") return TypeCompatibility::Nominal;
  if (text == "off") return TypeCompatibility::Off;
  return std::nullopt;
}

}  // namespace codegraph
