// codegraph/basic/location.cpp - Location parsing
//
#include "codegraph/basic/location.hpp"

#include <charconv>

namespace codegraph
{

namespace
{

/// Split off a trailing ":<digits>" field. Returns false if there is none.
bool take_numeric_suffix(std::string_view & text, uint32_t & out)
{
  const size_t colon = text.rfind(':');
  if (colon == std::string_view::npos || colon + 1 >= text.size()) {
    return false;
  }

  const std::string_view digits = text.substr(colon + 1);
  uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return false;
  }

  out = value;
  text = text.substr(0, colon);
  return true;
}

}  // namespace

std::string Location::to_string() const
{
  if (!has_line()) {
    return file;
  }
  return file + ":" + std::to_string(line) + ":" + std::to_string(column);
}

std::optional<Location> Location::parse(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }

  Location loc;
  uint32_t last = 0;
  if (take_numeric_suffix(text, last)) {
    uint32_t first = 0;
    if (take_numeric_suffix(text, first)) {
      loc.line = first;
      loc.column = last;
    } else {
      loc.line = last;
    }
  }
  loc.file = std::string(text);
  return loc;
}

}  // namespace codegraph
