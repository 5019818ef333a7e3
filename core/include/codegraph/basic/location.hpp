// codegraph/basic/location.hpp - Source locations of graph entities
//
// Locations are reported by the extractor as "file:line:column" strings.
// The graph stores them verbatim; this header provides the parsed form.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace codegraph
{

/**
 * A position in a source file.
 *
 * Lines are 1-based; columns are 0-based (extractor convention). A line of 0
 * means "unknown line" and the location only names a file.
 */
struct Location
{
  std::string file;
  uint32_t line = 0;
  uint32_t column = 0;

  /// Check if this location names at least a file
  [[nodiscard]] bool is_valid() const noexcept { return !file.empty(); }

  /// Check if a line number is known
  [[nodiscard]] bool has_line() const noexcept { return line != 0; }

  /// Render as "file:line:column" (or "file" without a line)
  [[nodiscard]] std::string to_string() const;

  /**
   * Parse a location string.
   *
   * Accepts "file", "file:line" and "file:line:column". The file part may
   * itself contain ':' (drive letters); only trailing numeric fields are
   * consumed.
   *
   * @return std::nullopt for an empty string
   */
  [[nodiscard]] static std::optional<Location> parse(std::string_view text);

  [[nodiscard]] bool operator==(const Location & other) const noexcept
  {
    return file == other.file && line == other.line && column == other.column;
  }
  [[nodiscard]] bool operator!=(const Location & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] bool operator<(const Location & other) const noexcept
  {
    if (file != other.file) return file < other.file;
    if (line != other.line) return line < other.line;
    return column < other.column;
  }
};

}  // namespace codegraph
