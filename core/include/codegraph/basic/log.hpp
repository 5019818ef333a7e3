// codegraph/basic/log.hpp - Leveled progress logging to stderr
//
// Uses fmt for formatting. The threshold is process-wide and set once by
// the driver (e.g. `cgc -v`); library code only emits messages.
//
#pragma once

#include <fmt/core.h>

#include <cstdint>
#include <string_view>
#include <utility>

namespace codegraph::log
{

enum class Level : uint8_t {
  Error,
  Warn,
  Info,
  Debug,
};

/// Set the most verbose level that is still printed (default: Warn)
void set_level(Level level) noexcept;

/// Get the current threshold
[[nodiscard]] Level level() noexcept;

/// Check whether a message at `lvl` would be printed
[[nodiscard]] inline bool enabled(Level lvl) noexcept
{
  return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level());
}

/// Write one already-formatted line
void write(Level lvl, std::string_view message);

template <typename... Args>
void error(fmt::format_string<Args...> format, Args &&... args)
{
  if (enabled(Level::Error)) write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args &&... args)
{
  if (enabled(Level::Warn)) write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args &&... args)
{
  if (enabled(Level::Info)) write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args &&... args)
{
  if (enabled(Level::Debug)) write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace codegraph::log
