// codegraph/basic/log.cpp - Logging sink
//
#include "codegraph/basic/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace codegraph::log
{

namespace
{

std::atomic<Level> g_level{Level::Warn};
std::mutex g_write_mutex;

const char * level_tag(Level lvl)
{
  switch (lvl) {
    case Level::Error:
      return "error";
    case Level::Warn:
      return "warn";
    case Level::Info:
      return "info";
    case Level::Debug:
      return "debug";
  }
  return "log";
}

}  // namespace

void set_level(Level lvl) noexcept { g_level.store(lvl, std::memory_order_relaxed); }

Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

void write(Level lvl, std::string_view message)
{
  // Builders for different modules may log concurrently; keep lines whole.
  const std::lock_guard<std::mutex> lock(g_write_mutex);
  fmt::print(stderr, "codegraph [{}] {}\n", level_tag(lvl), message);
}

}  // namespace codegraph::log
