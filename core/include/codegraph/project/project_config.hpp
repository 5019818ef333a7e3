// codegraph/project/project_config.hpp - Project configuration (codegraph.yaml)
//
// Parses and validates codegraph.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "codegraph/validate/validator_config.hpp"

namespace codegraph
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Project metadata section.
 */
struct ProjectSection
{
  std::string name;

  /// Extraction payloads checked when none are given on the command line
  std::vector<std::filesystem::path> payloads;
};

/**
 * Complete project configuration (codegraph.yaml).
 */
struct ProjectConfig
{
  ProjectSection project;
  ValidatorConfig validation;

  /// Directory containing codegraph.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Payload paths resolved against project_root
  [[nodiscard]] std::vector<std::filesystem::path> resolved_payloads() const;
};

// ============================================================================
// Load Result
// ============================================================================

/**
 * Outcome of reading codegraph.yaml. `config` holds defaults unless success.
 */
struct ConfigLoadResult
{
  ProjectConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Loading
// ============================================================================

/// Read and validate a codegraph.yaml file; its directory becomes project_root
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text.
 *
 * @param yaml Document text
 * @param project_root Directory relative payload paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml, const std::filesystem::path & project_root);

/**
 * Nearest codegraph.yaml in `start_dir` or one of its ancestors.
 *
 * A file argument starts the search from its directory.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "codegraph.yaml";

}  // namespace codegraph
