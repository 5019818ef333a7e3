// codegraph/project/project_config.cpp - codegraph.yaml loading
//
#include "codegraph/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace codegraph
{

namespace
{

/// Parse the 'validation' section into `out`
std::optional<std::string> parse_validation(const YAML::Node & node, ValidatorConfig & out)
{
  if (!node.IsMap()) {
    return "validation must be a map";
  }

  if (node["unresolved_severity"]) {
    const auto text = node["unresolved_severity"].as<std::string>();
    if (text == "off") {
      out.unresolved_severity = std::nullopt;
    } else if (const auto severity = parse_severity(text)) {
      out.unresolved_severity = *severity;
    } else {
      return "invalid validation.unresolved_severity: '" + text +
             "' (must be 'error', 'warning', 'info' or 'off')";
    }
  }

  if (node["type_compatibility"]) {
    const auto text = node["type_compatibility"].as<std::string>();
    const auto mode = parse_type_compatibility(text);
    if (!mode) {
      return "invalid validation.type_compatibility: '" + text +
             "' (must be 'exact', 'nominal' or 'off')";
    }
    out.type_compatibility = *mode;
  }

  if (node["missing_annotations"]) {
    out.report_missing_annotations = node["missing_annotations"].as<bool>();
  }

  if (node["incremental_hops"]) {
    const auto hops = node["incremental_hops"].as<int>();
    if (hops < 0) {
      return "validation.incremental_hops must not be negative";
    }
    out.incremental_hops = static_cast<uint32_t>(hops);
  }

  if (node["builtin_types"]) {
    if (!node["builtin_types"].IsSequence()) {
      return "validation.builtin_types must be a list";
    }
    out.builtin_types.clear();
    for (const auto & t : node["builtin_types"]) {
      out.builtin_types.insert(t.as<std::string>());
    }
  }

  if (node["any_type"]) {
    out.any_type = node["any_type"].as<std::string>();
  }

  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  try {
    if (root["project"]) {
      const auto & proj = root["project"];
      if (proj["name"]) {
        config.project.name = proj["name"].as<std::string>();
      }
      if (proj["payloads"]) {
        if (!proj["payloads"].IsSequence()) {
          return ConfigLoadResult::fail("project.payloads must be a list");
        }
        for (const auto & p : proj["payloads"]) {
          config.project.payloads.emplace_back(p.as<std::string>());
        }
      }
    }

    if (root["validation"]) {
      if (auto error = parse_validation(root["validation"], config.validation)) {
        return ConfigLoadResult::fail(std::move(*error));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::vector<std::filesystem::path> ProjectConfig::resolved_payloads() const
{
  std::vector<std::filesystem::path> result;
  result.reserve(project.payloads.size());
  for (const auto & p : project.payloads) {
    result.push_back(p.is_absolute() ? p : project_root / p);
  }
  return result;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root, fs::absolute(config_path).parent_path());
}

ConfigLoadResult parse_project_config(
  std::string_view yaml, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root, project_root);
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) break;
    current = parent;
  }

  return std::nullopt;
}

}  // namespace codegraph
