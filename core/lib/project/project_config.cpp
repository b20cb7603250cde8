// dockspan/project/project_config.cpp - Project configuration implementation
//
#include "dockspan/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace dockspan
{

namespace
{

/// Parse the 'output' section
std::optional<std::string> parse_output(const YAML::Node & node, OutputConfig & out)
{
  if (!node.IsMap()) {
    return "output must be a map";
  }

  if (node["format"]) {
    const auto format = node["format"].as<std::string>();
    if (format == "json") {
      out.format = OutputFormat::Json;
    } else if (format == "summary") {
      out.format = OutputFormat::Summary;
    } else {
      return "invalid output.format: '" + format + "' (must be 'json' or 'summary')";
    }
  }

  if (node["indent"]) {
    out.indent = node["indent"].as<int>();
    if (out.indent < 0) {
      return "output.indent must not be negative";
    }
  }

  if (node["color"]) {
    const auto color = node["color"].as<std::string>();
    if (color == "auto") {
      out.color = ColorMode::Auto;
    } else if (color == "always") {
      out.color = ColorMode::Always;
    } else if (color == "never") {
      out.color = ColorMode::Never;
    } else {
      return "invalid output.color: '" + color + "' (must be 'auto', 'always' or 'never')";
    }
  }

  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  ProjectConfig config;

  // An empty document keeps every default
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  if (root["output"]) {
    if (auto error = parse_output(root["output"], config.output)) {
      return ConfigLoadResult::fail(std::move(*error));
    }
  }

  if (root["parse"]) {
    const auto & parse = root["parse"];
    if (!parse.IsMap()) {
      return ConfigLoadResult::fail("parse must be a map");
    }
    if (parse["recover"]) {
      config.parse.recover = parse["recover"].as<bool>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(std::string_view yaml_text)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  ConfigLoadResult result;
  try {
    result = parse_root(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace dockspan
