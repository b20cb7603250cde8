// dockspan/project/project_config.hpp - Project configuration (dockspan.yaml)
//
// Parses and validates dockspan.yaml configuration files for the CLI.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dockspan
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Json,     ///< full record dump
  Summary,  ///< one line per instruction
};

enum class ColorMode : uint8_t {
  Auto,    ///< colors when stderr is a terminal
  Always,
  Never,
};

/**
 * Output section.
 */
struct OutputConfig
{
  OutputFormat format = OutputFormat::Json;

  /// JSON indentation width
  int indent = 2;

  ColorMode color = ColorMode::Auto;
};

/**
 * Parse section.
 */
struct ParseConfig
{
  /// Continue after an instruction fails to parse
  bool recover = true;
};

/**
 * Complete project configuration (dockspan.yaml).
 */
struct ProjectConfig
{
  OutputConfig output;
  ParseConfig parse;

  /// Directory containing dockspan.yaml (empty for built-in defaults)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a dockspan.yaml file.
 *
 * @param config_path Path to dockspan.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Missing keys keep their defaults.
 *
 * @param yaml_text Contents of a dockspan.yaml file
 */
[[nodiscard]] ConfigLoadResult parse_project_config(std::string_view yaml_text);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * Searches for dockspan.yaml starting from start_dir and moving up the
 * directory hierarchy until the filesystem root.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to dockspan.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "dockspan.yaml";

}  // namespace dockspan
