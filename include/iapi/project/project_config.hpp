// iapi/project/project_config.hpp - Project configuration (iapi.yaml)
//
// Parses and validates iapi.yaml project configuration files.
// Used by the CLI and by Engine::validate_project.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace iapi
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Validator configuration section.
 */
struct ValidatorConfig
{
  /// Schema documents to validate (relative to iapi.yaml)
  std::vector<std::filesystem::path> documents;

  /// Treat warnings (e.g. deprecated feature usage) as errors
  bool warnings_as_errors = false;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (iapi.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  ValidatorConfig validator;

  /// Directory containing iapi.yaml (for resolving relative paths)
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
 * Load a project configuration from an iapi.yaml file.
 *
 * @param config_path Path to iapi.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to iapi.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "iapi.yaml";

}  // namespace iapi
