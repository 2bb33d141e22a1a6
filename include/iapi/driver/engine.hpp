// iapi/driver/engine.hpp - Validation engine driver
//
// Single entry point for the Builder -> Resolver -> Validator pipeline.
// Used by the CLI and can be embedded in generators or other tooling.
//
#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "iapi/basic/diagnostic.hpp"
#include "iapi/document/field_reader.hpp"
#include "iapi/project/project_config.hpp"
#include "iapi/schema/schema_model.hpp"

namespace iapi
{

// ============================================================================
// Validate Options
// ============================================================================

struct ValidateOptions
{
  /// Treat warnings as errors (overrides project config when set)
  bool warnings_as_errors = false;
};

// ============================================================================
// Validate Result
// ============================================================================

struct ValidateResult
{
  /// Whether the document is valid (no errors)
  bool success = false;

  /// Collected diagnostics in canonical order
  DiagnosticBag diagnostics;

  /// Resolved model (only set when success == true)
  std::unique_ptr<SchemaModel> model;
};

/**
 * Result for one document of a project.
 */
struct DocumentReport
{
  std::filesystem::path path;
  ValidateResult result;
};

struct ProjectResult
{
  /// Whether every document is valid
  bool success = false;

  std::vector<DocumentReport> documents;

  /// Project-level problems (e.g. no documents configured)
  DiagnosticBag diagnostics;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * Engine driver that orchestrates the validation pipeline.
 *
 * The pipeline consists of:
 * 1. Graph building (fatal on unknown kinds / malformed fields)
 * 2. Reference resolution (alias cycles, dangling names)
 * 3. Structural validation
 *
 * Steps 2 and 3 both run whenever step 1 succeeds so that one run reports
 * every problem. Each call owns its model; concurrent calls on different
 * documents need no synchronization.
 */
class Engine
{
public:
  /**
   * Validate an in-memory document.
   */
  [[nodiscard]] static ValidateResult validate(
    const Document & doc, const ValidateOptions & options = {});

  /**
   * Load a JSON/YAML document from disk and validate it.
   *
   * Load failures are reported as a single IoError diagnostic.
   */
  [[nodiscard]] static ValidateResult validate_file(
    const std::filesystem::path & file, const ValidateOptions & options = {});

  /**
   * Validate every document listed in a project configuration.
   *
   * @param config Project configuration (from iapi.yaml)
   * @param options Validate options (warnings_as_errors is OR-ed with the config)
   */
  [[nodiscard]] static ProjectResult validate_project(
    const ProjectConfig & config, const ValidateOptions & options = {});
};

}  // namespace iapi
