// iapi/document/document_loader.hpp - Read schema documents from JSON or YAML
//
// Turns raw bytes into the generic document tree consumed by the engine.
// Used by the CLI and the engine's file entry points.
//
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "iapi/document/field_reader.hpp"

namespace iapi
{

enum class DocumentFormat : uint8_t {
  Json,
  Yaml,
};

/**
 * Result of loading a document.
 */
struct LoadResult
{
  /// Loaded tree (only valid if success == true)
  Document document;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static LoadResult ok(Document doc)
  {
    LoadResult r;
    r.document = std::move(doc);
    r.success = true;
    return r;
  }

  static LoadResult fail(std::string msg)
  {
    LoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Guess the format from a file extension (.yaml / .yml -> Yaml, else Json).
 */
[[nodiscard]] DocumentFormat format_from_path(const std::filesystem::path & path);

/**
 * Parse a document held in memory.
 */
[[nodiscard]] LoadResult parse_document(const std::string & text, DocumentFormat format);

/**
 * Load a document from disk, choosing the format by extension.
 */
[[nodiscard]] LoadResult load_document(const std::filesystem::path & path);

}  // namespace iapi
