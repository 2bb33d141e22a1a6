// iapi/basic/diagnostic.hpp - Diagnostic types for building/resolving/validating
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "iapi/basic/document_path.hpp"

namespace iapi
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * What went wrong. Each kind has a stable code (see diagnostic_code()).
 *
 * Enumerator order is the tie-break order used when sorting diagnostics.
 */
enum class DiagnosticKind : uint8_t {
  MalformedField,       ///< E0001 field present with the wrong shape, or missing
  UnknownKind,          ///< E0002 unsupported `type` string
  CyclicAlias,          ///< E0003 namedType chain that loops back on itself
  UnresolvedReference,  ///< E0004 name not declared in `types`
  DuplicateIndex,       ///< E0005 two struct/enum members share an index
  InvalidErrorType,     ///< E0006 errorType is not a struct
  DuplicateFeature,     ///< E0007 name in both features and unstableFeatures
  UnboundCall,          ///< E0008 call names an undeclared feature
  FutureStabilization,  ///< E0009 stablizedRevision > document revision
  DeprecatedFeature,    ///< W0001 call bound to a deprecated feature
  Io,                   ///< E0100 document could not be loaded
};

/// Stable code for a kind, e.g. "E0005"
[[nodiscard]] const char * diagnostic_code(DiagnosticKind kind) noexcept;

/// Taxonomy name for a kind, e.g. "DuplicateIndexError"
[[nodiscard]] const char * diagnostic_kind_name(DiagnosticKind kind) noexcept;

enum class LabelStyle {
  Primary,    // the element the diagnostic is about
  Secondary,  // related elements
};

struct Label
{
  DocumentPath path;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticKind kind = DiagnosticKind::MalformedField;
  std::string code;     // e.g., "E0004"
  std::string message;  // main message

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] DocumentPath primary_path() const;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and registers it with the
 * bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_label(
    DocumentPath path, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(DocumentPath path, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    DiagnosticKind kind, DocumentPath path, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    DiagnosticKind kind, DocumentPath path, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// Number of diagnostics of the given kind
  [[nodiscard]] size_t count(DiagnosticKind kind) const;
  [[nodiscard]] bool has_kind(DiagnosticKind kind) const { return count(kind) > 0; }

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  /**
   * Sort into canonical order: namespace, then element name, then kind.
   * Stable, so equal keys keep their emission order.
   */
  void sort_canonical();

  /// Raise every warning to an error (warnings-as-errors)
  void promote_warnings();

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace iapi
