// iapi/basic/diagnostic.cpp - Diagnostic implementation
#include "iapi/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace iapi
{

const char * diagnostic_code(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::MalformedField:
      return "E0001";
    case DiagnosticKind::UnknownKind:
      return "E0002";
    case DiagnosticKind::CyclicAlias:
      return "E0003";
    case DiagnosticKind::UnresolvedReference:
      return "E0004";
    case DiagnosticKind::DuplicateIndex:
      return "E0005";
    case DiagnosticKind::InvalidErrorType:
      return "E0006";
    case DiagnosticKind::DuplicateFeature:
      return "E0007";
    case DiagnosticKind::UnboundCall:
      return "E0008";
    case DiagnosticKind::FutureStabilization:
      return "E0009";
    case DiagnosticKind::DeprecatedFeature:
      return "W0001";
    case DiagnosticKind::Io:
      return "E0100";
  }
  return "E0000";
}

const char * diagnostic_kind_name(DiagnosticKind kind) noexcept
{
  switch (kind) {
    case DiagnosticKind::MalformedField:
      return "MalformedFieldError";
    case DiagnosticKind::UnknownKind:
      return "UnknownKindError";
    case DiagnosticKind::CyclicAlias:
      return "CyclicAliasError";
    case DiagnosticKind::UnresolvedReference:
      return "UnresolvedReferenceError";
    case DiagnosticKind::DuplicateIndex:
      return "DuplicateIndexError";
    case DiagnosticKind::InvalidErrorType:
      return "InvalidErrorTypeError";
    case DiagnosticKind::DuplicateFeature:
      return "DuplicateFeatureError";
    case DiagnosticKind::UnboundCall:
      return "UnboundCallError";
    case DiagnosticKind::FutureStabilization:
      return "FutureStabilizationError";
    case DiagnosticKind::DeprecatedFeature:
      return "DeprecatedFeatureWarning";
    case DiagnosticKind::Io:
      return "IoError";
  }
  return "UnknownDiagnostic";
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

DocumentPath Diagnostic::primary_path() const
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->path;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  DocumentPath path, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{std::move(path), std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(DocumentPath path, std::string msg)
{
  return with_label(std::move(path), std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic make_diagnostic(
  Severity severity, DiagnosticKind kind, DocumentPath path, std::string message,
  std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.kind = kind;
  d.code = diagnostic_code(kind);
  d.message = std::move(message);
  d.labels.push_back(Label{std::move(path), std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report_error(
  DiagnosticKind kind, DocumentPath path, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(
             Severity::Error, kind, std::move(path), std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  DiagnosticKind kind, DocumentPath path, std::string message, std::string label_message)
{
  return {
    *this,
    make_diagnostic(
      Severity::Warning, kind, std::move(path), std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

size_t DiagnosticBag::count(DiagnosticKind kind) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [kind](const Diagnostic & d) { return d.kind == kind; }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

void DiagnosticBag::sort_canonical()
{
  std::stable_sort(
    diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & a, const Diagnostic & b) {
      const DocumentPath pa = a.primary_path();
      const DocumentPath pb = b.primary_path();
      if (pa.get_namespace() != pb.get_namespace()) {
        return pa.get_namespace() < pb.get_namespace();
      }
      if (pa.element() != pb.element()) {
        return pa.element() < pb.element();
      }
      return a.kind < b.kind;
    });
}

void DiagnosticBag::promote_warnings()
{
  for (auto & d : diagnostics_) {
    if (d.severity == Severity::Warning) {
      d.severity = Severity::Error;
    }
  }
}

}  // namespace iapi
