// iapi/driver/engine.cpp - Engine driver implementation
//
#include "iapi/driver/engine.hpp"

#include <utility>

#include "iapi/document/document_loader.hpp"
#include "iapi/sema/graph_builder.hpp"
#include "iapi/sema/reference_resolver.hpp"
#include "iapi/sema/schema_validator.hpp"

namespace iapi
{

ValidateResult Engine::validate(const Document & doc, const ValidateOptions & options)
{
  ValidateResult result;
  auto model = std::make_unique<SchemaModel>();

  // 1. Build the graph. Unknown kinds and malformed fields stop here.
  GraphBuilder builder(&result.diagnostics);
  if (!builder.build(doc, *model)) {
    result.diagnostics.sort_canonical();
    return result;
  }

  bool success = true;

  // 2. Resolve references. Keep going on failure: the validator skips
  //    unbound edges.
  ReferenceResolver resolver(*model, &result.diagnostics);
  if (!resolver.resolve()) {
    success = false;
  }

  // 3. Structural checks
  SchemaValidator validator(*model, &result.diagnostics);
  if (!validator.validate()) {
    success = false;
  }

  if (options.warnings_as_errors) {
    result.diagnostics.promote_warnings();
  }
  result.diagnostics.sort_canonical();

  result.success = success && !result.diagnostics.has_errors();
  if (result.success) {
    result.model = std::move(model);
  }
  return result;
}

ValidateResult Engine::validate_file(
  const std::filesystem::path & file, const ValidateOptions & options)
{
  LoadResult loaded = load_document(file);
  if (!loaded.success) {
    ValidateResult result;
    result.diagnostics.report_error(DiagnosticKind::Io, DocumentPath{}, loaded.error);
    return result;
  }
  return validate(loaded.document, options);
}

ProjectResult Engine::validate_project(const ProjectConfig & config, const ValidateOptions & options)
{
  ProjectResult result;

  if (config.validator.documents.empty()) {
    result.diagnostics.report_error(
      DiagnosticKind::Io, DocumentPath{}, "no documents defined in project configuration");
    return result;
  }

  ValidateOptions effective = options;
  effective.warnings_as_errors = options.warnings_as_errors || config.validator.warnings_as_errors;

  bool all_ok = true;
  for (const auto & rel : config.validator.documents) {
    const std::filesystem::path path = rel.is_absolute() ? rel : config.project_root / rel;

    DocumentReport report;
    report.path = path;
    report.result = validate_file(path, effective);
    all_ok = all_ok && report.result.success;
    result.documents.push_back(std::move(report));
  }

  result.success = all_ok;
  return result;
}

}  // namespace iapi
