// iapi/sema/graph_builder.hpp - Document tree -> unresolved SchemaModel
//
// First pass. Reads the header, the feature namespaces, the types namespace
// and the call tables. Container children become node edges; alias targets
// and type names used by calls and errorType stay as names for the
// ReferenceResolver.
//
#pragma once

#include <cstddef>
#include <string>

#include "iapi/basic/diagnostic.hpp"
#include "iapi/document/field_reader.hpp"
#include "iapi/schema/schema_model.hpp"

namespace iapi
{

/**
 * Builds the type graph and the feature/call tables from a document.
 *
 * Unknown `type` kinds and malformed fields are fatal to the document, but
 * the builder finishes its sweep first so all of them are reported together.
 * Member indices are captured verbatim; their uniqueness is checked later.
 */
class GraphBuilder
{
public:
  explicit GraphBuilder(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Build a model from a document (bare, or wrapped in `inversionApiSpec`).
   *
   * @param doc The document tree
   * @param out Model to populate (should be default-constructed)
   * @return true if the document could be modeled without errors
   */
  bool build(const Document & doc, SchemaModel & out);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void build_header(FieldReader & reader, const Document & spec, SchemaModel & out);
  void build_features(FieldReader & reader, const Document & spec, SchemaModel & out);
  void build_types(FieldReader & reader, const Document & spec, SchemaModel & out);
  void build_calls(
    FieldReader & reader, const Document & spec, CallDirection direction, SchemaModel & out);

  /**
   * Build one (possibly inline) type definition and its children.
   *
   * @return the new node id, invalid if the definition could not be modeled
   */
  TypeId build_type(
    FieldReader & reader, const Document & def, const DocumentPath & path,
    const std::string & display_name, bool declared, TypeGraph & graph);

  void report_unknown_kind(
    const DocumentPath & path, const std::string & kind, const std::string & display_name);

  [[nodiscard]] DiagnosticBag & sink() noexcept { return diags_ ? *diags_ : scratch_; }

  DiagnosticBag * diags_ = nullptr;
  DiagnosticBag scratch_;
  size_t error_count_ = 0;
};

/**
 * Strip the optional single-key `inversionApiSpec` wrapper.
 *
 * @return the inner mapping when the wrapper is present, the argument otherwise
 */
[[nodiscard]] const Document & unwrap_document(const Document & doc);

}  // namespace iapi
