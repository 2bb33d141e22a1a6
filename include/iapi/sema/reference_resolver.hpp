// iapi/sema/reference_resolver.hpp - Name -> node resolution with alias cycle detection
//
// This pass runs after GraphBuilder. It binds every name-based reference
// (namedType content, errorType, call input/output) to a node, so later
// traversal never needs a name lookup.
//
#pragma once

#include <cstddef>
#include <string_view>

#include "iapi/basic/diagnostic.hpp"
#include "iapi/schema/schema_model.hpp"

namespace iapi
{

/**
 * Resolve references in a SchemaModel in place.
 *
 * Alias chains are walked depth-first with three-color marking. A chain
 * that returns to an in-progress alias is an alias cycle. Chains stop at
 * the first non-alias node, so recursion through struct, enum, array or
 * optional is never a cycle here.
 *
 * After a successful run every alias node's `target` is the first non-alias
 * node of its chain. Unresolved or cyclic aliases keep an invalid target.
 */
class ReferenceResolver
{
public:
  explicit ReferenceResolver(SchemaModel & model, DiagnosticBag * diags = nullptr)
  : model_(model), diags_(diags)
  {
  }

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Resolve all references. Continues past errors to report all of them.
   *
   * @return true if no errors occurred
   */
  bool resolve();

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void resolve_aliases();
  void resolve_error_type();
  void resolve_call(CallEntry & call);

  /// Bind a type name used outside the types namespace
  TypeId bind_name(std::string_view name, const DocumentPath & path, std::string_view referrer);

  void report_unresolved(
    const DocumentPath & path, std::string_view referrer, std::string_view missing);

  SchemaModel & model_;
  DiagnosticBag * diags_;
  DiagnosticBag pass_diags_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace iapi
