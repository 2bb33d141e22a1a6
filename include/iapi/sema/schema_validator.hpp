// iapi/sema/schema_validator.hpp - Structural checks over a resolved model
//
// Runs after ReferenceResolver. Each check is independent; all of them run
// and their diagnostics accumulate. Edges the resolver could not bind are
// skipped (their cause is already reported).
//
#pragma once

#include <cstddef>

#include "iapi/basic/diagnostic.hpp"
#include "iapi/schema/schema_model.hpp"

namespace iapi
{

/**
 * Validate a resolved SchemaModel.
 *
 * Checks:
 * - member indices are unique within each struct/enum
 * - errorType is a struct
 * - no feature name is both stable and unstable
 * - every call names a declared feature
 * - no stable feature stabilized after the document revision
 * - calls bound to deprecated features (warning)
 *
 * Diagnostics are emitted in canonical order (namespace, element, kind).
 */
class SchemaValidator
{
public:
  explicit SchemaValidator(const SchemaModel & model, DiagnosticBag * diags = nullptr)
  : model_(model), diags_(diags)
  {
  }

  /**
   * Run all checks.
   *
   * @return true if no errors occurred (warnings do not count)
   */
  bool validate();

  // Individual checks
  void check_member_indices();
  void check_error_type();
  void check_feature_namespaces();
  void check_stabilization();
  void check_calls();

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }
  [[nodiscard]] size_t warning_count() const noexcept { return warning_count_; }

private:
  void check_call(const CallEntry & call);

  const SchemaModel & model_;
  DiagnosticBag * diags_;
  DiagnosticBag pass_diags_;

  size_t error_count_ = 0;
  size_t warning_count_ = 0;
};

}  // namespace iapi
