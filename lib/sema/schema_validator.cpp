// iapi/sema/schema_validator.cpp - Structural schema checks
//
#include "iapi/sema/schema_validator.hpp"

#include <map>
#include <string>
#include <utility>

namespace iapi
{

bool SchemaValidator::validate()
{
  error_count_ = 0;
  warning_count_ = 0;
  pass_diags_ = DiagnosticBag{};

  check_feature_namespaces();
  check_stabilization();
  check_member_indices();
  check_error_type();
  check_calls();

  pass_diags_.sort_canonical();
  if (diags_) {
    diags_->merge(std::move(pass_diags_));
  }
  return error_count_ == 0;
}

// ============================================================================
// Types
// ============================================================================

void SchemaValidator::check_member_indices()
{
  for (const TypeNode & node : model_.types.nodes()) {
    if (!has_members(node.kind)) continue;

    std::map<uint32_t, const Member *> first_by_index;
    for (const Member & m : node.members) {
      auto [it, inserted] = first_by_index.emplace(m.index, &m);
      if (inserted) continue;

      const Member & first = *it->second;
      ++error_count_;
      pass_diags_
        .report_error(
          DiagnosticKind::DuplicateIndex, m.path,
          "duplicate index " + std::to_string(m.index) + " in " + type_kind_name(node.kind) +
            " '" + node.name + "': '" + first.name + "' and '" + m.name + "'",
          "index " + std::to_string(m.index) + " already used")
        .with_secondary_label(first.path, "first used here")
        .with_help("indices are never reused or renumbered; pick an unused index");
    }
  }
}

void SchemaValidator::check_error_type()
{
  if (!model_.error_type.is_valid()) {
    return;  // unresolved name, reported by the resolver
  }

  const TypeNode * resolved = model_.types.canonical_node(model_.error_type);
  if (resolved == nullptr) {
    return;  // alias into a dangling or cyclic chain
  }
  if (resolved->kind == TypeKind::Struct) {
    return;
  }

  ++error_count_;
  pass_diags_
    .report_error(
      DiagnosticKind::InvalidErrorType, DocumentPath{k_error_type_key},
      "errorType '" + model_.header.error_type_name + "' must be a struct, found " +
        type_kind_name(resolved->kind),
      "not a struct")
    .with_secondary_label(resolved->path, "declared here")
    .with_help("every call may fail with a value of the error type; declare it as a struct");
}

// ============================================================================
// Features
// ============================================================================

void SchemaValidator::check_feature_namespaces()
{
  for (const FeatureCollision & c : model_.features.collisions()) {
    ++error_count_;
    pass_diags_
      .report_error(
        DiagnosticKind::DuplicateFeature, c.second,
        "feature '" + c.name + "' is declared more than once across features and "
                               "unstableFeatures",
        "duplicate definition")
      .with_secondary_label(c.first, "first defined here");
  }
}

void SchemaValidator::check_stabilization()
{
  const uint32_t revision = model_.header.revision;
  for (const FeatureDef * f : model_.stable_features()) {
    if (f->stabilized_revision <= revision) continue;

    ++error_count_;
    pass_diags_
      .report_error(
        DiagnosticKind::FutureStabilization, f->path.child("stablizedRevision"),
        "feature '" + f->name + "' is stabilized at revision " +
          std::to_string(f->stabilized_revision) + ", after the document revision " +
          std::to_string(revision),
        "later than document revision")
      .with_help("a feature cannot stabilize after the revision the document describes");
  }
}

// ============================================================================
// Calls
// ============================================================================

void SchemaValidator::check_calls()
{
  for (const CallEntry & call : model_.calls_out) {
    check_call(call);
  }
  for (const CallEntry & call : model_.calls_in) {
    check_call(call);
  }
}

void SchemaValidator::check_call(const CallEntry & call)
{
  const FeatureDef * feature = model_.find_feature(call.feature);
  if (feature == nullptr) {
    ++error_count_;
    pass_diags_
      .report_error(
        DiagnosticKind::UnboundCall, call.path.child("feature"),
        "call '" + call.name + "' references undeclared feature '" + call.feature + "'",
        "not found in features or unstableFeatures")
      .with_help("declare '" + call.feature + "' under features or unstableFeatures");
    return;
  }

  if (feature->is_stable() && feature->deprecated) {
    ++warning_count_;
    pass_diags_
      .report_warning(
        DiagnosticKind::DeprecatedFeature, call.path.child("feature"),
        "call '" + call.name + "' is bound to deprecated feature '" + feature->name + "'")
      .with_secondary_label(feature->path, "deprecated here");
  }
}

}  // namespace iapi
