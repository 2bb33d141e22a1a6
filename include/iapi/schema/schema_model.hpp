// iapi/schema/schema_model.hpp - Queryable model of one schema document
//
// Produced by GraphBuilder (names unresolved), completed in place by
// ReferenceResolver, checked by SchemaValidator. Callers only ever see a
// model whose diagnostics contained no errors.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "iapi/basic/document_path.hpp"
#include "iapi/schema/feature_table.hpp"
#include "iapi/schema/type_graph.hpp"

namespace iapi
{

// ============================================================================
// Document Header
// ============================================================================

struct DocumentHeader
{
  std::string id;
  std::string title;
  uint32_t revision = 0;
  std::string error_type_name;

  /// Opaque pass-through; absent in the document means false
  bool unique = false;

  [[nodiscard]] bool operator==(const DocumentHeader & other) const
  {
    return id == other.id && title == other.title && revision == other.revision &&
           error_type_name == other.error_type_name && unique == other.unique;
  }
  [[nodiscard]] bool operator!=(const DocumentHeader & other) const { return !(*this == other); }
};

// ============================================================================
// Calls
// ============================================================================

enum class CallDirection : uint8_t {
  Out,  ///< callsOut: the binding calls out to its owner
  In,   ///< callsIn: the owner calls into the binding
};

[[nodiscard]] const char * call_direction_key(CallDirection direction) noexcept;

/**
 * A call binding: feature plus input and output type names.
 */
struct CallEntry
{
  std::string name;
  CallDirection direction = CallDirection::In;
  std::string feature;
  std::string input;
  std::string output;

  /// Bound by the resolver (the declared node, possibly an alias)
  TypeId input_type;
  TypeId output_type;

  DocumentPath path;

  [[nodiscard]] bool operator==(const CallEntry & other) const
  {
    return name == other.name && direction == other.direction && feature == other.feature &&
           input == other.input && output == other.output && input_type == other.input_type &&
           output_type == other.output_type && path == other.path;
  }
  [[nodiscard]] bool operator!=(const CallEntry & other) const { return !(*this == other); }
};

/**
 * Effective result of a call: exactly one of {output, error} per invocation.
 */
struct CallResult
{
  TypeId output;
  TypeId error;
};

// ============================================================================
// SchemaModel
// ============================================================================

struct SchemaModel
{
  DocumentHeader header;
  TypeGraph types;
  FeatureTable features;
  std::vector<CallEntry> calls_out;
  std::vector<CallEntry> calls_in;

  /// Declared node named by errorType (bound by the resolver)
  TypeId error_type;

  // ===========================================================================
  // Queries
  // ===========================================================================

  /// Declared type by name
  [[nodiscard]] const TypeNode * find_type(std::string_view name) const
  {
    return types.lookup_node(name);
  }

  /// Declared type by name with aliases stripped
  [[nodiscard]] const TypeNode * resolve_type(std::string_view name) const
  {
    return types.canonical_node(types.lookup(name));
  }

  /// The error type with aliases stripped
  [[nodiscard]] const TypeNode * error_type_node() const
  {
    return types.canonical_node(error_type);
  }

  [[nodiscard]] const FeatureDef * find_feature(std::string_view name) const
  {
    return features.lookup(name);
  }

  [[nodiscard]] std::vector<const FeatureDef *> stable_features() const
  {
    return features.with_stability(Stability::Stable);
  }

  [[nodiscard]] std::vector<const FeatureDef *> unstable_features() const
  {
    return features.with_stability(Stability::Unstable);
  }

  [[nodiscard]] const std::vector<CallEntry> & calls(CallDirection direction) const noexcept
  {
    return direction == CallDirection::In ? calls_in : calls_out;
  }

  [[nodiscard]] const CallEntry * find_call(CallDirection direction, std::string_view name) const;

  /**
   * Effective result of a call: its output type or the document error type.
   *
   * @return nullopt if either side is unbound
   */
  [[nodiscard]] std::optional<CallResult> call_result(const CallEntry & call) const;

  [[nodiscard]] bool operator==(const SchemaModel & other) const
  {
    return header == other.header && types == other.types && features == other.features &&
           calls_out == other.calls_out && calls_in == other.calls_in &&
           error_type == other.error_type;
  }
  [[nodiscard]] bool operator!=(const SchemaModel & other) const { return !(*this == other); }
};

}  // namespace iapi
