// iapi/schema/model_json.hpp - JSON serialization for resolved models
//
// Emits a normalized view of a SchemaModel: aliases annotated with their
// resolved kind, calls annotated with their effective result. Used by
// `iapi dump` and handy for snapshot tests.
//
#pragma once

#include "iapi/document/field_reader.hpp"
#include "iapi/schema/schema_model.hpp"

namespace iapi
{

/**
 * Serialize a model to JSON.
 *
 * Key order follows document order, so equal models produce byte-identical
 * output.
 *
 * @param model The model to serialize
 * @return JSON representation of the model
 */
[[nodiscard]] Document model_to_json(const SchemaModel & model);

}  // namespace iapi
