// iapi/schema/model_json.cpp - JSON serialization implementation
//
#include "iapi/schema/model_json.hpp"

#include <string>
#include <utility>

#include "iapi/basic/document_path.hpp"

namespace iapi
{
namespace
{

using json = Document;

// ============================================================================
// Helper functions
// ============================================================================

json j_name(const TypeNode * node)
{
  if (!node) return nullptr;
  return node->name;
}

json j_type(const TypeGraph & graph, TypeId id)
{
  const TypeNode * t = graph.find(id);
  if (!t) return json{{"kind", "unresolved"}};

  json j{{"kind", type_kind_name(t->kind)}};
  if (t->doc) {
    j["doc"] = *t->doc;
  }

  if (has_element(t->kind)) {
    j["content"] = j_type(graph, t->element);
  } else if (has_members(t->kind)) {
    json members = json::array();
    for (const Member & m : t->members) {
      members.push_back(json{{"name", m.name}, {"index", m.index}, {"content", j_type(graph, m.type)}});
    }
    j["members"] = std::move(members);
  } else if (t->is_alias()) {
    const TypeNode * target = graph.canonical_node(t->id);
    j["name"] = t->alias_name;
    j["resolved"] = j_name(target);
    j["resolvedKind"] = target ? json(type_kind_name(target->kind)) : json(nullptr);
  }
  return j;
}

json j_feature(const FeatureDef & f)
{
  json j{{"name", f.name}, {"stable", f.is_stable()}};
  if (f.doc) {
    j["doc"] = *f.doc;
  }
  if (f.is_stable()) {
    j["stabilizedRevision"] = f.stabilized_revision;
    j["deprecated"] = f.deprecated;
  }
  return j;
}

json j_calls(const SchemaModel & model, CallDirection direction)
{
  json calls = json::object();
  for (const CallEntry & call : model.calls(direction)) {
    json j{{"feature", call.feature}, {"input", call.input}, {"output", call.output}};
    if (auto result = model.call_result(call)) {
      // Declared names as written, with the alias-stripped names beside them.
      j["result"] = json{
        {"output", j_name(model.types.find(result->output))},
        {"resolvedOutput", j_name(model.types.canonical_node(result->output))},
        {"error", j_name(model.types.find(result->error))},
        {"resolvedError", j_name(model.types.canonical_node(result->error))}};
    } else {
      j["result"] = nullptr;
    }
    calls[call.name] = std::move(j);
  }
  return calls;
}

}  // namespace

Document model_to_json(const SchemaModel & model)
{
  json types = json::object();
  for (TypeId id : model.types.declared()) {
    types[model.types.node(id).name] = j_type(model.types, id);
  }

  json stable = json::array();
  json unstable = json::array();
  for (const FeatureDef & f : model.features.all()) {
    (f.is_stable() ? stable : unstable).push_back(j_feature(f));
  }

  return json{
    {k_id_key, model.header.id},
    {k_title_key, model.header.title},
    {k_revision_key, model.header.revision},
    {k_error_type_key, model.header.error_type_name},
    {k_unique_key, model.header.unique},
    {k_features_key, std::move(stable)},
    {k_unstable_features_key, std::move(unstable)},
    {k_types_key, std::move(types)},
    {k_calls_out_key, j_calls(model, CallDirection::Out)},
    {k_calls_in_key, j_calls(model, CallDirection::In)}};
}

}  // namespace iapi
