// iapi/sema/graph_builder.cpp - Type graph construction
//
#include "iapi/sema/graph_builder.hpp"

#include <utility>

namespace iapi
{

namespace
{

std::string supported_kinds_help()
{
  return "supported kinds: null, bool, i32, u32, i64, u64, f64, bytes, string, optional, array, "
         "struct, enum, namedType";
}

}  // namespace

const Document & unwrap_document(const Document & doc)
{
  if (doc.is_object() && doc.size() == 1) {
    auto it = doc.find(k_wrapper_key);
    if (it != doc.end()) {
      return *it;
    }
  }
  return doc;
}

// ============================================================================
// Entry Point
// ============================================================================

bool GraphBuilder::build(const Document & doc, SchemaModel & out)
{
  error_count_ = 0;

  FieldReader reader(sink());
  const Document & spec = unwrap_document(doc);

  if (reader.expect_mapping(spec, DocumentPath{})) {
    build_header(reader, spec, out);
    build_features(reader, spec, out);
    build_types(reader, spec, out);
    build_calls(reader, spec, CallDirection::Out, out);
    build_calls(reader, spec, CallDirection::In, out);
  }

  error_count_ += reader.error_count();
  return error_count_ == 0;
}

// ============================================================================
// Sections
// ============================================================================

void GraphBuilder::build_header(FieldReader & reader, const Document & spec, SchemaModel & out)
{
  const DocumentPath root;

  if (auto id = reader.read_string(spec, k_id_key, root)) {
    out.header.id = std::move(*id);
  }
  if (auto title = reader.read_string(spec, k_title_key, root)) {
    out.header.title = std::move(*title);
  }
  if (auto revision = reader.read_uint(spec, k_revision_key, root)) {
    out.header.revision = *revision;
  }
  if (auto error_type = reader.read_string(spec, k_error_type_key, root)) {
    out.header.error_type_name = std::move(*error_type);
  }
  if (auto unique = reader.read_bool(spec, k_unique_key, root, Presence::Optional)) {
    out.header.unique = *unique;
  }
}

void GraphBuilder::build_features(FieldReader & reader, const Document & spec, SchemaModel & out)
{
  const DocumentPath root;

  if (const Document * stable =
        reader.read_mapping(spec, k_features_key, root, Presence::Optional)) {
    reader.for_each_entry(
      *stable, root.child(k_features_key),
      [&](const std::string & name, const Document & def, const DocumentPath & path) {
        if (!reader.expect_mapping(def, path)) return;

        FeatureDef f;
        f.name = name;
        f.stability = Stability::Stable;
        f.path = path;
        f.doc = reader.read_string(def, "doc", path, Presence::Optional);
        if (auto rev = reader.read_uint(def, "stablizedRevision", path)) {
          f.stabilized_revision = *rev;
        }
        if (auto deprecated = reader.read_bool(def, "deprecated", path, Presence::Optional)) {
          f.deprecated = *deprecated;
        }
        out.features.define(std::move(f));
      });
  }

  if (const Document * unstable =
        reader.read_mapping(spec, k_unstable_features_key, root, Presence::Optional)) {
    reader.for_each_entry(
      *unstable, root.child(k_unstable_features_key),
      [&](const std::string & name, const Document & def, const DocumentPath & path) {
        if (!reader.expect_mapping(def, path)) return;

        FeatureDef f;
        f.name = name;
        f.stability = Stability::Unstable;
        f.path = path;
        f.doc = reader.read_string(def, "doc", path, Presence::Optional);
        // A losing definition is kept as a collision; the validator reports it.
        out.features.define(std::move(f));
      });
  }
}

void GraphBuilder::build_types(FieldReader & reader, const Document & spec, SchemaModel & out)
{
  const DocumentPath root;

  const Document * types = reader.read_mapping(spec, k_types_key, root, Presence::Optional);
  if (types == nullptr) {
    return;
  }

  reader.for_each_entry(
    *types, root.child(k_types_key),
    [&](const std::string & name, const Document & def, const DocumentPath & path) {
      const TypeId id = build_type(reader, def, path, name, true, out.types);
      if (id.is_valid()) {
        out.types.declare(name, id);
      }
    });
}

void GraphBuilder::build_calls(
  FieldReader & reader, const Document & spec, CallDirection direction, SchemaModel & out)
{
  const DocumentPath root;
  const char * key = call_direction_key(direction);

  const Document * calls = reader.read_mapping(spec, key, root, Presence::Optional);
  if (calls == nullptr) {
    return;
  }

  auto & table = direction == CallDirection::In ? out.calls_in : out.calls_out;
  reader.for_each_entry(
    *calls, root.child(key),
    [&](const std::string & name, const Document & def, const DocumentPath & path) {
      if (!reader.expect_mapping(def, path)) return;

      CallEntry call;
      call.name = name;
      call.direction = direction;
      call.path = path;
      call.feature = reader.read_string(def, "feature", path).value_or("");
      call.input = reader.read_string(def, "input", path).value_or("");
      call.output = reader.read_string(def, "output", path).value_or("");
      table.push_back(std::move(call));
    });
}

// ============================================================================
// Type Definitions
// ============================================================================

TypeId GraphBuilder::build_type(
  FieldReader & reader, const Document & def, const DocumentPath & path,
  const std::string & display_name, bool declared, TypeGraph & graph)
{
  if (!reader.expect_mapping(def, path)) {
    return TypeId::invalid();
  }

  const auto kind_name = reader.read_string(def, "type", path);
  if (!kind_name) {
    return TypeId::invalid();
  }

  const auto kind = parse_type_kind(*kind_name);
  if (!kind) {
    report_unknown_kind(path.child("type"), *kind_name, display_name);
    return TypeId::invalid();
  }

  TypeNode node;
  node.kind = *kind;
  node.name = display_name;
  node.declared = declared;
  node.path = path;
  node.doc = reader.read_string(def, "doc", path, Presence::Optional);

  // Reserve the id before the children so ids follow document order.
  const TypeId id = graph.add_node(std::move(node));

  switch (*kind) {
    case TypeKind::Optional:
    case TypeKind::Array: {
      const Document * content = reader.field(def, "content", path);
      if (content == nullptr) break;
      const std::string child_name = display_name + (*kind == TypeKind::Array ? "[]" : "?");
      const TypeId element =
        build_type(reader, *content, path.child("content"), child_name, false, graph);
      graph.node(id).element = element;
      break;
    }

    case TypeKind::Struct:
    case TypeKind::Enum: {
      const Document * content = reader.read_mapping(def, "content", path);
      if (content == nullptr) break;
      reader.for_each_entry(
        *content, path.child("content"),
        [&](const std::string & member_name, const Document & member_def,
            const DocumentPath & member_path) {
          if (!reader.expect_mapping(member_def, member_path)) return;

          Member m;
          m.name = member_name;
          m.path = member_path;
          if (auto index = reader.read_uint(member_def, "index", member_path)) {
            m.index = *index;
          }
          if (const Document * member_content = reader.field(member_def, "content", member_path)) {
            m.type = build_type(
              reader, *member_content, member_path.child("content"),
              display_name + "." + member_name, false, graph);
          }
          graph.node(id).members.push_back(std::move(m));
        });
      break;
    }

    case TypeKind::NamedType: {
      if (auto target = reader.read_string(def, "content", path)) {
        graph.node(id).alias_name = std::move(*target);
      }
      break;
    }

    default:
      // Primitives carry no children.
      break;
  }

  return id;
}

void GraphBuilder::report_unknown_kind(
  const DocumentPath & path, const std::string & kind, const std::string & display_name)
{
  ++error_count_;
  sink()
    .report_error(
      DiagnosticKind::UnknownKind, path,
      "unknown type kind '" + kind + "' for type '" + display_name + "'")
    .with_help(supported_kinds_help());
}

}  // namespace iapi
