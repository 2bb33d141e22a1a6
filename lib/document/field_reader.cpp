// iapi/document/field_reader.cpp - FieldReader implementation
//
#include "iapi/document/field_reader.hpp"

#include <limits>

namespace iapi
{

const Document * FieldReader::field(
  const Document & mapping, std::string_view key, const DocumentPath & path, Presence presence)
{
  const DocumentPath field_path = path.child(key);
  if (!mapping.is_object()) {
    report_malformed(path, "mapping", mapping);
    return nullptr;
  }

  auto it = mapping.find(std::string(key));
  if (it == mapping.end()) {
    if (presence == Presence::Required) {
      report_missing(field_path);
    }
    return nullptr;
  }
  return &*it;
}

std::optional<std::string> FieldReader::read_string(
  const Document & mapping, std::string_view key, const DocumentPath & path, Presence presence)
{
  const Document * value = field(mapping, key, path, presence);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    report_malformed(path.child(key), "string", *value);
    return std::nullopt;
  }
  return value->get<std::string>();
}

std::optional<uint32_t> FieldReader::read_uint(
  const Document & mapping, std::string_view key, const DocumentPath & path, Presence presence)
{
  const Document * value = field(mapping, key, path, presence);
  if (value == nullptr) {
    return std::nullopt;
  }

  // Parsed literals are number_unsigned when non-negative; trees built in code
  // may hold a signed integer of either sign.
  if (!value->is_number_integer() ||
      (!value->is_number_unsigned() && value->get<int64_t>() < 0)) {
    report_malformed(path.child(key), "non-negative integer", *value);
    return std::nullopt;
  }
  const auto raw = value->get<uint64_t>();
  if (raw > std::numeric_limits<uint32_t>::max()) {
    report_malformed(path.child(key), "non-negative 32-bit integer", *value);
    return std::nullopt;
  }
  return static_cast<uint32_t>(raw);
}

std::optional<bool> FieldReader::read_bool(
  const Document & mapping, std::string_view key, const DocumentPath & path, Presence presence)
{
  const Document * value = field(mapping, key, path, presence);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_boolean()) {
    report_malformed(path.child(key), "boolean", *value);
    return std::nullopt;
  }
  return value->get<bool>();
}

const Document * FieldReader::read_mapping(
  const Document & mapping, std::string_view key, const DocumentPath & path, Presence presence)
{
  const Document * value = field(mapping, key, path, presence);
  if (value == nullptr) {
    return nullptr;
  }
  if (!expect_mapping(*value, path.child(key))) {
    return nullptr;
  }
  return value;
}

bool FieldReader::expect_mapping(const Document & node, const DocumentPath & path)
{
  if (node.is_object()) {
    return true;
  }
  report_malformed(path, "mapping", node);
  return false;
}

void FieldReader::report_malformed(
  const DocumentPath & path, std::string_view expected, const Document & got)
{
  ++error_count_;
  const std::string name = path.empty() ? std::string("document") : path.segments().back();
  diags_
    .report_error(
      DiagnosticKind::MalformedField, path,
      "malformed field '" + name + "': expected " + std::string(expected) + ", found " +
        got.type_name())
    .with_help("expected " + std::string(expected));
}

void FieldReader::report_missing(const DocumentPath & path)
{
  ++error_count_;
  const std::string name = path.empty() ? std::string("document") : path.segments().back();
  diags_.report_error(
    DiagnosticKind::MalformedField, path, "missing required field '" + name + "'",
    "expected to be present");
}

}  // namespace iapi
