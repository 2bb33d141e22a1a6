// iapi/document/field_reader.hpp - Minimal read contract over a document tree
//
// The engine never walks the raw tree directly. Everything it needs is:
// read a named field of a mapping, iterate a mapping in insertion order,
// and read a scalar as string / unsigned integer / boolean. Shape errors
// are reported as MalformedField diagnostics carrying the field path.
//
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "iapi/basic/diagnostic.hpp"

namespace iapi
{

/// Generic mapping/sequence/scalar tree. Mappings keep insertion order.
using Document = nlohmann::ordered_json;

/**
 * Whether a missing field is reported.
 */
enum class Presence : uint8_t {
  Required,
  Optional,
};

class FieldReader
{
public:
  explicit FieldReader(DiagnosticBag & diags) : diags_(diags) {}

  /**
   * Look up a field of a mapping.
   *
   * @return the field, or nullptr when absent (reported if Required)
   */
  const Document * field(
    const Document & mapping, std::string_view key, const DocumentPath & path,
    Presence presence = Presence::Required);

  std::optional<std::string> read_string(
    const Document & mapping, std::string_view key, const DocumentPath & path,
    Presence presence = Presence::Required);

  /// Non-negative integer that fits in 32 bits
  std::optional<uint32_t> read_uint(
    const Document & mapping, std::string_view key, const DocumentPath & path,
    Presence presence = Presence::Required);

  std::optional<bool> read_bool(
    const Document & mapping, std::string_view key, const DocumentPath & path,
    Presence presence = Presence::Required);

  /**
   * Read a field that must be a mapping.
   *
   * @return the mapping, or nullptr when absent or not a mapping
   */
  const Document * read_mapping(
    const Document & mapping, std::string_view key, const DocumentPath & path,
    Presence presence = Presence::Required);

  /// Check that a node is a mapping, reporting it otherwise
  bool expect_mapping(const Document & node, const DocumentPath & path);

  /**
   * Visit each entry of a mapping in insertion order.
   *
   * fn(key, value, path_of_entry)
   */
  template <typename Fn>
  void for_each_entry(const Document & mapping, const DocumentPath & path, Fn && fn)
  {
    if (!expect_mapping(mapping, path)) {
      return;
    }
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
      fn(it.key(), it.value(), path.child(it.key()));
    }
  }

  /// Report a field of the wrong shape
  void report_malformed(const DocumentPath & path, std::string_view expected, const Document & got);

  /// Report a required field that is absent
  void report_missing(const DocumentPath & path);

  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }
  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }

private:
  DiagnosticBag & diags_;
  size_t error_count_ = 0;
};

}  // namespace iapi
