// iapi/basic/document_path.hpp - Location of an element inside a schema document
//
// A DocumentPath plays the role a source range plays in a text frontend:
// it names the element a diagnostic is about, as the sequence of mapping
// keys leading to it from the document root (e.g. types.structItem.content.a).
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace iapi
{

// ============================================================================
// Top-level Document Keys
// ============================================================================

inline constexpr const char * k_wrapper_key = "inversionApiSpec";

inline constexpr const char * k_id_key = "id";
inline constexpr const char * k_title_key = "title";
inline constexpr const char * k_revision_key = "revision";
inline constexpr const char * k_error_type_key = "errorType";
inline constexpr const char * k_unique_key = "unique";
inline constexpr const char * k_features_key = "features";
inline constexpr const char * k_unstable_features_key = "unstableFeatures";
inline constexpr const char * k_types_key = "types";
inline constexpr const char * k_calls_out_key = "callsOut";
inline constexpr const char * k_calls_in_key = "callsIn";

/**
 * Top-level namespace a path belongs to.
 *
 * The enumerator order is the canonical diagnostic sort order.
 */
enum class DocumentNamespace : uint8_t {
  Header,  ///< id, title, revision, errorType, unique
  Features,
  UnstableFeatures,
  Types,
  CallsOut,
  CallsIn,
};

// ============================================================================
// DocumentPath
// ============================================================================

class DocumentPath
{
public:
  /// Create the root path
  DocumentPath() = default;

  explicit DocumentPath(std::vector<std::string> segments) : segments_(std::move(segments)) {}

  DocumentPath(std::initializer_list<std::string> segments) : segments_(segments) {}

  /// Path of a named child of this element
  [[nodiscard]] DocumentPath child(std::string_view segment) const;

  [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return segments_.size(); }

  [[nodiscard]] const std::vector<std::string> & segments() const noexcept { return segments_; }

  /// First segment (top-level key), empty for the root
  [[nodiscard]] std::string_view root() const noexcept;

  /**
   * Name of the top-level element the path points into.
   *
   * For paths inside a namespace mapping this is the entry key
   * (types.A.content -> "A"); for header fields it is the field itself.
   */
  [[nodiscard]] std::string_view element() const noexcept;

  /// Namespace of the first segment
  [[nodiscard]] DocumentNamespace get_namespace() const noexcept;

  /// Dotted form, "<root>" for the empty path
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const DocumentPath & other) const noexcept
  {
    return segments_ == other.segments_;
  }
  [[nodiscard]] bool operator!=(const DocumentPath & other) const noexcept
  {
    return segments_ != other.segments_;
  }
  [[nodiscard]] bool operator<(const DocumentPath & other) const noexcept
  {
    return segments_ < other.segments_;
  }

private:
  std::vector<std::string> segments_;
};

/// Map a top-level key to its namespace (unknown keys count as Header)
[[nodiscard]] DocumentNamespace namespace_of_key(std::string_view key) noexcept;

}  // namespace iapi
