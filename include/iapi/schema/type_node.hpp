// iapi/schema/type_node.hpp - Type graph node representation
//
// Nodes are addressed by TypeId rather than nested by value, so recursive
// shapes (a struct holding an array of itself) stay finite.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "iapi/basic/document_path.hpp"

namespace iapi
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of a schema type, as spelled in the `type` field.
 */
enum class TypeKind : uint8_t {
  // Primitive types
  Null,    ///< no data
  Bool,    ///< true / false
  I32,     ///< 32 bit signed integer
  U32,     ///< 32 bit unsigned integer
  I64,     ///< 64 bit signed integer
  U64,     ///< 64 bit unsigned integer
  F64,     ///< 64 bit floating point
  Bytes,   ///< binary byte array
  String,  ///< utf-8 string

  // Containers
  Optional,  ///< present or absent
  Array,     ///< ordered sequence of one child type
  Struct,    ///< product of indexed members
  Enum,      ///< sum of indexed variants

  // Alias
  NamedType,  ///< reference to another declared type by name
};

/// Spelling used in documents ("i32", "namedType", ...)
[[nodiscard]] const char * type_kind_name(TypeKind kind) noexcept;

/// Parse a `type` field; nullopt for unsupported kinds
[[nodiscard]] std::optional<TypeKind> parse_type_kind(std::string_view name) noexcept;

[[nodiscard]] constexpr bool is_primitive(TypeKind kind) noexcept
{
  return kind <= TypeKind::String;
}

[[nodiscard]] constexpr bool has_members(TypeKind kind) noexcept
{
  return kind == TypeKind::Struct || kind == TypeKind::Enum;
}

[[nodiscard]] constexpr bool has_element(TypeKind kind) noexcept
{
  return kind == TypeKind::Optional || kind == TypeKind::Array;
}

// ============================================================================
// TypeId - Stable node handle
// ============================================================================

class TypeId
{
public:
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  /// Create an invalid id
  constexpr TypeId() noexcept : value_(k_invalid_value) {}

  constexpr explicit TypeId(uint32_t value) noexcept : value_(value) {}

  [[nodiscard]] static constexpr TypeId invalid() noexcept { return TypeId(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != k_invalid_value; }
  [[nodiscard]] constexpr uint32_t get_value() const noexcept { return value_; }

  [[nodiscard]] constexpr bool operator==(TypeId other) const noexcept
  {
    return value_ == other.value_;
  }
  [[nodiscard]] constexpr bool operator!=(TypeId other) const noexcept
  {
    return value_ != other.value_;
  }
  [[nodiscard]] constexpr bool operator<(TypeId other) const noexcept
  {
    return value_ < other.value_;
  }

private:
  uint32_t value_;
};

// ============================================================================
// Member
// ============================================================================

/**
 * A struct field or enum variant.
 */
struct Member
{
  std::string name;
  uint32_t index = 0;
  TypeId type;  ///< inline content node
  DocumentPath path;

  [[nodiscard]] bool operator==(const Member & other) const
  {
    return name == other.name && index == other.index && type == other.type &&
           path == other.path;
  }
  [[nodiscard]] bool operator!=(const Member & other) const { return !(*this == other); }
};

// ============================================================================
// TypeNode
// ============================================================================

struct TypeNode
{
  TypeId id;
  TypeKind kind = TypeKind::Null;

  /// Declared name, or a dotted display name for inline nodes
  std::string name;
  bool declared = false;

  std::optional<std::string> doc;
  DocumentPath path;

  /// For Optional/Array: element node
  TypeId element;

  /// For Struct/Enum: members in declaration order
  std::vector<Member> members;

  /// For NamedType: referenced name as written
  std::string alias_name;

  /// For NamedType, set by the resolver: first non-alias node in the chain
  TypeId target;

  [[nodiscard]] bool is_alias() const noexcept { return kind == TypeKind::NamedType; }
  [[nodiscard]] bool is_primitive() const noexcept { return iapi::is_primitive(kind); }

  /// Find a member by name
  [[nodiscard]] const Member * find_member(std::string_view member_name) const noexcept
  {
    for (const auto & m : members) {
      if (m.name == member_name) return &m;
    }
    return nullptr;
  }

  [[nodiscard]] bool operator==(const TypeNode & other) const
  {
    return id == other.id && kind == other.kind && name == other.name &&
           declared == other.declared && doc == other.doc && path == other.path &&
           element == other.element && members == other.members &&
           alias_name == other.alias_name && target == other.target;
  }
  [[nodiscard]] bool operator!=(const TypeNode & other) const { return !(*this == other); }
};

}  // namespace iapi
