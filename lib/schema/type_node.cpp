// iapi/schema/type_node.cpp - TypeKind spelling
//
#include "iapi/schema/type_node.hpp"

#include <array>
#include <utility>

namespace iapi
{

namespace
{

constexpr std::array<std::pair<std::string_view, TypeKind>, 14> k_kind_names = {{
  {"null", TypeKind::Null},
  {"bool", TypeKind::Bool},
  {"i32", TypeKind::I32},
  {"u32", TypeKind::U32},
  {"i64", TypeKind::I64},
  {"u64", TypeKind::U64},
  {"f64", TypeKind::F64},
  {"bytes", TypeKind::Bytes},
  {"string", TypeKind::String},
  {"optional", TypeKind::Optional},
  {"array", TypeKind::Array},
  {"struct", TypeKind::Struct},
  {"enum", TypeKind::Enum},
  {"namedType", TypeKind::NamedType},
}};

}  // namespace

const char * type_kind_name(TypeKind kind) noexcept
{
  for (const auto & [name, k] : k_kind_names) {
    if (k == kind) {
      return name.data();
    }
  }
  return "?";
}

std::optional<TypeKind> parse_type_kind(std::string_view name) noexcept
{
  for (const auto & [spelling, k] : k_kind_names) {
    if (spelling == name) {
      return k;
    }
  }
  return std::nullopt;
}

}  // namespace iapi
