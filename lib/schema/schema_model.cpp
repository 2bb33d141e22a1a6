// iapi/schema/schema_model.cpp - SchemaModel queries
//
#include "iapi/schema/schema_model.hpp"

namespace iapi
{

const char * call_direction_key(CallDirection direction) noexcept
{
  return direction == CallDirection::In ? k_calls_in_key : k_calls_out_key;
}

const CallEntry * SchemaModel::find_call(CallDirection direction, std::string_view name) const
{
  for (const auto & c : calls(direction)) {
    if (c.name == name) {
      return &c;
    }
  }
  return nullptr;
}

std::optional<CallResult> SchemaModel::call_result(const CallEntry & call) const
{
  if (!call.output_type.is_valid() || !error_type.is_valid()) {
    return std::nullopt;
  }
  return CallResult{call.output_type, error_type};
}

}  // namespace iapi
