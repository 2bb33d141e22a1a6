// iapi/basic/document_path.cpp - DocumentPath implementation
//
#include "iapi/basic/document_path.hpp"

namespace iapi
{

DocumentPath DocumentPath::child(std::string_view segment) const
{
  DocumentPath out(segments_);
  out.segments_.emplace_back(segment);
  return out;
}

std::string_view DocumentPath::root() const noexcept
{
  if (segments_.empty()) {
    return {};
  }
  return segments_.front();
}

std::string_view DocumentPath::element() const noexcept
{
  if (segments_.empty()) {
    return {};
  }
  if (segments_.size() == 1 || get_namespace() == DocumentNamespace::Header) {
    return segments_.front();
  }
  return segments_[1];
}

DocumentNamespace DocumentPath::get_namespace() const noexcept { return namespace_of_key(root()); }

std::string DocumentPath::to_string() const
{
  if (segments_.empty()) {
    return "<root>";
  }

  std::string out;
  for (size_t i = 0; i < segments_.size(); ++i) {
    if (i > 0) out += '.';
    out += segments_[i];
  }
  return out;
}

DocumentNamespace namespace_of_key(std::string_view key) noexcept
{
  if (key == k_features_key) return DocumentNamespace::Features;
  if (key == k_unstable_features_key) return DocumentNamespace::UnstableFeatures;
  if (key == k_types_key) return DocumentNamespace::Types;
  if (key == k_calls_out_key) return DocumentNamespace::CallsOut;
  if (key == k_calls_in_key) return DocumentNamespace::CallsIn;
  return DocumentNamespace::Header;
}

}  // namespace iapi
