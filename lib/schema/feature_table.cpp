// iapi/schema/feature_table.cpp - FeatureTable implementation
//
#include "iapi/schema/feature_table.hpp"

#include <utility>

namespace iapi
{

bool FeatureTable::define(FeatureDef def)
{
  auto it = index_.find(def.name);
  if (it != index_.end()) {
    collisions_.push_back(FeatureCollision{def.name, features_[it->second].path, def.path});
    return false;
  }

  index_.emplace(def.name, features_.size());
  features_.push_back(std::move(def));
  return true;
}

const FeatureDef * FeatureTable::lookup(std::string_view name) const
{
  auto it = index_.find(name);
  return it != index_.end() ? &features_[it->second] : nullptr;
}

std::vector<const FeatureDef *> FeatureTable::with_stability(Stability stability) const
{
  std::vector<const FeatureDef *> out;
  for (const auto & f : features_) {
    if (f.stability == stability) {
      out.push_back(&f);
    }
  }
  return out;
}

}  // namespace iapi
