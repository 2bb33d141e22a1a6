// iapi/schema/feature_table.hpp - Unified stable/unstable feature namespace
//
// `features` and `unstableFeatures` share one namespace. Both are kept in a
// single table tagged by stability, so a name can only ever be defined once;
// the losing definition is recorded as a collision for the validator.
//
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "iapi/basic/document_path.hpp"

namespace iapi
{

enum class Stability : uint8_t {
  Stable,
  Unstable,
};

/**
 * A feature (operation) definition.
 */
struct FeatureDef
{
  std::string name;
  std::optional<std::string> doc;
  Stability stability = Stability::Unstable;

  /// Stable only: revision at which the feature joined the stable contract
  uint32_t stabilized_revision = 0;

  /// Stable only: implementations may no longer support it
  bool deprecated = false;

  DocumentPath path;

  [[nodiscard]] bool is_stable() const noexcept { return stability == Stability::Stable; }

  [[nodiscard]] bool operator==(const FeatureDef & other) const
  {
    return name == other.name && doc == other.doc && stability == other.stability &&
           stabilized_revision == other.stabilized_revision &&
           deprecated == other.deprecated && path == other.path;
  }
  [[nodiscard]] bool operator!=(const FeatureDef & other) const { return !(*this == other); }
};

/**
 * A second definition of an already-defined feature name.
 */
struct FeatureCollision
{
  std::string name;
  DocumentPath first;
  DocumentPath second;

  [[nodiscard]] bool operator==(const FeatureCollision & other) const
  {
    return name == other.name && first == other.first && second == other.second;
  }
};

class FeatureTable
{
public:
  FeatureTable() = default;

  /**
   * Define a feature.
   *
   * @return true if defined, false if the name already exists (the collision
   *         is recorded and the existing definition kept)
   */
  bool define(FeatureDef def);

  /// Look up by name, nullptr if undefined
  [[nodiscard]] const FeatureDef * lookup(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  /// Definitions in insertion order (stable namespace first)
  [[nodiscard]] const std::vector<FeatureDef> & all() const noexcept { return features_; }

  [[nodiscard]] std::vector<const FeatureDef *> with_stability(Stability stability) const;

  [[nodiscard]] const std::vector<FeatureCollision> & collisions() const noexcept
  {
    return collisions_;
  }

  [[nodiscard]] size_t size() const noexcept { return features_.size(); }
  [[nodiscard]] bool empty() const noexcept { return features_.empty(); }

  [[nodiscard]] bool operator==(const FeatureTable & other) const
  {
    return features_ == other.features_ && collisions_ == other.collisions_;
  }
  [[nodiscard]] bool operator!=(const FeatureTable & other) const { return !(*this == other); }

private:
  std::vector<FeatureDef> features_;
  std::map<std::string, size_t, std::less<>> index_;
  std::vector<FeatureCollision> collisions_;
};

}  // namespace iapi
