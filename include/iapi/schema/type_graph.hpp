// iapi/schema/type_graph.hpp - Node arena and type namespace
//
// Owns every TypeNode of a document (declared and inline) and maps declared
// names to node ids.
//
#pragma once

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "iapi/schema/type_node.hpp"

namespace iapi
{

/**
 * Type graph for one document.
 *
 * Ids are dense and assigned in insertion order. Node storage uses a deque
 * so references handed out stay valid while the builder keeps adding nodes.
 */
class TypeGraph
{
public:
  TypeGraph() = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /**
   * Add a node to the arena.
   *
   * @return the id assigned to the node (also stored in node.id)
   */
  TypeId add_node(TypeNode node);

  /**
   * Bind a declared name to a node.
   *
   * @return true if bound, false if the name already exists
   */
  bool declare(const std::string & name, TypeId id);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /// Node by id (id must be valid and in range)
  [[nodiscard]] TypeNode & node(TypeId id) { return nodes_[id.get_value()]; }
  [[nodiscard]] const TypeNode & node(TypeId id) const { return nodes_[id.get_value()]; }

  /// Node by id, nullptr for invalid or out-of-range ids
  [[nodiscard]] const TypeNode * find(TypeId id) const noexcept;

  /// Declared node id by name, invalid if not declared
  [[nodiscard]] TypeId lookup(std::string_view name) const;

  /// Declared node by name, nullptr if not declared
  [[nodiscard]] const TypeNode * lookup_node(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name).is_valid(); }

  /**
   * Strip aliases: the node itself for non-aliases, the resolved target for
   * aliases. Invalid for an alias the resolver could not bind.
   */
  [[nodiscard]] TypeId canonical(TypeId id) const noexcept;

  [[nodiscard]] const TypeNode * canonical_node(TypeId id) const noexcept
  {
    return find(canonical(id));
  }

  // ===========================================================================
  // Iteration
  // ===========================================================================

  /// Declared node ids in document order
  [[nodiscard]] const std::vector<TypeId> & declared() const noexcept { return declared_; }

  /// All nodes in id order
  [[nodiscard]] const std::deque<TypeNode> & nodes() const noexcept { return nodes_; }

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

  [[nodiscard]] bool operator==(const TypeGraph & other) const
  {
    return nodes_ == other.nodes_ && names_ == other.names_ && declared_ == other.declared_;
  }
  [[nodiscard]] bool operator!=(const TypeGraph & other) const { return !(*this == other); }

private:
  std::deque<TypeNode> nodes_;
  std::map<std::string, TypeId, std::less<>> names_;
  std::vector<TypeId> declared_;
};

}  // namespace iapi
