// iapi/schema/type_graph.cpp - TypeGraph implementation
//
#include "iapi/schema/type_graph.hpp"

#include <utility>

namespace iapi
{

TypeId TypeGraph::add_node(TypeNode node)
{
  const TypeId id(static_cast<uint32_t>(nodes_.size()));
  node.id = id;
  nodes_.push_back(std::move(node));
  return id;
}

bool TypeGraph::declare(const std::string & name, TypeId id)
{
  const bool inserted = names_.emplace(name, id).second;
  if (inserted) {
    declared_.push_back(id);
  }
  return inserted;
}

const TypeNode * TypeGraph::find(TypeId id) const noexcept
{
  if (!id.is_valid() || id.get_value() >= nodes_.size()) {
    return nullptr;
  }
  return &nodes_[id.get_value()];
}

TypeId TypeGraph::lookup(std::string_view name) const
{
  auto it = names_.find(name);
  return it != names_.end() ? it->second : TypeId::invalid();
}

const TypeNode * TypeGraph::lookup_node(std::string_view name) const
{
  return find(lookup(name));
}

TypeId TypeGraph::canonical(TypeId id) const noexcept
{
  const TypeNode * n = find(id);
  if (n == nullptr) {
    return TypeId::invalid();
  }
  // The resolver collapses alias chains, so one hop reaches a non-alias.
  return n->is_alias() ? n->target : id;
}

}  // namespace iapi
