// tests/unit/schema/test_type_graph.cpp - Unit tests for the type arena and namespace

#include <gtest/gtest.h>

#include <string>

#include "iapi/schema/type_graph.hpp"

using namespace iapi;

namespace
{

TypeNode make_node(const std::string & name, TypeKind kind)
{
  TypeNode node;
  node.kind = kind;
  node.name = name;
  node.declared = true;
  return node;
}

}  // namespace

TEST(TypeGraph, AddNodeAssignsDenseIds)
{
  TypeGraph graph;
  const TypeId a = graph.add_node(make_node("A", TypeKind::I32));
  const TypeId b = graph.add_node(make_node("B", TypeKind::String));

  EXPECT_EQ(a.get_value(), 0u);
  EXPECT_EQ(b.get_value(), 1u);
  EXPECT_EQ(graph.node(b).id, b);
  EXPECT_EQ(graph.size(), 2u);
}

TEST(TypeGraph, DeclareRejectsDuplicateName)
{
  TypeGraph graph;
  const TypeId first = graph.add_node(make_node("Item", TypeKind::I32));
  const TypeId second = graph.add_node(make_node("Item", TypeKind::String));

  EXPECT_TRUE(graph.declare("Item", first));
  EXPECT_FALSE(graph.declare("Item", second));

  ASSERT_EQ(graph.declared().size(), 1u);
  EXPECT_EQ(graph.declared()[0], first);
  EXPECT_EQ(graph.lookup("Item"), first);
  EXPECT_EQ(graph.lookup_node("Item")->kind, TypeKind::I32);
}

TEST(TypeGraph, DeclaredKeepsInsertionOrder)
{
  TypeGraph graph;
  const TypeId zeta = graph.add_node(make_node("zeta", TypeKind::Bool));
  const TypeId alpha = graph.add_node(make_node("alpha", TypeKind::Bool));
  ASSERT_TRUE(graph.declare("zeta", zeta));
  ASSERT_TRUE(graph.declare("alpha", alpha));

  ASSERT_EQ(graph.declared().size(), 2u);
  EXPECT_EQ(graph.declared()[0], zeta);
  EXPECT_EQ(graph.declared()[1], alpha);
}

TEST(TypeGraph, LookupOfUndeclaredNameIsInvalid)
{
  TypeGraph graph;
  graph.add_node(make_node("inline", TypeKind::I64));

  EXPECT_FALSE(graph.lookup("inline").is_valid());
  EXPECT_EQ(graph.lookup_node("inline"), nullptr);
  EXPECT_EQ(graph.find(TypeId::invalid()), nullptr);
  EXPECT_EQ(graph.find(TypeId(7)), nullptr);
}
