// tests/unit/sema/test_reference_resolver.cpp - Unit tests for reference resolution
//
// Alias chains terminate at a non-alias node; loops among aliases are
// reported once per cycle regardless of declaration order.

#include <gtest/gtest.h>

#include <string>

#include "iapi/sema/graph_builder.hpp"
#include "iapi/sema/reference_resolver.hpp"
#include "iapi/test_support/fixture.hpp"

using namespace iapi;
using test_support::has_error_containing;
using test_support::parse_json;

namespace
{

std::string doc_with(const std::string & types, const std::string & error_type = "Err")
{
  return R"({"id": "t", "title": "T", "revision": 1, "errorType": ")" + error_type +
         R"(", "types": )" + types + "}";
}

const std::string k_err = R"("Err": {"type": "struct", "content": {}})";

struct Resolved
{
  SchemaModel model;
  DiagnosticBag diags;
  bool ok = false;
};

Resolved build_and_resolve(const std::string & text)
{
  Resolved r;
  GraphBuilder builder(&r.diags);
  EXPECT_TRUE(builder.build(parse_json(text), r.model));
  ReferenceResolver resolver(r.model, &r.diags);
  r.ok = resolver.resolve();
  return r;
}

}  // namespace

TEST(ReferenceResolver, FixtureResolvesCleanly)
{
  Resolved r = build_and_resolve(test_support::k_kv_fixture);
  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());

  const TypeNode * resolved = r.model.resolve_type("namedTypeItem");
  ASSERT_NE(resolved, nullptr);
  EXPECT_EQ(resolved->kind, TypeKind::Enum);
  EXPECT_EQ(resolved->name, "enumItem");

  ASSERT_NE(r.model.error_type_node(), nullptr);
  EXPECT_EQ(r.model.error_type_node()->name, "structItem");
}

TEST(ReferenceResolver, AliasChainResolvesToFirstNonAlias)
{
  Resolved r = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "A": {"type": "namedType", "content": "B"},
      "B": {"type": "namedType", "content": "C"},
      "C": {"type": "u64"}})"));
  ASSERT_TRUE(r.ok);

  const TypeNode * a = r.model.find_type("A");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->target, r.model.types.lookup("C"));
  EXPECT_EQ(r.model.find_type("B")->target, r.model.types.lookup("C"));
}

TEST(ReferenceResolver, TwoAliasCycleIsReportedOnce)
{
  Resolved r = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "A": {"type": "namedType", "content": "B"},
      "B": {"type": "namedType", "content": "A"}})"));

  EXPECT_FALSE(r.ok);
  ASSERT_EQ(r.diags.count(DiagnosticKind::CyclicAlias), 1u);
  EXPECT_EQ(r.diags.size(), 1u);
  EXPECT_TRUE(has_error_containing(r.diags, "cyclic type alias: A -> B -> A"));
  EXPECT_FALSE(r.model.find_type("A")->target.is_valid());
  EXPECT_FALSE(r.model.find_type("B")->target.is_valid());
}

TEST(ReferenceResolver, CycleReportIsIndependentOfDeclarationOrder)
{
  Resolved forward = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "A": {"type": "namedType", "content": "B"},
      "B": {"type": "namedType", "content": "A"}})"));
  Resolved reversed = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "B": {"type": "namedType", "content": "A"},
      "A": {"type": "namedType", "content": "B"}})"));

  ASSERT_EQ(forward.diags.size(), 1u);
  ASSERT_EQ(reversed.diags.size(), 1u);
  EXPECT_EQ(forward.diags.all()[0].message, reversed.diags.all()[0].message);
  EXPECT_EQ(
    forward.diags.all()[0].primary_path().to_string(),
    reversed.diags.all()[0].primary_path().to_string());
}

TEST(ReferenceResolver, SelfAliasIsACycle)
{
  Resolved r = build_and_resolve(
    doc_with("{" + k_err + R"(, "A": {"type": "namedType", "content": "A"}})"));

  EXPECT_FALSE(r.ok);
  EXPECT_TRUE(has_error_containing(r.diags, "cyclic type alias: A -> A"));
}

TEST(ReferenceResolver, AliasIntoCycleIsReportedOnlyAsTheCycle)
{
  Resolved r = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "X": {"type": "namedType", "content": "A"},
      "A": {"type": "namedType", "content": "B"},
      "B": {"type": "namedType", "content": "A"}})"));

  EXPECT_EQ(r.diags.size(), 1u);
  EXPECT_EQ(r.diags.count(DiagnosticKind::CyclicAlias), 1u);
  EXPECT_FALSE(r.model.find_type("X")->target.is_valid());
}

TEST(ReferenceResolver, RecursionThroughContainerIsNotACycle)
{
  Resolved r = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "List": {"type": "struct", "content": {
        "next": {"index": 0, "content": {"type": "optional", "content": {"type": "namedType", "content": "List"}}}
      }}})"));

  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());
}

TEST(ReferenceResolver, DanglingAliasIsUnresolved)
{
  Resolved r = build_and_resolve(
    doc_with("{" + k_err + R"(, "A": {"type": "namedType", "content": "Missing"}})"));

  EXPECT_FALSE(r.ok);
  ASSERT_EQ(r.diags.size(), 1u);
  const Diagnostic & d = r.diags.all().front();
  EXPECT_EQ(d.kind, DiagnosticKind::UnresolvedReference);
  EXPECT_EQ(d.primary_path().to_string(), "types.A.content");
  EXPECT_EQ(d.message, "'A' references undeclared type 'Missing'");
}

TEST(ReferenceResolver, UndeclaredErrorTypeIsUnresolved)
{
  Resolved r = build_and_resolve(doc_with("{" + k_err + "}", "Nope"));

  EXPECT_FALSE(r.ok);
  ASSERT_EQ(r.diags.size(), 1u);
  EXPECT_EQ(r.diags.all().front().primary_path().to_string(), "errorType");
  EXPECT_FALSE(r.model.error_type.is_valid());
}

TEST(ReferenceResolver, ErrorTypeIsLeftUnboundWithoutTypes)
{
  Resolved r = build_and_resolve(doc_with("{}", "Nope"));

  EXPECT_TRUE(r.ok);
  EXPECT_TRUE(r.diags.empty());
  EXPECT_FALSE(r.model.error_type.is_valid());
}

TEST(ReferenceResolver, DanglingInlineAliasIsUnresolved)
{
  Resolved r = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "S": {"type": "struct", "content": {
        "a": {"index": 0, "content": {"type": "namedType", "content": "Ghost"}}
      }}})"));

  EXPECT_FALSE(r.ok);
  ASSERT_EQ(r.diags.size(), 1u);
  const Diagnostic & d = r.diags.all().front();
  EXPECT_EQ(d.kind, DiagnosticKind::UnresolvedReference);
  EXPECT_EQ(d.primary_path().to_string(), "types.S.content.a.content.content");
  EXPECT_EQ(d.message, "'S.a' references undeclared type 'Ghost'");
}

TEST(ReferenceResolver, DanglingAliasInsideArrayIsUnresolved)
{
  Resolved r = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "L": {"type": "array", "content": {"type": "namedType", "content": "Ghost"}}})"));

  ASSERT_EQ(r.diags.size(), 1u);
  EXPECT_EQ(r.diags.all().front().primary_path().to_string(), "types.L.content.content");
}

TEST(ReferenceResolver, InlineAliasTargetsDeclaredStruct)
{
  Resolved r = build_and_resolve(doc_with(
    "{" + k_err + R"(,
      "E": {"type": "enum", "content": {
        "failed": {"index": 0, "content": {"type": "namedType", "content": "Err"}}
      }},
      "O": {"type": "optional", "content": {"type": "namedType", "content": "Err"}}})"));
  ASSERT_TRUE(r.ok);

  const TypeId err = r.model.types.lookup("Err");
  const TypeNode * e = r.model.find_type("E");
  ASSERT_NE(e, nullptr);
  ASSERT_EQ(e->members.size(), 1u);
  const TypeNode & member_alias = r.model.types.node(e->members[0].type);
  EXPECT_TRUE(member_alias.is_alias());
  EXPECT_EQ(member_alias.target, err);
  EXPECT_EQ(r.model.types.canonical_node(member_alias.id)->kind, TypeKind::Struct);

  const TypeNode * o = r.model.find_type("O");
  ASSERT_NE(o, nullptr);
  EXPECT_EQ(r.model.types.node(o->element).target, err);
}

TEST(ReferenceResolver, UndeclaredCallTypesAreUnresolved)
{
  const std::string text =
    R"({"id": "t", "title": "T", "revision": 1, "errorType": "Err",
        "types": {)" + k_err + R"(},
        "callsOut": {"push": {"feature": "f", "input": "Err", "output": "Gone"}}})";
  Resolved r = build_and_resolve(text);

  EXPECT_FALSE(r.ok);
  ASSERT_EQ(r.diags.size(), 1u);
  EXPECT_EQ(r.diags.all().front().primary_path().to_string(), "callsOut.push.output");
  EXPECT_TRUE(has_error_containing(r.diags, "'callsOut.push' references undeclared type 'Gone'"));

  const CallEntry * call = r.model.find_call(CallDirection::Out, "push");
  ASSERT_NE(call, nullptr);
  EXPECT_TRUE(call->input_type.is_valid());
  EXPECT_FALSE(call->output_type.is_valid());
}
