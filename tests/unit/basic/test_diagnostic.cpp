// tests/unit/basic/test_diagnostic.cpp - Unit tests for DiagnosticBag and DocumentPath

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "iapi/basic/diagnostic.hpp"
#include "iapi/basic/document_path.hpp"

using namespace iapi;

TEST(DocumentPath, ToStringJoinsSegments)
{
  const DocumentPath p{"types", "structItem", "content", "intItem"};
  EXPECT_EQ(p.to_string(), "types.structItem.content.intItem");
  EXPECT_EQ(p.size(), 4u);
  EXPECT_EQ(p.root(), "types");
  EXPECT_EQ(p.element(), "structItem");
  EXPECT_EQ(p.get_namespace(), DocumentNamespace::Types);
}

TEST(DocumentPath, EmptyPathPrintsRoot)
{
  const DocumentPath p;
  EXPECT_TRUE(p.empty());
  EXPECT_EQ(p.to_string(), "<root>");
  EXPECT_EQ(p.get_namespace(), DocumentNamespace::Header);
}

TEST(DocumentPath, HeaderFieldIsItsOwnElement)
{
  const DocumentPath p{"errorType"};
  EXPECT_EQ(p.get_namespace(), DocumentNamespace::Header);
  EXPECT_EQ(p.element(), "errorType");
}

TEST(DocumentPath, ChildAppendsWithoutMutating)
{
  const DocumentPath base{"callsIn"};
  const DocumentPath child = base.child("set").child("feature");
  EXPECT_EQ(base.size(), 1u);
  EXPECT_EQ(child.to_string(), "callsIn.set.feature");
  EXPECT_EQ(child.element(), "set");
}

TEST(DiagnosticKind, CodesAndNamesAreStable)
{
  EXPECT_STREQ(diagnostic_code(DiagnosticKind::MalformedField), "E0001");
  EXPECT_STREQ(diagnostic_code(DiagnosticKind::CyclicAlias), "E0003");
  EXPECT_STREQ(diagnostic_code(DiagnosticKind::DuplicateIndex), "E0005");
  EXPECT_STREQ(diagnostic_code(DiagnosticKind::DeprecatedFeature), "W0001");
  EXPECT_STREQ(diagnostic_kind_name(DiagnosticKind::InvalidErrorType), "InvalidErrorTypeError");
  EXPECT_STREQ(diagnostic_kind_name(DiagnosticKind::DeprecatedFeature), "DeprecatedFeatureWarning");
}

TEST(DiagnosticBag, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto b = bag.report_error(
      DiagnosticKind::DuplicateIndex, DocumentPath{"types", "s", "content", "b"}, "dup", "here");
    b.with_secondary_label(DocumentPath{"types", "s", "content", "a"}, "first")
      .with_help("pick another");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1u);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E0005");
  ASSERT_EQ(d.labels.size(), 2u);
  EXPECT_EQ(d.primary_path().to_string(), "types.s.content.b");
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "pick another");
}

TEST(DiagnosticBag, CountsBySeverityAndKind)
{
  DiagnosticBag bag;
  bag.report_error(DiagnosticKind::UnboundCall, DocumentPath{"callsIn", "a"}, "x");
  bag.report_error(DiagnosticKind::UnboundCall, DocumentPath{"callsIn", "b"}, "y");
  bag.report_warning(DiagnosticKind::DeprecatedFeature, DocumentPath{"callsIn", "c"}, "z");

  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.errors().size(), 2u);
  EXPECT_EQ(bag.warnings().size(), 1u);
  EXPECT_EQ(bag.count(DiagnosticKind::UnboundCall), 2u);
  EXPECT_FALSE(bag.has_kind(DiagnosticKind::CyclicAlias));
}

TEST(DiagnosticBag, SortCanonicalOrdersByNamespaceElementKind)
{
  DiagnosticBag bag;
  bag.report_error(DiagnosticKind::UnboundCall, DocumentPath{"callsIn", "a", "feature"}, "4");
  bag.report_error(DiagnosticKind::DuplicateIndex, DocumentPath{"types", "zeta"}, "3");
  bag.report_error(DiagnosticKind::CyclicAlias, DocumentPath{"types", "alpha"}, "2");
  bag.report_error(DiagnosticKind::InvalidErrorType, DocumentPath{"errorType"}, "1");
  bag.report_error(DiagnosticKind::UnknownKind, DocumentPath{"types", "zeta"}, "3a");

  bag.sort_canonical();

  std::vector<std::string> order;
  for (const auto & d : bag) {
    order.push_back(d.message);
  }
  EXPECT_EQ(order, (std::vector<std::string>{"1", "2", "3a", "3", "4"}));
}

TEST(DiagnosticBag, SortIsStableForEqualKeys)
{
  DiagnosticBag bag;
  bag.report_error(DiagnosticKind::DuplicateIndex, DocumentPath{"types", "s", "content", "b"}, "b");
  bag.report_error(DiagnosticKind::DuplicateIndex, DocumentPath{"types", "s", "content", "c"}, "c");

  bag.sort_canonical();

  EXPECT_EQ(bag.all()[0].message, "b");
  EXPECT_EQ(bag.all()[1].message, "c");
}

TEST(DiagnosticBag, PromoteWarningsTurnsWarningsIntoErrors)
{
  DiagnosticBag bag;
  bag.report_warning(DiagnosticKind::DeprecatedFeature, DocumentPath{"callsIn", "c"}, "z");
  EXPECT_FALSE(bag.has_errors());

  bag.promote_warnings();

  EXPECT_TRUE(bag.has_errors());
  EXPECT_FALSE(bag.has_warnings());
}

TEST(DiagnosticBag, MergeMovesDiagnostics)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error(DiagnosticKind::Io, DocumentPath{}, "a");
  b.report_error(DiagnosticKind::Io, DocumentPath{}, "b");

  a.merge(std::move(b));

  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a.all()[1].message, "b");
}
