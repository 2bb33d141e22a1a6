// tests/unit/document/test_document_loader.cpp - Unit tests for JSON/YAML loading

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "iapi/document/document_loader.hpp"
#include "iapi/sema/graph_builder.hpp"

namespace fs = std::filesystem;
using namespace iapi;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

}  // namespace

TEST(DocumentLoader, FormatFromExtension)
{
  EXPECT_EQ(format_from_path("a/kv.yaml"), DocumentFormat::Yaml);
  EXPECT_EQ(format_from_path("kv.yml"), DocumentFormat::Yaml);
  EXPECT_EQ(format_from_path("kv.json"), DocumentFormat::Json);
  EXPECT_EQ(format_from_path("kv"), DocumentFormat::Json);
}

TEST(DocumentLoader, JsonKeepsInsertionOrder)
{
  const LoadResult r = parse_document(R"({"b": 1, "a": 2})", DocumentFormat::Json);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.document.begin().key(), "b");
}

TEST(DocumentLoader, InvalidJsonFails)
{
  const LoadResult r = parse_document("{ not json", DocumentFormat::Json);
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("failed to parse JSON"), std::string::npos);
}

TEST(DocumentLoader, YamlScalarsConvert)
{
  const LoadResult r = parse_document(
    "revision: 2\n"
    "negative: -4\n"
    "ratio: 1.5\n"
    "unique: true\n"
    "answer: yes\n"
    "quoted: \"7\"\n"
    "title: Key Value Persistence\n"
    "empty:\n",
    DocumentFormat::Yaml);
  ASSERT_TRUE(r.success) << r.error;

  const Document & d = r.document;
  EXPECT_TRUE(d["revision"].is_number_unsigned());
  EXPECT_EQ(d["revision"].get<uint64_t>(), 2u);
  EXPECT_TRUE(d["negative"].is_number_integer());
  EXPECT_EQ(d["negative"].get<int64_t>(), -4);
  EXPECT_TRUE(d["ratio"].is_number_float());
  EXPECT_TRUE(d["unique"].is_boolean());
  EXPECT_TRUE(d["answer"].is_string());
  EXPECT_TRUE(d["quoted"].is_string());
  EXPECT_EQ(d["title"], "Key Value Persistence");
  EXPECT_TRUE(d["empty"].is_null());
}

TEST(DocumentLoader, YamlMappingsKeepInsertionOrder)
{
  const LoadResult r = parse_document("types:\n  zeta: {type: i32}\n  alpha: {type: string}\n",
                                      DocumentFormat::Yaml);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.document["types"].begin().key(), "zeta");
}

TEST(DocumentLoader, InvalidYamlFails)
{
  const LoadResult r = parse_document("a: [1, 2", DocumentFormat::Yaml);
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("failed to parse YAML"), std::string::npos);
}

TEST(DocumentLoader, YamlDuplicateKeyFails)
{
  const LoadResult r = parse_document("types:\n  a: {type: i32}\n  a: {type: string}\n",
                                      DocumentFormat::Yaml);
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("failed to parse YAML"), std::string::npos);
  EXPECT_NE(r.error.find("duplicate key 'a'"), std::string::npos) << r.error;
}

TEST(DocumentLoader, JsonDuplicateKeyFails)
{
  const LoadResult r =
    parse_document(R"({"types": {"a": {"type": "i32"}, "a": {"type": "string"}}})",
                   DocumentFormat::Json);
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("duplicate key 'a'"), std::string::npos) << r.error;
}

TEST(DocumentLoader, SameKeyInSiblingMappingsIsAllowed)
{
  const LoadResult y = parse_document("x: {type: i32}\ny: {type: i32}\n", DocumentFormat::Yaml);
  const LoadResult j =
    parse_document(R"({"x": {"type": "i32"}, "y": {"type": "i32"}})", DocumentFormat::Json);
  EXPECT_TRUE(y.success) << y.error;
  EXPECT_TRUE(j.success) << j.error;
}

TEST(DocumentLoader, LoadsFilesByExtension)
{
  const fs::path dir = make_temp_dir("iapi_loader");
  write_all(dir / "a.json", R"({"id": "a"})");
  write_all(dir / "b.yaml", "id: b\n");

  const LoadResult a = load_document(dir / "a.json");
  const LoadResult b = load_document(dir / "b.yaml");

  ASSERT_TRUE(a.success) << a.error;
  ASSERT_TRUE(b.success) << b.error;
  EXPECT_EQ(a.document["id"], "a");
  EXPECT_EQ(b.document["id"], "b");
}

TEST(DocumentLoader, MissingFileFails)
{
  const LoadResult r = load_document(fs::temp_directory_path() / "iapi_does_not_exist.json");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("document not found"), std::string::npos);
}

TEST(DocumentLoader, UnwrapStripsWrapperOnly)
{
  const LoadResult wrapped =
    parse_document(R"({"inversionApiSpec": {"id": "x"}})", DocumentFormat::Json);
  const LoadResult bare = parse_document(R"({"id": "x"})", DocumentFormat::Json);
  ASSERT_TRUE(wrapped.success);
  ASSERT_TRUE(bare.success);

  EXPECT_EQ(unwrap_document(wrapped.document), bare.document);
  EXPECT_EQ(&unwrap_document(bare.document), &bare.document);
}
