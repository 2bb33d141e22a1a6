// iapi/document/document_loader.cpp - JSON / YAML document loading
//
#include "iapi/document/document_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace iapi
{

namespace
{

/// Convert a plain YAML scalar to the closest JSON scalar
Document convert_scalar(const YAML::Node & node)
{
  const std::string & text = node.Scalar();

  // Quoted scalars ("!" tag) are always strings.
  if (node.Tag() == "!") {
    return text;
  }

  // YAML 1.2 core schema booleans only; yes/no/on/off stay strings.
  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }

  if (!text.empty() && text.front() != '-') {
    uint64_t u = 0;
    if (YAML::convert<uint64_t>::decode(node, u)) {
      return u;
    }
  }

  int64_t i = 0;
  if (YAML::convert<int64_t>::decode(node, i)) {
    return i;
  }

  double d = 0.0;
  if (YAML::convert<double>::decode(node, d)) {
    return d;
  }

  return text;
}

Document convert_yaml(const YAML::Node & node)
{
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return nullptr;
    case YAML::NodeType::Scalar:
      return convert_scalar(node);
    case YAML::NodeType::Sequence: {
      Document out = Document::array();
      for (const auto & item : node) {
        out.push_back(convert_yaml(item));
      }
      return out;
    }
    case YAML::NodeType::Map: {
      Document out = Document::object();
      for (const auto & entry : node) {
        const std::string key = entry.first.as<std::string>();
        if (out.contains(key)) {
          throw YAML::ParserException(entry.first.Mark(), "duplicate key '" + key + "'");
        }
        out[key] = convert_yaml(entry.second);
      }
      return out;
    }
  }
  return nullptr;
}

}  // namespace

DocumentFormat format_from_path(const std::filesystem::path & path)
{
  const std::string ext = path.extension().string();
  if (ext == ".yaml" || ext == ".yml") {
    return DocumentFormat::Yaml;
  }
  return DocumentFormat::Json;
}

LoadResult parse_document(const std::string & text, DocumentFormat format)
{
  if (format == DocumentFormat::Json) {
    // One key set per open object; the parser itself keeps the last duplicate.
    std::vector<std::set<std::string>> open_objects;
    std::optional<std::string> duplicate;
    const Document::parser_callback_t track_keys =
      [&](int /*depth*/, Document::parse_event_t event, Document & parsed) {
        using Event = Document::parse_event_t;
        if (event == Event::object_start) {
          open_objects.emplace_back();
        } else if (event == Event::object_end) {
          open_objects.pop_back();
        } else if (event == Event::key && !open_objects.empty()) {
          const auto & key = parsed.get_ref<const std::string &>();
          if (!open_objects.back().insert(key).second && !duplicate) {
            duplicate = key;
          }
        }
        return true;
      };

    try {
      Document doc = Document::parse(text, track_keys);
      if (duplicate) {
        return LoadResult::fail("failed to parse JSON: duplicate key '" + *duplicate + "'");
      }
      return LoadResult::ok(std::move(doc));
    } catch (const nlohmann::json::exception & e) {
      return LoadResult::fail("failed to parse JSON: " + std::string(e.what()));
    }
  }

  try {
    return LoadResult::ok(convert_yaml(YAML::Load(text)));
  } catch (const YAML::Exception & e) {
    return LoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

LoadResult load_document(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return LoadResult::fail("document not found: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return LoadResult::fail("cannot open document: " + path.string());
  }
  std::stringstream ss;
  ss << in.rdbuf();

  return parse_document(ss.str(), format_from_path(path));
}

}  // namespace iapi
