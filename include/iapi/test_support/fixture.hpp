// iapi/test_support/fixture.hpp - helpers for unit/integration tests
//
// A complete reference document plus small wrappers that run the pipeline
// over inline JSON text.
//
#pragma once

#include <algorithm>
#include <string>
#include <string_view>

#include "iapi/basic/diagnostic.hpp"
#include "iapi/basic/document_path.hpp"
#include "iapi/document/field_reader.hpp"
#include "iapi/driver/engine.hpp"

namespace iapi::test_support
{

/// Key/value persistence API exercising every type kind
inline constexpr const char * k_kv_fixture = R"({
  "inversionApiSpec": {
    "id": "gwSMYpO3kr5yLvTNR3KR4",
    "title": "Key Value Persistence",
    "revision": 2,
    "errorType": "structItem",
    "unique": true,
    "features": {
      "set": {
        "doc": "Set values in the KV store.",
        "stablizedRevision": 0
      },
      "get": {
        "doc": "Get values from the KV store.",
        "stablizedRevision": 0
      }
    },
    "unstableFeatures": {
      "list": {
        "doc": "List the values in the KV store."
      }
    },
    "types": {
      "intItem": {
        "type": "i32",
        "doc": "An integer item."
      },
      "stringItem": {
        "type": "string"
      },
      "optionalItem": {
        "type": "optional",
        "content": {
          "type": "string"
        }
      },
      "arrayItem": {
        "type": "array",
        "content": {
          "type": "string"
        }
      },
      "structItem": {
        "type": "struct",
        "content": {
          "intItem": {
            "index": 0,
            "content": {
              "type": "i32",
              "doc": "An integer item."
            }
          },
          "stringItem": {
            "index": 1,
            "content": {
              "type": "string"
            }
          }
        }
      },
      "enumItem": {
        "type": "enum",
        "content": {
          "intItem": {
            "index": 0,
            "content": {
              "type": "i32",
              "doc": "An integer item."
            }
          },
          "stringItem": {
            "index": 1,
            "content": {
              "type": "string"
            }
          }
        }
      },
      "namedTypeItem": {
        "type": "namedType",
        "content": "enumItem"
      }
    },
    "callsOut": {},
    "callsIn": {
      "set": {
        "feature": "set",
        "input": "structItem",
        "output": "arrayItem"
      }
    }
  }
})";

[[nodiscard]] inline Document parse_json(std::string_view text)
{
  return Document::parse(text.begin(), text.end());
}

/// The fixture as a wrapped document
[[nodiscard]] inline Document kv_fixture() { return parse_json(k_kv_fixture); }

/// Mutable reference to the inner spec object of a wrapped document
[[nodiscard]] inline Document & spec_of(Document & doc) { return doc[k_wrapper_key]; }

[[nodiscard]] inline ValidateResult validate_text(
  std::string_view text, const ValidateOptions & options = {})
{
  return Engine::validate(parse_json(text), options);
}

[[nodiscard]] inline bool has_error_containing(const DiagnosticBag & diags, std::string_view needle)
{
  const auto & all = diags.all();
  return std::any_of(all.begin(), all.end(), [&](const Diagnostic & d) {
    if (d.severity != Severity::Error) return false;
    return d.message.find(needle) != std::string::npos;
  });
}

}  // namespace iapi::test_support
