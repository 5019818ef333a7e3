// codegraph/extract/payload_json.hpp - JSON wire form of extractor payloads
//
// Out-of-process extractors hand payloads to the driver as JSON documents:
//
//   { "module": "app.main",
//     "entities": [ {"kind": "Function", "name": "calc", ...} ],
//     "relationships": [ {"kind": "DECLARES", "from": "app.main", "to": "..."} ] }
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "codegraph/extract/extraction.hpp"

namespace codegraph
{

/**
 * Result of decoding a payload document.
 */
struct PayloadLoadResult
{
  /// Decoded payload (only valid if success == true)
  ExtractionPayload payload;

  bool success = false;

  /// Error message if decoding failed
  std::string error;

  static PayloadLoadResult ok(ExtractionPayload p)
  {
    PayloadLoadResult r;
    r.payload = std::move(p);
    r.success = true;
    return r;
  }

  static PayloadLoadResult fail(std::string msg)
  {
    PayloadLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// Decode a payload from an already parsed JSON value
[[nodiscard]] PayloadLoadResult payload_from_json(const nlohmann::json & j);

/// Parse and decode a payload document
[[nodiscard]] PayloadLoadResult parse_payload(std::string_view text);

/// Read, parse and decode a payload file
[[nodiscard]] PayloadLoadResult load_payload_file(const std::filesystem::path & path);

/// Encode a payload (fields left at their defaults are omitted)
[[nodiscard]] nlohmann::json to_json(const ExtractionPayload & payload);

}  // namespace codegraph
