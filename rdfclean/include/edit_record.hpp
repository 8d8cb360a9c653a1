#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace RdfClean {

// Changelog documents keep the key order line/before/after.
using ordered_json = nlohmann::ordered_json;

struct IriRewrite {
  int line{0};
  std::string before; // IRI content without the angle brackets
  std::string after;

  bool operator==(const IriRewrite &other) const {
    return line == other.line && before == other.before &&
           after == other.after;
  }
};

struct MergedStatement {
  int line{0};               // physical line holding the terminator
  std::string mergedTriple;  // trimmed, before IRI sanitization

  bool operator==(const MergedStatement &other) const {
    return line == other.line && mergedTriple == other.mergedTriple;
  }
};

// Every edit applied to one file. Both lists are append-only.
struct EditRecord {
  std::vector<IriRewrite> iriRewrites;
  std::vector<MergedStatement> mergedStatements;

  bool empty() const { return iriRewrites.empty() && mergedStatements.empty(); }

  void append(const std::vector<IriRewrite> &rewrites);

  bool operator==(const EditRecord &other) const {
    return iriRewrites == other.iriRewrites &&
           mergedStatements == other.mergedStatements;
  }

  // {"iri_sanitized": {"count", "details"}, "multiline_merged": {...}}
  ordered_json toJson() const;
  std::string dump() const;

  // Throws nlohmann::json::exception on a document of the wrong shape.
  static EditRecord fromJson(const nlohmann::json &doc);
};

} // namespace RdfClean
