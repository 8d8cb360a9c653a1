#include "edit_record.hpp"

namespace RdfClean {

void EditRecord::append(const std::vector<IriRewrite> &rewrites) {
  iriRewrites.insert(iriRewrites.end(), rewrites.begin(), rewrites.end());
}

ordered_json EditRecord::toJson() const {
  ordered_json iriDetails = ordered_json::array();
  for (const auto &rewrite : iriRewrites) {
    iriDetails.push_back({{"line", rewrite.line},
                          {"before", rewrite.before},
                          {"after", rewrite.after}});
  }

  ordered_json mergeDetails = ordered_json::array();
  for (const auto &merged : mergedStatements) {
    mergeDetails.push_back(
        {{"line", merged.line}, {"merged_triple", merged.mergedTriple}});
  }

  ordered_json doc = ordered_json::object();
  doc["iri_sanitized"] = {{"count", iriRewrites.size()},
                          {"details", iriDetails}};
  doc["multiline_merged"] = {{"count", mergedStatements.size()},
                             {"details", mergeDetails}};
  return doc;
}

std::string EditRecord::dump() const {
  // Non-ASCII as \uXXXX; stray invalid bytes become U+FFFD instead of throwing
  return toJson().dump(4, ' ', true, ordered_json::error_handler_t::replace);
}

EditRecord EditRecord::fromJson(const nlohmann::json &doc) {
  EditRecord record;

  for (const auto &detail : doc.at("iri_sanitized").at("details")) {
    IriRewrite rewrite;
    rewrite.line = detail.at("line").get<int>();
    rewrite.before = detail.at("before").get<std::string>();
    rewrite.after = detail.at("after").get<std::string>();
    record.iriRewrites.push_back(rewrite);
  }

  for (const auto &detail : doc.at("multiline_merged").at("details")) {
    MergedStatement merged;
    merged.line = detail.at("line").get<int>();
    merged.mergedTriple = detail.at("merged_triple").get<std::string>();
    record.mergedStatements.push_back(merged);
  }

  return record;
}

} // namespace RdfClean
