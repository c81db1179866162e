// Repository: ReelSync
// Component: Output Locator Resolver
// Purpose: Extract the artifact locator from a loosely-structured stage
//          output payload returned by the render backend.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_RENDER_OUTPUT_LOCATOR_RESOLVER_HPP_
#define REELSYNC_RENDER_OUTPUT_LOCATOR_RESOLVER_HPP_

#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "reelsync/render/RenderJobTypes.hpp"

namespace reelsync::render {

// Parse filename / subfolder / type out of the query string of a view-style
// URI ("/view?filename=a.mp4&subfolder=x&type=output"). Values are
// percent-decoded. Returns empty optional when no non-empty filename
// parameter is present.
std::optional<OutputLocator> ParseLocatorFromUri(const std::string& uri);

// OutputLocatorResolver tries candidate keys in a fixed priority order and
// takes the first one that is present, non-empty and yields a filename.
//
// Candidate list entries come in two shapes, each handled by its own
// extractor:
//   - file descriptor object  {"filename", "subfolder", "type"}
//   - URI string              parsed with ParseLocatorFromUri
// Only the first element of a candidate list is inspected.
//
// Resolution failure is a normal outcome (the job may have failed upstream)
// and is reported as an empty optional; Resolve never throws.
class OutputLocatorResolver {
 public:
  // videos, files, uris, gifs, images
  static const std::vector<std::string>& DefaultCandidateKeys();

  OutputLocatorResolver();
  explicit OutputLocatorResolver(std::vector<std::string> candidate_keys);

  std::optional<OutputLocator> Resolve(const Json::Value& stage_output) const;

  const std::vector<std::string>& candidate_keys() const { return candidate_keys_; }

 private:
  std::vector<std::string> candidate_keys_;
};

}  // namespace reelsync::render

#endif  // REELSYNC_RENDER_OUTPUT_LOCATOR_RESOLVER_HPP_
