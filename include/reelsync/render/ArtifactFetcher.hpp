// Repository: ReelSync
// Component: Artifact Fetcher
// Purpose: Download a produced artifact to local storage and verify the
//          write is non-empty.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_RENDER_ARTIFACT_FETCHER_HPP_
#define REELSYNC_RENDER_ARTIFACT_FETCHER_HPP_

#include <cstdint>
#include <filesystem>
#include <string>

#include "reelsync/render/IRenderBackend.hpp"
#include "reelsync/render/RenderJobTypes.hpp"

namespace reelsync::render {

enum class FetchError {
  kNone = 0,
  kNoFilename,        // locator has an empty filename; nothing requested
  kDirectoryFailed,   // could not create the destination's parent directory
  kTransportFailed,   // backend reported a transfer error
  kEmptyFile,         // transfer "succeeded" but the file is missing or 0 bytes
};

const char* FetchErrorToString(FetchError error);

struct FetchResult {
  bool ok = false;
  FetchError error = FetchError::kNone;
  std::string detail;
  uintmax_t bytes = 0;

  static FetchResult Success(uintmax_t bytes) {
    return {true, FetchError::kNone, "", bytes};
  }
  static FetchResult Failure(FetchError error, std::string detail) {
    return {false, error, std::move(detail), 0};
  }
};

// Local filename for a resolved artifact: the locator filename, with ".mp4"
// appended when it does not already end in ".mp4" (case-insensitive).
std::string LocalClipFilename(const OutputLocator& locator);

class ArtifactFetcher {
 public:
  explicit ArtifactFetcher(IRenderBackend& backend);

  // Creates parent directories of `destination`, downloads the artifact and
  // verifies the file exists with non-zero size. A zero-byte file is a
  // failure even when the transfer itself reported success.
  FetchResult Fetch(const OutputLocator& locator,
                    const std::filesystem::path& destination);

 private:
  IRenderBackend& backend_;
};

}  // namespace reelsync::render

#endif  // REELSYNC_RENDER_ARTIFACT_FETCHER_HPP_
