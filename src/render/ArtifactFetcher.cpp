// Repository: ReelSync
// Component: Artifact Fetcher Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/render/ArtifactFetcher.hpp"

#include <algorithm>
#include <cctype>

#include "reelsync/util/Logger.hpp"

namespace reelsync::render {

const char* FetchErrorToString(FetchError error) {
  switch (error) {
    case FetchError::kNone: return "NONE";
    case FetchError::kNoFilename: return "NO_FILENAME";
    case FetchError::kDirectoryFailed: return "DIRECTORY_FAILED";
    case FetchError::kTransportFailed: return "TRANSPORT_FAILED";
    case FetchError::kEmptyFile: return "EMPTY_FILE";
  }
  return "UNKNOWN";
}

std::string LocalClipFilename(const OutputLocator& locator) {
  std::string lower = locator.filename;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const std::string ext = ".mp4";
  if (lower.size() >= ext.size() &&
      lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
    return locator.filename;
  }
  return locator.filename + ext;
}

ArtifactFetcher::ArtifactFetcher(IRenderBackend& backend) : backend_(backend) {}

FetchResult ArtifactFetcher::Fetch(const OutputLocator& locator,
                                   const std::filesystem::path& destination) {
  if (locator.filename.empty()) {
    util::Logger::Warn("[ArtifactFetcher] Download attempt with no filename (subfolder '" +
                       locator.subfolder + "', type '" + locator.type + "')");
    return FetchResult::Failure(FetchError::kNoFilename, "locator has no filename");
  }

  std::error_code ec;
  if (destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
      return FetchResult::Failure(FetchError::kDirectoryFailed,
                                  "cannot create " + destination.parent_path().string() +
                                      ": " + ec.message());
    }
  }

  DownloadResponse response = backend_.Download(locator, destination);
  if (!response.ok) {
    util::Logger::Warn("[ArtifactFetcher] Download of " + locator.filename +
                       " failed: " + response.error);
    return FetchResult::Failure(FetchError::kTransportFailed, response.error);
  }

  const bool exists = std::filesystem::exists(destination, ec);
  const uintmax_t size = exists ? std::filesystem::file_size(destination, ec) : 0;
  if (!exists || ec || size == 0) {
    util::Logger::Warn("[ArtifactFetcher] File saved but it is empty or missing: " +
                       destination.string());
    return FetchResult::Failure(FetchError::kEmptyFile,
                                "empty or missing file after download: " + destination.string());
  }

  util::Logger::Info("[ArtifactFetcher] Saved " + destination.string() + " (" +
                     std::to_string(size) + " bytes)");
  return FetchResult::Success(size);
}

}  // namespace reelsync::render
