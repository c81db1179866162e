// Repository: ReelSync
// Component: Render Backend Interface
// Purpose: The three calls the pipeline makes against the asynchronous
//          render job queue: submit, history, view.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_RENDER_IRENDER_BACKEND_HPP_
#define REELSYNC_RENDER_IRENDER_BACKEND_HPP_

#include <filesystem>
#include <string>

#include <json/json.h>

#include "reelsync/render/RenderJobTypes.hpp"

namespace reelsync::render {

struct SubmitResponse {
  bool ok = false;
  std::string job_handle;  // backend "prompt_id"
  std::string error;

  static SubmitResponse Success(std::string handle) {
    return {true, std::move(handle), ""};
  }
  static SubmitResponse Failure(std::string error) {
    return {false, "", std::move(error)};
  }
};

struct HistoryResponse {
  bool ok = false;
  Json::Value body;  // {handle: {"outputs": {...}, "status": {...}}}
  std::string error;

  static HistoryResponse Success(Json::Value body) {
    return {true, std::move(body), ""};
  }
  static HistoryResponse Failure(std::string error) {
    return {false, Json::Value(), std::move(error)};
  }
};

struct DownloadResponse {
  bool ok = false;
  std::string error;

  static DownloadResponse Success() { return {true, ""}; }
  static DownloadResponse Failure(std::string error) { return {false, std::move(error)}; }
};

// IRenderBackend is implemented by HttpRenderBackend in production and by a
// scripted fake in tests. Implementations report transport problems through
// the response structs and never throw.
class IRenderBackend {
 public:
  virtual ~IRenderBackend() = default;

  // Queue one job specification.
  virtual SubmitResponse Submit(const Json::Value& job_spec) = 0;

  // Fetch the history document for a job handle. A job that is still
  // running may have no entry yet; that is a successful, empty response.
  virtual HistoryResponse GetHistory(const std::string& job_handle) = 0;

  // Stream the artifact bytes for `locator` into `destination` (the parent
  // directory already exists).
  virtual DownloadResponse Download(const OutputLocator& locator,
                                    const std::filesystem::path& destination) = 0;
};

}  // namespace reelsync::render

#endif  // REELSYNC_RENDER_IRENDER_BACKEND_HPP_
