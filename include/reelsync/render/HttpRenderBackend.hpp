// Repository: ReelSync
// Component: HTTP Render Backend
// Purpose: IRenderBackend over the backend's HTTP API using libcurl.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_RENDER_HTTP_RENDER_BACKEND_HPP_
#define REELSYNC_RENDER_HTTP_RENDER_BACKEND_HPP_

#include <string>

#include "reelsync/render/IRenderBackend.hpp"

namespace reelsync::render {

struct HttpRenderBackendConfig {
  std::string server_url = "http://127.0.0.1:8188";
  std::string client_id;           // generated when empty
  long request_timeout_s = 60;     // submit / history calls
  long download_timeout_s = 600;   // view call (large artifacts)
};

// HttpRenderBackend
//   POST {server}/prompt          {"prompt": spec, "client_id": id}
//   GET  {server}/history/{id}
//   GET  {server}/view?filename=&subfolder=&type=
//
// Thread Safety:
// - One curl easy handle per request; safe to call from one thread at a time.
class HttpRenderBackend : public IRenderBackend {
 public:
  explicit HttpRenderBackend(HttpRenderBackendConfig config);
  ~HttpRenderBackend() override;

  HttpRenderBackend(const HttpRenderBackend&) = delete;
  HttpRenderBackend& operator=(const HttpRenderBackend&) = delete;

  SubmitResponse Submit(const Json::Value& job_spec) override;
  HistoryResponse GetHistory(const std::string& job_handle) override;
  DownloadResponse Download(const OutputLocator& locator,
                            const std::filesystem::path& destination) override;

  const std::string& client_id() const { return config_.client_id; }

  // Exposed for tests: the view URL for a locator.
  std::string ViewUrl(const OutputLocator& locator) const;

 private:
  HttpRenderBackendConfig config_;
};

// Random RFC 4122 version-4 style identifier.
std::string GenerateClientId();

}  // namespace reelsync::render

#endif  // REELSYNC_RENDER_HTTP_RENDER_BACKEND_HPP_
