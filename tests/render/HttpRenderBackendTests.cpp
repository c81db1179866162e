// Repository: ReelSync
// Component: HTTP Render Backend Tests
// Purpose: URL building, client ids and cleanup after failed transfers.
//          No test needs a running backend.
// Copyright (c) 2025 ReelSync

#include <gtest/gtest.h>

#include <regex>

#include "reelsync/render/HttpRenderBackend.hpp"
#include "tests/support/TempDir.hpp"

namespace reelsync::testing {
namespace {

TEST(HttpRenderBackendTest, ViewUrlEscapesLocatorFields) {
  render::HttpRenderBackendConfig config;
  config.server_url = "http://gpu-box:8188/";
  config.client_id = "fixed";
  render::HttpRenderBackend backend(config);

  EXPECT_EQ(backend.client_id(), "fixed");
  EXPECT_EQ(backend.ViewUrl(render::OutputLocator{"clip 1.mp4", "a/b", "output"}),
            "http://gpu-box:8188/view?filename=clip%201.mp4&subfolder=a%2Fb&type=output");
}

TEST(HttpRenderBackendTest, GeneratedClientIdIsVersion4Shaped) {
  const std::regex shape("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
  EXPECT_TRUE(std::regex_match(render::GenerateClientId(), shape));
  EXPECT_NE(render::GenerateClientId(), render::GenerateClientId());
}

TEST(HttpRenderBackendTest, FailedDownloadLeavesNoFileBehind) {
  TempDir dir;
  render::HttpRenderBackendConfig config;
  config.server_url = "http://127.0.0.1:1";  // nothing listens on port 1
  config.download_timeout_s = 5;
  render::HttpRenderBackend backend(config);

  const auto destination = dir.path() / "narrativegen_clip_0001__00001.mp4";
  auto response = backend.Download(
      render::OutputLocator{"narrativegen_clip_0001__00001.mp4", "", "output"}, destination);
  EXPECT_FALSE(response.ok);
  EXPECT_FALSE(std::filesystem::exists(destination));
}

}  // namespace
}  // namespace reelsync::testing
