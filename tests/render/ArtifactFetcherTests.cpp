// Repository: ReelSync
// Component: Artifact Fetcher Tests
// Copyright (c) 2025 ReelSync

#include <gtest/gtest.h>

#include "reelsync/render/ArtifactFetcher.hpp"
#include "tests/support/FakeRenderBackend.hpp"
#include "tests/support/TempDir.hpp"

namespace reelsync::testing {
namespace {

render::OutputLocator Locator(const std::string& filename) {
  render::OutputLocator locator;
  locator.filename = filename;
  return locator;
}

TEST(ArtifactFetcherTest, DownloadsIntoNewDirectory) {
  TempDir dir;
  FakeRenderBackend backend;
  backend.SetArtifact("clip.mp4", "0123456789");
  render::ArtifactFetcher fetcher(backend);

  const auto dest = dir.path() / "video_outputs" / "mp4_clips" / "clip.mp4";
  auto result = fetcher.Fetch(Locator("clip.mp4"), dest);
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.bytes, 10u);
  EXPECT_EQ(std::filesystem::file_size(dest), 10u);
}

TEST(ArtifactFetcherTest, ZeroByteFileIsFailureEvenWhenTransferSucceeded) {
  TempDir dir;
  FakeRenderBackend backend;
  backend.SetArtifact("empty.mp4", "");
  render::ArtifactFetcher fetcher(backend);

  auto result = fetcher.Fetch(Locator("empty.mp4"), dir.path() / "empty.mp4");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, render::FetchError::kEmptyFile);
}

TEST(ArtifactFetcherTest, TransportFailure) {
  TempDir dir;
  FakeRenderBackend backend;
  render::ArtifactFetcher fetcher(backend);
  auto result = fetcher.Fetch(Locator("unknown.mp4"), dir.path() / "unknown.mp4");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, render::FetchError::kTransportFailed);
  EXPECT_EQ(result.detail, "HTTP 404");
}

TEST(ArtifactFetcherTest, EmptyFilenameRejectedWithoutTransfer) {
  TempDir dir;
  FakeRenderBackend backend;
  render::ArtifactFetcher fetcher(backend);
  auto result = fetcher.Fetch(Locator(""), dir.path() / "x.mp4");
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, render::FetchError::kNoFilename);
  EXPECT_TRUE(backend.downloads().empty());
}

TEST(LocalClipFilenameTest, AppendsMp4WhenMissing) {
  EXPECT_EQ(render::LocalClipFilename(Locator("clip_00001_")), "clip_00001_.mp4");
  EXPECT_EQ(render::LocalClipFilename(Locator("clip.webm")), "clip.webm.mp4");
  EXPECT_EQ(render::LocalClipFilename(Locator("clip.mp4")), "clip.mp4");
  EXPECT_EQ(render::LocalClipFilename(Locator("CLIP.MP4")), "CLIP.MP4");
}

}  // namespace
}  // namespace reelsync::testing
