// Repository: ReelSync
// Component: Content Items Tests
// Copyright (c) 2025 ReelSync

#include <gtest/gtest.h>

#include "reelsync/pipeline/ContentItems.hpp"
#include "reelsync/render/RenderJobTypes.hpp"
#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"
#include "tests/support/TempDir.hpp"

namespace reelsync::testing {
namespace {

using pipeline::ParseContentItems;

Json::Value Parse(const std::string& text) {
  Json::Value root;
  std::string error;
  EXPECT_TRUE(util::ParseJson(text, &root, &error)) << error;
  return root;
}

TEST(ContentItemsTest, DefaultsAndAliases) {
  auto items = ParseContentItems(Parse(R"([
    {"image_prompt": "a red fox", "commentary": "Foxes are clever."},
    {"id": 9, "prompt": "a blue whale", "frames": 81, "width": 640, "height": 360},
    {"duration_frames": 33}
  ])"));
  ASSERT_EQ(items.size(), 3u);

  EXPECT_EQ(items[0].id, 1);
  EXPECT_EQ(items[0].order, 0);
  EXPECT_EQ(items[0].prompt, "a red fox");
  EXPECT_EQ(items[0].commentary, "Foxes are clever.");
  EXPECT_FALSE(items[0].frames.has_value());

  EXPECT_EQ(items[1].id, 9);
  EXPECT_EQ(items[1].order, 1);
  EXPECT_EQ(items[1].prompt, "a blue whale");
  EXPECT_EQ(items[1].frames, 81);
  EXPECT_EQ(items[1].width, 640);
  EXPECT_EQ(items[1].height, 360);
  EXPECT_TRUE(items[1].commentary.empty());

  EXPECT_EQ(items[2].id, 3);
  EXPECT_TRUE(items[2].prompt.empty());
  EXPECT_EQ(items[2].frames, 33);
}

TEST(ContentItemsTest, PrimaryKeyWinsOverAlias) {
  auto items = ParseContentItems(Parse(R"([{"image_prompt": "primary", "prompt": "alias"}])"));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].prompt, "primary");
}

TEST(ContentItemsTest, RejectsMalformedDocuments) {
  EXPECT_THROW(ParseContentItems(Parse(R"({"items": []})")), util::ConfigurationError);
  EXPECT_THROW(ParseContentItems(Parse(R"([42])")), util::ConfigurationError);
  EXPECT_THROW(ParseContentItems(Parse(R"([{"image_prompt": 5}])")), util::ConfigurationError);
  EXPECT_THROW(ParseContentItems(Parse(R"([{"id": 0}])")), util::ConfigurationError);
  EXPECT_THROW(ParseContentItems(Parse(R"([{"width": -1}])")), util::ConfigurationError);
  EXPECT_THROW(ParseContentItems(Parse(R"([{"frames": "many"}])")), util::ConfigurationError);
}

TEST(ContentItemsTest, RejectsIdsOutsideClipIdRange) {
  // Larger than any int64; jsoncpp stores it as an unsigned value.
  EXPECT_THROW(ParseContentItems(Parse(R"([{"id": 18446744073709551615}])")),
               util::ConfigurationError);
  // Would format to five digits and never pair with its narration.
  EXPECT_THROW(ParseContentItems(Parse(R"([{"id": 10000}])")), util::ConfigurationError);

  auto items = ParseContentItems(Parse(R"([{"id": 9999}])"));
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].id, render::kMaxClipId);
}

TEST(ContentItemsTest, RejectsDuplicateIds) {
  // The second entry defaults to id 2, which the first entry already uses.
  EXPECT_THROW(ParseContentItems(Parse(R"([{"id": 2}, {}])")), util::ConfigurationError);
}

TEST(ContentItemsTest, EmptyListIsValid) {
  EXPECT_TRUE(ParseContentItems(Parse("[]")).empty());
}

TEST(ContentItemsTest, LoadFromFile) {
  TempDir dir;
  const auto path = dir.WriteFile("content.json", R"([{"image_prompt": "x", "commentary": "y"}])");
  auto items = pipeline::LoadContentItems(path);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].commentary, "y");

  EXPECT_THROW(pipeline::LoadContentItems(dir.path() / "absent.json"), util::ConfigurationError);
  const auto broken = dir.WriteFile("broken.json", "[{");
  EXPECT_THROW(pipeline::LoadContentItems(broken), util::ConfigurationError);
}

}  // namespace
}  // namespace reelsync::testing
