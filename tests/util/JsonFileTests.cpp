// Repository: ReelSync
// Component: JSON File Helper Tests
// Copyright (c) 2025 ReelSync

#include <gtest/gtest.h>

#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"
#include "tests/support/TempDir.hpp"

namespace reelsync::testing {
namespace {

TEST(JsonFileTest, ParseReportsErrors) {
  Json::Value root;
  std::string error;
  EXPECT_TRUE(util::ParseJson(R"({"a": [1, 2]})", &root, &error));
  EXPECT_EQ(root["a"].size(), 2u);
  EXPECT_FALSE(util::ParseJson("{\"a\": ", &root, &error));
  EXPECT_FALSE(error.empty());
}

TEST(JsonFileTest, CompactOutputIsSingleLine) {
  Json::Value root(Json::objectValue);
  root["prompt"]["6"]["inputs"]["text"] = "a fox";
  const std::string text = util::ToCompactJson(root);
  EXPECT_EQ(text.find('\n'), std::string::npos);

  Json::Value back;
  std::string error;
  ASSERT_TRUE(util::ParseJson(text, &back, &error)) << error;
  EXPECT_EQ(back, root);
}

TEST(JsonFileTest, WriteCreatesDirectoriesAndReadsBack) {
  TempDir dir;
  Json::Value root(Json::arrayValue);
  root.append("x");
  const auto path = dir.path() / "nested" / "deeper" / "doc.json";
  std::string error;
  ASSERT_TRUE(util::WriteJsonFile(path, root, &error)) << error;
  EXPECT_EQ(util::ReadJsonFileOrThrow(path, "doc"), root);
}

TEST(JsonFileTest, ReadThrowsWithDocumentName) {
  TempDir dir;
  try {
    util::ReadJsonFileOrThrow(dir.path() / "absent.json", "content file");
    FAIL() << "expected ConfigurationError";
  } catch (const util::ConfigurationError& e) {
    EXPECT_NE(std::string(e.what()).find("content file"), std::string::npos);
  }
}

}  // namespace
}  // namespace reelsync::testing
