// Repository: ReelSync
// Component: JSON File Helpers Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/util/JsonFile.hpp"

#include <fstream>
#include <memory>
#include <sstream>

#include "reelsync/util/Errors.hpp"

namespace reelsync::util {

bool ParseJson(const std::string& text, Json::Value* out, std::string* error) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), out, &errs)) {
    if (error != nullptr) *error = errs;
    return false;
  }
  return true;
}

std::string ToStyledJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, value);
}

std::string ToCompactJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

Json::Value ReadJsonFileOrThrow(const std::filesystem::path& path,
                                const std::string& what) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigurationError(what + " not found: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  Json::Value root;
  std::string error;
  if (!ParseJson(buffer.str(), &root, &error)) {
    throw ConfigurationError("malformed " + what + " " + path.string() + ": " + error);
  }
  return root;
}

bool WriteJsonFile(const std::filesystem::path& path,
                   const Json::Value& value,
                   std::string* error) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error != nullptr) *error = "cannot create " + path.parent_path().string() + ": " + ec.message();
      return false;
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    if (error != nullptr) *error = "cannot open " + path.string() + " for writing";
    return false;
  }
  out << ToStyledJson(value) << '\n';
  if (!out.good()) {
    if (error != nullptr) *error = "write failed: " + path.string();
    return false;
  }
  return true;
}

}  // namespace reelsync::util
