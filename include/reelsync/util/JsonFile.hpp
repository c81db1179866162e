// Repository: ReelSync
// Component: JSON File Helpers
// Purpose: Read / parse / write JSON documents with jsoncpp.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_UTIL_JSON_FILE_HPP_
#define REELSYNC_UTIL_JSON_FILE_HPP_

#include <filesystem>
#include <string>

#include <json/json.h>

namespace reelsync::util {

// Parse a JSON document. Returns false and fills *error on malformed input.
bool ParseJson(const std::string& text, Json::Value* out, std::string* error);

// Serialize with two-space indentation (human-readable manifest files).
std::string ToStyledJson(const Json::Value& value);

// Serialize on one line (request bodies).
std::string ToCompactJson(const Json::Value& value);

// Read and parse a JSON file.
// Throws ConfigurationError when the file is missing or malformed;
// `what` names the document in the message ("content file", ...).
Json::Value ReadJsonFileOrThrow(const std::filesystem::path& path,
                                const std::string& what);

// Write a JSON file, creating parent directories. Returns false and fills
// *error on failure.
bool WriteJsonFile(const std::filesystem::path& path,
                   const Json::Value& value,
                   std::string* error);

}  // namespace reelsync::util

#endif  // REELSYNC_UTIL_JSON_FILE_HPP_
