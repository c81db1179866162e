// Repository: ReelSync
// Component: Output Locator Resolver Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/render/OutputLocatorResolver.hpp"

#include <cctype>
#include <sstream>
#include <variant>

#include "reelsync/util/Logger.hpp"

namespace reelsync::render {

namespace {

// One candidate list entry, classified by shape.
struct RecordEntry {
  const Json::Value* record;
};
struct UriEntry {
  std::string uri;
};
struct UnsupportedEntry {};

using CandidateEntry = std::variant<RecordEntry, UriEntry, UnsupportedEntry>;

CandidateEntry Classify(const Json::Value& entry) {
  if (entry.isObject()) return RecordEntry{&entry};
  if (entry.isString()) return UriEntry{entry.asString()};
  return UnsupportedEntry{};
}

std::string StringMember(const Json::Value& record, const char* key) {
  const Json::Value& v = record[key];
  return v.isString() ? v.asString() : std::string();
}

// Extractor visitor: each shape has its own typed extraction.
struct LocatorExtractor {
  std::optional<OutputLocator> operator()(const RecordEntry& entry) const {
    OutputLocator locator;
    locator.filename = StringMember(*entry.record, "filename");
    if (locator.filename.empty()) return std::nullopt;
    locator.subfolder = StringMember(*entry.record, "subfolder");
    locator.type = StringMember(*entry.record, "type");
    if (locator.type.empty()) locator.type = kDefaultStorageType;
    return locator;
  }

  std::optional<OutputLocator> operator()(const UriEntry& entry) const {
    return ParseLocatorFromUri(entry.uri);
  }

  std::optional<OutputLocator> operator()(const UnsupportedEntry&) const {
    return std::nullopt;
  }
};

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string PercentDecode(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '+') {
      out += ' ';
    } else if (in[i] == '%' && i + 2 < in.size() &&
               HexValue(in[i + 1]) >= 0 && HexValue(in[i + 2]) >= 0) {
      out += static_cast<char>(HexValue(in[i + 1]) * 16 + HexValue(in[i + 2]));
      i += 2;
    } else {
      out += in[i];
    }
  }
  return out;
}

}  // namespace

std::optional<OutputLocator> ParseLocatorFromUri(const std::string& uri) {
  const size_t query_start = uri.find('?');
  if (query_start == std::string::npos) return std::nullopt;

  std::string query = uri.substr(query_start + 1);
  const size_t fragment = query.find('#');
  if (fragment != std::string::npos) query.resize(fragment);

  OutputLocator locator;
  bool has_type = false;
  bool has_subfolder = false;
  std::istringstream pairs(query);
  std::string pair;
  while (std::getline(pairs, pair, '&')) {
    const size_t eq = pair.find('=');
    const std::string key = PercentDecode(pair.substr(0, eq));
    const std::string value =
        eq == std::string::npos ? std::string() : PercentDecode(pair.substr(eq + 1));
    // First occurrence wins for repeated keys.
    if (key == "filename" && locator.filename.empty()) {
      locator.filename = value;
    } else if (key == "subfolder" && !has_subfolder) {
      locator.subfolder = value;
      has_subfolder = true;
    } else if (key == "type" && !has_type) {
      locator.type = value;
      has_type = true;
    }
  }

  if (locator.filename.empty()) return std::nullopt;
  if (locator.type.empty()) locator.type = kDefaultStorageType;
  return locator;
}

const std::vector<std::string>& OutputLocatorResolver::DefaultCandidateKeys() {
  static const std::vector<std::string> kKeys = {
      "videos",  // artifact list
      "files",   // generic file list
      "uris",    // encoded URI list
      "gifs",    // legacy media-type keys
      "images",
  };
  return kKeys;
}

OutputLocatorResolver::OutputLocatorResolver()
    : candidate_keys_(DefaultCandidateKeys()) {}

OutputLocatorResolver::OutputLocatorResolver(std::vector<std::string> candidate_keys)
    : candidate_keys_(std::move(candidate_keys)) {}

std::optional<OutputLocator> OutputLocatorResolver::Resolve(
    const Json::Value& stage_output) const {
  if (!stage_output.isObject()) return std::nullopt;

  for (const auto& key : candidate_keys_) {
    const Json::Value& candidate = stage_output[key];
    if (!candidate.isArray() || candidate.empty()) continue;

    auto locator = std::visit(LocatorExtractor{}, Classify(candidate[0]));
    if (locator) {
      util::Logger::Debug("[OutputLocatorResolver] resolved via '" + key +
                          "' filename=" + locator->filename);
      return locator;
    }
    util::Logger::Debug("[OutputLocatorResolver] key '" + key +
                        "' present but yielded no filename");
  }
  return std::nullopt;
}

}  // namespace reelsync::render
