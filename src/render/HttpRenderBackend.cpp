// Repository: ReelSync
// Component: HTTP Render Backend Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/render/HttpRenderBackend.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>

#include <curl/curl.h>

#include "reelsync/util/JsonFile.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::render {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t AppendToString(char* data, size_t size, size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

size_t AppendToStream(char* data, size_t size, size_t nmemb, void* userp) {
  auto* out = static_cast<std::ofstream*>(userp);
  out->write(data, static_cast<std::streamsize>(size * nmemb));
  return out->good() ? size * nmemb : 0;
}

struct HttpResult {
  CURLcode code = CURLE_OK;
  long status = 0;
  std::string body;

  bool Ok() const { return code == CURLE_OK && status >= 200 && status < 300; }

  std::string Describe() const {
    if (code != CURLE_OK) return std::string("curl error: ") + curl_easy_strerror(code);
    return "HTTP " + std::to_string(status) + (body.empty() ? "" : ": " + body.substr(0, 512));
  }
};

HttpResult PerformGet(const std::string& url, long timeout_s) {
  HttpResult result;
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    result.code = CURLE_FAILED_INIT;
    return result;
  }
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_s);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
  result.code = curl_easy_perform(curl.get());
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
  return result;
}

HttpResult PerformPostJson(const std::string& url, const std::string& body, long timeout_s) {
  HttpResult result;
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    result.code = CURLE_FAILED_INIT;
    return result;
  }
  CurlHeaders headers(curl_slist_append(nullptr, "Content-Type: application/json"));
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_s);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendToString);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
  result.code = curl_easy_perform(curl.get());
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
  return result;
}

std::string Escape(const std::string& value) {
  CurlHandle curl(curl_easy_init());
  if (!curl) return value;
  char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
  if (escaped == nullptr) return value;
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

// A failed transfer must not leave a clip-shaped file behind.
void RemovePartialFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    util::Logger::Warn("[HttpRenderBackend] Could not remove partial download " + path.string() +
                       ": " + ec.message());
  }
}

}  // namespace

std::string GenerateClientId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(gen);
  uint64_t lo = dist(gen);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

  std::ostringstream out;
  out << std::hex << std::setfill('0')
      << std::setw(8) << (hi >> 32) << '-'
      << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
      << std::setw(4) << (hi & 0xFFFF) << '-'
      << std::setw(4) << (lo >> 48) << '-'
      << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return out.str();
}

HttpRenderBackend::HttpRenderBackend(HttpRenderBackendConfig config)
    : config_(std::move(config)) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  while (!config_.server_url.empty() && config_.server_url.back() == '/') {
    config_.server_url.pop_back();
  }
  if (config_.client_id.empty()) {
    config_.client_id = GenerateClientId();
  }
}

HttpRenderBackend::~HttpRenderBackend() {
  curl_global_cleanup();
}

SubmitResponse HttpRenderBackend::Submit(const Json::Value& job_spec) {
  Json::Value request(Json::objectValue);
  request["prompt"] = job_spec;
  request["client_id"] = config_.client_id;

  HttpResult http = PerformPostJson(config_.server_url + "/prompt",
                                    util::ToCompactJson(request),
                                    config_.request_timeout_s);
  if (!http.Ok()) {
    return SubmitResponse::Failure("queue request failed: " + http.Describe());
  }

  Json::Value reply;
  std::string error;
  if (!util::ParseJson(http.body, &reply, &error)) {
    return SubmitResponse::Failure("queue reply is not JSON: " + error);
  }
  if (!reply.isObject() || !reply["prompt_id"].isString() ||
      reply["prompt_id"].asString().empty()) {
    return SubmitResponse::Failure("queue reply has no prompt_id: " +
                                   util::ToCompactJson(reply));
  }
  return SubmitResponse::Success(reply["prompt_id"].asString());
}

HistoryResponse HttpRenderBackend::GetHistory(const std::string& job_handle) {
  HttpResult http = PerformGet(config_.server_url + "/history/" + Escape(job_handle),
                               config_.request_timeout_s);
  if (!http.Ok()) {
    return HistoryResponse::Failure("history request failed: " + http.Describe());
  }
  Json::Value body;
  std::string error;
  if (!util::ParseJson(http.body, &body, &error)) {
    return HistoryResponse::Failure("history reply is not JSON: " + error);
  }
  return HistoryResponse::Success(std::move(body));
}

std::string HttpRenderBackend::ViewUrl(const OutputLocator& locator) const {
  return config_.server_url + "/view?filename=" + Escape(locator.filename) +
         "&subfolder=" + Escape(locator.subfolder) + "&type=" + Escape(locator.type);
}

DownloadResponse HttpRenderBackend::Download(const OutputLocator& locator,
                                             const std::filesystem::path& destination) {
  const std::string url = ViewUrl(locator);
  util::Logger::Info("[HttpRenderBackend] GET " + url + " -> " + destination.string());

  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return DownloadResponse::Failure("cannot open " + destination.string() + " for writing");
  }

  CurlHandle curl(curl_easy_init());
  if (!curl) {
    out.close();
    RemovePartialFile(destination);
    return DownloadResponse::Failure("curl init failed");
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config_.download_timeout_s);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendToStream);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
  const CURLcode code = curl_easy_perform(curl.get());
  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  out.close();

  if (code != CURLE_OK) {
    RemovePartialFile(destination);
    return DownloadResponse::Failure(std::string("view request failed: ") +
                                     curl_easy_strerror(code) + " (HTTP " +
                                     std::to_string(status) + ")");
  }
  if (status != 200) {
    RemovePartialFile(destination);
    return DownloadResponse::Failure("view endpoint returned HTTP " + std::to_string(status));
  }
  return DownloadResponse::Success();
}

}  // namespace reelsync::render
