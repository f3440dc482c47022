#include "chunkwise_core/converter/markitdown_client.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>

#include "chunkwise_core/errors.hpp"
#include "chunkwise_core/utils/text_utils.hpp"

namespace chunkwise_core {

namespace {

struct CurlHandleDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};
struct CurlMimeDeleter {
  void operator()(curl_mime* mime) const {
    curl_mime_free(mime);
  }
};
using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlMime = std::unique_ptr<curl_mime, CurlMimeDeleter>;

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(contents, size * nmemb);
  return size * nmemb;
}

// Returning non-zero makes curl abort the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* ctx = static_cast<const RequestContext*>(clientp);
  return ctx->is_cancelled() ? 1 : 0;
}

std::string status_text(long http_code) {
  switch (http_code) {
    case 400:
      return "400 Bad Request";
    case 401:
      return "401 Unauthorized";
    case 403:
      return "403 Forbidden";
    case 404:
      return "404 Not Found";
    case 413:
      return "413 Request Entity Too Large";
    case 415:
      return "415 Unsupported Media Type";
    case 422:
      return "422 Unprocessable Entity";
    case 500:
      return "500 Internal Server Error";
    case 502:
      return "502 Bad Gateway";
    case 503:
      return "503 Service Unavailable";
    case 504:
      return "504 Gateway Timeout";
    default:
      return "HTTP " + std::to_string(http_code);
  }
}

CurlHandle make_handle() {
  CurlHandle handle(curl_easy_init());
  if (!handle) {
    throw ConverterError("Failed to initialize CURL");
  }
  return handle;
}

// Runs the prepared request and returns the HTTP status code
long perform(CURL* curl,
             const RequestContext& ctx,
             std::chrono::milliseconds timeout,
             const std::string& url,
             std::string& response_body,
             const std::string& description) {
  if (ctx.is_cancelled()) {
    throw ConverterError(description + " cancelled before it was sent");
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw ConverterError(description + " cancelled");
  }
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw ConverterError(description + " timed out after " + std::to_string(timeout.count()) + "ms");
  }
  if (res != CURLE_OK) {
    throw ConverterError("failed to call " + url + " for " + description + ": " +
                         std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  return http_code;
}

}  // namespace

MarkitdownClient::MarkitdownClient(const std::string& base_url,
                                   std::chrono::milliseconds default_timeout)
    : default_timeout_(default_timeout) {
  std::string trimmed(text_utils::trim(base_url));
  if (trimmed.empty()) {
    throw ConverterError("markitdown base URL is required");
  }
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  base_url_ = trimmed;
}

std::chrono::milliseconds MarkitdownClient::effective_timeout(const RequestContext& ctx) const {
  return ctx.timeout().count() > 0 ? ctx.timeout() : default_timeout_;
}

std::string MarkitdownClient::convert(const RequestContext& ctx,
                                      const std::string& filename,
                                      const std::string& data) {
  if (data.empty()) {
    throw ValidationError("file data is empty");
  }

  const std::string upload_name = text_utils::is_blank(filename) ? "uploaded_file" : filename;
  const std::string endpoint = base_url_ + "/convert";
  const std::string description = "markitdown conversion of " + upload_name;

  CurlHandle curl = make_handle();
  CurlMime mime(curl_mime_init(curl.get()));
  if (!mime) {
    throw ConverterError("failed to create multipart payload for file: " + upload_name);
  }
  curl_mimepart* part = curl_mime_addpart(mime.get());
  if (!part || curl_mime_name(part, "file") != CURLE_OK ||
      curl_mime_filename(part, upload_name.c_str()) != CURLE_OK ||
      curl_mime_data(part, data.data(), data.size()) != CURLE_OK) {
    throw ConverterError("failed to write file payload for file: " + upload_name + " (size: " +
                         std::to_string(data.size()) + " bytes)");
  }
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

  std::string response_body;
  long http_code =
      perform(curl.get(), ctx, effective_timeout(ctx), endpoint, response_body, description);

  if (http_code != 200) {
    std::string message = decode_error_message(response_body, status_text(http_code));
    std::cerr << "MarkitdownClient: conversion of '" << upload_name << "' failed with status "
              << http_code << std::endl;
    throw ConverterError("markitdown conversion failed for file " + upload_name + " (status " +
                             std::to_string(http_code) + "): " + message,
                         http_code);
  }

  std::string markdown(text_utils::trim(response_body));
  if (markdown.empty()) {
    throw ValidationError("markitdown service returned empty content for file: " + upload_name);
  }
  return markdown;
}

std::vector<std::string> MarkitdownClient::supported_extensions(const RequestContext& ctx) {
  const std::string endpoint = base_url_ + "/supported-extensions";

  CurlHandle curl = make_handle();
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

  std::string response_body;
  long http_code = perform(curl.get(), ctx, effective_timeout(ctx), endpoint, response_body,
                           "supported-extensions request");

  if (http_code != 200) {
    std::string message = decode_error_message(response_body, status_text(http_code));
    throw ConverterError("supported-extensions request failed (status " +
                             std::to_string(http_code) + "): " + message,
                         http_code);
  }

  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(response_body);
  } catch (const nlohmann::json::exception& e) {
    throw ConverterError("failed to parse supported-extensions response: " + std::string(e.what()),
                         http_code);
  }

  std::vector<std::string> extensions;
  if (!payload.is_object() || !payload.contains("extensions") || !payload["extensions"].is_array()) {
    throw ConverterError("supported-extensions response does not contain an extensions array",
                         http_code);
  }
  for (const auto& entry : payload["extensions"]) {
    if (!entry.is_string()) {
      continue;
    }
    std::string ext = normalize_extension(entry.get<std::string>());
    if (!ext.empty()) {
      extensions.push_back(std::move(ext));
    }
  }
  return extensions;
}

std::string decode_error_message(const std::string& body, const std::string& fallback) {
  if (body.empty()) {
    return fallback;
  }

  nlohmann::json payload = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);
  if (payload.is_object()) {
    if (payload.contains("detail")) {
      const auto& detail = payload["detail"];
      if (detail.is_string()) {
        std::string message(text_utils::trim(detail.get<std::string>()));
        if (!message.empty()) {
          return message;
        }
      } else if (detail.is_array() && !detail.empty() && detail[0].is_object()) {
        // FastAPI validation errors: [{"loc": [...], "msg": "...", "type": "..."}]
        const auto& first = detail[0];
        if (first.contains("msg") && first["msg"].is_string()) {
          std::string message(text_utils::trim(first["msg"].get<std::string>()));
          if (!message.empty()) {
            return message;
          }
        }
      }
    }
    for (const char* key : {"message", "error"}) {
      if (payload.contains(key) && payload[key].is_string()) {
        std::string message(text_utils::trim(payload[key].get<std::string>()));
        if (!message.empty()) {
          return message;
        }
      }
    }
  }

  std::string raw(text_utils::trim(body));
  return raw.empty() ? fallback : raw;
}

std::string normalize_extension(const std::string& extension) {
  std::string ext = text_utils::to_lower(text_utils::trim(extension));
  if (ext.empty()) {
    return ext;
  }
  if (ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }
  return ext;
}

}  // namespace chunkwise_core
