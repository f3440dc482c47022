#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "chunkwise_core/converter/document_converter.hpp"

namespace chunkwise_core {

class MarkitdownClient : public DocumentConverter {
 public:
  static constexpr std::chrono::seconds DEFAULT_TIMEOUT{60};

  explicit MarkitdownClient(const std::string& base_url,
                            std::chrono::milliseconds default_timeout = DEFAULT_TIMEOUT);
  ~MarkitdownClient() override = default;

  // Disable copy constructor and assignment
  MarkitdownClient(const MarkitdownClient&) = delete;
  MarkitdownClient& operator=(const MarkitdownClient&) = delete;

  // POST {base}/convert with the file as multipart field "file"
  std::string convert(const RequestContext& ctx,
                      const std::string& filename,
                      const std::string& data) override;

  // GET {base}/supported-extensions -> {"extensions": [...]}
  std::vector<std::string> supported_extensions(const RequestContext& ctx) override;

  const std::string& base_url() const {
    return base_url_;
  }

 private:
  std::string base_url_;
  std::chrono::milliseconds default_timeout_;

  std::chrono::milliseconds effective_timeout(const RequestContext& ctx) const;
};

/**
 * @brief Best-effort extraction of a human readable message from an error body.
 *
 * Understands JSON bodies carrying "detail" (a string, or a list of objects
 * with "msg"), "message" or "error". Falls back to the raw body, and to
 * `fallback` (usually the HTTP status text) when the body is empty.
 */
std::string decode_error_message(const std::string& body, const std::string& fallback);

// "pdf", " .PDF " -> ".pdf"; blank input -> ""
std::string normalize_extension(const std::string& extension);

}  // namespace chunkwise_core
