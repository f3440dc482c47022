#pragma once

#include <memory>
#include <string>
#include <vector>

#include "chunkwise_core/converter/request_context.hpp"

namespace chunkwise_core {

/**
 * @class DocumentConverter
 * @brief Turns uploaded documents into markdown.
 *
 * Implementations talk to a conversion service and throw ConverterError for
 * upstream failures and ValidationError for input the service cannot accept.
 * They never retry on their own.
 */
class DocumentConverter {
 public:
  virtual ~DocumentConverter() = default;

  // Converts the raw file bytes to markdown. The result is trimmed and non-empty.
  virtual std::string convert(const RequestContext& ctx,
                              const std::string& filename,
                              const std::string& data) = 0;

  // Extensions the service accepts, normalized to lowercase with a leading dot
  virtual std::vector<std::string> supported_extensions(const RequestContext& ctx) = 0;
};

using DocumentConverterPtr = std::shared_ptr<DocumentConverter>;

}  // namespace chunkwise_core
