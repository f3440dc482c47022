#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "chunkwise_core/chunking/markdown_chunker.hpp"
#include "chunkwise_core/chunking/metadata_wrapper.hpp"
#include "chunkwise_core/converter/document_converter.hpp"
#include "chunkwise_core/converter/extension_cache.hpp"
#include "chunkwise_core/errors.hpp"
#include "chunkwise_core/types/chunk.hpp"
#include "chunkwise_core/types/processed_file.hpp"
#include "chunkwise_core/types/uploaded_file.hpp"

namespace chunkwise_core {

struct ProcessorOptions {
  std::uint64_t max_file_bytes = 10 * 1024 * 1024;  // 10 MB
  size_t max_text_bytes = 200'000;                   // 200 KB
  size_t text_chunk_size = 1000;
  ChunkOptions chunk_options;
  EmbeddingBudget embedding_budget;
};

/**
 * @class DocumentProcessor
 * @brief Turns uploads and free text into chunked ProcessedFile records.
 *
 * Uploads are validated, read once while being hashed, converted to markdown
 * by the DocumentConverter and chunked structurally. Free text skips
 * conversion and is chunked in fixed windows. Every failure is thrown as a
 * ValidationError (bad input, never worth retrying) or a ConverterError
 * (the conversion service failed; the caller decides whether to retry).
 *
 * The supported extension list is fetched from the converter on first use and
 * cached for the lifetime of this instance (see ExtensionCache). Instances do
 * not share state, and all methods are safe to call concurrently.
 */
class DocumentProcessor {
 public:
  explicit DocumentProcessor(std::shared_ptr<DocumentConverter> converter,
                             ProcessorOptions options = {});

  DocumentProcessor(const DocumentProcessor&) = delete;
  DocumentProcessor& operator=(const DocumentProcessor&) = delete;

  ProcessedFile process_file(const RequestContext& ctx, const UploadedFile& file);

  ProcessedFile process_text(const std::string& text) const;

  // Sorted list of accepted extensions, fetched on first use
  std::vector<std::string> get_supported_extensions(const RequestContext& ctx);

  // Forgets the cached extension list so the next call asks the converter again
  void invalidate_supported_extensions();

  std::vector<std::string> chunk_markdown(std::string_view markdown) const;
  std::vector<std::string> chunk_markdown_with_options(std::string_view markdown,
                                                       const ChunkOptions& options) const;
  std::vector<std::string> chunk_text(std::string_view text, size_t chunk_size) const;

  // Structural chunking plus front-matter, every result within the embedding budget
  std::vector<std::string> wrap_markdown_with_metadata(std::string_view markdown,
                                                       const ChunkAddress& address) const;

  const ProcessorOptions& options() const {
    return options_;
  }

 private:
  void ensure_supported_extensions(const RequestContext& ctx);
  std::string read_and_hash(const UploadedFile& file, std::string& content_hash) const;
  std::string convert_to_markdown(const RequestContext& ctx,
                                  const std::string& filename,
                                  const std::string& data);

  std::shared_ptr<DocumentConverter> converter_;
  ProcessorOptions options_;
  MarkdownChunker markdown_chunker_;
  MetadataWrapper metadata_wrapper_;
  ExtensionCache extension_cache_;
};

}  // namespace chunkwise_core
