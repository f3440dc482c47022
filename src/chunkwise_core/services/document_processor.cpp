#include "chunkwise_core/services/document_processor.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "chunkwise_core/chunking/text_chunker.hpp"
#include "chunkwise_core/converter/markitdown_client.hpp"
#include "chunkwise_core/services/content_hasher.hpp"
#include "chunkwise_core/utils/document_utils.hpp"
#include "chunkwise_core/utils/text_utils.hpp"
#include "chunkwise_core/utils/uuid.hpp"

namespace chunkwise_core {

namespace {

constexpr size_t READ_BLOCK_SIZE = 64 * 1024;

std::string text_filename(std::chrono::system_clock::time_point now) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream ss;
  ss << "text-" << std::put_time(&local, "%Y%m%d-%H%M%S") << ".txt";
  return ss.str();
}

}  // namespace

DocumentProcessor::DocumentProcessor(std::shared_ptr<DocumentConverter> converter,
                                     ProcessorOptions options)
    : converter_(std::move(converter)),
      options_(options),
      markdown_chunker_(options.chunk_options),
      metadata_wrapper_(options.chunk_options, options.embedding_budget) {}

ProcessedFile DocumentProcessor::process_file(const RequestContext& ctx, const UploadedFile& file) {
  if (file.size > options_.max_file_bytes) {
    throw ValidationError("file exceeds maximum size (" + format_file_size(options_.max_file_bytes) +
                          "): " + file.filename + " (" + std::to_string(file.size) + " bytes)");
  }

  const std::string filename = std::filesystem::path(file.filename).filename().string();
  if (text_utils::is_blank(filename) || filename == "." || filename == "..") {
    throw ValidationError("file name is required");
  }

  // Everything from the last dot, so ".pdf" names a pdf upload
  const size_t dot = filename.rfind('.');
  const std::string extension =
      dot == std::string::npos ? std::string() : text_utils::to_lower(filename.substr(dot));
  if (extension.size() <= 1) {
    throw ValidationError("file extension is required: " + filename);
  }

  ensure_supported_extensions(ctx);
  if (!extension_cache_.contains(extension)) {
    throw ValidationError("unsupported file type: " + extension);
  }

  std::string content_hash;
  const std::string data = read_and_hash(file, content_hash);

  std::string markdown = convert_to_markdown(ctx, filename, data);

  std::vector<std::string> chunks = markdown_chunker_.chunk_texts(markdown);
  if (chunks.empty()) {
    throw ValidationError("file did not produce any indexable content: " + filename);
  }

  std::cout << "DocumentProcessor: processed '" << filename << "' (" << file.size << " bytes) into "
            << chunks.size() << " chunks" << std::endl;

  return {.id = generate_uuid_v4(),
          .filename = filename,
          .original_size = file.size,
          .content_hash = std::move(content_hash),
          .markdown = std::move(markdown),
          .chunks = std::move(chunks),
          .processed_at = std::chrono::system_clock::now()};
}

ProcessedFile DocumentProcessor::process_text(const std::string& text) const {
  if (text_utils::is_blank(text)) {
    throw ValidationError("text is required");
  }
  if (text.size() > options_.max_text_bytes) {
    throw ValidationError("text exceeds maximum allowed length (" + std::to_string(text.size()) +
                          " > " + std::to_string(options_.max_text_bytes) + " bytes)");
  }

  std::vector<std::string> chunks = TextChunker::chunk_text(text, options_.text_chunk_size);
  if (chunks.empty()) {
    throw ValidationError("text did not produce any chunks");
  }

  const auto now = std::chrono::system_clock::now();
  return {.id = generate_uuid_v4(),
          .filename = text_filename(now),
          .original_size = text.size(),
          .content_hash = ContentHasher::sha256_hex(text),
          .markdown = text,
          .chunks = std::move(chunks),
          .processed_at = now};
}

std::vector<std::string> DocumentProcessor::get_supported_extensions(const RequestContext& ctx) {
  ensure_supported_extensions(ctx);
  return extension_cache_.snapshot();
}

void DocumentProcessor::invalidate_supported_extensions() {
  extension_cache_.invalidate();
}

std::vector<std::string> DocumentProcessor::chunk_markdown(std::string_view markdown) const {
  return markdown_chunker_.chunk_texts(markdown);
}

std::vector<std::string> DocumentProcessor::chunk_markdown_with_options(
    std::string_view markdown, const ChunkOptions& options) const {
  return MarkdownChunker(options).chunk_texts(markdown);
}

std::vector<std::string> DocumentProcessor::chunk_text(std::string_view text,
                                                       size_t chunk_size) const {
  return TextChunker::chunk_text(text, chunk_size);
}

std::vector<std::string> DocumentProcessor::wrap_markdown_with_metadata(
    std::string_view markdown, const ChunkAddress& address) const {
  std::vector<std::string> out;
  for (auto& chunk : metadata_wrapper_.wrap(markdown_chunker_.chunk(markdown), address)) {
    out.push_back(std::move(chunk.text));
  }
  return out;
}

void DocumentProcessor::ensure_supported_extensions(const RequestContext& ctx) {
  if (!converter_) {
    throw ValidationError("markitdown client is not configured");
  }

  try {
    extension_cache_.ensure_loaded([&]() {
      std::vector<std::string> extensions;
      for (const auto& ext : converter_->supported_extensions(ctx)) {
        std::string normalized = normalize_extension(ext);
        if (!normalized.empty()) {
          extensions.push_back(std::move(normalized));
        }
      }
      return extensions;
    });
  } catch (const ConverterError& e) {
    std::cerr << "DocumentProcessor: failed to load supported file types: " << e.what() << std::endl;
    throw ConverterError("failed to load supported file types: " + std::string(e.what()),
                         e.status_code());
  }
}

// Single pass over the upload: every block read is hashed and kept for conversion
std::string DocumentProcessor::read_and_hash(const UploadedFile& file,
                                             std::string& content_hash) const {
  std::unique_ptr<std::istream> stream = file.open ? file.open() : nullptr;
  if (!stream || !*stream) {
    throw ProcessingError("failed to open uploaded file: " + file.filename);
  }

  ContentHasher hasher;
  std::string data;
  data.reserve(static_cast<size_t>(file.size));
  std::vector<char> buffer(READ_BLOCK_SIZE);

  while (*stream) {
    stream->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = stream->gcount();
    if (count <= 0) {
      break;
    }
    std::string_view block(buffer.data(), static_cast<size_t>(count));
    hasher.update(block);
    data.append(block);

    if (data.size() > options_.max_file_bytes) {
      throw ValidationError("file exceeds maximum size (" +
                            format_file_size(options_.max_file_bytes) + "): " + file.filename);
    }
  }

  if (stream->bad()) {
    throw ProcessingError("failed to read file: " + file.filename + " (size: " +
                          std::to_string(file.size) + " bytes)");
  }

  content_hash = hasher.hex_digest();
  return data;
}

std::string DocumentProcessor::convert_to_markdown(const RequestContext& ctx,
                                                   const std::string& filename,
                                                   const std::string& data) {
  if (!converter_) {
    throw ValidationError("markitdown client is not configured");
  }

  std::string markdown;
  try {
    markdown = converter_->convert(ctx, filename, data);
  } catch (const ValidationError& e) {
    throw ValidationError("failed to convert file to markdown: " + std::string(e.what()));
  } catch (const ConverterError& e) {
    std::cerr << "DocumentProcessor: conversion failed for '" << filename << "' (" << data.size()
              << " bytes): " << e.what() << std::endl;
    throw ConverterError("failed to convert file to markdown: " + std::string(e.what()),
                         e.status_code());
  }

  markdown = std::string(text_utils::trim(markdown));
  if (markdown.empty()) {
    throw ValidationError("failed to convert file to markdown: converted markdown is empty for " +
                          filename);
  }
  return markdown;
}

}  // namespace chunkwise_core
